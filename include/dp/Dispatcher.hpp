/**
 * Dispatcher.hpp - Raw text to Result Envelope; never throws
 */

#pragma once

#include <string>
#include <vector>

#include "dp/Command.hpp"
#include "dp/Intent.hpp"
#include "dp/Result.hpp"

namespace dp {

class CommandRegistry;
class IntentResolver;

struct Dispatch {
    Intent intent;
    Result result;
};

class Dispatcher {
public:
    Dispatcher(const IntentResolver& resolver, const CommandRegistry& registry, CommandContext& context);

    Dispatch handle(const std::string& raw_text) const;

    // For callers that already hold an Intent (e.g. `dp create-site`)
    Result dispatch(const Intent& intent) const;

    static const std::vector<std::string>& exampleCommands();

private:
    const IntentResolver& resolver_;
    const CommandRegistry& registry_;
    CommandContext& context_;
};

} // namespace dp
