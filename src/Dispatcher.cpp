/**
 * Dispatcher.cpp - Raw text to Result Envelope; never throws
 */

#include "dp/Dispatcher.hpp"
#include "dp/CommandRegistry.hpp"
#include "dp/IntentResolver.hpp"
#include "dp/Log.hpp"

using json = nlohmann::json;

namespace dp {

Dispatcher::Dispatcher(const IntentResolver& resolver, const CommandRegistry& registry,
                       CommandContext& context)
    : resolver_(resolver), registry_(registry), context_(context) {}

const std::vector<std::string>& Dispatcher::exampleCommands() {
    static const std::vector<std::string> examples = {
        "create a blog post about AI in Drupal",
        "get the latest 5 articles",
        "clear cache",
        "enable module pathauto",
        "upload ./images/hero.jpg with alt text 'Hero banner'",
        "create ddev site named my-blog",
        "start my-blog",
        "status of site my-blog"
    };
    return examples;
}

Dispatch Dispatcher::handle(const std::string& raw_text) const {
    Dispatch out;
    try {
        out.intent = resolver_.resolve(raw_text);
    } catch (const std::exception& e) {
        log::error("dispatch", std::string("resolver failed: ") + e.what());
        out.intent = Intent();
        out.intent.raw_text = raw_text;
        out.result = Result::fail(ErrorKind::PARSE, "Could not interpret the request",
                                  exampleCommands());
        return out;
    }
    out.result = dispatch(out.intent);

    if (out.intent.resolved()) {
        out.result.data["operation"] = toString(out.intent.operation);
        out.result.data["intent_source"] = toString(out.intent.source);
    }
    return out;
}

Result Dispatcher::dispatch(const Intent& intent) const {
    if (!intent.resolved() && intent.parameters.contains("max_length")) {
        size_t length = intent.parameters.value("input_length", size_t(0));
        size_t limit = intent.parameters.value("max_length", size_t(0));
        return Result::fail(ErrorKind::VALIDATION,
                            "Request is too long (" + std::to_string(length) +
                                " characters, the limit is " + std::to_string(limit) + ")",
                            {"shorten the request; long post bodies can be generated from a topic"},
                            {{"input_length", length}, {"max_length", limit}});
    }

    if (!intent.resolved()) {
        std::string text = intent.parameters.value("raw_command", intent.raw_text);
        return Result::fail(ErrorKind::PARSE,
                            "Could not understand: \"" + text + "\"",
                            exampleCommands(),
                            {{"raw_command", text}});
    }

    std::string op = toString(intent.operation);

    try {
        std::unique_ptr<Command> command = registry_.create(intent, context_);

        std::vector<std::string> problems = command->problems();
        if (!problems.empty()) {
            std::string joined;
            for (const auto& p : problems) {
                if (!joined.empty()) joined += "; ";
                joined += p;
            }
            log::info("dispatch", op + " rejected: " + joined);
            return Result::fail(ErrorKind::VALIDATION, "Invalid " + op + " request: " + joined,
                                {}, {{"problems", problems}, {"parameters", intent.parameters}});
        }

        log::debug("dispatch", "executing " + command->name() + " " + dumpJson(intent.parameters));
        return command->execute();

    } catch (const Error& e) {
        log::info("dispatch", op + " failed: " + toString(e.kind()) + ": " + e.what());
        return e.toResult();
    } catch (const UnknownOperationError& e) {
        log::error("dispatch", e.what());
        return Result::fail(ErrorKind::UNKNOWN_OPERATION,
                            "No command is registered for operation '" + op + "'",
                            {"this is an internal inconsistency; please report it"});
    } catch (const nlohmann::json::exception& e) {
        log::error("dispatch", op + ": unexpected JSON: " + e.what());
        return Result::fail(ErrorKind::PROVIDER,
                            "Unexpected reply while running " + op,
                            {"rerun with --verbose for details"});
    } catch (const std::exception& e) {
        log::error("dispatch", op + ": internal error: " + e.what());
        return Result::fail(ErrorKind::PLATFORM, "Internal error while running " + op,
                            {"rerun with --verbose for details"});
    }
}

} // namespace dp
