/**
 * Keyring.hpp - Provider API keys in the desktop secret store (libsecret)
 */

#pragma once

#include <string>

namespace dp {
namespace keyring {

// Empty when no secret is stored or the secret service is unreachable
std::string lookup(const std::string& provider);

// On failure returns false and fills error
bool store(const std::string& provider, const std::string& secret, std::string& error);

} // namespace keyring
} // namespace dp
