/**
 * Keyring.cpp - Provider API keys in the desktop secret store (libsecret)
 */

#include "dp/Keyring.hpp"
#include "dp/Log.hpp"

#include <libsecret/secret.h>

namespace dp {
namespace keyring {

namespace {

const SecretSchema DP_CREDENTIAL_SCHEMA = {
    "org.drupalpilot.credentials",
    SECRET_SCHEMA_NONE,
    {
        {"provider", SECRET_SCHEMA_ATTRIBUTE_STRING},
        {NULL, SECRET_SCHEMA_ATTRIBUTE_STRING}
    }
};

} // anonymous namespace

std::string lookup(const std::string& provider) {
    GError* error = nullptr;
    gchar* value = secret_password_lookup_sync(
        &DP_CREDENTIAL_SCHEMA,
        nullptr,
        &error,
        "provider", provider.c_str(),
        NULL
    );

    if (error != nullptr) {
        log::debug("keyring", "lookup for " + provider + " failed: " + error->message);
        g_error_free(error);
        return "";
    }

    if (value == nullptr) {
        return "";
    }

    std::string result(value);
    secret_password_free(value);
    return result;
}

bool store(const std::string& provider, const std::string& secret, std::string& error_message) {
    std::string label = "DrupalPilot " + provider + " API key";

    GError* error = nullptr;
    gboolean success = secret_password_store_sync(
        &DP_CREDENTIAL_SCHEMA,
        SECRET_COLLECTION_DEFAULT,
        label.c_str(),
        secret.c_str(),
        nullptr,
        &error,
        "provider", provider.c_str(),
        NULL
    );

    if (error != nullptr) {
        error_message = error->message;
        g_error_free(error);
        return false;
    }

    if (success != TRUE) {
        error_message = "secret service refused the item";
        return false;
    }
    return true;
}

} // namespace keyring
} // namespace dp
