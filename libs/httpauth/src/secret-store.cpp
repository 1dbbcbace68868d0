#include "secret-store.hpp"
#include "errors.hpp"
#include "log.hpp"

#ifdef HTTPAUTH_KEYCHAIN_SUPPORT
#include <keychain/keychain.h>
#endif

#include <chrono>
#include <future>

#include "stx/format.h"

namespace httpauth
{

namespace
{

[[maybe_unused]] const std::chrono::minutes KEYCHAIN_TIMEOUT{1};
[[maybe_unused]] const char* KEYCHAIN_PACKAGE = "lib.httpauth.client";

#ifdef HTTPAUTH_KEYCHAIN_SUPPORT

std::optional<std::string> keychainGet(std::string const& service, std::string const& user)
{
    log().debug("Loading secret (service={}, user={}) ...", service, user);
    auto result = std::async(std::launch::async, [=]() -> std::optional<std::string> {
        keychain::Error error;
        auto password = keychain::getPassword(KEYCHAIN_PACKAGE, service, user, error);
        if (error.type == keychain::ErrorType::NotFound)
            return {};
        if (error)
            throw ConfigurationError(stx::format("Keychain read failed: {}", error.message));
        return password;
    });

    if (result.wait_for(KEYCHAIN_TIMEOUT) == std::future_status::timeout) {
        log().warn("  ... Keychain timed out.");
        return {};
    }

    auto password = result.get();
    log().debug("  ...{}.", password ? "OK" : "not found");
    return password;
}

#endif

}

KeychainSecretStore::KeychainSecretStore(std::string service)
    : service_(std::move(service))
{}

std::optional<std::string> KeychainSecretStore::get(std::string const& key)
{
#ifdef HTTPAUTH_KEYCHAIN_SUPPORT
    return keychainGet(service_, key);
#else
    throw logRuntimeError<ConfigurationError>(
        "[KeychainSecretStore::get] httpauth was compiled with HTTPAUTH_KEYCHAIN_SUPPORT OFF.");
#endif
}

void KeychainSecretStore::set(std::string const& key, std::string const& secret)
{
#ifdef HTTPAUTH_KEYCHAIN_SUPPORT
    log().debug("Storing secret (service={}, user={}) ...", service_, key);
    auto result = std::async(std::launch::async, [service = service_, key, secret]() {
        keychain::Error error;
        keychain::setPassword(KEYCHAIN_PACKAGE, service, key, secret, error);
        if (error)
            throw ConfigurationError(stx::format("Keychain write failed: {}", error.message));
    });

    if (result.wait_for(KEYCHAIN_TIMEOUT) == std::future_status::timeout)
        throw logRuntimeError<TimeoutError>("[KeychainSecretStore::set] Keychain timed out.");

    result.get();
    log().debug("  ...OK.");
#else
    throw logRuntimeError<ConfigurationError>(
        "[KeychainSecretStore::set] httpauth was compiled with HTTPAUTH_KEYCHAIN_SUPPORT OFF.");
#endif
}

bool KeychainSecretStore::remove(std::string const& key)
{
#ifdef HTTPAUTH_KEYCHAIN_SUPPORT
    log().debug("Deleting secret (service={}, user={}) ...", service_, key);
    auto result = std::async(std::launch::async, [service = service_, key]() {
        keychain::Error error;
        keychain::deletePassword(KEYCHAIN_PACKAGE, service, key, error);
        return !error;
    });

    if (result.wait_for(KEYCHAIN_TIMEOUT) == std::future_status::timeout) {
        log().warn("  ... Keychain timed out!");
        return false;
    }

    auto removed = result.get();
    log().debug("  ...{}.", removed ? "OK" : "nothing to delete");
    return removed;
#else
    throw logRuntimeError<ConfigurationError>(
        "[KeychainSecretStore::remove] httpauth was compiled with HTTPAUTH_KEYCHAIN_SUPPORT OFF.");
#endif
}

std::string KeychainSecretStore::loadPassword(std::string const& service, std::string const& user)
{
#ifdef HTTPAUTH_KEYCHAIN_SUPPORT
    if (auto password = keychainGet(service, user))
        return *password;
    throw logRuntimeError<ConfigurationError>(
        stx::format("No keychain password found for service '{}' and user '{}'.", service, user));
#else
    throw logRuntimeError<ConfigurationError>(
        "[KeychainSecretStore::loadPassword] httpauth was compiled with HTTPAUTH_KEYCHAIN_SUPPORT OFF.");
#endif
}

std::optional<std::string> InMemorySecretStore::get(std::string const& key)
{
    std::lock_guard lock(mutex_);
    auto it = secrets_.find(key);
    if (it == secrets_.end())
        return {};
    return it->second;
}

void InMemorySecretStore::set(std::string const& key, std::string const& secret)
{
    std::lock_guard lock(mutex_);
    secrets_[key] = secret;
}

bool InMemorySecretStore::remove(std::string const& key)
{
    std::lock_guard lock(mutex_);
    return secrets_.erase(key) > 0;
}

}
