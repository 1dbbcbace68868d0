#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace httpauth
{

/**
 * Persistent secret storage, used for OIDC tokens.
 */
class ISecretStore
{
public:
    virtual ~ISecretStore() = default;

    virtual std::optional<std::string> get(std::string const& key) = 0;
    virtual void set(std::string const& key, std::string const& secret) = 0;

    /**
     * Returns `true` if a secret was removed.
     */
    virtual bool remove(std::string const& key) = 0;
};

/**
 * Secret store backed by the system keychain. Every call may block
 * on user interaction and is bounded by KEYCHAIN_TIMEOUT.
 * Keys are stored as the keychain user below the given service.
 */
class KeychainSecretStore : public ISecretStore
{
public:
    explicit KeychainSecretStore(std::string service = "httpauth-oidc");

    std::optional<std::string> get(std::string const& key) override;
    void set(std::string const& key, std::string const& secret) override;
    bool remove(std::string const& key) override;

    /**
     * Read a password which a settings file references by
     * its keychain service name.
     * Throws ConfigurationError if it cannot be found.
     */
    static std::string loadPassword(std::string const& service, std::string const& user);

private:
    std::string service_;
};

/**
 * Process-local secret store.
 */
class InMemorySecretStore : public ISecretStore
{
public:
    std::optional<std::string> get(std::string const& key) override;
    void set(std::string const& key, std::string const& secret) override;
    bool remove(std::string const& key) override;

private:
    std::mutex mutex_;
    std::map<std::string, std::string> secrets_;
};

}
