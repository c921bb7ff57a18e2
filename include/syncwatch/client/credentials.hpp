#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace syncwatch::client {

/**
 * @brief Source of the bearer credential used to open a stream
 *
 * Asked once per connection attempt. nullopt means "no credential", which
 * the reconnection controller treats as a hard stop.
 */
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    virtual std::optional<std::string> bearer_token() const = 0;
};

/// Token held in memory; may be replaced or cleared at any time
class StaticCredentialProvider : public CredentialProvider {
public:
    StaticCredentialProvider() = default;
    explicit StaticCredentialProvider(std::string token);

    std::optional<std::string> bearer_token() const override;

    void set_token(std::string token);
    void clear();

private:
    mutable std::mutex mutex_;
    std::optional<std::string> token_;
};

/// Reads the named environment variable on every call
class EnvironmentCredentialProvider : public CredentialProvider {
public:
    explicit EnvironmentCredentialProvider(std::string variable);

    std::optional<std::string> bearer_token() const override;

    const std::string& variable() const { return variable_; }

private:
    std::string variable_;
};

} // namespace syncwatch::client
