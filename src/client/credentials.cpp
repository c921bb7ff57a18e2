#include "syncwatch/client/credentials.hpp"

#include <cstdlib>

namespace syncwatch::client {

StaticCredentialProvider::StaticCredentialProvider(std::string token) {
    if (!token.empty()) {
        token_ = std::move(token);
    }
}

std::optional<std::string> StaticCredentialProvider::bearer_token() const {
    std::lock_guard lock(mutex_);
    return token_;
}

void StaticCredentialProvider::set_token(std::string token) {
    std::lock_guard lock(mutex_);
    if (token.empty()) {
        token_.reset();
    } else {
        token_ = std::move(token);
    }
}

void StaticCredentialProvider::clear() {
    std::lock_guard lock(mutex_);
    token_.reset();
}

EnvironmentCredentialProvider::EnvironmentCredentialProvider(std::string variable)
    : variable_(std::move(variable)) {}

std::optional<std::string> EnvironmentCredentialProvider::bearer_token() const {
    const char* value = std::getenv(variable_.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace syncwatch::client
