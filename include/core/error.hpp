#pragma once

#include <optional>
#include <string>
#include <utility>

namespace ldapauth {

/**
 * @brief Failure classes of a login attempt
 *
 * INVALID_CREDENTIALS deliberately covers "unknown user" and "bad password"
 * so callers cannot enumerate usernames.
 */
enum class AuthErrorCode {
    NONE,
    INVALID_CREDENTIALS,
    DIRECTORY_UNREACHABLE,
    MALFORMED_DIRECTORY_RESPONSE,
    CONFIGURATION_MISSING
};

[[nodiscard]] inline constexpr const char* error_code_name(AuthErrorCode code) {
    switch (code) {
        case AuthErrorCode::NONE:                         return "none";
        case AuthErrorCode::INVALID_CREDENTIALS:          return "invalid_credentials";
        case AuthErrorCode::DIRECTORY_UNREACHABLE:        return "directory_unreachable";
        case AuthErrorCode::MALFORMED_DIRECTORY_RESPONSE: return "malformed_directory_response";
        case AuthErrorCode::CONFIGURATION_MISSING:        return "configuration_missing";
    }
    return "unknown";
}

struct AuthError {
    AuthErrorCode code = AuthErrorCode::NONE;
    std::string message;
    std::string field;  // Set for CONFIGURATION_MISSING only

    static AuthError invalid_credentials() {
        return {AuthErrorCode::INVALID_CREDENTIALS, "Invalid username or password", {}};
    }

    static AuthError configuration_missing(std::string key) {
        std::string msg = "Missing required configuration key: " + key;
        return {AuthErrorCode::CONFIGURATION_MISSING, std::move(msg), std::move(key)};
    }
};

/**
 * @brief Message safe to show the authenticating end user.
 *
 * Detail stays in the logs; the directory's own wording never reaches the
 * response.
 */
[[nodiscard]] inline std::string user_facing_message(const AuthError& error) {
    if (error.code == AuthErrorCode::INVALID_CREDENTIALS) {
        return "Incorrect login details";
    }
    return "Login is currently unavailable, please contact your administrator";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(AuthErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_.code = code;
        r.error_.message = std::move(message);
        return r;
    }

    static Result error(AuthError err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    /// Forward the failure of a differently-typed result.
    template<typename U>
    static Result forward(const Result<U>& other) {
        return error(other.error());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const AuthError& error() const { return error_; }
    AuthErrorCode error_code() const { return error_.code; }
    const std::string& error_message() const { return error_.message; }

private:
    bool success_ = false;
    std::optional<T> value_;
    AuthError error_;
};

} // namespace ldapauth
