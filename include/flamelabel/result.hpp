#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace flamelabel {

//=============================================================================
// Error - message plus an optional chained cause
//=============================================================================
class Error {
public:
    explicit Error(std::string message)
        : _message(std::move(message)) {}

    Error(std::string message, std::shared_ptr<const Error> cause)
        : _message(std::move(message)), _cause(std::move(cause)) {}

    const std::string& message() const { return _message; }
    const std::shared_ptr<const Error>& cause() const { return _cause; }

    /// "outer: inner: innermost"
    std::string fullMessage() const {
        std::string out = _message;
        for (auto c = _cause; c; c = c->cause()) {
            out += ": ";
            out += c->message();
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() {
    return {};
}

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::in_place, std::forward<T>(value));
}

// The type parameter only documents the Result type being returned;
// std::unexpected converts to any Result<U>.
template<typename T = void>
std::unexpected<Error> Err(std::string message) {
    return std::unexpected<Error>(Error(std::move(message)));
}

template<typename T = void, typename U>
std::unexpected<Error> Err(std::string message, const Result<U>& cause) {
    if (cause) {
        return std::unexpected<Error>(Error(std::move(message)));
    }
    return std::unexpected<Error>(
        Error(std::move(message), std::make_shared<const Error>(cause.error())));
}

inline std::string error_msg(const Error& error) {
    return error.fullMessage();
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().fullMessage();
}

} // namespace flamelabel
