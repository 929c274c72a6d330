#pragma once

#include <corral/error.h>

#include <expected>
#include <string>
#include <type_traits>
#include <utility>

namespace corral {

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() {
    return {};
}

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return std::unexpected(Error(std::move(message)));
}

template<typename T = void>
Result<T> Err(Error error) {
    return std::unexpected(std::move(error));
}

// Chain: keeps the classification of the cause, prefixes the message
template<typename T = void, typename U>
Result<T> Err(const std::string& context, const Result<U>& cause) {
    return std::unexpected(Error(context, cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) {
        return {};
    }
    return result.error().message();
}

} // namespace corral
