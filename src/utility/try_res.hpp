#pragma once
#include <concepts>
#include <expected>

/**
 * @brief Concept to detect Result-like types (has value(), error(), operator bool())
 */
template <typename T>
concept ResultLike = requires(T t) {
    { t.has_value() } -> std::convertible_to<bool>;
    { t.error() };
};

/**
 * @brief Propagates the error of a sable::Result, otherwise yields its value.
 * Relies on GNU statement expressions.
 */
#define __Try(expr) \
({ \
    auto&& result = (expr); \
    static_assert(ResultLike<decltype(result)>, "__Try expects a Result-like type"); \
    if (!result) return std::unexpected(result.error()); \
    std::move(result.value()); \
})

/**
 * @brief For Result<void> and for results whose value is not needed.
 */
#define __TryVoid(expr) \
do { \
    auto&& result = (expr); \
    static_assert(ResultLike<decltype(result)>, "__TryVoid expects a Result-like type"); \
    if (!result) return std::unexpected(result.error()); \
} while(0)

