#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "invariant/exceptions.hpp"

namespace invariant {

namespace detail {
/// types for which check_not_null_or_throw has a meaning of "absent"
template <typename T>
struct IsNullable : std::bool_constant<std::is_pointer_v<T> || std::is_null_pointer_v<T>> {};

template <typename T>
struct IsNullable<std::optional<T>> : std::true_type {};

template <typename T>
struct IsNullable<std::shared_ptr<T>> : std::true_type {};

template <typename T, typename D>
struct IsNullable<std::unique_ptr<T, D>> : std::true_type {};

template <typename R, typename... Args>
struct IsNullable<std::function<R(Args...)>> : std::true_type {};

template <typename T>
bool is_null(const T &value) {
  if constexpr (std::is_pointer_v<T> || std::is_null_pointer_v<T>)
    return value == nullptr;
  else
    return !static_cast<bool>(value);
}

std::string missing_value_message(const std::string &parameter_name);
}  // namespace detail

/// true if text has zero length once characters <= ' ' (space and the ASCII
/// control characters) are trimmed from both ends
bool is_blank(std::string_view text);

/// check that value is present, returning it unchanged
///
/// value may be nullptr, a raw pointer, shared_ptr, unique_ptr, std::function or
/// std::optional; move-only values must be moved in, and are moved back out
///
/// throws MissingValueError ("Value of parameter '<name>' cannot be null") if
/// value is absent
template <typename T>
T check_not_null_or_throw(T value, const std::string &parameter_name) {
  static_assert(detail::IsNullable<T>::value, "check_not_null_or_throw needs a pointer-like or optional value");
  if (detail::is_null(value)) throw MissingValueError(detail::missing_value_message(parameter_name));
  return value;
}

/// check that text is not blank, returning it unchanged
///
/// a null pointer is not checked, and is returned as is
///
/// throws InvalidArgumentError ("Value of parameter '<name>' cannot be empty")
/// if text is blank
const char *check_not_empty_or_throw(const char *text, const std::string &parameter_name);
std::string check_not_empty_or_throw(std::string text, const std::string &parameter_name);
std::optional<std::string> check_not_empty_or_throw(std::optional<std::string> text,
                                                    const std::string &parameter_name);

/// check_not_null_or_throw followed by check_not_empty_or_throw
const char *check_not_null_not_empty_or_throw(const char *text, const std::string &parameter_name);

/// as above, but as the result is known to be present the contained string is
/// returned rather than the optional
std::string check_not_null_not_empty_or_throw(std::optional<std::string> text, const std::string &parameter_name);

/// check that value >= bound, returning value unchanged
///
/// throws InvalidArgumentError ("Value of parameter '<name>' must be larger
/// than or equal to <bound>") otherwise
int64_t check_lower_bound_or_throw(int64_t value, const std::string &parameter_name, int64_t bound);

/// 32 bit version of check_lower_bound_or_throw
int32_t check_int_lower_bound_or_throw(int32_t value, const std::string &parameter_name, int32_t bound);

}  // namespace invariant
