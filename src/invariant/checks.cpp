#include "invariant/checks.hpp"

#include <utility>

namespace invariant {

namespace {
bool is_trimmed(char c) { return static_cast<unsigned char>(c) <= ' '; }

std::string empty_value_message(const std::string &parameter_name) {
  return "Value of parameter '" + parameter_name + "' cannot be empty";
}

std::string lower_bound_message(const std::string &parameter_name, int64_t bound) {
  return "Value of parameter '" + parameter_name + "' must be larger than or equal to " + std::to_string(bound);
}
}  // namespace

namespace detail {
std::string missing_value_message(const std::string &parameter_name) {
  return "Value of parameter '" + parameter_name + "' cannot be null";
}
}  // namespace detail

bool is_blank(std::string_view text) {
  // trimming both ends leaves nothing iff every character would be trimmed
  for (char c : text)
    if (!is_trimmed(c)) return false;
  return true;
}

const char *check_not_empty_or_throw(const char *text, const std::string &parameter_name) {
  if (text != nullptr && is_blank(text)) throw InvalidArgumentError(empty_value_message(parameter_name));
  return text;
}

std::string check_not_empty_or_throw(std::string text, const std::string &parameter_name) {
  if (is_blank(text)) throw InvalidArgumentError(empty_value_message(parameter_name));
  return text;
}

std::optional<std::string> check_not_empty_or_throw(std::optional<std::string> text,
                                                    const std::string &parameter_name) {
  if (text && is_blank(*text)) throw InvalidArgumentError(empty_value_message(parameter_name));
  return text;
}

const char *check_not_null_not_empty_or_throw(const char *text, const std::string &parameter_name) {
  return check_not_empty_or_throw(check_not_null_or_throw(text, parameter_name), parameter_name);
}

std::string check_not_null_not_empty_or_throw(std::optional<std::string> text, const std::string &parameter_name) {
  auto present = check_not_null_or_throw(std::move(text), parameter_name);
  return check_not_empty_or_throw(std::move(*present), parameter_name);
}

int64_t check_lower_bound_or_throw(int64_t value, const std::string &parameter_name, int64_t bound) {
  if (value < bound) throw InvalidArgumentError(lower_bound_message(parameter_name, bound));
  return value;
}

int32_t check_int_lower_bound_or_throw(int32_t value, const std::string &parameter_name, int32_t bound) {
  if (value < bound) throw InvalidArgumentError(lower_bound_message(parameter_name, bound));
  return value;
}

}  // namespace invariant
