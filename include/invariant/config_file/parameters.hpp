#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "invariant/checks.hpp"

namespace invariant::config_file {
// accessors for parameters held in a json object. each one applies a check
// to the value for a key, using the key as the parameter name, and removes
// the key only once the check has passed
//
// a json null is treated the same as a missing key

namespace detail {
/// the value for key, or nullptr if it is missing or null
inline const nlohmann::json *find_value(const nlohmann::json &config, const std::string &key) {
  auto it = config.find(key);
  if (it == config.end() || it->is_null()) return nullptr;
  return &*it;
}
}  // namespace detail

/// get and remove key, throwing MissingValueError if it is missing or null
template <typename T>
T get(nlohmann::json &config, const std::string &key) {
  T value = check_not_null_or_throw(detail::find_value(config, key), key)->template get<T>();
  config.erase(key);
  return value;
}

/// get and remove a string which must be present and not blank
std::string get_not_empty(nlohmann::json &config, const std::string &key);

/// get and remove an integer which must be present and at least bound
int64_t get_lower_bounded(nlohmann::json &config, const std::string &key, int64_t bound);

}  // namespace invariant::config_file
