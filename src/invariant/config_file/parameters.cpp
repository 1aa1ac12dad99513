#include "invariant/config_file/parameters.hpp"

namespace invariant::config_file {

std::string get_not_empty(nlohmann::json &config, const std::string &key) {
  const nlohmann::json *found = check_not_null_or_throw(detail::find_value(config, key), key);
  std::string value = check_not_empty_or_throw(found->get<std::string>(), key);
  config.erase(key);
  return value;
}

int64_t get_lower_bounded(nlohmann::json &config, const std::string &key, int64_t bound) {
  const nlohmann::json *found = check_not_null_or_throw(detail::find_value(config, key), key);
  int64_t value = check_lower_bound_or_throw(found->get<int64_t>(), key, bound);
  config.erase(key);
  return value;
}

}  // namespace invariant::config_file
