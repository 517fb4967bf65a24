#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace utils {

/**
 * @brief Every enumerator strictly between _START and _COUNT, in declaration order.
 */
template <typename EnumType> std::vector<EnumType> get_enum_vector() {
  static_assert(std::is_enum_v<EnumType>, "Template parameter must be an enum type");
  static_assert(std::is_same_v<decltype(EnumType::_COUNT), EnumType>,
                "Enum type must have a _COUNT member to indicate the number of "
                "enum values");
  static_assert(std::is_same_v<decltype(EnumType::_START), EnumType>,
                "Enum type must have a _START member to indicate the starting "
                "enum value");
  std::vector<EnumType> values;
  for (int i = static_cast<int>(EnumType::_START) + 1; i < static_cast<int>(EnumType::_COUNT);
       ++i) {
    values.push_back(static_cast<EnumType>(i));
  }
  return values;
}

inline std::pair<std::string, int> parse_endpoint(const std::string &endpoint) {
  size_t colon_pos = endpoint.rfind(':');
  if (colon_pos == std::string::npos) {
    throw std::invalid_argument("Invalid endpoint format: " + endpoint);
  }

  std::string host = endpoint.substr(0, colon_pos);
  int port = std::stoi(endpoint.substr(colon_pos + 1));
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("Invalid port in endpoint: " + endpoint);
  }

  return {host, port};
}

} // namespace utils
