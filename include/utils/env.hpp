#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

namespace utils {

inline std::string get_env(const std::string &env_var, const std::string &default_value) {
  const char *env_value = std::getenv(env_var.c_str());
  return env_value ? std::string(env_value) : default_value;
}

inline uint64_t get_env_u64(const std::string &env_var, uint64_t default_value) {
  const char *env_value = std::getenv(env_var.c_str());
  if (env_value == nullptr || *env_value == '\0') {
    return default_value;
  }
  try {
    return std::stoull(env_value);
  } catch (const std::exception &) {
    std::cerr << "Ignoring non-numeric value for " << env_var << ": " << env_value << std::endl;
    return default_value;
  }
}

} // namespace utils
