#pragma once

#include <cstdlib>
#include <iostream>
#include <string>

namespace keys {

inline bool session_debug_enabled() {
  static bool enabled = [] {
    const char* env = std::getenv("KEYS_DEBUG_SESSION");
    if (!env) {
      return false;
    }
    std::string value(env);
    return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
  }();
  return enabled;
}

inline void session_debug(const std::string& message) {
  if (session_debug_enabled()) {
    std::cerr << "[session] " << message << std::endl;
  }
}

} // namespace keys
