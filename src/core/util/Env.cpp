#include "Env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace pjt {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

bool env_flag(const char* key, bool defval) {
  std::string v = get_env_or(key, "");
  if (v.empty()) return defval;
  std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

} // namespace pjt
