#pragma once
#include <string>

namespace pjt {

std::string get_env_or(const char* key, const std::string& defval);

// "1", "true", "yes", "on" (any case) -> true; unset -> defval.
bool env_flag(const char* key, bool defval);

} // namespace pjt
