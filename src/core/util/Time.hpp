#pragma once
#include <chrono>
#include <string>

namespace pjt {

// UTC "YYYY-MM-DD HH:MM:SS"
std::string format_timestamp(std::chrono::system_clock::time_point tp);
std::string current_timestamp();

// Strict "YYYY-MM-DD" check including month lengths.
bool is_iso_date(const std::string& s);

} // namespace pjt
