#include "Time.hpp"

#include <cctype>
#include <ctime>

namespace pjt {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

std::string current_timestamp() {
  return format_timestamp(std::chrono::system_clock::now());
}

bool is_iso_date(const std::string& s) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
  for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  const int year  = std::stoi(s.substr(0, 4));
  const int month = std::stoi(s.substr(5, 2));
  const int day   = std::stoi(s.substr(8, 2));
  if (month < 1 || month > 12 || day < 1) return false;

  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  int maxDay = kDays[month - 1];
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month == 2 && leap) maxDay = 29;
  return day <= maxDay;
}

} // namespace pjt
