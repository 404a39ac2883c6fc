#include <ringout/text_fields.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ringout {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

double to_double_safe(const std::string& s, bool& ok) {
  try {
    std::size_t idx = 0;
    const double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0.0;
  }
}

long long to_int_safe(const std::string& s, bool& ok) {
  try {
    std::size_t idx = 0;
    const long long v = std::stoll(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0;
  }
}

std::uint64_t to_u64_safe(const std::string& s, bool& ok, int base) {
  if (s.empty() || s[0] == '-' || s[0] == '+') { ok = false; return 0; }
  try {
    std::size_t idx = 0;
    const unsigned long long v = std::stoull(s, &idx, base);
    ok = idx == s.size();
    return static_cast<std::uint64_t>(v);
  } catch (const std::exception&) {
    ok = false;
    return 0;
  }
}

} // namespace ringout
