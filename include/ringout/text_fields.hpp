#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace ringout {

// Field helpers shared by the config and replay readers. Parsers never
// throw: `ok` reports whether the whole field was consumed.

std::string trim(std::string s);
std::string lower(std::string s);

// Splits on ',' and trims every column. No quoting.
std::vector<std::string> split_csv_line(const std::string& line);

double to_double_safe(const std::string& s, bool& ok);
long long to_int_safe(const std::string& s, bool& ok);
// Rejects signs; base 16 reads checksums.
std::uint64_t to_u64_safe(const std::string& s, bool& ok, int base = 10);

} // namespace ringout
