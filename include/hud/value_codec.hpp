// Text helpers shared by the MangoHud config reader and writer.
#pragma once
#include <string>
#include <vector>

namespace mo {

std::string trim(const std::string& s);
std::string to_lower(std::string s);

// Split on any character in `separators`, trimming each token. Empty tokens
// are dropped.
std::vector<std::string> split_list(const std::string& s, const std::string& separators = ",+");
std::string join_list(const std::vector<std::string>& items, char sep = ',');

// Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
bool parse_bool(const std::string& s);

// Whole-string integer parse with inclusive range check.
long long parse_int(const std::string& s, long long min_value, long long max_value);
double parse_float(const std::string& s);

// Shortest decimal text that reads back to the same float, without a
// trailing ".0" for whole values.
std::string format_float(double v);

} // namespace mo
