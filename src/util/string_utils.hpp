#pragma once

#include <string>
#include <vector>

namespace StringUtils {
// Split on every delimiter; empty fields are kept.
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, char delimiter);
bool ends_with(const std::string& str, const std::string& suffix);
bool iequals(const std::string& a, const std::string& b);
}
