#pragma once
#include <string>
#include <vector>

namespace textutil {

// strip spaces, tabs and line breaks from both ends
std::string trim(const std::string& s);

// case-insensitive (ASCII) prefix test starting at `pos`
bool starts_with_ci(const std::string& s, size_t pos, const std::string& prefix);

// split on '\n', keeping empty lines; "" -> {""}
std::vector<std::string> split_lines(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

}
