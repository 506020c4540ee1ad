#include "normalize/TextUtil.hpp"

namespace textutil {

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && is_space(s[i])) ++i;
    size_t j = s.size();
    while (j > i && is_space(s[j - 1])) --j;
    return s.substr(i, j - i);
}

bool starts_with_ci(const std::string& s, size_t pos, const std::string& prefix) {
    if (pos > s.size() || s.size() - pos < prefix.size()) return false;
    for (size_t k = 0; k < prefix.size(); ++k) {
        char a = s[pos + k];
        char b = prefix[k];
        if (a >= 'A' && a <= 'Z') a = (char)(a - 'A' + 'a');
        if (b >= 'A' && b <= 'Z') b = (char)(b - 'A' + 'a');
        if (a != b) return false;
    }
    return true;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    std::string cur;

    for (char c : s) {
        if (c == '\n') {
            lines.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    lines.push_back(cur);
    return lines;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

}
