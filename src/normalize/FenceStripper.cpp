#include "normalize/FenceStripper.hpp"
#include "normalize/TextUtil.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace normalize {

static const char* kBullet = "\xE2\x80\xA2";  // U+2022

static const char* kOpeners[] = {
    "here is",
    "here's",
    "here\xE2\x80\x99s",  // curly apostrophe
    "sure,",
    "sure!",
    "i have rewritten",
    "i've rewritten",
    "the improved version",
    "below is",
};

struct EmphasisRule {
    std::string delim;
    bool lone;           // delimiter char must not touch another copy of itself
    bool word_bounded;   // must not sit inside a word (keeps snake_case intact)
};

static const EmphasisRule kRules[] = {
    {"**", false, false},
    {"__", false, true},
    {"*", true, false},
    {"_", true, true},
};

static bool is_ws(char c) { return std::isspace((unsigned char)c) != 0; }
static bool is_word(char c) { return std::isalnum((unsigned char)c) != 0; }

static bool opens_at(const std::string& s, size_t i, const EmphasisRule& r) {
    const size_t n = r.delim.size();
    if (s.compare(i, n, r.delim) != 0) return false;
    if (i + n >= s.size()) return false;

    const char mark = r.delim[0];
    const char next = s[i + n];
    if (is_ws(next)) return false;
    if (r.lone && next == mark) return false;

    if (i > 0) {
        const char prev = s[i - 1];
        if (r.lone && prev == mark) return false;
        if (r.word_bounded && (is_word(prev) || prev == mark)) return false;
    }
    return true;
}

static bool closes_at(const std::string& s, size_t i, const EmphasisRule& r) {
    const size_t n = r.delim.size();
    if (i == 0 || s.compare(i, n, r.delim) != 0) return false;

    const char mark = r.delim[0];
    const char prev = s[i - 1];
    if (is_ws(prev)) return false;
    if (r.lone && prev == mark) return false;

    if (i + n < s.size()) {
        const char next = s[i + n];
        if (r.lone && next == mark) return false;
        if (r.word_bounded && (is_word(next) || next == mark)) return false;
    }
    return true;
}

// One left-to-right pass over a single line. Closer positions depend only on
// the line, so they are computed once: next_close[j] is the first closer at or after j.
static std::string unwrap_emphasis(const std::string& line, const EmphasisRule& r) {
    const size_t n = r.delim.size();
    if (line.find(r.delim) == std::string::npos) return line;

    std::vector<size_t> next_close(line.size() + 1, std::string::npos);
    for (size_t j = line.size(); j-- > 0;) {
        next_close[j] = closes_at(line, j, r) ? j : next_close[j + 1];
    }

    std::string out;
    out.reserve(line.size());

    size_t i = 0;
    while (i < line.size()) {
        if (opens_at(line, i, r)) {
            const size_t close = next_close[i + n + 1];
            if (close != std::string::npos) {
                out.append(line, i + n, close - (i + n));
                i = close + n;
                continue;
            }
        }
        out.push_back(line[i]);
        ++i;
    }
    return out;
}

static std::string bulletize(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
    if (i + 1 >= line.size()) return line;
    if (line[i] != '-' && line[i] != '*') return line;
    if (line[i + 1] != ' ') return line;

    size_t k = i + 1;
    while (k < line.size() && line[k] == ' ') ++k;
    return line.substr(0, i) + kBullet + " " + line.substr(k);
}

static const char* match_opener(const std::string& text, size_t pos) {
    for (const char* opener : kOpeners) {
        if (textutil::starts_with_ci(text, pos, opener)) return opener;
    }
    return nullptr;
}

// Drops stacked openers ("Here is: Sure, ...: text") in one pass. Each opener
// must have its colon on the same line; the first one that doesn't stops the scan.
static std::string strip_preamble(const std::string& text) {
    size_t cut = 0;
    size_t start = 0;

    for (;;) {
        while (start < text.size() && is_ws(text[start])) ++start;
        if (!match_opener(text, start)) break;

        const size_t colon = text.find(':', start);
        if (colon == std::string::npos) break;
        if (std::find(text.begin() + start, text.begin() + colon, '\n') != text.begin() + colon) break;

        cut = colon + 1;
        start = cut;
    }
    return cut == 0 ? text : text.substr(cut);
}

static std::string clean_once(const std::string& text) {
    std::string s = textutil::trim(strip_preamble(text));

    std::vector<std::string> lines = textutil::split_lines(s);
    for (auto& line : lines) {
        for (const auto& rule : kRules) line = unwrap_emphasis(line, rule);
        line = bulletize(line);
    }
    return textutil::trim(textutil::join(lines, "\n"));
}

std::string remove_code_fences(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, 3, "```") == 0) {
            i += 3;
            if (text.compare(i, 4, "json") == 0) i += 4;
            continue;
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::string clean_markdown(const std::string& text) {
    // Every rule only removes markers or rewrites "-"/"*" line markers, so this terminates.
    std::string cur = text;
    for (;;) {
        std::string next = clean_once(cur);
        if (next == cur) return next;
        cur = std::move(next);
    }
}

std::string strip(const std::string& text) {
    if (text.empty()) return "";

    std::string cur = text;
    for (;;) {
        std::string next = clean_markdown(remove_code_fences(cur));
        if (next == cur) return next;
        cur = std::move(next);
    }
}

}  // namespace normalize
