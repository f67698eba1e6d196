#include "tags/TextUtil.hpp"

#include <string>

namespace textutil {

static bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// UTF-8 encodings of the non-ASCII White_Space code points
static const char* const kUnicodeWs[] = {
    "\xC2\x85",      // U+0085 next line
    "\xC2\xA0",      // U+00A0 no-break space
    "\xE1\x9A\x80",  // U+1680
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83",
    "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",  // U+2000..U+200A
    "\xE2\x80\xA8",  // U+2028 line separator
    "\xE2\x80\xA9",  // U+2029 paragraph separator
    "\xE2\x80\xAF",  // U+202F narrow no-break space
    "\xE2\x81\x9F",  // U+205F
    "\xE3\x80\x80",  // U+3000 ideographic space
};

// byte length of the whitespace starting at s[b], 0 if none
static size_t ws_prefix(const std::string& s, size_t b, size_t e) {
    if (is_ws(s[b])) return 1;
    for (const char* ws : kUnicodeWs) {
        const size_t n = std::char_traits<char>::length(ws);
        if (e - b >= n && s.compare(b, n, ws) == 0) return n;
    }
    return 0;
}

// byte length of the whitespace ending just before s[e], 0 if none
static size_t ws_suffix(const std::string& s, size_t b, size_t e) {
    if (is_ws(s[e - 1])) return 1;
    for (const char* ws : kUnicodeWs) {
        const size_t n = std::char_traits<char>::length(ws);
        if (e - b >= n && s.compare(e - n, n, ws) == 0) return n;
    }
    return 0;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string cur;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n' || c == '\r') {
            lines.push_back(cur);
            cur.clear();
            // "\r\n" is one terminator
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            cur.push_back(c);
        }
    }
    // a trailing terminator does not open another line
    if (!cur.empty()) lines.push_back(cur);
    return lines;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e) {
        const size_t n = ws_prefix(s, b, e);
        if (n == 0) break;
        b += n;
    }
    while (e > b) {
        const size_t n = ws_suffix(s, b, e);
        if (n == 0) break;
        e -= n;
    }
    return s.substr(b, e - b);
}

std::string strip_comment(const std::string& line) {
    const size_t pos = line.find('#');
    if (pos == std::string::npos) return line;
    return line.substr(0, pos);
}

}
