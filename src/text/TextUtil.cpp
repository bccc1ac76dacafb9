#include "text/TextUtil.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace textutil {

std::string to_lower(const std::string& s) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(s);
    u.toLower(icu::Locale::getRoot());
    std::string out;
    u.toUTF8String(out);
    return out;
}

bool contains(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    return haystack.find(needle) != std::string::npos;
}

size_t replace_all(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return 0;

    size_t n = 0;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
        ++n;
    }
    return n;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace((unsigned char)s[i])) ++i;
    while (j > i && std::isspace((unsigned char)s[j - 1])) --j;
    return s.substr(i, j - i);
}

std::string utf8_from_code_point(unsigned long cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        throw std::invalid_argument("not a Unicode scalar value");
    }
    icu::UnicodeString u(static_cast<UChar32>(cp));
    std::string out;
    u.toUTF8String(out);
    return out;
}

unsigned long parse_code_point(const std::string& s) {
    std::string hex = trim(s);
    if (hex.size() > 2 && (hex[0] == 'U' || hex[0] == 'u') && hex[1] == '+') hex = hex.substr(2);
    if (hex.empty() || hex.size() > 6) throw std::invalid_argument("bad code point: " + s);

    unsigned long cp = 0;
    for (char c : hex) {
        if (!std::isxdigit((unsigned char)c)) throw std::invalid_argument("bad code point: " + s);
        cp = cp * 16 + (unsigned long)(std::isdigit((unsigned char)c) ? c - '0' : std::tolower((unsigned char)c) - 'a' + 10);
    }
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        throw std::invalid_argument("not a Unicode scalar value: " + s);
    }
    return cp;
}

std::string code_point_label(const std::string& utf8) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(utf8);
    if (u.isEmpty()) return "";
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", (unsigned)u.char32At(0));
    return buf;
}

}
