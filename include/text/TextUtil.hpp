#pragma once
#include <string>

namespace textutil {

// Unicode lowercase (ICU root locale). Invalid UTF-8 becomes U+FFFD.
std::string to_lower(const std::string& s);

bool contains(const std::string& haystack, const std::string& needle);

// replace every occurrence of `from` with `to`, returns number of replacements
size_t replace_all(std::string& s, const std::string& from, const std::string& to);

std::string trim(const std::string& s);

// single code point -> UTF-8; throws std::invalid_argument for surrogates / out of range
std::string utf8_from_code_point(unsigned long cp);

// "U+200B" / "u+200b" / "200B" -> code point; throws std::invalid_argument
unsigned long parse_code_point(const std::string& s);

// first code point of a UTF-8 string formatted as "U+XXXX"
std::string code_point_label(const std::string& utf8);

}
