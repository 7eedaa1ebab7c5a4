#pragma once
#include <string>
#include <vector>

// UTF-8 aware string helpers. Everything here is total: bad UTF-8 degrades to
// the input rather than failing.
namespace textutil {

std::string trim(const std::string& s);

// unicode lowercase (root locale)
std::string to_lower(const std::string& s);

// lowercase + compatibility decomposition with combining marks dropped,
// so "EXPÉRIENCE" and "experience" fold to the same key
std::string fold(const std::string& s);

// fold, turn everything except letters/digits/_/& into spaces, collapse spaces
std::string normalize_heading(const std::string& s);

// split on unicode whitespace, no empty tokens
std::vector<std::string> split_words(const std::string& s);

// split on any of the given (possibly multi-byte) delimiters; keeps empty parts
std::vector<std::string> split_any(const std::string& s, const std::vector<std::string>& delimiters);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);
bool contains(const std::string& haystack, const std::string& needle);

// case-insensitive substring search; returns a byte offset into haystack or npos
size_t find_ci(const std::string& haystack, const std::string& needle);

// number of code points
size_t char_count(const std::string& s);

// first n code points
std::string prefix(const std::string& s, size_t n);

bool has_digit(const std::string& s);

// first code point is upper/title case
bool starts_upper(const std::string& s);

// at least one cased character and no lowercase ones
bool is_all_upper(const std::string& s);

// non-empty and every code point alphabetic
bool is_all_alpha(const std::string& s);

// strip any of the given leading markers and whitespace, repeatedly
std::string strip_leading(const std::string& s, const std::vector<std::string>& markers);

// strip trailing ASCII characters contained in `chars`
std::string rstrip_chars(const std::string& s, const std::string& chars);

}  // namespace textutil
