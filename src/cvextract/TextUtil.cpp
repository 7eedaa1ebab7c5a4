#include "cvextract/TextUtil.hpp"

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <cctype>

namespace textutil {

// decode one code point starting at byte i, advancing i; invalid bytes yield -1
static UChar32 next_cp(const std::string& s, int32_t& i) {
    const auto* p = reinterpret_cast<const uint8_t*>(s.data());
    const auto n = static_cast<int32_t>(s.size());
    UChar32 c = 0;
    U8_NEXT(p, i, n, c);
    return c;
}

static bool is_space_cp(UChar32 c) {
    return c >= 0 && (u_isUWhiteSpace(c) || c == 0x00A0);
}

std::string trim(const std::string& s) {
    int32_t i = 0;
    const auto n = static_cast<int32_t>(s.size());
    int32_t first = n;
    int32_t last_end = 0;
    while (i < n) {
        const int32_t start = i;
        const UChar32 c = next_cp(s, i);
        if (!is_space_cp(c)) {
            if (first == n) first = start;
            last_end = i;
        }
    }
    if (first >= last_end) return "";
    return s.substr(static_cast<size_t>(first), static_cast<size_t>(last_end - first));
}

std::string to_lower(const std::string& s) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(icu::StringPiece(s));
    u.toLower(icu::Locale::getRoot());
    std::string out;
    u.toUTF8String(out);
    return out;
}

std::string fold(const std::string& s) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(icu::StringPiece(s));
    u.toLower(icu::Locale::getRoot());

    UErrorCode err = U_ZERO_ERROR;
    const icu::Normalizer2* nfkd = icu::Normalizer2::getNFKDInstance(err);
    if (U_FAILURE(err) || nfkd == nullptr) {
        std::string out;
        u.toUTF8String(out);
        return out;
    }

    icu::UnicodeString decomposed = nfkd->normalize(u, err);
    if (U_FAILURE(err)) {
        std::string out;
        u.toUTF8String(out);
        return out;
    }

    icu::UnicodeString stripped;
    for (int32_t i = 0; i < decomposed.length();) {
        const UChar32 c = decomposed.char32At(i);
        if (u_charType(c) != U_NON_SPACING_MARK) stripped.append(c);
        i += U16_LENGTH(c);
    }

    std::string out;
    stripped.toUTF8String(out);
    return out;
}

std::string normalize_heading(const std::string& s) {
    const std::string folded = fold(s);

    std::string out;
    out.reserve(folded.size());
    bool prev_space = true;

    int32_t i = 0;
    const auto n = static_cast<int32_t>(folded.size());
    while (i < n) {
        const int32_t start = i;
        const UChar32 c = next_cp(folded, i);
        const bool keep = c >= 0 && (u_isalnum(c) || c == '_' || c == '&');
        if (keep) {
            out.append(folded, static_cast<size_t>(start), static_cast<size_t>(i - start));
            prev_space = false;
        } else if (!prev_space) {
            out.push_back(' ');
            prev_space = true;
        }
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::string cur;

    int32_t i = 0;
    const auto n = static_cast<int32_t>(s.size());
    while (i < n) {
        const int32_t start = i;
        const UChar32 c = next_cp(s, i);
        if (is_space_cp(c)) {
            if (!cur.empty()) {
                words.push_back(cur);
                cur.clear();
            }
        } else {
            cur.append(s, static_cast<size_t>(start), static_cast<size_t>(i - start));
        }
    }
    if (!cur.empty()) words.push_back(cur);
    return words;
}

std::vector<std::string> split_any(const std::string& s, const std::vector<std::string>& delimiters) {
    std::vector<std::string> parts;
    std::string cur;

    size_t i = 0;
    while (i < s.size()) {
        bool matched = false;
        for (const auto& d : delimiters) {
            if (!d.empty() && s.compare(i, d.size(), d) == 0) {
                parts.push_back(cur);
                cur.clear();
                i += d.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            cur.push_back(s[i]);
            ++i;
        }
    }
    parts.push_back(cur);
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

size_t find_ci(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return 0;
    if (needle.size() > haystack.size()) return std::string::npos;

    const std::string want = to_lower(needle);
    int32_t i = 0;
    const auto n = static_cast<int32_t>(haystack.size());
    while (i < n) {
        const auto start = static_cast<size_t>(i);
        if (start + needle.size() > haystack.size()) break;
        if (to_lower(haystack.substr(start, needle.size())) == want) return start;
        next_cp(haystack, i);
    }
    return std::string::npos;
}

size_t char_count(const std::string& s) {
    size_t count = 0;
    int32_t i = 0;
    const auto n = static_cast<int32_t>(s.size());
    while (i < n) {
        next_cp(s, i);
        ++count;
    }
    return count;
}

std::string prefix(const std::string& s, size_t n) {
    int32_t i = 0;
    const auto len = static_cast<int32_t>(s.size());
    size_t taken = 0;
    while (i < len && taken < n) {
        next_cp(s, i);
        ++taken;
    }
    return s.substr(0, static_cast<size_t>(i));
}

bool has_digit(const std::string& s) {
    int32_t i = 0;
    const auto n = static_cast<int32_t>(s.size());
    while (i < n) {
        const UChar32 c = next_cp(s, i);
        if (c >= 0 && u_isdigit(c)) return true;
    }
    return false;
}

bool starts_upper(const std::string& s) {
    if (s.empty()) return false;
    int32_t i = 0;
    const UChar32 c = next_cp(s, i);
    return c >= 0 && (u_isupper(c) || u_istitle(c));
}

bool is_all_upper(const std::string& s) {
    bool any_cased = false;
    int32_t i = 0;
    const auto n = static_cast<int32_t>(s.size());
    while (i < n) {
        const UChar32 c = next_cp(s, i);
        if (c < 0) continue;
        if (u_islower(c)) return false;
        if (u_isupper(c) || u_istitle(c)) any_cased = true;
    }
    return any_cased;
}

bool is_all_alpha(const std::string& s) {
    if (s.empty()) return false;
    int32_t i = 0;
    const auto n = static_cast<int32_t>(s.size());
    while (i < n) {
        const UChar32 c = next_cp(s, i);
        if (c < 0 || !u_isalpha(c)) return false;
    }
    return true;
}

std::string strip_leading(const std::string& s, const std::vector<std::string>& markers) {
    size_t pos = 0;
    bool progressed = true;
    while (progressed && pos < s.size()) {
        progressed = false;
        if (std::isspace(static_cast<unsigned char>(s[pos]))) {
            ++pos;
            progressed = true;
            continue;
        }
        for (const auto& m : markers) {
            if (!m.empty() && s.compare(pos, m.size(), m) == 0) {
                pos += m.size();
                progressed = true;
                break;
            }
        }
    }
    return trim(s.substr(pos));
}

std::string rstrip_chars(const std::string& s, const std::string& chars) {
    size_t end = s.size();
    while (end > 0 && chars.find(s[end - 1]) != std::string::npos) --end;
    return s.substr(0, end);
}

}  // namespace textutil
