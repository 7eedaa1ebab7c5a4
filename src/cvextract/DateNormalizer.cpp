#include "cvextract/DateNormalizer.hpp"

#include "cvextract/TextUtil.hpp"
#include "cvextract/Vocabulary.hpp"

#include <cctype>
#include <cstdio>
#include <iterator>
#include <vector>

namespace cvextract {

namespace {

enum class TokKind { Word, Year, YearMonth, Sep, Other };

struct DateTok {
    std::string raw;    // as printed
    std::string core;   // surrounding punctuation removed
    TokKind kind = TokKind::Other;
};

// a single date element starting at some token: its raw text and the index after it
struct Element {
    std::string raw;
    size_t next = 0;
};

const char* const kDashes[] = {"-", "\xE2\x80\x93", "\xE2\x80\x94"};  // hyphen, en dash, em dash

bool all_ascii_digits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

bool is_year(const std::string& s) {
    return s.size() == 4 && all_ascii_digits(s);
}

bool is_year_month(const std::string& s) {
    if (s.size() != 7 || s[4] != '-') return false;
    const std::string y = s.substr(0, 4);
    const std::string m = s.substr(5, 2);
    if (!is_year(y) || !all_ascii_digits(m)) return false;
    const int month = (m[0] - '0') * 10 + (m[1] - '0');
    return month >= 1 && month <= 12;
}

std::string strip_punct(const std::string& s) {
    static const std::string kPunct = "()[]{},.;:\"'";
    size_t a = 0;
    size_t b = s.size();
    while (a < b && kPunct.find(s[a]) != std::string::npos) ++a;
    while (b > a && kPunct.find(s[b - 1]) != std::string::npos) --b;
    return s.substr(a, b - a);
}

// "12/2019" -> "2019-12"; "1/15/2019" -> "2019"; anything else -> ""
std::string slash_date(const std::string& s) {
    const size_t slash = s.rfind('/');
    if (slash == std::string::npos || slash == 0) return "";
    const std::string year = s.substr(slash + 1);
    if (!is_year(year)) return "";

    const std::string head = s.substr(0, slash);
    if (head.size() <= 2 && all_ascii_digits(head)) {
        const int month = std::stoi(head);
        if (month >= 1 && month <= 12) return year + "-" + (month < 10 ? "0" : "") + std::to_string(month);
        return "";
    }
    const size_t first = head.find('/');
    if (first == std::string::npos || head.find('/', first + 1) != std::string::npos) return "";
    if (first == 0 || first > 2 || head.size() - first - 1 > 2) return "";
    if (!all_ascii_digits(head.substr(0, first)) || !all_ascii_digits(head.substr(first + 1))) return "";
    return year;
}

DateTok make_tok(const std::string& raw) {
    DateTok t;
    t.raw = raw;
    t.core = strip_punct(raw);
    const std::string slashed = slash_date(t.core);
    if (!slashed.empty()) {
        t.core = slashed;
        t.kind = is_year(slashed) ? TokKind::Year : TokKind::YearMonth;
    } else if (is_year(t.core)) {
        t.kind = TokKind::Year;
    } else if (is_year_month(t.core)) {
        t.kind = TokKind::YearMonth;
    } else if (textutil::is_all_alpha(t.core)) {
        t.kind = TokKind::Word;
    }
    return t;
}

DateTok sep_tok(const std::string& dash) {
    DateTok sep;
    sep.raw = dash;
    sep.core = dash;
    sep.kind = TokKind::Sep;
    return sep;
}

// splits on every dash in `dashes`, emitting a separator token for each
void push_dash_split(const std::string& word, const std::vector<std::string>& dashes, std::vector<DateTok>& out) {
    std::string cur;
    size_t i = 0;
    while (i < word.size()) {
        bool dash = false;
        for (const auto& ds : dashes) {
            if (word.compare(i, ds.size(), ds) == 0) {
                if (!cur.empty()) out.push_back(make_tok(cur));
                cur.clear();
                out.push_back(sep_tok(ds));
                i += ds.size();
                dash = true;
                break;
            }
        }
        if (!dash) {
            cur.push_back(word[i]);
            ++i;
        }
    }
    if (!cur.empty()) out.push_back(make_tok(cur));
}

std::vector<DateTok> tokenize_dates(const std::string& text) {
    std::vector<DateTok> toks;
    static const std::vector<std::string> all_dashes(std::begin(kDashes), std::end(kDashes));
    static const std::vector<std::string> long_dashes = {kDashes[1], kDashes[2]};

    for (const auto& word : textutil::split_words(text)) {
        // en/em dashes first so "2021-06–2022-01" keeps both months
        std::vector<DateTok> pieces;
        push_dash_split(word, long_dashes, pieces);
        for (const auto& piece : pieces) {
            if (piece.kind == TokKind::Sep || piece.kind == TokKind::YearMonth) {
                toks.push_back(piece);
            } else {
                push_dash_split(piece.raw, all_dashes, toks);
            }
        }
    }

    for (auto& t : toks) {
        if (t.kind != TokKind::Word) continue;
        const std::string folded = textutil::fold(t.core);
        for (const auto& w : vocab::range_words()) {
            if (folded == w) {
                t.kind = TokKind::Sep;
                break;
            }
        }
    }
    return toks;
}

std::optional<Element> element_at(const std::vector<DateTok>& toks, size_t i) {
    if (i >= toks.size()) return std::nullopt;
    const DateTok& t = toks[i];
    if (t.kind == TokKind::Year || t.kind == TokKind::YearMonth) {
        return Element{t.core, i + 1};
    }
    if (t.kind == TokKind::Word && i + 1 < toks.size() && toks[i + 1].kind == TokKind::Year) {
        const size_t n = textutil::char_count(t.core);
        if (n >= 3 && n <= 12) return Element{t.core + " " + toks[i + 1].core, i + 2};
    }
    return std::nullopt;
}

// open-ended marker spanning 1..3 tokens
std::optional<Element> present_at(const std::vector<DateTok>& toks, size_t i) {
    for (size_t span = 3; span >= 1; --span) {
        if (i + span > toks.size()) continue;
        std::vector<std::string> raw;
        std::vector<std::string> core;
        for (size_t k = i; k < i + span; ++k) {
            raw.push_back(toks[k].raw);
            core.push_back(toks[k].core);
        }
        const std::string raw_text = textutil::join(raw, " ");
        if (vocab::is_present_marker(raw_text)) return Element{raw_text, i + span};
        if (vocab::is_present_marker(textutil::join(core, " "))) return Element{raw_text, i + span};
    }
    return std::nullopt;
}

}  // namespace

std::optional<RawDateRange> find_date_range(const std::string& text) {
    const auto toks = tokenize_dates(text);
    for (size_t i = 0; i < toks.size(); ++i) {
        const auto start = element_at(toks, i);
        if (!start) continue;

        size_t j = start->next;
        if (j >= toks.size() || toks[j].kind != TokKind::Sep) continue;
        ++j;

        if (auto end = element_at(toks, j)) return RawDateRange{start->raw, end->raw};
        if (auto end = present_at(toks, j)) return RawDateRange{start->raw, end->raw};
    }
    return std::nullopt;
}

std::optional<std::string> find_single_date(const std::string& text) {
    const auto toks = tokenize_dates(text);
    for (size_t i = 0; i < toks.size(); ++i) {
        if (auto e = element_at(toks, i)) return e->raw;
    }
    return std::nullopt;
}

bool contains_date_range(const std::string& text) {
    return find_date_range(text).has_value();
}

bool contains_single_date(const std::string& text) {
    return find_single_date(text).has_value();
}

bool is_canonical_date(const std::string& value) {
    return value.empty() || is_year(value) || is_year_month(value);
}

std::string normalize_date(const std::string& value) {
    const std::string v = textutil::trim(value);
    if (v.empty()) return "";
    if (is_year(v) || is_year_month(v)) return v;
    if (vocab::is_present_marker(v)) return "";

    const auto words = textutil::split_words(v);
    if (words.empty()) return "";

    const std::string year = strip_punct(words.back());
    if (!is_year(year)) {
        const std::string only = strip_punct(words.front());
        return (words.size() == 1 && is_year_month(only)) ? only : "";
    }
    if (words.size() == 1) return year;

    const auto month = vocab::month_number(strip_punct(words.front()));
    if (!month) return year;

    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d", *month);
    return year + "-" + buf;
}

DateRange parse_date_range(const std::string& text) {
    if (text.empty()) return {};
    if (auto r = find_date_range(text)) {
        return DateRange{normalize_date(r->start), normalize_date(r->end)};
    }
    if (auto d = find_single_date(text)) {
        return DateRange{normalize_date(*d), ""};
    }
    return {};
}

}  // namespace cvextract
