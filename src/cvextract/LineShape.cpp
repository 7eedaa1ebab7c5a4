#include "cvextract/LineShape.hpp"

#include "cvextract/DateNormalizer.hpp"
#include "cvextract/TextUtil.hpp"
#include "cvextract/Vocabulary.hpp"

#include <cctype>
#include <regex>
#include <unordered_set>

namespace cvextract {

static bool has_four_digit_run(const std::string& s) {
    size_t run = 0;
    for (size_t i = 0; i <= s.size(); ++i) {
        if (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            ++run;
            continue;
        }
        if (run == 4) return true;
        run = 0;
    }
    return false;
}

static std::string strip_edges(const std::string& s) {
    static const std::string kPunct = "()[]{},.;:";
    size_t a = 0;
    size_t b = s.size();
    while (a < b && kPunct.find(s[a]) != std::string::npos) ++a;
    while (b > a && kPunct.find(s[b - 1]) != std::string::npos) --b;
    return s.substr(a, b - a);
}

static bool is_number(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

bool is_page_footer(const std::string& text) {
    static const std::regex re(
        "^(page|seite|página|pagina|страница)\\s+\\d+\\s*(of|/|von|de|di|sur|из)\\s*\\d+$");
    return std::regex_match(textutil::to_lower(textutil::trim(text)), re);
}

bool is_noise_line(const std::string& text) {
    const std::string lowered = textutil::to_lower(textutil::trim(text));
    if (textutil::starts_with(lowered, "page ") || is_page_footer(lowered)) return true;
    if (lowered == "contact" || textutil::starts_with(lowered, "contact ")) return true;
    for (const auto& n : vocab::contact_noise_lines()) {
        if (lowered == n) return true;
    }
    return false;
}

bool is_bullet_line(const std::string& text) {
    const std::string t = textutil::trim(text);
    for (const auto& m : vocab::bullet_markers()) {
        if (textutil::starts_with(t, m)) return true;
    }
    return false;
}

bool is_achievements_label(const std::string& text) {
    const std::string lowered = textutil::to_lower(textutil::trim(text));
    for (const auto& label : vocab::achievement_labels()) {
        if (lowered == label) return true;
    }
    return false;
}

bool starts_with_achievements(const std::string& text) {
    return textutil::starts_with(textutil::to_lower(textutil::trim(text)), "achievements");
}

bool is_duration_line(const std::string& text) {
    static const std::unordered_set<std::string> units = [] {
        const char* raw[] = {
            "year", "years", "yr", "yrs", "month", "months", "mo", "mos",
            "год", "года", "лет", "мес", "месяц", "месяца", "месяцев",
            "an", "ans", "mois", "jahr", "jahre", "monat", "monate",
            "año", "años", "mes", "meses", "ano", "anos", "anno", "anni", "mese", "mesi",
            "jaar", "jaren", "maand", "maanden",
        };
        std::unordered_set<std::string> s;
        for (const char* r : raw) s.insert(textutil::fold(r));
        return s;
    }();

    if (has_four_digit_run(text)) return false;

    const auto words = textutil::split_words(text);
    for (size_t i = 0; i + 1 < words.size(); ++i) {
        if (!is_number(strip_edges(words[i]))) continue;
        if (units.count(textutil::fold(strip_edges(words[i + 1]))) > 0) return true;
    }
    return false;
}

bool is_employment_type_line(const std::string& text) {
    const std::string lowered = textutil::to_lower(text);
    for (const auto& term : vocab::employment_type_terms()) {
        if (textutil::contains(lowered, term)) return true;
    }
    return false;
}

bool contains_role_keyword(const std::string& text) {
    const std::string lowered = textutil::to_lower(text);
    for (const auto& k : vocab::role_keywords()) {
        if (textutil::contains(lowered, k)) return true;
    }
    return false;
}

bool looks_like_degree_line(const std::string& text) {
    if (contains_date_range(text)) return true;
    static const std::regex paren_year("\\(\\d{4}");
    if (std::regex_search(text, paren_year)) return true;
    const std::string lowered = textutil::to_lower(text);
    for (const auto& k : vocab::degree_line_keywords()) {
        if (textutil::contains(lowered, k)) return true;
    }
    return false;
}

bool is_trailing_year_line(const std::string& text) {
    static const std::regex re("^\\d{4}\\)?$");
    return std::regex_match(textutil::trim(text), re);
}

std::string strip_bullet(const std::string& text) {
    return textutil::strip_leading(text, vocab::bullet_markers());
}

LineShape shape_of(const std::string& text) {
    LineShape s;
    s.text = textutil::trim(text);
    s.footer = is_page_footer(s.text);
    s.noise = is_noise_line(s.text);
    s.bullet = is_bullet_line(s.text);
    s.achievements = is_achievements_label(s.text);
    s.date_range = contains_date_range(s.text);
    s.duration = is_duration_line(s.text);
    return s;
}

std::vector<std::string> filter_block_texts(const std::vector<std::string>& texts,
                                            bool drop_duration,
                                            bool drop_employment) {
    std::vector<std::string> out;
    for (const auto& raw : texts) {
        const std::string t = textutil::trim(raw);
        if (t.empty()) continue;
        if (is_page_footer(t) || is_noise_line(t)) continue;
        const std::string lowered = textutil::to_lower(t);
        if (lowered == "achievements:" || lowered == "achievements") continue;
        if (drop_duration && is_duration_line(t)) continue;
        if (drop_employment && is_employment_type_line(t)) continue;
        out.push_back(t);
    }
    return out;
}

}  // namespace cvextract
