#pragma once
#include <string>
#include <vector>

namespace cvextract {

// Text-shape predicates shared by the segmenter and the category parsers.
bool is_page_footer(const std::string& text);      // "Page 2 of 3", "page 1 / 2"
bool is_noise_line(const std::string& text);       // footers and "Contact" labels
bool is_bullet_line(const std::string& text);
bool is_achievements_label(const std::string& text);
bool starts_with_achievements(const std::string& text);
bool is_duration_line(const std::string& text);    // "3 years 2 months", no year in it
bool is_employment_type_line(const std::string& text);
bool contains_role_keyword(const std::string& text);

// a date range, "(2019", or a degree keyword
bool looks_like_degree_line(const std::string& text);

// "2019" or "2019)" on its own, left over from a wrapped degree line
bool is_trailing_year_line(const std::string& text);

std::string strip_bullet(const std::string& text);

// Every shape a line can have, evaluated once per line.
struct LineShape {
    std::string text;          // trimmed
    bool footer = false;
    bool noise = false;
    bool bullet = false;
    bool achievements = false;
    bool date_range = false;
    bool duration = false;
};

LineShape shape_of(const std::string& text);

// Drops blanks, footers, noise and "achievements" labels; optionally duration and
// employment-type lines. Keeps order.
std::vector<std::string> filter_block_texts(const std::vector<std::string>& texts,
                                            bool drop_duration = false,
                                            bool drop_employment = false);

}  // namespace cvextract
