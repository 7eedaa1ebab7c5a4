#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cvextract/Models.hpp"

namespace cvextract {

// Static multilingual lookup data. Adding a locale means adding rows here,
// never touching the heuristics that consume them.
namespace vocab {

// section -> heading spellings, as printed on documents
const std::vector<std::pair<SectionKind, std::vector<std::string>>>& heading_aliases();

// normalize_heading(alias) -> section
const std::unordered_map<std::string, SectionKind>& heading_lookup();

// folded month name, abbreviation or 3-letter prefix -> 1..12
const std::unordered_map<std::string, int>& month_lookup();

// folded open-ended markers ("present", "настоящее время", ...)
const std::vector<std::string>& present_markers();

// words that may stand between two dates instead of a dash
const std::vector<std::string>& range_words();

const std::vector<std::string>& location_keywords();
const std::vector<std::string>& role_keywords();
const std::vector<std::string>& degree_keywords();
const std::vector<std::string>& degree_line_keywords();
const std::vector<std::string>& employment_type_terms();
const std::vector<std::string>& company_suffixes();
const std::vector<std::string>& contact_noise_lines();

// "achievements:", "main responsibilities:" and friends (lowercase)
const std::vector<std::string>& achievement_labels();

// leading bullet markers
const std::vector<std::string>& bullet_markers();

// separators for skill / interest lists
const std::vector<std::string>& list_delimiters();

// month number for a folded word, trying the whole word before its prefix
std::optional<int> month_number(const std::string& word);

bool is_present_marker(const std::string& text);

}  // namespace vocab

}  // namespace cvextract
