#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cvextract/BlockSegmenter.hpp"
#include "cvextract/ExtractConfig.hpp"
#include "cvextract/LineShape.hpp"
#include "cvextract/Models.hpp"

namespace cvextract {

struct Highlights {
    std::vector<std::string> items;
    std::string summary;
};

// Bulleted lines become highlights and absorb soft-wrapped continuation
// lines; everything else accumulates into the summary.
Highlights split_highlights(const std::vector<std::string>& texts);

// First line that looks like a place: comma separated (and not a date
// range), or a single short capitalized word that is not a role title.
// The single-word rule is a heuristic and can misfire on one-word titles.
std::string find_location_from_block(const std::vector<std::string>& texts);

// "Engineer at Acme" -> {"Engineer", "Acme"}; otherwise {texts[0], texts[1] before any "·"}
std::pair<std::string, std::string> split_title_company(const std::vector<std::string>& texts);

// header lines -> {company, position}; a lone title inherits last_company
std::pair<std::string, std::string> parse_company_position(const std::vector<std::string>& header,
                                                           const std::string& last_company);

bool is_header_candidate(const std::string& text);
bool looks_like_header_start(const std::vector<LineShape>& shapes, size_t idx);

// One entry per date-range pivot (or per block with ExperienceStrategy::Blocks).
// Entries without company and position are dropped.
std::vector<WorkEntry> parse_experience(const std::vector<Line>& lines, const ExtractConfig& cfg = {});

std::optional<WorkEntry> parse_work_block(const Block& block);

}  // namespace cvextract
