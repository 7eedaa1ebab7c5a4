#pragma once
#include <vector>

#include "cvextract/ExtractConfig.hpp"
#include "cvextract/LineShape.hpp"
#include "cvextract/Models.hpp"

namespace cvextract {

// One entry candidate: consecutive lines of a section.
using Block = std::vector<Line>;

// median of positive line heights, or `fallback` when there are none
double median_line_height(const std::vector<Line>& lines, double fallback);

// starts with a bullet or an "achievements" label, is a footer, or carries a
// bare duration without any date range
bool is_continuation_block(const Block& block);

// Gap-based split (gap > cfg.block_gap_factor x median height), then
// continuation blocks are folded back into their predecessor.
std::vector<Block> split_blocks(const std::vector<Line>& lines, const ExtractConfig& cfg = {});

// Short, plain, undated line followed within two lines by a date range or a
// bare duration line.
bool is_entry_start(const std::vector<LineShape>& shapes, size_t idx);

// One block per job. A position-only start (title directly above its date
// range) inherits the last seen company line.
std::vector<Block> split_experience_blocks(const std::vector<Line>& lines);

// institution line + optional degree line (a trailing year line is merged into it)
std::vector<Block> split_education_blocks(const std::vector<Line>& lines);

}  // namespace cvextract
