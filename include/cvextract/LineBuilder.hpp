#pragma once
#include <vector>

#include "cvextract/ExtractConfig.hpp"
#include "cvextract/Models.hpp"

namespace cvextract {

// Horizontal gap above which two tokens of one band belong to separate lines.
double column_gap_threshold(double page_width, const ExtractConfig& cfg = {});

// Groups one page's tokens into reading-order lines. Tokens whose vertical
// centers are within cfg.band_tolerance share a band; a band is cut wherever
// the gap between neighbouring tokens exceeds column_gap_threshold().
std::vector<Line> build_page_lines(const Page& page, int page_index, const ExtractConfig& cfg = {});

// All pages, page-major.
std::vector<Line> build_lines(const std::vector<Page>& pages, const ExtractConfig& cfg = {});

}  // namespace cvextract
