#pragma once
#include <string>
#include <vector>

#include "cvextract/ExtractConfig.hpp"
#include "cvextract/Models.hpp"

namespace cvextract {

// Text of the line closest below a "Hobbies:" aside, looking only at the
// opposite column on the same page. Empty when the document is single column.
std::string find_hobbies_marker(const std::vector<Line>& lines, const ExtractConfig& cfg = {});

// Inserts an explicit "Hobbies: " clause into basics.summary where the
// interest list (or the marker text) already appears, else appends it.
// No-op for an empty summary or one that already mentions hobbies.
void add_interests_label_to_summary(Basics& basics,
                                    const std::vector<InterestEntry>& interests,
                                    const std::string& hobbies_marker);

// lines -> sections -> category parsers -> hobbies post-pass
Resume assemble_resume(const std::vector<Line>& lines, const ExtractConfig& cfg = {});

// build_lines + assemble_resume
Resume parse_document(const std::vector<Page>& pages, const ExtractConfig& cfg = {});

}  // namespace cvextract
