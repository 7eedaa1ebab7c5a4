#pragma once
#include <optional>
#include <string>
#include <vector>

#include "cvextract/ExtractConfig.hpp"
#include "cvextract/Models.hpp"

namespace cvextract {

// x coordinate separating a sidebar column from the main column, if any.
// Short documents (< cfg.min_lines_for_columns lines) are always single column.
std::optional<double> detect_column_split(const std::vector<Line>& lines, const ExtractConfig& cfg = {});

// no digits, at most cfg.max_heading_chars characters, 1..cfg.max_heading_words words
bool looks_like_heading(const std::string& text, const ExtractConfig& cfg = {});

// multilingual, case- and accent-insensitive heading lookup
std::optional<SectionKind> classify_heading(const std::string& text, const ExtractConfig& cfg = {});

// Per-column "active section" state. A heading switches it; any other line is
// collected into the active section, or dropped if none is active yet.
class ColumnState {
public:
    void on_line(const Line& line, SectionLines& out, const ExtractConfig& cfg);
    std::optional<SectionKind> active() const { return m_active; }

private:
    std::optional<SectionKind> m_active;
};

// Footers skipped; left/right columns tracked independently.
SectionLines split_sections(const std::vector<Line>& lines, const ExtractConfig& cfg = {});

}  // namespace cvextract
