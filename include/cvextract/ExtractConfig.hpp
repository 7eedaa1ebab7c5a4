#pragma once

namespace cvextract {

enum class ExperienceStrategy {
    Pivot,   // date-range pivot scan over the whole section
    Blocks   // split_experience_blocks, then one entry per block
};

struct ExtractConfig {
    // line reconstruction
    double band_tolerance = 2.5;      // max distance between vertical centers in one band
    double min_column_gap = 30.0;
    double column_gap_ratio = 0.08;   // of page width

    // two-column detection
    bool detect_columns = true;
    int min_lines_for_columns = 40;
    double min_column_split_gap = 80.0;

    // headings
    int max_heading_chars = 60;
    int max_heading_words = 5;

    // block segmentation
    double block_gap_factor = 1.8;    // x median line height
    double default_line_height = 10.0;

    // basics
    int header_scan_lines = 12;

    ExperienceStrategy experience_strategy = ExperienceStrategy::Pivot;
};

}  // namespace cvextract
