#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cvextract/BlockSegmenter.hpp"
#include "cvextract/Models.hpp"

namespace cvextract {

// "Master of Science, Computer Science" -> {"Master of Science", "Computer Science"}
// "BSc in Physics (2012 - 2016)"        -> {"BSc", "Physics"}
std::pair<std::string, std::string> parse_degree(const std::string& line);

std::optional<EducationEntry> parse_education_block(const Block& block);

std::vector<EducationEntry> parse_education(const std::vector<Line>& lines);

}  // namespace cvextract
