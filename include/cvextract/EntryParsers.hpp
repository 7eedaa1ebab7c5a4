#pragma once
#include <optional>
#include <string>
#include <vector>

#include "cvextract/BlockSegmenter.hpp"
#include "cvextract/ExtractConfig.hpp"
#include "cvextract/Models.hpp"

namespace cvextract {

// Parsers for the list-like sections. Each one is total and drops entries
// without any signal.

std::vector<CertificateEntry> parse_certifications(const std::vector<Line>& lines);

std::optional<ProjectEntry> parse_project_block(const Block& block);
std::vector<ProjectEntry> parse_projects(const std::vector<Line>& lines, const ExtractConfig& cfg = {});

std::optional<VolunteerEntry> parse_volunteer_block(const Block& block);
std::vector<VolunteerEntry> parse_volunteer(const std::vector<Line>& lines, const ExtractConfig& cfg = {});

// first-seen spelling wins on case-insensitive duplicates
std::vector<SkillEntry> normalize_skill_parts(const std::vector<std::string>& parts);
std::vector<SkillEntry> parse_skills(const std::vector<Line>& lines);

std::vector<LanguageEntry> parse_languages(const std::vector<Line>& lines);

std::vector<InterestEntry> parse_interests(const std::vector<Line>& lines);

}  // namespace cvextract
