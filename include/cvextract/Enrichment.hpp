#pragma once
#include <string>
#include <vector>

#include "cvextract/Models.hpp"

namespace cvextract {

// Sidecar data from a profile export. Merges only fill gaps: a non-empty
// field of the extracted resume is never overwritten. Records are matched to
// existing entries by trimmed, lowercased name.

struct PersonalInfo {
    std::string phone;
    std::vector<std::string> additional_skills;
};

struct CertificationRecord {
    std::string name;
    std::string issuer;
    std::string url;
    std::string started_on;
    std::string finished_on;
};

struct ProjectRecord {
    std::string title;
    std::string description;
    std::string url;
    std::string started_on;
    std::string finished_on;
};

// "Jun 2021", "June 2021", "2021-06", "2021-06-15" -> "2021-06"; "2021" -> "2021".
// Unparseable text is returned trimmed but otherwise unchanged.
std::string parse_year_month(const std::string& value);

// Each returns true when the resume changed.
bool merge_personal_info(Resume& resume, const PersonalInfo& info);
bool merge_skill_names(Resume& resume, const std::vector<std::string>& names);
bool merge_certification_records(Resume& resume, const std::vector<CertificationRecord>& records);
bool merge_project_records(Resume& resume, const std::vector<ProjectRecord>& records);

}  // namespace cvextract
