#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "cvextract/Models.hpp"

namespace cvextract {

struct ValidationError {
    std::string code;      // bad_date, empty_entry, duplicate_skill, duplicate_profile
    std::string message;
    std::string where;     // e.g. "work[2].startDate"
};

struct ValidationReport {
    bool pass = true;
    std::vector<ValidationError> errors;
};

// Checks the record-level guarantees of an extracted (or enriched) resume.
ValidationReport validate_resume(const Resume& resume);

// Throws std::runtime_error when the file cannot be written.
void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}  // namespace cvextract
