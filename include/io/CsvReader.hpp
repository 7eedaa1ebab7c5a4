#pragma once
#include <map>
#include <string>
#include <vector>

#include "cvextract/Enrichment.hpp"

namespace cvextract {

// header name -> cell text; empty and missing cells are left out
using CsvRecord = std::map<std::string, std::string>;

// Parsed with libvroom: quoted cells may hold commas, doubled quotes and line
// breaks, and a UTF-8 BOM is dropped. The first row is the header.
// Throws std::runtime_error when libvroom rejects the input.
std::vector<CsvRecord> parse_csv_records(const std::string& text);

// Throws std::runtime_error when the file cannot be read.
std::vector<CsvRecord> read_csv_records(const std::string& path);

// Profile export files (Skills.csv, Certifications.csv, Projects.csv).
std::vector<std::string> load_skill_names_csv(const std::string& path);
std::vector<CertificationRecord> load_certification_records_csv(const std::string& path);
std::vector<ProjectRecord> load_project_records_csv(const std::string& path);

}  // namespace cvextract
