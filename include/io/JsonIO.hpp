#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cvextract/Enrichment.hpp"
#include "cvextract/ExtractConfig.hpp"
#include "cvextract/Models.hpp"

namespace cvextract {

// Everything here throws std::runtime_error naming the file or the JSON path
// ("root.pages[0].words[3] missing required field: text") on bad input.

// {"pages": [{"width": 595, "words": [{"text", "top", "bottom", "x0", "x1"}]}]}
// "left"/"right" are accepted in place of "x0"/"x1".
std::vector<Page> token_document_from_json(const nlohmann::json& j);
std::vector<Page> load_token_document(const std::string& path);

// Every field present; unknown values are "" or [].
nlohmann::json resume_to_json(const Resume& r);

// Lenient: missing keys stay empty, wrongly typed values are errors.
Resume resume_from_json(const nlohmann::json& j);
Resume load_resume_json(const std::string& path);
void write_resume_json(const std::string& path, const Resume& r);

// snake_case keys of ExtractConfig; unknown keys are ignored
ExtractConfig extract_config_from_json(const nlohmann::json& j);
ExtractConfig load_extract_config(const std::string& path);

// {"phone": "...", "additional_skills": ["..."]}
PersonalInfo personal_info_from_json(const nlohmann::json& j);
PersonalInfo load_personal_info(const std::string& path);

}  // namespace cvextract
