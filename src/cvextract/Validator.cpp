#include "cvextract/Validator.hpp"

#include "cvextract/DateNormalizer.hpp"
#include "cvextract/TextUtil.hpp"

#include "nlohmann/json.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace fs = std::filesystem;

namespace cvextract {

static void add_error(ValidationReport& rep, const std::string& code, const std::string& msg, const std::string& where) {
    rep.pass = false;
    ValidationError e;
    e.code = code;
    e.message = msg;
    e.where = where;
    rep.errors.push_back(std::move(e));
}

static std::string at(const char* list, size_t i) {
    std::ostringstream oss;
    oss << list << "[" << i << "]";
    return oss.str();
}

static void check_date(ValidationReport& rep, const std::string& value, const std::string& where) {
    if (!is_canonical_date(value)) {
        add_error(rep, "bad_date", "date is not empty, YYYY or YYYY-MM: \"" + value + "\"", where);
    }
}

template <typename Entry>
static void check_not_empty(ValidationReport& rep, const std::vector<Entry>& entries, const char* list) {
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].empty()) add_error(rep, "empty_entry", "entry has no non-empty field", at(list, i));
    }
}

ValidationReport validate_resume(const Resume& r) {
    ValidationReport rep;

    check_not_empty(rep, r.work, "work");
    check_not_empty(rep, r.education, "education");
    check_not_empty(rep, r.certificates, "certificates");
    check_not_empty(rep, r.projects, "projects");
    check_not_empty(rep, r.volunteer, "volunteer");

    for (size_t i = 0; i < r.work.size(); ++i) {
        check_date(rep, r.work[i].start_date, at("work", i) + ".startDate");
        check_date(rep, r.work[i].end_date, at("work", i) + ".endDate");
    }
    for (size_t i = 0; i < r.education.size(); ++i) {
        check_date(rep, r.education[i].start_date, at("education", i) + ".startDate");
        check_date(rep, r.education[i].end_date, at("education", i) + ".endDate");
    }
    for (size_t i = 0; i < r.certificates.size(); ++i) {
        check_date(rep, r.certificates[i].date, at("certificates", i) + ".date");
    }
    for (size_t i = 0; i < r.projects.size(); ++i) {
        check_date(rep, r.projects[i].start_date, at("projects", i) + ".startDate");
        check_date(rep, r.projects[i].end_date, at("projects", i) + ".endDate");
    }
    for (size_t i = 0; i < r.volunteer.size(); ++i) {
        check_date(rep, r.volunteer[i].start_date, at("volunteer", i) + ".startDate");
        check_date(rep, r.volunteer[i].end_date, at("volunteer", i) + ".endDate");
    }

    std::unordered_set<std::string> skills;
    for (size_t i = 0; i < r.skills.size(); ++i) {
        const std::string key = textutil::to_lower(textutil::trim(r.skills[i].name));
        if (key.empty()) {
            add_error(rep, "empty_entry", "skill has no name", at("skills", i));
        } else if (!skills.insert(key).second) {
            add_error(rep, "duplicate_skill", "skill listed twice: " + r.skills[i].name, at("skills", i));
        }
    }

    std::unordered_set<std::string> links;
    for (size_t i = 0; i < r.basics.profiles.size(); ++i) {
        const std::string key = textutil::to_lower(r.basics.profiles[i].url);
        if (!links.insert(key).second) {
            add_error(rep, "duplicate_profile", "profile link listed twice: " + r.basics.profiles[i].url,
                      at("basics.profiles", i));
        }
    }

    return rep;
}

void write_validation_report(const fs::path& path, const ValidationReport& rep) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    nlohmann::json j;
    j["pass"] = rep.pass;
    j["errors"] = nlohmann::json::array();

    for (const auto& e : rep.errors) {
        nlohmann::json ej;
        ej["code"] = e.code;
        ej["message"] = e.message;
        if (!e.where.empty()) ej["where"] = e.where;
        j["errors"].push_back(ej);
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to write validation report: " + path.string());
    out << j.dump(2) << "\n";
}

}  // namespace cvextract
