#include "cvextract/Enrichment.hpp"

#include "cvextract/TextUtil.hpp"
#include "cvextract/Vocabulary.hpp"

#include <regex>
#include <unordered_map>
#include <unordered_set>

namespace cvextract {

static std::string key_of(const std::string& name) {
    return textutil::to_lower(textutil::trim(name));
}

static bool set_if_missing(std::string& field, const std::string& value) {
    if (value.empty() || !field.empty()) return false;
    field = value;
    return true;
}

static std::string two_digits(int month) {
    return (month < 10 ? "0" : "") + std::to_string(month);
}

std::string parse_year_month(const std::string& value) {
    const std::string raw = textutil::trim(value);
    if (raw.empty()) return "";

    static const std::regex month_year("^([^\\s\\d]+)\\s+(\\d{4})$");
    static const std::regex year_month("^(\\d{4})-(\\d{1,2})(?:-\\d{1,2}(?:[T ].*)?)?$");

    std::smatch m;
    if (std::regex_match(raw, m, month_year)) {
        if (auto month = vocab::month_number(m.str(1))) return m.str(2) + "-" + two_digits(*month);
        return raw;
    }
    if (std::regex_match(raw, m, year_month)) {
        const int month = std::stoi(m.str(2));
        if (month >= 1 && month <= 12) return m.str(1) + "-" + two_digits(month);
        return raw;
    }
    return raw;
}

static bool add_skill(Resume& resume, const std::string& name, std::unordered_set<std::string>& existing) {
    const std::string clean = textutil::trim(name);
    if (clean.empty()) return false;
    if (!existing.insert(key_of(clean)).second) return false;
    resume.skills.push_back(SkillEntry{clean});
    return true;
}

static std::unordered_set<std::string> skill_keys(const Resume& resume) {
    std::unordered_set<std::string> keys;
    for (const auto& s : resume.skills) keys.insert(key_of(s.name));
    return keys;
}

bool merge_personal_info(Resume& resume, const PersonalInfo& info) {
    bool updated = false;

    auto existing = skill_keys(resume);
    for (const auto& name : info.additional_skills) {
        if (add_skill(resume, name, existing)) updated = true;
    }

    if (set_if_missing(resume.basics.phone, textutil::trim(info.phone))) updated = true;
    return updated;
}

bool merge_skill_names(Resume& resume, const std::vector<std::string>& names) {
    bool updated = false;
    auto existing = skill_keys(resume);
    for (const auto& name : names) {
        if (add_skill(resume, name, existing)) updated = true;
    }
    return updated;
}

bool merge_certification_records(Resume& resume, const std::vector<CertificationRecord>& records) {
    // index, not pointer: push_back below may reallocate
    std::unordered_map<std::string, size_t> existing;
    for (size_t i = 0; i < resume.certificates.size(); ++i) {
        existing.emplace(key_of(resume.certificates[i].name), i);
    }

    bool updated = false;
    for (const auto& rec : records) {
        const std::string name = textutil::trim(rec.name);
        if (name.empty()) continue;

        const std::string issuer = textutil::trim(rec.issuer);
        const std::string url = textutil::trim(rec.url);
        const std::string started = textutil::trim(rec.started_on);
        const std::string date = parse_year_month(started.empty() ? rec.finished_on : started);

        auto it = existing.find(key_of(name));
        if (it != existing.end()) {
            CertificateEntry& entry = resume.certificates[it->second];
            if (set_if_missing(entry.issuer, issuer)) updated = true;
            if (set_if_missing(entry.date, date)) updated = true;
            if (set_if_missing(entry.url, url)) updated = true;
            continue;
        }

        resume.certificates.push_back(CertificateEntry{name, issuer, date, url});
        existing.emplace(key_of(name), resume.certificates.size() - 1);
        updated = true;
    }
    return updated;
}

bool merge_project_records(Resume& resume, const std::vector<ProjectRecord>& records) {
    std::unordered_map<std::string, size_t> existing;
    for (size_t i = 0; i < resume.projects.size(); ++i) {
        existing.emplace(key_of(resume.projects[i].name), i);
    }

    bool updated = false;
    for (const auto& rec : records) {
        const std::string name = textutil::trim(rec.title);
        if (name.empty()) continue;

        ProjectEntry incoming;
        incoming.name = name;
        incoming.description = textutil::trim(rec.description);
        incoming.url = textutil::trim(rec.url);
        incoming.start_date = parse_year_month(rec.started_on);
        incoming.end_date = parse_year_month(rec.finished_on);

        auto it = existing.find(key_of(name));
        if (it != existing.end()) {
            ProjectEntry& entry = resume.projects[it->second];
            if (set_if_missing(entry.description, incoming.description)) updated = true;
            if (set_if_missing(entry.url, incoming.url)) updated = true;
            if (set_if_missing(entry.start_date, incoming.start_date)) updated = true;
            if (set_if_missing(entry.end_date, incoming.end_date)) updated = true;
            continue;
        }

        resume.projects.push_back(std::move(incoming));
        existing.emplace(key_of(name), resume.projects.size() - 1);
        updated = true;
    }
    return updated;
}

}  // namespace cvextract
