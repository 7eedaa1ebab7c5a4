#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cvextract {

struct BoundingBox {
    double top = 0.0;
    double bottom = 0.0;
    double left = 0.0;
    double right = 0.0;
};

// One decoded word, as handed over by the document decoder.
struct WordToken {
    std::string text;
    BoundingBox box;
    int page = 0;
};

struct Page {
    double width = 0.0;              // page width in the decoder's units
    std::vector<WordToken> words;    // any order
};

// A reconstructed visual line. Never mutated once built.
struct Line {
    std::string text;
    double top = 0.0;
    double bottom = 0.0;
    double left = 0.0;
    double right = 0.0;
    int page = 0;

    double height() const { return bottom - top; }

    // copy with replaced text (degree line + trailing year line)
    Line with_text(std::string new_text) const {
        Line out = *this;
        out.text = std::move(new_text);
        return out;
    }
};

enum class SectionKind {
    About,
    Experience,
    Education,
    Skills,
    Certifications,
    Projects,
    Volunteer,
    Languages,
    Interests
};

const char* section_name(SectionKind kind);

// section -> lines in reading order
using SectionLines = std::map<SectionKind, std::vector<Line>>;

const std::vector<Line>& lines_of(const SectionLines& sections, SectionKind kind);

struct WorkEntry {
    std::string name;       // organization
    std::string position;
    std::string location;
    std::string start_date;
    std::string end_date;
    std::string summary;
    std::vector<std::string> highlights;

    bool empty() const;
};

struct EducationEntry {
    std::string institution;
    std::string study_type;
    std::string area;
    std::string start_date;
    std::string end_date;

    bool empty() const;
};

struct CertificateEntry {
    std::string name;
    std::string issuer;
    std::string date;
    std::string url;

    bool empty() const;
};

struct ProjectEntry {
    std::string name;
    std::string description;
    std::string url;
    std::string start_date;
    std::string end_date;

    bool empty() const;
};

struct VolunteerEntry {
    std::string organization;
    std::string position;
    std::string start_date;
    std::string end_date;
    std::string summary;

    bool empty() const;
};

struct SkillEntry {
    std::string name;
};

struct LanguageEntry {
    std::string language;
    std::string fluency;
};

struct InterestEntry {
    std::string name;
};

struct Profile {
    std::string network;   // LinkedIn, GitHub, Twitter or Website
    std::string url;
};

struct Basics {
    std::string name;
    std::string label;     // headline
    std::string email;
    std::string phone;
    std::string location;
    std::vector<Profile> profiles;
    std::string summary;
};

struct Resume {
    Basics basics;
    std::vector<WorkEntry> work;
    std::vector<EducationEntry> education;
    std::vector<SkillEntry> skills;
    std::vector<CertificateEntry> certificates;
    std::vector<ProjectEntry> projects;
    std::vector<VolunteerEntry> volunteer;
    std::vector<LanguageEntry> languages;
    std::vector<InterestEntry> interests;
};

}  // namespace cvextract
