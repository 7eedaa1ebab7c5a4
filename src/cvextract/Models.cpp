#include "cvextract/Models.hpp"

namespace cvextract {

namespace {

struct SectionNameRow {
    SectionKind kind;
    const char* name;
};

const SectionNameRow kSectionNames[] = {
    {SectionKind::About, "about"},
    {SectionKind::Experience, "experience"},
    {SectionKind::Education, "education"},
    {SectionKind::Skills, "skills"},
    {SectionKind::Certifications, "certifications"},
    {SectionKind::Projects, "projects"},
    {SectionKind::Volunteer, "volunteer"},
    {SectionKind::Languages, "languages"},
    {SectionKind::Interests, "interests"},
};

}  // namespace

const char* section_name(SectionKind kind) {
    for (const auto& row : kSectionNames) {
        if (row.kind == kind) return row.name;
    }
    return "";
}

const std::vector<Line>& lines_of(const SectionLines& sections, SectionKind kind) {
    static const std::vector<Line> kNone;
    auto it = sections.find(kind);
    return it == sections.end() ? kNone : it->second;
}

bool WorkEntry::empty() const {
    return name.empty() && position.empty() && location.empty() && start_date.empty() &&
           end_date.empty() && summary.empty() && highlights.empty();
}

bool EducationEntry::empty() const {
    return institution.empty() && study_type.empty() && area.empty() && start_date.empty() &&
           end_date.empty();
}

bool CertificateEntry::empty() const {
    return name.empty() && issuer.empty() && date.empty() && url.empty();
}

bool ProjectEntry::empty() const {
    return name.empty() && description.empty() && url.empty() && start_date.empty() &&
           end_date.empty();
}

bool VolunteerEntry::empty() const {
    return organization.empty() && position.empty() && start_date.empty() && end_date.empty() &&
           summary.empty();
}

}  // namespace cvextract
