#include "cvextract/ResumeAssembler.hpp"

#include "cvextract/BasicsParser.hpp"
#include "cvextract/EducationParser.hpp"
#include "cvextract/EntryParsers.hpp"
#include "cvextract/LineBuilder.hpp"
#include "cvextract/SectionClassifier.hpp"
#include "cvextract/TextUtil.hpp"
#include "cvextract/WorkParser.hpp"

#include <optional>
#include <regex>

namespace cvextract {

std::string find_hobbies_marker(const std::vector<Line>& lines, const ExtractConfig& cfg) {
    if (!cfg.detect_columns) return "";
    const std::optional<double> split = detect_column_split(lines, cfg);
    if (!split) return "";

    std::string best_text;
    std::optional<double> best_gap;
    for (const auto& hobby : lines) {
        if (!textutil::contains(textutil::to_lower(hobby.text), "hobbies:")) continue;
        const bool hobby_left = hobby.left <= *split;

        for (const auto& l : lines) {
            if (l.page != hobby.page || (l.left <= *split) == hobby_left || l.top < hobby.top) continue;
            const std::string text = textutil::trim(l.text);
            if (text.empty() || textutil::contains(textutil::to_lower(text), "hobbies")) continue;

            const double gap = l.top - hobby.top;
            if (!best_gap || gap < *best_gap) {
                best_gap = gap;
                best_text = text;
            }
        }
    }
    return best_text;
}

void add_interests_label_to_summary(Basics& basics,
                                    const std::vector<InterestEntry>& interests,
                                    const std::string& hobbies_marker) {
    static const std::regex mentions_hobbies("\\bhobbies\\b", std::regex::icase);

    std::string summary = textutil::trim(basics.summary);
    if (summary.empty()) return;
    if (std::regex_search(summary, mentions_hobbies)) return;
    if (interests.empty() && hobbies_marker.empty()) return;

    std::vector<std::string> names;
    for (const auto& i : interests) {
        const std::string n = textutil::trim(i.name);
        if (!n.empty()) names.push_back(n);
    }

    if (!names.empty()) {
        const std::string listed = textutil::join(names, ", ");
        const size_t at = textutil::find_ci(summary, listed);
        if (at != std::string::npos) {
            summary.insert(at, "Hobbies: ");
        } else {
            summary += " Hobbies: " + listed;
        }
    } else if (!hobbies_marker.empty()) {
        const size_t at = textutil::find_ci(summary, hobbies_marker);
        if (at != std::string::npos) summary.insert(at, "Hobbies: ");
    }
    basics.summary = textutil::trim(summary);
}

Resume assemble_resume(const std::vector<Line>& lines, const ExtractConfig& cfg) {
    const SectionLines sections = split_sections(lines, cfg);

    Resume r;
    r.basics       = parse_basics(lines, lines_of(sections, SectionKind::About), cfg);
    r.work         = parse_experience(lines_of(sections, SectionKind::Experience), cfg);
    r.education    = parse_education(lines_of(sections, SectionKind::Education));
    r.skills       = parse_skills(lines_of(sections, SectionKind::Skills));
    r.certificates = parse_certifications(lines_of(sections, SectionKind::Certifications));
    r.projects     = parse_projects(lines_of(sections, SectionKind::Projects), cfg);
    r.volunteer    = parse_volunteer(lines_of(sections, SectionKind::Volunteer), cfg);
    r.languages    = parse_languages(lines_of(sections, SectionKind::Languages));
    r.interests    = parse_interests(lines_of(sections, SectionKind::Interests));

    add_interests_label_to_summary(r.basics, r.interests, find_hobbies_marker(lines, cfg));
    return r;
}

Resume parse_document(const std::vector<Page>& pages, const ExtractConfig& cfg) {
    return assemble_resume(build_lines(pages, cfg), cfg);
}

}  // namespace cvextract
