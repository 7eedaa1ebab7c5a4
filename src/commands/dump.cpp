#include "commands/dump.hpp"

#include "cvextract/Models.hpp"
#include "io/JsonIO.hpp"

#include <iostream>

using namespace cvextract;

static void print_dates(const std::string& start, const std::string& end) {
    if (start.empty() && end.empty()) return;
    std::cout << " (" << (start.empty() ? "?" : start) << " - " << (end.empty() ? "present" : end) << ")";
}

int cmd_dump(const std::string& resume_path) {
    Resume r;
    try {
        r = load_resume_json(resume_path);
    } catch (const std::exception& e) {
        std::cerr << "error: failed to load resume: " << e.what() << "\n";
        return 1;
    }

    std::cout << "[Basics] " << r.basics.name;
    if (!r.basics.label.empty()) std::cout << " - " << r.basics.label;
    std::cout << "\n";
    if (!r.basics.email.empty()) std::cout << "  email: " << r.basics.email << "\n";
    if (!r.basics.phone.empty()) std::cout << "  phone: " << r.basics.phone << "\n";
    if (!r.basics.location.empty()) std::cout << "  location: " << r.basics.location << "\n";
    for (const auto& p : r.basics.profiles) std::cout << "  " << p.network << ": " << p.url << "\n";
    std::cout << "\n";

    for (const auto& w : r.work) {
        std::cout << "[Work] " << w.position << " - " << w.name;
        print_dates(w.start_date, w.end_date);
        std::cout << "\n";
        for (const auto& h : w.highlights) std::cout << "  - " << h << "\n";
    }

    for (const auto& e : r.education) {
        std::cout << "[Education] " << e.institution;
        if (!e.study_type.empty()) std::cout << ", " << e.study_type;
        if (!e.area.empty()) std::cout << " in " << e.area;
        print_dates(e.start_date, e.end_date);
        std::cout << "\n";
    }

    for (const auto& c : r.certificates) std::cout << "[Certificate] " << c.name << "\n";

    for (const auto& p : r.projects) {
        std::cout << "[Project] " << p.name;
        print_dates(p.start_date, p.end_date);
        std::cout << "\n";
    }

    for (const auto& v : r.volunteer) {
        std::cout << "[Volunteer] " << v.position << " - " << v.organization;
        print_dates(v.start_date, v.end_date);
        std::cout << "\n";
    }

    if (!r.skills.empty()) {
        std::cout << "[Skills] ";
        for (size_t i = 0; i < r.skills.size(); ++i) {
            std::cout << r.skills[i].name;
            if (i + 1 < r.skills.size()) std::cout << ", ";
        }
        std::cout << "\n";
    }

    for (const auto& l : r.languages) {
        std::cout << "[Language] " << l.language;
        if (!l.fluency.empty()) std::cout << " (" << l.fluency << ")";
        std::cout << "\n";
    }

    for (const auto& i : r.interests) std::cout << "[Interest] " << i.name << "\n";

    return 0;
}
