#pragma once
#include <string>
#include <vector>

#include "cvextract/ExtractConfig.hpp"
#include "cvextract/Models.hpp"

namespace cvextract {

struct NameLabel {
    std::string name;
    std::string label;
};

// First non-contact line of the header is the name, the next non-location line the headline.
NameLabel pick_name_label(const std::vector<Line>& lines, size_t scan_lines);

// "Contact Jane Doe" -> "Jane Doe"
std::string clean_contact_name(const std::string& text);

// short and either comma separated or containing a region keyword
bool is_location_text(const std::string& text);
std::string find_location(const std::vector<Line>& lines, size_t scan_lines);

std::string find_email(const std::vector<Line>& lines);
std::string find_phone(const std::vector<Line>& lines);
std::vector<std::string> find_urls(const std::vector<Line>& lines);

// "jane-doe (LinkedIn)" -> https://www.linkedin.com/in/jane-doe
std::string extract_linkedin_from_lines(const std::vector<Line>& lines);

// classify by domain, drop truncated or bare LinkedIn links when a full
// /in/<handle> link exists, dedupe case-insensitively
std::vector<Profile> build_profiles(const std::vector<std::string>& urls, const std::vector<Line>& lines);

Basics parse_basics(const std::vector<Line>& lines,
                    const std::vector<Line>& about_lines,
                    const ExtractConfig& cfg = {});

}  // namespace cvextract
