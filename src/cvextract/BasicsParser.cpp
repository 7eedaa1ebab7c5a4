#include "cvextract/BasicsParser.hpp"

#include "cvextract/LineShape.hpp"
#include "cvextract/TextUtil.hpp"
#include "cvextract/Vocabulary.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace cvextract {

static const std::regex& email_re() {
    static const std::regex re("[a-z0-9._%+-]+@[a-z0-9.-]+\\.[a-z]{2,}", std::regex::icase);
    return re;
}

static const std::regex& url_re() {
    static const std::regex re(
        "https?://\\S+|www\\.\\S+|linkedin\\.com/\\S+|github\\.com/\\S+|gitlab\\.com/\\S+",
        std::regex::icase);
    return re;
}

static const std::regex& phone_re() {
    static const std::regex re("(?:\\+?\\d{1,3}[\\s.-]?)?(?:\\(?\\d{2,3}\\)?[\\s.-]?)?\\d{3}[\\s.-]?\\d{4}");
    return re;
}

static bool looks_like_contact(const std::string& text) {
    return std::regex_search(text, email_re()) || std::regex_search(text, url_re()) ||
           std::regex_search(text, phone_re());
}

// labels and footers that never carry a value; "Contact Jane" is kept for the name
static bool is_header_noise(const std::string& text) {
    const std::string lowered = textutil::to_lower(text);
    if (textutil::starts_with(lowered, "contact ")) return false;
    return is_noise_line(text);
}

std::string clean_contact_name(const std::string& text) {
    if (textutil::starts_with(textutil::to_lower(text), "contact ")) {
        return textutil::trim(text.substr(std::string("contact ").size()));
    }
    return text;
}

bool is_location_text(const std::string& text) {
    if (textutil::char_count(text) > 60) return false;
    if (textutil::contains(text, ",")) return true;
    const std::string folded = textutil::fold(text);
    for (const auto& k : vocab::location_keywords()) {
        if (textutil::contains(folded, k)) return true;
    }
    return false;
}

NameLabel pick_name_label(const std::vector<Line>& lines, size_t scan_lines) {
    NameLabel out;
    const size_t n = std::min(scan_lines, lines.size());
    for (size_t i = 0; i < n; ++i) {
        const std::string text = textutil::trim(lines[i].text);
        if (text.empty() || is_header_noise(text)) continue;
        if (looks_like_contact(text)) continue;

        if (out.name.empty()) {
            out.name = clean_contact_name(text);
            continue;
        }
        if (!is_location_text(text)) {
            out.label = text;
            break;
        }
    }
    return out;
}

std::string find_location(const std::vector<Line>& lines, size_t scan_lines) {
    const size_t n = std::min(scan_lines, lines.size());
    for (size_t i = 0; i < n; ++i) {
        const std::string text = textutil::trim(lines[i].text);
        if (is_location_text(text) && !std::regex_search(text, email_re())) return text;
        if (textutil::contains(textutil::to_lower(text), " area")) return text;
    }
    return "";
}

std::string find_email(const std::vector<Line>& lines) {
    std::smatch m;
    for (const auto& l : lines) {
        if (std::regex_search(l.text, m, email_re())) return m.str(0);
    }
    return "";
}

std::string find_phone(const std::vector<Line>& lines) {
    for (const auto& l : lines) {
        const std::string text = textutil::trim(l.text);
        const std::string lowered = textutil::to_lower(text);
        if (textutil::contains(lowered, "linkedin") || textutil::contains(lowered, "github")) continue;
        if (std::regex_search(text, url_re())) continue;

        std::smatch m;
        if (!std::regex_search(text, m, phone_re())) continue;
        const std::string found = m.str(0);
        const auto digits = std::count_if(found.begin(), found.end(),
                                          [](unsigned char c) { return std::isdigit(c) != 0; });
        if (digits < 7) continue;
        return found;
    }
    return "";
}

std::vector<std::string> find_urls(const std::vector<Line>& lines) {
    std::vector<std::string> urls;
    for (const auto& l : lines) {
        auto begin = std::sregex_iterator(l.text.begin(), l.text.end(), url_re());
        for (auto it = begin; it != std::sregex_iterator(); ++it) urls.push_back(it->str());
    }
    return urls;
}

std::string extract_linkedin_from_lines(const std::vector<Line>& lines) {
    static const std::regex re("(\\S+)\\s*\\(LinkedIn\\)", std::regex::icase);
    for (const auto& l : lines) {
        std::smatch m;
        if (!std::regex_search(l.text, m, re)) continue;
        const std::string handle = textutil::trim(m.str(1));
        if (!handle.empty() && !textutil::contains(textutil::to_lower(handle), "linkedin.com")) {
            return "https://www.linkedin.com/in/" + handle;
        }
    }
    return "";
}

// linkedin.com/in/<handle> with a handle that was not cut by a line wrap
static bool is_full_linkedin(const std::string& lower_url) {
    const std::string marker = "linkedin.com/in/";
    const size_t pos = lower_url.find(marker);
    if (pos == std::string::npos) return false;
    const std::string handle = textutil::rstrip_chars(lower_url.substr(pos + marker.size()), "/");
    return !handle.empty() && handle.back() != '-';
}

std::vector<Profile> build_profiles(const std::vector<std::string>& urls, const std::vector<Line>& lines) {
    std::vector<std::string> collected;
    for (const auto& u : urls) collected.push_back(textutil::rstrip_chars(u, ").,"));
    const std::string extra = extract_linkedin_from_lines(lines);
    if (!extra.empty()) collected.push_back(extra);

    const bool has_full_linkedin = std::any_of(collected.begin(), collected.end(), [](const std::string& u) {
        return is_full_linkedin(textutil::to_lower(u));
    });

    std::vector<Profile> profiles;
    std::unordered_set<std::string> seen;
    for (const auto& url : collected) {
        const std::string lower = textutil::to_lower(url);

        std::string network;
        if (textutil::contains(lower, "linkedin.com")) {
            if (has_full_linkedin && !is_full_linkedin(lower)) continue;
            network = "LinkedIn";
        } else if (textutil::contains(lower, "github.com")) {
            network = "GitHub";
        } else if (textutil::contains(lower, "twitter.com")) {
            network = "Twitter";
        }

        const std::string key = textutil::to_lower(network) + "::" + textutil::rstrip_chars(lower, "/");
        if (!seen.insert(key).second) continue;
        profiles.push_back(Profile{network.empty() ? "Website" : network, url});
    }
    return profiles;
}

Basics parse_basics(const std::vector<Line>& lines,
                    const std::vector<Line>& about_lines,
                    const ExtractConfig& cfg) {
    Basics b;
    const auto scan = static_cast<size_t>(std::max(cfg.header_scan_lines, 0));

    NameLabel nl = pick_name_label(lines, scan);
    b.name = std::move(nl.name);
    b.label = std::move(nl.label);
    b.location = find_location(lines, scan);
    b.email = find_email(lines);
    b.phone = find_phone(lines);
    b.profiles = build_profiles(find_urls(lines), lines);

    std::vector<std::string> summary;
    for (const auto& l : about_lines) {
        const std::string t = textutil::trim(l.text);
        if (!t.empty() && !is_noise_line(t)) summary.push_back(t);
    }
    b.summary = textutil::trim(textutil::join(summary, " "));
    return b;
}

}  // namespace cvextract
