#include "cvextract/WorkParser.hpp"

#include "cvextract/DateNormalizer.hpp"
#include "cvextract/TextUtil.hpp"
#include "cvextract/Vocabulary.hpp"

#include <algorithm>
#include <regex>

namespace cvextract {

static bool is_section_label(const std::string& text) {
    const std::string lowered = textutil::to_lower(text);
    return lowered == "achievements:" || lowered == "main responsibilities:";
}

static std::vector<std::string> clean_header_lines(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    for (const auto& t : header) {
        if (t.empty() || is_section_label(t)) continue;
        if (is_duration_line(t) || is_employment_type_line(t)) continue;
        out.push_back(t);
    }
    return out;
}

static bool is_company_name_word(const std::string& text) {
    const std::string t = textutil::trim(text);
    if (textutil::ends_with(t, ".") || textutil::ends_with(t, ":")) return false;
    const auto parts = textutil::split_words(t);
    return parts.size() == 1 && textutil::starts_upper(parts[0]);
}

static void finalize_work_entry(WorkEntry& entry, const std::vector<std::string>& content) {
    entry.location = find_location_from_block(content);

    std::vector<std::string> rest;
    for (const auto& t : content) {
        if (entry.location.empty() || t != entry.location) rest.push_back(t);
    }
    Highlights h = split_highlights(rest);
    entry.highlights = std::move(h.items);
    entry.summary = std::move(h.summary);
}

Highlights split_highlights(const std::vector<std::string>& texts) {
    Highlights out;
    std::vector<std::string> summary_parts;
    bool last_was_highlight = false;

    for (const auto& raw : texts) {
        const std::string t = textutil::trim(raw);
        if (t.empty() || is_achievements_label(t)) continue;

        if (is_bullet_line(t)) {
            out.items.push_back(strip_bullet(t));
            last_was_highlight = true;
        } else if (!out.items.empty() && last_was_highlight) {
            out.items.back() = textutil::trim(out.items.back() + " " + t);
        } else {
            summary_parts.push_back(t);
            last_was_highlight = false;
        }
    }
    out.summary = textutil::trim(textutil::join(summary_parts, " "));
    return out;
}

std::string find_location_from_block(const std::vector<std::string>& texts) {
    for (const auto& t : texts) {
        if (is_bullet_line(t)) continue;
        if (textutil::contains(t, ",") && textutil::char_count(t) <= 60 && !contains_date_range(t)) return t;
        if (textutil::char_count(t) <= 20 && textutil::starts_upper(t) && textutil::is_all_alpha(t) &&
            !contains_role_keyword(t)) {
            return t;
        }
    }
    return "";
}

std::pair<std::string, std::string> split_title_company(const std::vector<std::string>& texts) {
    if (texts.empty()) return {"", ""};

    static const std::regex at_re("\\s+at\\s+", std::regex::icase);
    const std::string& first = texts[0];
    if (textutil::contains(textutil::to_lower(first), " at ")) {
        std::sregex_token_iterator it(first.begin(), first.end(), at_re, -1);
        std::vector<std::string> parts(it, std::sregex_token_iterator());
        if (parts.size() >= 2) return {textutil::trim(parts[0]), textutil::trim(parts[1])};
    }

    std::string company;
    if (texts.size() > 1) {
        company = texts[1];
        const size_t dot = company.find("·");
        if (dot != std::string::npos) company = company.substr(0, dot);
        company = textutil::trim(company);
    }
    return {first, company};
}

std::pair<std::string, std::string> parse_company_position(const std::vector<std::string>& header,
                                                           const std::string& last_company) {
    if (header.empty()) return {last_company, ""};

    if (header.size() >= 2) {
        std::string company = header[0];
        std::string position = header[1];
        if (textutil::contains(textutil::to_lower(company), " at ")) {
            auto tc = split_title_company({company, position});
            position = tc.first;
            company = tc.second;
        }
        return {company, position};
    }

    if (textutil::contains(textutil::to_lower(header[0]), " at ")) {
        auto tc = split_title_company({header[0]});
        if (!tc.second.empty()) return {tc.second, tc.first};
    }
    return {last_company, header[0]};
}

bool is_header_candidate(const std::string& text) {
    if (textutil::ends_with(text, ".") || textutil::ends_with(text, ":")) return false;
    if (contains_role_keyword(text)) return true;
    for (const auto& suffix : vocab::company_suffixes()) {
        if (textutil::contains(text, suffix)) return true;
    }
    const auto words = textutil::split_words(text);
    if (words.size() >= 2) {
        const auto caps = static_cast<size_t>(std::count_if(words.begin(), words.end(), [](const std::string& w) {
            return textutil::starts_upper(w);
        }));
        return caps >= std::max<size_t>(1, words.size() / 2);
    }
    return false;
}

bool looks_like_header_start(const std::vector<LineShape>& shapes, size_t idx) {
    const std::string& text = shapes[idx].text;
    if (text.empty() || is_section_label(text)) return false;
    if (shapes[idx].bullet) return false;

    const LineShape* next = idx + 1 < shapes.size() ? &shapes[idx + 1] : nullptr;
    if (next && next->duration) return true;

    if (next && !next->text.empty() && contains_role_keyword(next->text) && idx + 2 < shapes.size() &&
        shapes[idx + 2].date_range) {
        return is_company_name_word(text) || is_header_candidate(text);
    }

    if (textutil::char_count(text) > 50 || !is_header_candidate(text)) return false;
    for (size_t offset = 1; offset < 4; ++offset) {
        if (idx + offset < shapes.size() && shapes[idx + offset].date_range) return true;
    }
    return false;
}

static std::vector<WorkEntry> parse_experience_pivot(const std::vector<Line>& lines) {
    std::vector<LineShape> shapes;
    for (const auto& l : lines) {
        LineShape s = shape_of(l.text);
        if (!s.text.empty() && !s.footer && !s.noise) shapes.push_back(std::move(s));
    }

    std::vector<WorkEntry> entries;
    std::optional<WorkEntry> current;
    std::vector<std::string> header;
    std::vector<std::string> content;
    std::string last_company;

    for (size_t i = 0; i < shapes.size(); ++i) {
        const LineShape& s = shapes[i];

        if (s.date_range) {
            if (current) {
                finalize_work_entry(*current, content);
                entries.push_back(std::move(*current));
            }
            auto cp = parse_company_position(clean_header_lines(header), last_company);
            header.clear();

            const DateRange dates = parse_date_range(s.text);
            current = WorkEntry{};
            current->name = cp.first;
            current->position = cp.second;
            current->start_date = dates.start;
            current->end_date = dates.end;
            if (!cp.first.empty()) last_company = cp.first;
            content.clear();
            continue;
        }

        if (s.duration && !header.empty()) {
            header.push_back(s.text);
            continue;
        }
        if (looks_like_header_start(shapes, i)) {
            header.push_back(s.text);
            continue;
        }
        if (current) {
            content.push_back(s.text);
        } else {
            header.push_back(s.text);
        }
    }

    if (current) {
        finalize_work_entry(*current, content);
        entries.push_back(std::move(*current));
    }

    entries.erase(std::remove_if(entries.begin(), entries.end(), [](const WorkEntry& e) {
        return e.name.empty() && e.position.empty();
    }), entries.end());
    return entries;
}

std::optional<WorkEntry> parse_work_block(const Block& block) {
    std::vector<std::string> raw;
    for (const auto& l : block) raw.push_back(l.text);
    const auto texts = filter_block_texts(raw, true, true);
    if (texts.empty()) return std::nullopt;

    auto date_it = std::find_if(texts.begin(), texts.end(), [](const std::string& t) {
        return contains_single_date(t);
    });

    WorkEntry entry;
    std::vector<std::string> before;
    std::vector<std::string> after;
    if (date_it != texts.end()) {
        const DateRange dates = parse_date_range(*date_it);
        entry.start_date = dates.start;
        entry.end_date = dates.end;
        before.assign(texts.begin(), date_it);
        after.assign(date_it + 1, texts.end());
    } else {
        before = texts;
    }

    before.erase(std::remove_if(before.begin(), before.end(), [](const std::string& t) {
        return is_duration_line(t);
    }), before.end());

    if (before.size() >= 2) {
        entry.name = before[0];
        entry.position = before[1];
    } else if (before.size() == 1) {
        entry.position = before[0];
    }

    std::vector<std::string> content = after;
    if (date_it == texts.end() && texts.size() > 2) content.assign(texts.begin() + 2, texts.end());
    finalize_work_entry(entry, content);

    if (entry.empty()) return std::nullopt;
    return entry;
}

std::vector<WorkEntry> parse_experience(const std::vector<Line>& lines, const ExtractConfig& cfg) {
    if (cfg.experience_strategy == ExperienceStrategy::Pivot) return parse_experience_pivot(lines);

    std::vector<WorkEntry> entries;
    for (const auto& block : split_experience_blocks(lines)) {
        auto e = parse_work_block(block);
        if (e && (!e->name.empty() || !e->position.empty())) entries.push_back(std::move(*e));
    }
    return entries;
}

}  // namespace cvextract
