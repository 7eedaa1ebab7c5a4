#include "io/JsonIO.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace cvextract {

static json read_json_file(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON in " + path + ": " + e.what());
    }
    return j;
}

static std::string index_path(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where << "." << key << "[" << i << "]";
    return oss.str();
}

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static double require_number(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

// first of `key` / `alias` that is present
static double require_number_alias(const json& j, const char* key, const char* alias, const std::string& where) {
    if (!j.contains(key) && j.contains(alias)) return require_number(j, alias, where);
    return require_number(j, key, where);
}

static std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    return require_string(j, key, where);
}

static std::vector<std::string> optional_string_array(const json& j, const char* key, const std::string& where) {
    std::vector<std::string> out;
    if (!j.contains(key) || j.at(key).is_null()) return out;

    const json& arr = j.at(key);
    require_array(arr, where + "." + key);
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            throw std::runtime_error(index_path(where, key, i) + " must be a string");
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

// calls fn(item, path) for every object in j[key], if present
template <typename Fn>
static void for_each_object(const json& j, const char* key, const std::string& where, Fn fn) {
    if (!j.contains(key) || j.at(key).is_null()) return;
    const json& arr = j.at(key);
    require_array(arr, where + "." + key);
    for (size_t i = 0; i < arr.size(); ++i) {
        const std::string item_where = index_path(where, key, i);
        require_object(arr.at(i), item_where);
        fn(arr.at(i), item_where);
    }
}

// ---- token documents ----

static WordToken parse_word(const json& j, const std::string& where, int page) {
    require_object(j, where);

    WordToken w;
    w.text       = require_string(j, "text", where);
    w.box.top    = require_number(j, "top", where);
    w.box.bottom = require_number(j, "bottom", where);
    w.box.left   = require_number_alias(j, "x0", "left", where);
    w.box.right  = require_number_alias(j, "x1", "right", where);
    w.page = page;
    return w;
}

std::vector<Page> token_document_from_json(const json& j) {
    require_object(j, "root");
    if (!j.contains("pages")) {
        throw std::runtime_error("root missing required field: pages");
    }
    const json& pages = j.at("pages");
    require_array(pages, "root.pages");

    std::vector<Page> out;
    out.reserve(pages.size());
    for (size_t p = 0; p < pages.size(); ++p) {
        const std::string where = index_path("root", "pages", p);
        const json& pj = pages.at(p);
        require_object(pj, where);

        Page page;
        page.width = require_number(pj, "width", where);
        if (!pj.contains("words")) {
            throw std::runtime_error(where + " missing required field: words");
        }
        const json& words = pj.at("words");
        require_array(words, where + ".words");
        for (size_t i = 0; i < words.size(); ++i) {
            page.words.push_back(parse_word(words.at(i), index_path(where, "words", i), static_cast<int>(p)));
        }
        out.push_back(std::move(page));
    }
    return out;
}

std::vector<Page> load_token_document(const std::string& path) {
    return token_document_from_json(read_json_file(path, "token"));
}

// ---- resume ----

json resume_to_json(const Resume& r) {
    json basics;
    basics["name"] = r.basics.name;
    basics["label"] = r.basics.label;
    basics["email"] = r.basics.email;
    basics["phone"] = r.basics.phone;
    basics["location"] = json{{"address", r.basics.location}};
    basics["profiles"] = json::array();
    for (const auto& p : r.basics.profiles) {
        basics["profiles"].push_back(json{{"network", p.network}, {"url", p.url}});
    }
    basics["summary"] = r.basics.summary;

    json j;
    j["basics"] = basics;

    j["work"] = json::array();
    for (const auto& w : r.work) {
        j["work"].push_back(json{
            {"name", w.name},
            {"position", w.position},
            {"location", w.location},
            {"startDate", w.start_date},
            {"endDate", w.end_date},
            {"summary", w.summary},
            {"highlights", w.highlights},
        });
    }

    j["education"] = json::array();
    for (const auto& e : r.education) {
        j["education"].push_back(json{
            {"institution", e.institution},
            {"studyType", e.study_type},
            {"area", e.area},
            {"startDate", e.start_date},
            {"endDate", e.end_date},
        });
    }

    j["skills"] = json::array();
    for (const auto& s : r.skills) j["skills"].push_back(json{{"name", s.name}});

    j["certificates"] = json::array();
    for (const auto& c : r.certificates) {
        j["certificates"].push_back(json{{"name", c.name}, {"issuer", c.issuer}, {"date", c.date}, {"url", c.url}});
    }

    j["projects"] = json::array();
    for (const auto& p : r.projects) {
        j["projects"].push_back(json{
            {"name", p.name},
            {"description", p.description},
            {"url", p.url},
            {"startDate", p.start_date},
            {"endDate", p.end_date},
        });
    }

    j["volunteer"] = json::array();
    for (const auto& v : r.volunteer) {
        j["volunteer"].push_back(json{
            {"organization", v.organization},
            {"position", v.position},
            {"startDate", v.start_date},
            {"endDate", v.end_date},
            {"summary", v.summary},
        });
    }

    j["languages"] = json::array();
    for (const auto& l : r.languages) {
        j["languages"].push_back(json{{"language", l.language}, {"fluency", l.fluency}});
    }

    j["interests"] = json::array();
    for (const auto& i : r.interests) j["interests"].push_back(json{{"name", i.name}});

    return j;
}

Resume resume_from_json(const json& j) {
    require_object(j, "root");

    Resume r;
    if (j.contains("basics")) {
        const json& b = j.at("basics");
        const std::string where = "root.basics";
        require_object(b, where);
        r.basics.name    = optional_string(b, "name", where);
        r.basics.label   = optional_string(b, "label", where);
        r.basics.email   = optional_string(b, "email", where);
        r.basics.phone   = optional_string(b, "phone", where);
        r.basics.summary = optional_string(b, "summary", where);
        if (b.contains("location")) {
            const json& loc = b.at("location");
            if (loc.is_string()) {
                r.basics.location = loc.get<std::string>();
            } else {
                require_object(loc, where + ".location");
                r.basics.location = optional_string(loc, "address", where + ".location");
            }
        }
        for_each_object(b, "profiles", where, [&](const json& p, const std::string& w) {
            r.basics.profiles.push_back(Profile{optional_string(p, "network", w), optional_string(p, "url", w)});
        });
    }

    for_each_object(j, "work", "root", [&](const json& o, const std::string& w) {
        WorkEntry e;
        e.name       = optional_string(o, "name", w);
        e.position   = optional_string(o, "position", w);
        e.location   = optional_string(o, "location", w);
        e.start_date = optional_string(o, "startDate", w);
        e.end_date   = optional_string(o, "endDate", w);
        e.summary    = optional_string(o, "summary", w);
        e.highlights = optional_string_array(o, "highlights", w);
        r.work.push_back(std::move(e));
    });

    for_each_object(j, "education", "root", [&](const json& o, const std::string& w) {
        EducationEntry e;
        e.institution = optional_string(o, "institution", w);
        e.study_type  = optional_string(o, "studyType", w);
        e.area        = optional_string(o, "area", w);
        e.start_date  = optional_string(o, "startDate", w);
        e.end_date    = optional_string(o, "endDate", w);
        r.education.push_back(std::move(e));
    });

    for_each_object(j, "skills", "root", [&](const json& o, const std::string& w) {
        r.skills.push_back(SkillEntry{optional_string(o, "name", w)});
    });

    for_each_object(j, "certificates", "root", [&](const json& o, const std::string& w) {
        r.certificates.push_back(CertificateEntry{
            optional_string(o, "name", w),
            optional_string(o, "issuer", w),
            optional_string(o, "date", w),
            optional_string(o, "url", w),
        });
    });

    for_each_object(j, "projects", "root", [&](const json& o, const std::string& w) {
        ProjectEntry p;
        p.name        = optional_string(o, "name", w);
        p.description = optional_string(o, "description", w);
        p.url         = optional_string(o, "url", w);
        p.start_date  = optional_string(o, "startDate", w);
        p.end_date    = optional_string(o, "endDate", w);
        r.projects.push_back(std::move(p));
    });

    for_each_object(j, "volunteer", "root", [&](const json& o, const std::string& w) {
        VolunteerEntry v;
        v.organization = optional_string(o, "organization", w);
        v.position     = optional_string(o, "position", w);
        v.start_date   = optional_string(o, "startDate", w);
        v.end_date     = optional_string(o, "endDate", w);
        v.summary      = optional_string(o, "summary", w);
        r.volunteer.push_back(std::move(v));
    });

    for_each_object(j, "languages", "root", [&](const json& o, const std::string& w) {
        r.languages.push_back(LanguageEntry{optional_string(o, "language", w), optional_string(o, "fluency", w)});
    });

    for_each_object(j, "interests", "root", [&](const json& o, const std::string& w) {
        r.interests.push_back(InterestEntry{optional_string(o, "name", w)});
    });

    return r;
}

Resume load_resume_json(const std::string& path) {
    return resume_from_json(read_json_file(path, "resume"));
}

void write_resume_json(const std::string& path, const Resume& r) {
    const std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("failed to write resume file: " + path);
    }
    out << resume_to_json(r).dump(2) << "\n";
}

// ---- config ----

template <typename T>
static void read_number(const json& j, const char* key, T& field) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number()) {
        throw std::runtime_error("config." + std::string(key) + " must be a number");
    }
    field = j.at(key).get<T>();
}

ExtractConfig extract_config_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("config must be an object");
    }

    ExtractConfig cfg;
    read_number(j, "band_tolerance", cfg.band_tolerance);
    read_number(j, "min_column_gap", cfg.min_column_gap);
    read_number(j, "column_gap_ratio", cfg.column_gap_ratio);
    read_number(j, "min_lines_for_columns", cfg.min_lines_for_columns);
    read_number(j, "min_column_split_gap", cfg.min_column_split_gap);
    read_number(j, "max_heading_chars", cfg.max_heading_chars);
    read_number(j, "max_heading_words", cfg.max_heading_words);
    read_number(j, "block_gap_factor", cfg.block_gap_factor);
    read_number(j, "default_line_height", cfg.default_line_height);
    read_number(j, "header_scan_lines", cfg.header_scan_lines);

    if (j.contains("detect_columns")) {
        if (!j.at("detect_columns").is_boolean()) {
            throw std::runtime_error("config.detect_columns must be a boolean");
        }
        cfg.detect_columns = j.at("detect_columns").get<bool>();
    }

    if (j.contains("experience_strategy")) {
        const std::string s = require_string(j, "experience_strategy", "config");
        if (s == "pivot") {
            cfg.experience_strategy = ExperienceStrategy::Pivot;
        } else if (s == "blocks") {
            cfg.experience_strategy = ExperienceStrategy::Blocks;
        } else {
            throw std::runtime_error("config.experience_strategy must be \"pivot\" or \"blocks\", got: " + s);
        }
    }
    return cfg;
}

ExtractConfig load_extract_config(const std::string& path) {
    return extract_config_from_json(read_json_file(path, "config"));
}

// ---- sidecars ----

PersonalInfo personal_info_from_json(const json& j) {
    require_object(j, "root");

    PersonalInfo info;
    info.phone = optional_string(j, "phone", "root");
    info.additional_skills = optional_string_array(j, "additional_skills", "root");
    return info;
}

PersonalInfo load_personal_info(const std::string& path) {
    return personal_info_from_json(read_json_file(path, "personal info"));
}

}  // namespace cvextract
