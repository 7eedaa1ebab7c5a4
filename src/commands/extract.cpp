#include "commands/extract.hpp"

#include "cvextract/Enrichment.hpp"
#include "cvextract/LineBuilder.hpp"
#include "cvextract/ResumeAssembler.hpp"
#include "cvextract/SectionClassifier.hpp"
#include "cvextract/TextUtil.hpp"
#include "io/CsvReader.hpp"
#include "io/JsonIO.hpp"
#include "io/PdfWordSource.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

using namespace cvextract;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

// first argument that is neither an option nor an option's value
static std::string positional(int argc, char** argv) {
    static const char* kValued[] = {"-o", "--out", "--config", "--personal-info",
                                    "--skills-csv", "--certifications-csv", "--projects-csv"};
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        bool valued = false;
        for (const char* k : kValued) valued = valued || a == k;
        if (valued) {
            ++i;
            continue;
        }
        if (!textutil::starts_with(a, "-")) return a;
    }
    return "";
}

static int extract_usage() {
    std::cerr
        << "usage:\n"
        << "  cvextract extract <tokens.json|file.pdf> [-o resume.json] [--config cfg.json]\n"
        << "                    [--personal-info p.json] [--skills-csv Skills.csv]\n"
        << "                    [--certifications-csv Certifications.csv] [--projects-csv Projects.csv]\n"
        << "                    [--verbose]\n";
    return 1;
}

static std::vector<Page> load_pages(const std::string& input) {
    if (textutil::ends_with(textutil::to_lower(input), ".pdf")) return decode_pdf_words(input);
    return load_token_document(input);
}

static void log_stages(const std::vector<Line>& lines, const ExtractConfig& cfg) {
    std::cerr << "[info] lines: " << lines.size() << "\n";

    const auto split = cfg.detect_columns ? detect_column_split(lines, cfg) : std::nullopt;
    if (split) {
        std::cerr << "[info] column split at x=" << *split << "\n";
    } else {
        std::cerr << "[info] single column\n";
    }

    for (const auto& kv : split_sections(lines, cfg)) {
        std::cerr << "[info] section " << section_name(kv.first) << ": " << kv.second.size() << " lines\n";
    }
}

int cmd_extract(int argc, char** argv) {
    const std::string input = positional(argc, argv);
    if (input.empty()) {
        std::cerr << "error: missing input file\n";
        return extract_usage();
    }

    try {
        const std::string out_path = get_arg(argc, argv, "-o", get_arg(argc, argv, "--out", "resume.json"));
        const std::string config_path = get_arg(argc, argv, "--config", "");
        const bool verbose = has_flag(argc, argv, "--verbose");

        const ExtractConfig cfg = config_path.empty() ? ExtractConfig{} : load_extract_config(config_path);

        const std::vector<Page> pages = load_pages(input);
        const std::vector<Line> lines = build_lines(pages, cfg);
        if (verbose) log_stages(lines, cfg);

        Resume resume = assemble_resume(lines, cfg);

        bool enriched = false;
        const std::string personal = get_arg(argc, argv, "--personal-info", "");
        const std::string skills_csv = get_arg(argc, argv, "--skills-csv", "");
        const std::string certs_csv = get_arg(argc, argv, "--certifications-csv", "");
        const std::string projects_csv = get_arg(argc, argv, "--projects-csv", "");

        if (!personal.empty()) enriched = merge_personal_info(resume, load_personal_info(personal)) || enriched;
        if (!skills_csv.empty()) enriched = merge_skill_names(resume, load_skill_names_csv(skills_csv)) || enriched;
        if (!certs_csv.empty()) {
            enriched = merge_certification_records(resume, load_certification_records_csv(certs_csv)) || enriched;
        }
        if (!projects_csv.empty()) {
            enriched = merge_project_records(resume, load_project_records_csv(projects_csv)) || enriched;
        }
        if (verbose && enriched) std::cerr << "[info] resume enriched from sidecar files\n";

        write_resume_json(out_path, resume);

        std::cout << "OUT_RESUME: " << out_path << "\n";
        std::cout << "WORK: " << resume.work.size() << "\n";
        std::cout << "EDUCATION: " << resume.education.size() << "\n";
        std::cout << "SKILLS: " << resume.skills.size() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: extract failed: " << e.what() << "\n";
        return 1;
    }
}
