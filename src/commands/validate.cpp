#include "commands/validate.hpp"

#include "cvextract/Validator.hpp"
#include "io/JsonIO.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  cvextract validate --resume <path> [--out <path>]\n";
    return 1;
}

int cmd_validate(int argc, char** argv) {
    const std::string resume_path = get_arg(argc, argv, "--resume", "");
    if (resume_path.empty()) {
        std::cerr << "error: missing --resume\n";
        return validate_usage();
    }
    const std::string out_path = get_arg(argc, argv, "--out", "validation_report.json");

    cvextract::ValidationReport rep;
    try {
        rep = cvextract::validate_resume(cvextract::load_resume_json(resume_path));
        cvextract::write_validation_report(fs::path(out_path), rep);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    if (!rep.pass) {
        std::cerr << "validation failed: wrote " << out_path << "\n";
        for (const auto& e : rep.errors) {
            std::cerr << "- " << e.code << ": " << e.message;
            if (!e.where.empty()) std::cerr << " (at " << e.where << ")";
            std::cerr << "\n";
        }
        return 1;
    }

    std::cout << "VALIDATION: pass\n";
    std::cout << "OUT_VALIDATE: " << out_path << "\n";
    return 0;
}
