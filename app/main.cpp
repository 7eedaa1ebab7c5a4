#include "commands/dump.hpp"
#include "commands/extract.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  cvextract extract <tokens.json|file.pdf> [args]\n"
        << "  cvextract dump <resume.json>\n"
        << "  cvextract validate --resume <resume.json> [--out <path>]\n"
        << "  cvextract help\n";
    return 1;
}

static int print_extract_help() {
    std::cerr
        << "usage:\n"
        << "  cvextract extract <input> [options]\n"
        << "\n"
        << "input:\n"
        << "  <input>                      token JSON ({\"pages\": [...]}) or a PDF (needs pdftotext)\n"
        << "\n"
        << "output:\n"
        << "  -o, --out <path>             default: resume.json\n"
        << "  --verbose                    per-stage counts on stderr\n"
        << "\n"
        << "tuning:\n"
        << "  --config <path>              JSON object with extraction thresholds\n"
        << "\n"
        << "enrichment (fills gaps only):\n"
        << "  --personal-info <path>       {\"phone\", \"additional_skills\"}\n"
        << "  --skills-csv <path>          Skills.csv from a profile export\n"
        << "  --certifications-csv <path>  Certifications.csv from a profile export\n"
        << "  --projects-csv <path>        Projects.csv from a profile export\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    if (cmd == "extract" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_extract_help();

    if (cmd == "extract")  return cmd_extract(argc - 1, argv + 1);
    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);
    if (cmd == "dump") {
        if (argc < 3) {
            std::cerr << "error: missing resume path\n";
            return print_usage();
        }
        return cmd_dump(argv[2]);
    }

    std::cerr << "unknown command\n";
    return print_usage();
}
