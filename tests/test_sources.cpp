#include <catch2/catch.hpp>

#include "io/CsvReader.hpp"
#include "io/PdfWordSource.hpp"
#include "io/ProcUtil.hpp"

#include <filesystem>
#include <fstream>

using namespace cvextract;

TEST_CASE("xml entities decode to UTF-8", "[pdf]") {
    REQUIRE(decode_xml_entities("R&amp;D") == "R&D");
    REQUIRE(decode_xml_entities("&lt;b&gt;") == "<b>");
    REQUIRE(decode_xml_entities("&#233;t&#xE9;") == "\xC3\xA9t\xC3\xA9");
    REQUIRE(decode_xml_entities("a & b") == "a & b");
    REQUIRE(decode_xml_entities("&bogus;") == "&bogus;");
}

TEST_CASE("pdftotext bbox output becomes pages of words", "[pdf]") {
    const std::string xhtml =
        "<!DOCTYPE html><html><head><title></title></head><body>\n"
        "<doc>\n"
        "  <page width=\"612.000000\" height=\"792.000000\">\n"
        "    <word xMin=\"72.0\" yMin=\"70.5\" xMax=\"101.2\" yMax=\"82.5\">Jane</word>\n"
        "    <word xMin=\"104.0\" yMin=\"70.5\" xMax=\"130.0\" yMax=\"82.5\">R&amp;D</word>\n"
        "  </page>\n"
        "  <page width=\"595.000000\" height=\"842.000000\">\n"
        "  </page>\n"
        "</doc>\n"
        "</body></html>\n";

    const auto pages = parse_bbox_document(xhtml);
    REQUIRE(pages.size() == 2);
    REQUIRE(pages[0].width == Approx(612.0));
    REQUIRE(pages[0].words.size() == 2);
    REQUIRE(pages[0].words[0].text == "Jane");
    REQUIRE(pages[0].words[0].box.left == Approx(72.0));
    REQUIRE(pages[0].words[0].box.top == Approx(70.5));
    REQUIRE(pages[0].words[0].box.right == Approx(101.2));
    REQUIRE(pages[0].words[0].box.bottom == Approx(82.5));
    REQUIRE(pages[0].words[1].text == "R&D");
    REQUIRE(pages[1].width == Approx(595.0));
    REQUIRE(pages[1].words.empty());
}

TEST_CASE("csv records handle quoting", "[csv]") {
    const std::string text =
        "\xEF\xBB\xBFName,Authority,Url\r\n"
        "\"Cloud, Advanced\",\"The \"\"Cloud\"\" Org\",https://x.example\r\n"
        "\"Two\nLines\",Org,\r\n"
        "\r\n";

    const auto rows = parse_csv_records(text);
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].at("Name") == "Cloud, Advanced");
    REQUIRE(rows[0].at("Authority") == "The \"Cloud\" Org");
    REQUIRE(rows[0].at("Url") == "https://x.example");
    REQUIRE(rows[1].at("Name") == "Two\nLines");
    REQUIRE(rows[1].at("Authority") == "Org");
    REQUIRE(rows[1].count("Url") == 0);
}

TEST_CASE("export csv files load into records", "[csv]") {
    const auto dir = std::filesystem::temp_directory_path() / "cvextract_csv_test";
    std::filesystem::create_directories(dir);

    const auto certs = dir / "Certifications.csv";
    {
        std::ofstream out(certs);
        out << "Name,Url,Authority,Started On,Finished On,License Number\n"
            << "CKA,https://cncf.example,CNCF,Mar 2021,,ABC\n";
    }
    const auto records = load_certification_records_csv(certs.string());
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].name == "CKA");
    REQUIRE(records[0].issuer == "CNCF");
    REQUIRE(records[0].started_on == "Mar 2021");
    REQUIRE(records[0].finished_on.empty());

    const auto projects = dir / "Projects.csv";
    {
        std::ofstream out(projects);
        out << "Title,Description,Url,Started On,Finished On\n"
            << "cvextract,\"Parses resumes, well\",,Jan 2023,\n";
    }
    const auto prs = load_project_records_csv(projects.string());
    REQUIRE(prs.size() == 1);
    REQUIRE(prs[0].description == "Parses resumes, well");

    const auto skills = dir / "Skills.csv";
    {
        std::ofstream out(skills);
        out << "Name\nPython\nSQL\n";
    }
    REQUIRE(load_skill_names_csv(skills.string()) == std::vector<std::string>{"Python", "SQL"});

    std::filesystem::remove_all(dir);

    REQUIRE_THROWS_WITH(read_csv_records((dir / "missing.csv").string()),
                        Catch::Contains("failed to open CSV file"));
}

TEST_CASE("shell commands are quoted and captured", "[proc]") {
    REQUIRE(procutil::shell_quote("a b") == "'a b'");
    REQUIRE(procutil::shell_quote("it's") == "'it'\\''s'");

    const auto res = procutil::run_capture("printf '%s' " + procutil::shell_quote("it's"));
    REQUIRE(res.exit_code == 0);
    REQUIRE(res.output == "it's");

    REQUIRE_THROWS(procutil::run_capture_stdout("exit 3"));
}
