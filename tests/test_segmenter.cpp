#include <catch2/catch.hpp>

#include "cvextract/BlockSegmenter.hpp"

#include "TestLines.hpp"

using namespace cvextract;
using testlines::line;

static std::vector<std::string> texts(const Block& block) {
    std::vector<std::string> out;
    for (const auto& l : block) out.push_back(l.text);
    return out;
}

TEST_CASE("median line height", "[segmenter]") {
    std::vector<Line> lines{line("a", 0.0), line("b", 20.0), line("c", 40.0)};
    lines[1].bottom = lines[1].top + 12.0;
    lines[2].bottom = lines[2].top + 20.0;
    REQUIRE(median_line_height(lines, 10.0) == Approx(12.0));

    lines.pop_back();
    REQUIRE(median_line_height(lines, 10.0) == Approx(11.0));

    Line flat = line("flat", 0.0);
    flat.bottom = flat.top;
    REQUIRE(median_line_height({flat}, 10.0) == Approx(10.0));
}

TEST_CASE("split_blocks cuts at vertical gaps", "[segmenter]") {
    std::vector<Line> lines{
        line("Project One", 0.0), line("Does things", 12.0),
        line("Project Two", 60.0), line("Does more", 72.0),
    };

    const auto blocks = split_blocks(lines);
    REQUIRE(blocks.size() == 2);
    REQUIRE(texts(blocks[0]) == std::vector<std::string>{"Project One", "Does things"});
    REQUIRE(texts(blocks[1]) == std::vector<std::string>{"Project Two", "Does more"});
    REQUIRE(split_blocks({}).empty());
}

TEST_CASE("continuation blocks fold into their predecessor", "[segmenter]") {
    std::vector<Line> lines{
        line("Acme", 0.0), line("Jan 2019 - Present", 12.0),
        line("- built the thing", 60.0),
        line("3 years 2 months", 120.0),
    };

    const auto blocks = split_blocks(lines);
    REQUIRE(blocks.size() == 1);
    REQUIRE(blocks[0].size() == 4);
}

TEST_CASE("is_continuation_block", "[segmenter]") {
    REQUIRE(is_continuation_block({line("Achievements: shipped v2", 0.0)}));
    REQUIRE(is_continuation_block({line("\xE2\x80\xA2 bullet", 0.0)}));
    REQUIRE(is_continuation_block({line("Page 2 of 3", 0.0)}));
    REQUIRE(is_continuation_block({line("3 years 2 months", 0.0)}));
    REQUIRE_FALSE(is_continuation_block({line("Acme", 0.0), line("2019 - 2021", 12.0), line("2 years", 24.0)}));
    REQUIRE_FALSE(is_continuation_block({line("Acme", 0.0)}));
}

TEST_CASE("experience blocks carry the company to position-only starts", "[segmenter]") {
    const auto lines = testlines::stacked({
        "Acme Corp",
        "2 years 3 months",
        "Senior Engineer",
        "Jan 2020 - Present",
        "- Built things",
        "Engineer",
        "Mar 2018 - Dec 2019",
        "Beta LLC",
        "2 years",
        "Developer",
        "2016 - 2018",
    });

    const auto blocks = split_experience_blocks(lines);
    REQUIRE(blocks.size() == 3);
    REQUIRE(texts(blocks[0]) == std::vector<std::string>{
        "Acme Corp", "2 years 3 months", "Senior Engineer", "Jan 2020 - Present", "- Built things"});
    REQUIRE(texts(blocks[1]) == std::vector<std::string>{"Acme Corp", "Engineer", "Mar 2018 - Dec 2019"});
    REQUIRE(texts(blocks[2]) == std::vector<std::string>{"Beta LLC", "2 years", "Developer", "2016 - 2018"});
}

TEST_CASE("education blocks pair institution and degree", "[segmenter]") {
    const auto lines = testlines::stacked({
        "Stanford University",
        "Master of Science, Computer Science (2014 - 2016)",
        "MIT",
        "Bachelor of Science, Physics (2010 -",
        "2014)",
        "Page 1 of 2",
        "Coursera",
    });

    const auto blocks = split_education_blocks(lines);
    REQUIRE(blocks.size() == 3);
    REQUIRE(blocks[0].size() == 2);
    REQUIRE(texts(blocks[1]) == std::vector<std::string>{"MIT", "Bachelor of Science, Physics (2010 - 2014)"});
    REQUIRE(texts(blocks[2]) == std::vector<std::string>{"Coursera"});
}
