/**
 * @file test_report_assembler.cpp
 * @brief Unit tests for figure/artifact pairing and markdown rendering
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/report_assembler.hpp"

using namespace sandlyst;

TEST_CASE("Figures pair with artifacts by position", "[report]") {
    std::vector<FigureSpec> figures = {
        FigureSpec("Revenue", "Monthly revenue."),
        FigureSpec("Costs", "Monthly costs.")
    };

    SECTION("Equal counts") {
        Report report = build_report("Summary", figures, {"/r/a_1.png", "/r/a_2.png"});
        REQUIRE(report.sections().size() == 2);
        REQUIRE(report.sections()[0].image_path == "/r/a_1.png");
        REQUIRE(report.sections()[1].image_path == "/r/a_2.png");
    }

    SECTION("More figures than artifacts") {
        Report report = build_report("Summary", figures, {"/r/a_1.png"});
        REQUIRE(report.sections().size() == 2);
        REQUIRE(report.sections()[0].has_image());
        REQUIRE_FALSE(report.sections()[1].has_image());
        REQUIRE(report.sections()[1].description == "Monthly costs.");
    }

    SECTION("More artifacts than figures") {
        Report report = build_report("Summary", figures, {"/r/a_1.png", "/r/a_2.png", "/r/a_3.png"});
        REQUIRE(report.sections().size() == 2);
        REQUIRE(report.to_markdown().find("a_3.png") == std::string::npos);
    }

    SECTION("No figures") {
        Report report = build_report("Summary", {}, {"/r/a_1.png"});
        REQUIRE(report.sections().empty());
        REQUIRE(report.to_markdown() == "Summary");
    }
}

TEST_CASE("Untitled figures get a numbered title", "[report]") {
    Report report = build_report("", {FigureSpec("", "first"), FigureSpec("", "second")}, {});
    REQUIRE(report.sections()[0].title == "Figure 1");
    REQUIRE(report.sections()[1].title == "Figure 2");
}

TEST_CASE("Markdown layout", "[report]") {
    Report report = build_report(
        "  Overall trend is up.  \n",
        {FigureSpec("Trend", "  Revenue rises.\n"), FigureSpec("Table", "Text only.")},
        {"/r/x_1.png"}
    );

    std::string expected =
        "Overall trend is up."
        "\n\n### Trend\n"
        "\n\n![Trend](/r/x_1.png)\n"
        "\n\nRevenue rises."
        "\n\n### Table\n"
        "\n\nText only.";

    REQUIRE(report.to_markdown() == expected);
}

TEST_CASE("Empty blocks are skipped", "[report]") {
    Report report = build_report("", {FigureSpec("Only", "")}, {"/r/y_1.png"});
    REQUIRE(report.to_markdown() == "### Only\n\n\n![Only](/r/y_1.png)\n");
}

TEST_CASE("Rendering is idempotent", "[report]") {
    Report report = build_report("S", {FigureSpec("A", "a")}, {"/r/z_1.png"});
    std::string first = report.to_markdown();
    REQUIRE(report.to_markdown() == first);
    REQUIRE(report.to_json() == report.to_json());

    Report rebuilt = build_report("S", {FigureSpec("A", "a")}, {"/r/z_1.png"});
    REQUIRE(rebuilt.to_markdown() == first);
}

TEST_CASE("Report JSON", "[report]") {
    Report report = build_report("S", {FigureSpec("A", "a"), FigureSpec("B", "b")}, {"/r/z_1.png"});
    nlohmann::json j = report.to_json();

    REQUIRE(j["summary_markdown"] == "S");
    REQUIRE(j["sections"].size() == 2);
    REQUIRE(j["sections"][0]["image_path"] == "/r/z_1.png");
    REQUIRE(j["sections"][1]["image_path"].is_null());
}
