/**
 * @file test_action_decoder.cpp
 * @brief Unit tests for planner reply decoding
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/action_decoder.hpp"

using namespace sandlyst;

TEST_CASE("Compute replies decode", "[decoder]") {
    SECTION("Plain JSON") {
        PlannerAction action = decode_action(
            R"({"action": "compute", "reason": "check shape", "code": "print(df.shape)"})");
        REQUIRE(std::holds_alternative<ComputeAction>(action));
        const auto& compute = std::get<ComputeAction>(action);
        REQUIRE(compute.code == "print(df.shape)");
        REQUIRE(compute.reason == "check shape");
        REQUIRE(action_name(action) == "compute");
    }

    SECTION("Action name is case-insensitive and trimmed") {
        PlannerAction action = decode_action(R"({"action": "  Compute ", "code": "print(1)"})");
        REQUIRE(std::holds_alternative<ComputeAction>(action));
    }

    SECTION("Reply wrapped in a json fence") {
        PlannerAction action = decode_action(
            "```json\n{\"action\": \"compute\", \"code\": \"print(2)\"}\n```");
        REQUIRE(std::holds_alternative<ComputeAction>(action));
        REQUIRE(std::get<ComputeAction>(action).code == "print(2)");
    }

    SECTION("Code inside a python fence") {
        PlannerAction action = decode_action(
            R"({"action": "compute", "code": "```python\nimport pandas as pd\nprint(pd.__version__)\n```"})");
        REQUIRE(std::get<ComputeAction>(action).code == "import pandas as pd\nprint(pd.__version__)");
    }

    SECTION("Missing reason is empty") {
        PlannerAction action = decode_action(R"({"action": "compute", "code": "print(3)"})");
        REQUIRE(std::get<ComputeAction>(action).reason.empty());
    }
}

TEST_CASE("Compute without code is malformed", "[decoder]") {
    SECTION("Field missing") {
        PlannerAction action = decode_action(R"({"action": "compute", "reason": "look"})");
        REQUIRE(std::holds_alternative<MalformedAction>(action));
    }

    SECTION("Field blank") {
        PlannerAction action = decode_action(R"({"action": "compute", "code": "   "})");
        REQUIRE(std::holds_alternative<MalformedAction>(action));
    }

    SECTION("Field not a string") {
        PlannerAction action = decode_action(R"({"action": "compute", "code": 42})");
        REQUIRE(std::holds_alternative<MalformedAction>(action));
    }
}

TEST_CASE("Final replies decode", "[decoder]") {
    SECTION("All fields present") {
        PlannerAction action = decode_action(R"({
            "action": "final",
            "summary_md": "## Findings",
            "chart_code": "plt.plot([1, 2])",
            "figures": [{"title": "Line", "description_md": "A line."}, {"title": "Bar"}]
        })");
        REQUIRE(std::holds_alternative<FinalAction>(action));
        const auto& final_action = std::get<FinalAction>(action);
        REQUIRE(final_action.summary == "## Findings");
        REQUIRE(final_action.chart_code == "plt.plot([1, 2])");
        REQUIRE(final_action.figures.size() == 2);
        REQUIRE(final_action.figures[0].title == "Line");
        REQUIRE(final_action.figures[0].description == "A line.");
        REQUIRE(final_action.figures[1].title == "Bar");
        REQUIRE(final_action.figures[1].description.empty());
    }

    SECTION("Missing chart code decodes with empty chart_code") {
        PlannerAction action = decode_action(R"({"action": "final", "summary_md": "x"})");
        REQUIRE(std::holds_alternative<FinalAction>(action));
        REQUIRE(std::get<FinalAction>(action).chart_code.empty());
        REQUIRE(std::get<FinalAction>(action).figures.empty());
    }

    SECTION("Non-array figures is malformed") {
        PlannerAction action = decode_action(
            R"({"action": "final", "chart_code": "plt.plot([1])", "figures": "one"})");
        REQUIRE(std::holds_alternative<MalformedAction>(action));
    }
}

TEST_CASE("Everything else is malformed", "[decoder]") {
    const std::vector<std::string> replies = {
        "",
        "Sure, here is my analysis.",
        "[1, 2, 3]",
        R"({"reason": "no action"})",
        R"({"action": 7})",
        R"({"action": "plot", "code": "plt.plot([1])"})",
        R"({"action": "compute", "code": "print(1)")"
    };

    for (const auto& reply : replies) {
        PlannerAction action = decode_action(reply);
        REQUIRE(std::holds_alternative<MalformedAction>(action));
        REQUIRE(std::get<MalformedAction>(action).raw_text == reply);
        REQUIRE_FALSE(std::get<MalformedAction>(action).reason.empty());
    }
}

TEST_CASE("strip_code_fences", "[decoder]") {
    REQUIRE(strip_code_fences("  {\"a\": 1}  ") == "{\"a\": 1}");
    REQUIRE(strip_code_fences("```json\n{\"a\": 1}\n```") == "{\"a\": 1}");
    REQUIRE(strip_code_fences("```\n{\"a\": 1}\n```\n```") == "{\"a\": 1}");
    REQUIRE(strip_code_fences("```\r\n{\"a\": 1}\r\n```") == "{\"a\": 1}");
}

TEST_CASE("extract_code", "[decoder]") {
    SECTION("Python fence wins over a generic fence") {
        std::string text = "```\nother\n```\n```python\nprint(1)\n```";
        REQUIRE(extract_code(text) == "print(1)");
    }

    SECTION("Generic fence") {
        REQUIRE(extract_code("Here:\n```\nprint(2)\n```\nDone") == "print(2)");
    }

    SECTION("Unfenced text is the code") {
        REQUIRE(extract_code("  print(3)\n") == "print(3)");
    }

    SECTION("Dangling opening fence is dropped") {
        REQUIRE(extract_code("```python\nprint(4)") == "print(4)");
    }

    SECTION("Empty") {
        REQUIRE(extract_code("").empty());
        REQUIRE(extract_code("```\n```").empty());
    }
}

TEST_CASE("normalize_code_newlines", "[decoder]") {
    SECTION("Escaped newlines in single-line code are expanded") {
        REQUIRE(normalize_code_newlines("import os\\nprint(os.getcwd())") == "import os\nprint(os.getcwd())");
    }

    SECTION("Multi-line code is left alone") {
        std::string code = "a = 1\nb = 2\nprint('x\\ny')";
        REQUIRE(normalize_code_newlines(code) == code);
    }

    SECTION("Code without escapes is left alone") {
        REQUIRE(normalize_code_newlines("print(1)") == "print(1)");
    }
}
