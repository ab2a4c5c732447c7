/**
 * @file test_analysis_service.cpp
 * @brief Tests for AnalysisService wiring, interpret() and shutdown
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/analysis_service.hpp"
#include "test_fakes.hpp"
#include <filesystem>
#include <fstream>

using namespace sandlyst;
using namespace sandlyst::testing;
namespace fs = std::filesystem;

namespace {

struct ServiceHarness {
    fs::path dir;
    orchestrator::Settings settings;
    ScriptedPlanner* planner;
    FakeSandboxBackend* backend;
    std::unique_ptr<AnalysisService> service;

    ServiceHarness() {
        dir = fs::temp_directory_path() / generate_id("sandlyst_service_test");
        fs::create_directories(dir / "scratch");

        settings.orchestrator.results_dir = (dir / "results").string();
        settings.sandbox.scratch_root = (dir / "scratch").string();

        auto fake_planner = std::make_unique<ScriptedPlanner>();
        auto fake_backend = std::make_unique<FakeSandboxBackend>();
        planner = fake_planner.get();
        backend = fake_backend.get();

        service = std::make_unique<AnalysisService>(settings, std::move(fake_backend), std::move(fake_planner));
    }

    ~ServiceHarness() {
        service.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string write_csv(const std::string& name) const {
        fs::path path = dir / name;
        std::ofstream out(path);
        out << "gene,log2fc,pvalue\n"
            << "TP53,2.1,0.001\n"
            << "BRCA1,-1.4,0.02\n"
            << "MYC,0.3,0.4\n";
        return path.string();
    }
};

FakeRun plot_run(int figure_count) {
    FakeRun run(0, "");
    for (int i = 1; i <= figure_count; ++i) {
        run.figures["output_" + std::to_string(i) + ".png"] = "png";
    }
    return run;
}

} // anonymous namespace

TEST_CASE("interpret appends file metadata to the result content", "[analysis_service]") {
    ServiceHarness h;
    std::string csv = h.write_csv("deg.csv");

    h.planner->replies = {final_reply("Two genes pass the cutoff.", "plt.bar([1, 2], [3, 4])", {{"Fold change", "Bars."}})};
    h.backend->runs.push_back(plot_run(1));

    AnalysisResult result = h.service->interpret("3 significant genes", "RNA-seq liver", {csv}, "deg_report");

    SECTION("Planner sees the result, the metadata and the mount path") {
        const std::string& first_user = h.planner->seen_histories[0][1].content;
        REQUIRE(first_user.find("Context Description: RNA-seq liver") == 0);
        REQUIRE(first_user.find("3 significant genes\n\n### File Metadata: deg.csv") != std::string::npos);
        REQUIRE(first_user.find("/data/deg.csv") != std::string::npos);
        REQUIRE(first_user.find("log2fc") != std::string::npos);
    }

    SECTION("Chart lands in the results directory under the output name") {
        REQUIRE(result.charts.size() == 1);
        REQUIRE(fs::path(result.charts[0]).filename().string() == "deg_report_1.png");
        REQUIRE(fs::path(result.charts[0]).parent_path().string() == h.settings.orchestrator.results_dir);
        REQUIRE(result.original_context == "RNA-seq liver");
    }

    SECTION("Data file is mounted") {
        REQUIRE(h.backend->seen_data_files.at(0) == std::vector<std::string>{"deg.csv"});
    }
}

TEST_CASE("interpret without files passes the result content through", "[analysis_service]") {
    ServiceHarness h;
    h.planner->replies = {final_reply("Flat.", "plt.plot([1])", {{"A", "a"}})};
    h.backend->runs.push_back(plot_run(1));

    AnalysisResult result = h.service->interpret("mean=4.2", "Benchmark timings");

    REQUIRE(h.planner->seen_histories[0][1].content ==
            "Context Description: Benchmark timings\n\nResult Content and Metadata:\nmean=4.2");
    REQUIRE(fs::path(result.charts.at(0)).filename().string().rfind("analysis_", 0) == 0);
}

TEST_CASE("Missing files are described and skipped", "[analysis_service]") {
    ServiceHarness h;
    h.planner->replies = {final_reply("Nothing to plot.", "plt.plot([1])", {{"A", "a"}})};
    h.backend->runs.push_back(plot_run(1));

    std::string missing = (h.dir / "missing.csv").string();
    h.service->interpret("empty", "No data", {missing}, "x");

    REQUIRE(h.planner->seen_histories[0][1].content.find("File not found") != std::string::npos);
    REQUIRE(h.backend->seen_data_files.at(0).empty());
}

TEST_CASE("Analysis errors propagate through interpret", "[analysis_service]") {
    ServiceHarness h;
    h.planner->replies = {"not json"};

    REQUIRE_THROWS_AS(h.service->interpret("r", "c"), AnalysisIncomplete);
    REQUIRE(h.planner->calls() == h.settings.orchestrator.max_turns);
}

TEST_CASE("shutdown", "[analysis_service]") {
    ServiceHarness h;

    REQUIRE_FALSE(h.service->is_shutdown());
    h.service->shutdown();
    REQUIRE(h.service->is_shutdown());

    SECTION("Further calls throw") {
        REQUIRE_THROWS_AS(h.service->interpret("r", "c"), std::logic_error);
    }

    SECTION("Shutdown is idempotent") {
        REQUIRE_NOTHROW(h.service->shutdown());
    }
}

TEST_CASE("Service requires a planner", "[analysis_service]") {
    orchestrator::Settings settings;
    REQUIRE_THROWS_AS(
        AnalysisService(settings, std::make_unique<FakeSandboxBackend>(), nullptr),
        std::invalid_argument);
}

TEST_CASE("Production construction requires a planner key", "[analysis_service]") {
    orchestrator::Settings settings;
    settings.docker.docker_host = "unix:///nonexistent/docker.sock";
    settings.logging.enable_console = false;
    REQUIRE_THROWS_AS(AnalysisService(settings), PlannerError);
}

TEST_CASE("Production construction can verify the backend", "[analysis_service]") {
    orchestrator::Settings settings;
    settings.planner.api_key = "sk-test";
    settings.docker.docker_host = "unix:///nonexistent/docker.sock";
    settings.docker.ping_timeout_ms = 500;
    settings.logging.enable_console = false;
    settings.verify_backend = true;
    REQUIRE_THROWS_AS(AnalysisService(settings), SandboxUnavailableError);
}
