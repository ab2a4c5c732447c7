/**
 * @file test_fakes.hpp
 * @brief Scripted planner and fake execution backend shared by orchestrator tests
 */

#ifndef SANDLYST_TEST_FAKES_HPP
#define SANDLYST_TEST_FAKES_HPP

#include "../src/planner_interface.hpp"
#include "../src/analysis_errors.hpp"
#include "../../sandlyst-sandbox/src/execution_backend.hpp"
#include <nlohmann/json.hpp>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace sandlyst {
namespace testing {

/**
 * Planner that replays canned replies and records every history it was sent.
 * Once the script runs out, the last reply is repeated.
 */
class ScriptedPlanner : public IPlanner {
public:
    std::vector<std::string> replies;
    bool fail_with_planner_error = false;

    std::vector<std::vector<ChatMessage>> seen_histories;

    explicit ScriptedPlanner(const std::vector<std::string>& replies_ = {})
        : replies(replies_) {}

    std::string send(const std::vector<ChatMessage>& history) override {
        seen_histories.push_back(history);
        if (fail_with_planner_error) {
            throw PlannerError("HTTP 503 from planner", 503);
        }
        size_t index = seen_histories.size() - 1;
        if (replies.empty()) {
            return "";
        }
        return index < replies.size() ? replies[index] : replies.back();
    }

    std::string get_name() const override { return "scripted"; }

    int calls() const { return static_cast<int>(seen_histories.size()); }
};

/**
 * One scripted container run
 */
struct FakeRun {
    int exit_code = 0;
    std::string logs;
    bool timed_out = false;
    std::map<std::string, std::string> figures;     // written into the footer's figure directory

    FakeRun() = default;
    FakeRun(int exit_code_, const std::string& logs_) : exit_code(exit_code_), logs(logs_) {}
};

// Figure directory named by the instrumented footer, empty without a footer
inline std::string footer_figure_dir(const std::string& script) {
    const std::string marker = "_figure_dir = '/out/";
    size_t start = script.find(marker);
    if (start == std::string::npos) {
        return "";
    }
    start += marker.size();
    return script.substr(start, script.find('\'', start) - start);
}

/**
 * Backend that plays the container's part on the host side of the mounts
 */
class FakeSandboxBackend : public IExecutionBackend {
public:
    bool available = true;
    std::deque<FakeRun> runs;        // consumed in order; default FakeRun when empty

    std::vector<std::string> seen_scripts;
    std::vector<std::vector<std::string>> seen_data_files;

    BackendInfo get_info() const override {
        BackendInfo info;
        info.name = "fake";
        info.endpoint = "memory://";
        return info;
    }

    bool is_available() noexcept override { return available; }

    BackendRunResult run(const ContainerSpec& spec) override {
        FakeRun scripted;
        if (!runs.empty()) {
            scripted = runs.front();
            runs.pop_front();
        }

        std::string out_dir;
        std::vector<std::string> data_files;
        for (const auto& mount : spec.mounts) {
            if (mount.container_path == "/in") {
                std::ifstream in(std::filesystem::path(mount.host_path) / "run.py");
                std::stringstream ss;
                ss << in.rdbuf();
                seen_scripts.push_back(ss.str());
            } else if (mount.container_path == "/data") {
                for (const auto& entry : std::filesystem::directory_iterator(mount.host_path)) {
                    data_files.push_back(entry.path().filename().string());
                }
            } else if (mount.container_path == "/out") {
                out_dir = mount.host_path;
            }
        }
        seen_data_files.push_back(data_files);

        std::string figure_dir = seen_scripts.empty() ? std::string() : footer_figure_dir(seen_scripts.back());
        if (!figure_dir.empty() && !scripted.figures.empty()) {
            std::filesystem::path figures = std::filesystem::path(out_dir) / figure_dir;
            std::filesystem::create_directories(figures);
            for (const auto& file : scripted.figures) {
                std::ofstream out(figures / file.first, std::ios::binary);
                out << file.second;
            }
        }

        BackendRunResult result;
        result.exit_code = scripted.exit_code;
        result.logs = scripted.logs;
        result.timed_out = scripted.timed_out;
        return result;
    }

    size_t run_count() const { return seen_scripts.size(); }
};

inline std::string compute_reply(const std::string& code, const std::string& reason = "inspect data") {
    return nlohmann::json{{"action", "compute"}, {"reason", reason}, {"code", code}}.dump();
}

inline std::string final_reply(
    const std::string& summary,
    const std::string& chart_code,
    const std::vector<std::pair<std::string, std::string>>& figures
) {
    nlohmann::json figure_list = nlohmann::json::array();
    for (const auto& figure : figures) {
        figure_list.push_back({{"title", figure.first}, {"description_md", figure.second}});
    }
    return nlohmann::json{
        {"action", "final"},
        {"summary_md", summary},
        {"chart_code", chart_code},
        {"figures", figure_list}
    }.dump();
}

} // namespace testing
} // namespace sandlyst

#endif // SANDLYST_TEST_FAKES_HPP
