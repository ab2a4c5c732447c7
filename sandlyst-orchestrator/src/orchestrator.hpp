/**
 * @file orchestrator.hpp
 * @brief Turn-bounded negotiation between a planner and the sandbox
 *
 * The InteractiveOrchestrator drives one analysis session:
 * - Seeds the conversation with the action contract and the dataset context
 * - Asks the planner for an action each turn (at most max_turns planner calls)
 * - Runs compute actions in the sandbox and feeds back truncated output
 * - Runs the final chart code in plot mode and assembles the report
 * - Answers malformed replies with a corrective message
 *
 * Every session ends in exactly one of: an AnalysisResult, or an
 * AnalysisError subclass. No partial report is returned for a failed session.
 *
 * Design Pattern: Explicit state machine (NEGOTIATING -> SUCCEEDED | FAILED)
 * over an append-only message history.
 */

#ifndef SANDLYST_ORCHESTRATOR_HPP
#define SANDLYST_ORCHESTRATOR_HPP

#include "planner_interface.hpp"
#include "action_decoder.hpp"
#include "report_assembler.hpp"
#include "analysis_errors.hpp"
#include "../../sandlyst-sandbox/src/sandbox_runner.hpp"
#include "../../sandlyst-sandbox/src/logger.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sandlyst {

/**
 * @brief Session lifecycle states
 */
enum class SessionState {
    NEGOTIATING,   ///< Planner and sandbox are exchanging turns
    SUCCEEDED,     ///< Final charts rendered, report built
    FAILED         ///< Terminated with an AnalysisError
};

inline std::string session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::NEGOTIATING: return "NEGOTIATING";
        case SessionState::SUCCEEDED: return "SUCCEEDED";
        case SessionState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Orchestrator configuration
 */
struct OrchestratorConfig {
    int max_turns;                  ///< Planner calls per session (default: 4)
    size_t feedback_limit_bytes;    ///< Compute output fed back per turn (default: 6000)
    std::string results_dir;        ///< Destination of chart artifacts

    OrchestratorConfig()
        : max_turns(4),
          feedback_limit_bytes(6000),
          results_dir("results") {}
};

/**
 * @brief State of one analyze() call
 *
 * Owned exclusively by that call; never shared between sessions.
 */
struct AnalysisSession {
    std::string session_id;
    std::string context_description;
    std::string dataset_metadata;
    std::vector<ChatMessage> history;     ///< Append-only
    int turn;
    int max_turns;
    SessionState state;

    AnalysisSession() : turn(0), max_turns(4), state(SessionState::NEGOTIATING) {}

    void append(const std::string& role, const std::string& content) {
        history.emplace_back(role, content);
    }
};

/**
 * @brief Successful session output
 */
struct AnalysisResult {
    Report report;
    std::string analysis_markdown;        ///< report.to_markdown()
    std::vector<std::string> charts;      ///< Artifact paths in figure order
    std::string original_context;
    std::string session_id;
    int turns_used;

    explicit AnalysisResult(const Report& report_)
        : report(report_), analysis_markdown(report_.to_markdown()), turns_used(0) {}

    /**
     * @brief {"analysis", "charts", "original_context", "session_id", "turns_used", "report"}
     */
    nlohmann::json to_json() const;
};

/**
 * @brief Interactive analysis orchestrator
 *
 * Usage Example:
 *   @code
 *   ChatCompletionsPlanner planner(planner_config);
 *   SandboxRunner runner(std::make_unique<DockerBackend>());
 *
 *   OrchestratorConfig config;
 *   config.results_dir = "/var/lib/sandlyst/results";
 *
 *   InteractiveOrchestrator orchestrator(planner, runner, config);
 *   try {
 *       AnalysisResult result = orchestrator.analyze(
 *           "Quarterly sales by region", metadata_text, {InputFile("sales.csv")}, "");
 *       std::cout << result.analysis_markdown << std::endl;
 *   } catch (const AnalysisError& e) {
 *       std::cerr << e.to_json().dump() << std::endl;
 *   }
 *   @endcode
 *
 * Thread safety: analyze() keeps all session state on its own stack, so
 * concurrent sessions are safe if the planner and runner are.
 */
class InteractiveOrchestrator {
public:
    /**
     * @brief Constructor
     *
     * @param planner Planning entity (not owned)
     * @param runner Sandbox runner (not owned)
     * @param config Turn budget, feedback budget and results directory
     * @param logger Logger instance (optional, uses default if nullptr)
     */
    InteractiveOrchestrator(
        IPlanner& planner,
        SandboxRunner& runner,
        const OrchestratorConfig& config = OrchestratorConfig(),
        Logger* logger = nullptr
    );

    /**
     * @brief Run one analysis session to completion
     *
     * @param context_description What the data is about
     * @param dataset_metadata Result content and file metadata shown to the planner
     * @param input_files Files mounted at /data for every sandbox run
     * @param output_name Artifact name prefix (generated when empty)
     * @return Report, chart paths and session details
     *
     * @throws AnalysisIncomplete If max_turns planner calls produce no final action
     * @throws ActionContractViolation If a final action has no chart code
     * @throws TimeoutError If the chart code exceeds the wall clock
     * @throws ExecutionFailedError If the chart code fails in the sandbox
     * @throws SandboxUnavailableError If the sandbox backend cannot run anything
     * @throws PlannerError If the planner fails
     */
    AnalysisResult analyze(
        const std::string& context_description,
        const std::string& dataset_metadata,
        const std::vector<InputFile>& input_files,
        const std::string& output_name
    );

    const OrchestratorConfig& config() const { return config_; }

private:
    IPlanner& planner_;
    SandboxRunner& runner_;
    OrchestratorConfig config_;
    Logger* logger_;

    std::string ask_planner(AnalysisSession& session, const LogContext& ctx);

    void handle_compute(
        AnalysisSession& session,
        const ComputeAction& action,
        const std::string& raw_reply,
        const std::vector<InputFile>& input_files,
        const LogContext& ctx
    );

    AnalysisResult handle_final(
        AnalysisSession& session,
        const FinalAction& action,
        const std::vector<InputFile>& input_files,
        const std::string& output_name,
        const LogContext& ctx
    );

    void handle_malformed(AnalysisSession& session, const MalformedAction& action);

    void transition(AnalysisSession& session, SessionState new_state, const LogContext& ctx);

    template <typename ErrorT>
    [[noreturn]] void fail(AnalysisSession& session, const ErrorT& error, const LogContext& ctx);
};

/**
 * @brief Instruction that fixes the two-action reply contract
 */
std::string system_contract_instruction();

/**
 * @brief Cut text to limit bytes without splitting a UTF-8 sequence
 *
 * Truncated text ends with "\n...<truncated>...".
 */
std::string truncate_output(const std::string& text, size_t limit);

/**
 * @brief "<prefix>_" followed by 8 random lowercase hex digits
 */
std::string generate_id(const std::string& prefix);

} // namespace sandlyst

#endif // SANDLYST_ORCHESTRATOR_HPP
