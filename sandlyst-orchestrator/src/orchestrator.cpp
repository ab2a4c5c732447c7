#include "orchestrator.hpp"
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace sandlyst {

namespace {

const std::string kTruncationMarker = "\n...<truncated>...";

const std::string kCorrectiveMessage =
    "The response was not valid. Please return JSON with action compute or final.";

const char* kContractText = R"(You are a data analyst working through a sandboxed Python runtime.
The runtime has pandas, numpy and matplotlib. Input files are mounted read-only under /data.
The runtime has no network access. Anything printed to stdout or stderr is returned to you.

Reply with exactly one JSON object and nothing else. Two actions are accepted.

1. Run code to inspect the data:
{"action": "compute", "reason": "<why this step is needed>", "code": "<python script>"}

2. Finish with charts and a written analysis:
{"action": "final",
 "summary_md": "<markdown overview of the findings>",
 "chart_code": "<python script that draws every figure with matplotlib>",
 "figures": [{"title": "<figure title>", "description_md": "<markdown explanation>"}]}

Rules:
- Do not call plt.show() or plt.savefig(); open figures are saved automatically in creation order.
- List one entry in "figures" per figure, in the order the chart code creates them.
- Use compute only when the provided metadata is not enough to draw the charts.
- The conversation has a limited number of turns. Return final as soon as you can.)";

} // anonymous namespace

nlohmann::json AnalysisResult::to_json() const {
    return {
        {"analysis", analysis_markdown},
        {"charts", charts},
        {"original_context", original_context},
        {"session_id", session_id},
        {"turns_used", turns_used},
        {"report", report.to_json()}
    };
}

std::string system_contract_instruction() {
    return kContractText;
}

std::string truncate_output(const std::string& text, size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    size_t cut = limit;
    // Back off to the start of a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + kTruncationMarker;
}

std::string generate_id(const std::string& prefix) {
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> distribution;

    std::ostringstream oss;
    oss << prefix << "_" << std::hex << std::setw(8) << std::setfill('0') << distribution(generator);
    return oss.str();
}

InteractiveOrchestrator::InteractiveOrchestrator(
    IPlanner& planner,
    SandboxRunner& runner,
    const OrchestratorConfig& config,
    Logger* logger
)
    : planner_(planner),
      runner_(runner),
      config_(config),
      logger_(logger ? logger : &Logger::get_instance()) {}

AnalysisResult InteractiveOrchestrator::analyze(
    const std::string& context_description,
    const std::string& dataset_metadata,
    const std::vector<InputFile>& input_files,
    const std::string& output_name
) {
    AnalysisSession session;
    session.session_id = generate_id("session");
    session.context_description = context_description;
    session.dataset_metadata = dataset_metadata;
    session.max_turns = config_.max_turns;

    std::string artifact_name = output_name.empty() ? generate_id("analysis") : output_name;

    LogContext ctx(session.session_id, 0, "negotiate");
    logger_->log_session_start(ctx, context_description, input_files.size(), session.max_turns);

    session.append("system", system_contract_instruction());
    session.append("user",
        "Context Description: " + context_description +
        "\n\nResult Content and Metadata:\n" + dataset_metadata);

    while (session.turn < session.max_turns) {
        session.turn++;
        ctx.turn = session.turn;
        ctx.phase = "negotiate";

        std::string reply = ask_planner(session, ctx);
        PlannerAction action = decode_action(reply);

        if (const auto* compute = std::get_if<ComputeAction>(&action)) {
            logger_->log_turn(ctx, action_name(action), compute->reason);
            handle_compute(session, *compute, reply, input_files, ctx);
        } else if (const auto* final_action = std::get_if<FinalAction>(&action)) {
            logger_->log_turn(ctx, action_name(action), "figures=" + std::to_string(final_action->figures.size()));
            return handle_final(session, *final_action, input_files, artifact_name, ctx);
        } else {
            const auto& bad = std::get<MalformedAction>(action);
            logger_->log_turn(ctx, action_name(action), bad.reason);
            logger_->log_debug(ctx, "Malformed planner reply", {{"reply", bad.raw_text}});
            handle_malformed(session, bad);
        }
    }

    fail(session, AnalysisIncomplete(session.max_turns), ctx);
}

std::string InteractiveOrchestrator::ask_planner(AnalysisSession& session, const LogContext& ctx) {
    try {
        return planner_.send(session.history);
    } catch (const PlannerError& e) {
        fail(session, e, ctx);
    } catch (const std::exception& e) {
        fail(session, PlannerError(e.what()), ctx);
    }
}

void InteractiveOrchestrator::handle_compute(
    AnalysisSession& session,
    const ComputeAction& action,
    const std::string& raw_reply,
    const std::vector<InputFile>& input_files,
    const LogContext& ctx
) {
    LogContext job_ctx(ctx.session_id, ctx.turn, "compute");

    ExecutionJob job(action.code, ExecutionMode::COMPUTE);
    job.input_files = input_files;

    ExecutionOutcome outcome = runner_.run(job, job_ctx);

    if (outcome.backend_unavailable()) {
        fail(session, SandboxUnavailableError(trim(outcome.combined_log)), job_ctx);
    }

    // Failed computations are shown to the planner; only the final chart run is terminal
    std::string output_text;
    if (outcome.succeeded) {
        output_text = trim(outcome.combined_log);
    } else {
        output_text = "ERROR: Execution failed (exit=" + std::to_string(outcome.exit_code) +
                      "). Logs:\n" + outcome.combined_log;
    }
    output_text = truncate_output(output_text, config_.feedback_limit_bytes);

    session.append("assistant", raw_reply);
    session.append("user",
        "Computation output (turn " + std::to_string(session.turn) + "):\n" + output_text +
        "\nIf more data is needed, request another computation.");
}

AnalysisResult InteractiveOrchestrator::handle_final(
    AnalysisSession& session,
    const FinalAction& action,
    const std::vector<InputFile>& input_files,
    const std::string& output_name,
    const LogContext& ctx
) {
    if (action.chart_code.empty()) {
        fail(session, ActionContractViolation("final action has no chart code"), ctx);
    }

    LogContext job_ctx(ctx.session_id, ctx.turn, "plot");

    ExecutionJob job(action.chart_code, ExecutionMode::PLOT);
    job.input_files = input_files;
    job.output_dir = config_.results_dir;
    job.output_name = output_name;

    ExecutionOutcome outcome = runner_.run(job, job_ctx);

    if (outcome.backend_unavailable()) {
        fail(session, SandboxUnavailableError(trim(outcome.combined_log)), job_ctx);
    }
    if (outcome.timed_out()) {
        fail(session,
             TimeoutError("Chart code timed out (exit=" + std::to_string(outcome.exit_code) + ")",
                          outcome.exit_code, outcome.combined_log),
             job_ctx);
    }
    if (!outcome.succeeded) {
        fail(session,
             ExecutionFailedError("Chart code failed (exit=" + std::to_string(outcome.exit_code) + ")",
                                  outcome.exit_code, outcome.combined_log),
             job_ctx);
    }

    if (outcome.artifacts.size() != action.figures.size()) {
        logger_->log_warning(job_ctx,
            "Figure count mismatch: " + std::to_string(action.figures.size()) + " described, " +
            std::to_string(outcome.artifacts.size()) + " rendered");
    }

    LogContext report_ctx(ctx.session_id, ctx.turn, "report");
    AnalysisResult result(build_report(action.summary, action.figures, outcome.artifacts));
    result.charts = outcome.artifacts;
    result.original_context = session.context_description;
    result.session_id = session.session_id;
    result.turns_used = session.turn;

    transition(session, SessionState::SUCCEEDED, report_ctx);
    return result;
}

void InteractiveOrchestrator::handle_malformed(AnalysisSession& session, const MalformedAction& action) {
    session.append("assistant", action.raw_text);
    session.append("user", kCorrectiveMessage);
}

void InteractiveOrchestrator::transition(
    AnalysisSession& session,
    SessionState new_state,
    const LogContext& ctx
) {
    logger_->log_state_transition(ctx, session_state_to_string(session.state), session_state_to_string(new_state));
    session.state = new_state;
}

template <typename ErrorT>
void InteractiveOrchestrator::fail(AnalysisSession& session, const ErrorT& error, const LogContext& ctx) {
    transition(session, SessionState::FAILED, ctx);
    logger_->log_error(ctx, error.what(), kind_to_string(error.kind()));
    throw error;
}

} // namespace sandlyst
