/**
 * @file sandbox_runner.cpp
 * @brief Implementation of SandboxRunner
 */

#include "sandbox_runner.hpp"
#include "scratch_area.hpp"
#include "code_instrumentor.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace sandlyst {

namespace {

const char* const kInMount = "/in";
const char* const kOutMount = "/out";
const char* const kDataMount = "/data";

// Exit status reported for a killed container when the runtime gives none
const int kKilledExitCode = 137;

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

// Fresh figure directory name per run, e.g. ".figures_3fa9c1d2"
std::string make_figure_dir_name() {
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> distribution;
    std::ostringstream oss;
    oss << kDefaultFigureDir << "_" << std::hex << std::setw(8) << std::setfill('0') << distribution(generator);
    return oss.str();
}

} // anonymous namespace

void move_file(const std::string& source, const std::string& destination) {
    std::error_code ec;
    fs::rename(source, destination, ec);
    if (!ec) {
        return;
    }
    // EXDEV and friends: copy then remove
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing);
    fs::remove(source);
}

SandboxRunner::SandboxRunner(
    std::unique_ptr<IExecutionBackend> backend,
    const SandboxConfig& config,
    Logger* logger
)
    : backend_(std::move(backend)),
      config_(config),
      logger_(logger) {

    if (!logger_) {
        logger_ = &Logger::get_instance();
    }
}

bool SandboxRunner::is_available() {
    return backend_ && backend_->is_available();
}

ExecutionOutcome SandboxRunner::run(const ExecutionJob& job, const LogContext& ctx) {
    ExecutionOutcome outcome;
    auto start_time = std::chrono::steady_clock::now();

    // Availability first: no scratch tree is created for a backend that cannot run it
    if (!backend_) {
        outcome.status = ExecutionStatus::BACKEND_UNAVAILABLE;
        outcome.combined_log = "No execution backend configured";
        logger_->log_job_complete(ctx, job.mode, outcome);
        return outcome;
    }
    if (!backend_->is_available()) {
        BackendInfo info = backend_->get_info();
        outcome.status = ExecutionStatus::BACKEND_UNAVAILABLE;
        outcome.combined_log = "Execution backend '" + info.name + "' is not reachable at " + info.endpoint;
        logger_->log_job_complete(ctx, job.mode, outcome);
        return outcome;
    }

    logger_->log_job_start(ctx, job.mode, job.input_files.size(), job.code.size());

    try {
        ScratchArea scratch(config_.scratch_root);

        stage_inputs(scratch, job, ctx);

        std::string figure_dir = make_figure_dir_name();
        std::string script = instrument(job.code, job.mode, figure_dir);
        scratch.write_script(config_.script_name, script);
        logger_->log_debug(ctx, "Instrumented script written", {{"script", script}});

        BackendRunResult result = backend_->run(build_container_spec(scratch));

        outcome.combined_log = result.logs;
        outcome.exit_code = result.exit_code;

        if (result.timed_out) {
            outcome.status = ExecutionStatus::TIMED_OUT;
            outcome.succeeded = false;
            if (outcome.exit_code == 0) {
                outcome.exit_code = kKilledExitCode;
            }
            if (!outcome.combined_log.empty() && outcome.combined_log.back() != '\n') {
                outcome.combined_log += "\n";
            }
            outcome.combined_log += "Execution timed out after " +
                std::to_string(config_.limits.wall_clock_timeout_seconds) + " seconds";
        } else if (result.exit_code == 0) {
            outcome.status = ExecutionStatus::SUCCEEDED;
            outcome.succeeded = true;
            if (job.mode == ExecutionMode::PLOT) {
                outcome.artifacts = collect_artifacts(scratch, figure_dir, job, ctx);
            }
        } else {
            outcome.status = ExecutionStatus::FAILED;
            outcome.succeeded = false;
        }
        // scratch is removed here, before the outcome is returned
    } catch (const BackendUnavailableError& e) {
        outcome = ExecutionOutcome();
        outcome.status = ExecutionStatus::BACKEND_UNAVAILABLE;
        outcome.combined_log = e.what();
    } catch (const SandboxError& e) {
        outcome = ExecutionOutcome();
        outcome.status = ExecutionStatus::FAILED;
        outcome.combined_log = e.what();
    } catch (const fs::filesystem_error& e) {
        outcome = ExecutionOutcome();
        outcome.status = ExecutionStatus::FAILED;
        outcome.combined_log = std::string("Sandbox filesystem error: ") + e.what();
    }

    outcome.duration_ms = elapsed_ms(start_time);
    logger_->log_job_complete(ctx, job.mode, outcome);
    return outcome;
}

ContainerSpec SandboxRunner::build_container_spec(const ScratchArea& scratch) const {
    ContainerSpec spec;
    spec.image = config_.image;
    spec.command = config_.command;
    spec.working_dir = kOutMount;
    spec.mounts.emplace_back(scratch.in_dir().string(), kInMount, true);
    spec.mounts.emplace_back(scratch.out_dir().string(), kOutMount, false);
    spec.mounts.emplace_back(scratch.data_dir().string(), kDataMount, true);
    spec.limits = config_.limits;
    spec.network_disabled = true;
    spec.read_only_root = true;
    return spec;
}

void SandboxRunner::stage_inputs(ScratchArea& scratch, const ExecutionJob& job, const LogContext& ctx) {
    for (const auto& input : job.input_files) {
        std::string error;
        if (!scratch.stage_input(input.name, input.source_path, error)) {
            logger_->log_warning(ctx, "Skipping input file: " + error);
        }
    }
}

std::vector<std::string> SandboxRunner::collect_artifacts(
    const ScratchArea& scratch,
    const std::string& figure_dir,
    const ExecutionJob& job,
    const LogContext& ctx
) {
    std::vector<std::string> artifacts;

    // Only the footer writes here; anything else under /out is ignored
    fs::path figures = scratch.out_dir() / figure_dir;
    if (!fs::is_directory(figures)) {
        return artifacts;
    }

    std::vector<std::pair<int, fs::path>> found;
    for (const auto& entry : fs::directory_iterator(figures)) {
        // Links would resolve against the host filesystem
        if (entry.is_symlink() || !entry.is_regular_file()) {
            continue;
        }
        int index = parse_artifact_index(entry.path().filename().string());
        if (index >= 0) {
            found.emplace_back(index, entry.path());
        }
    }

    if (found.empty()) {
        return artifacts;
    }

    // Numeric order, so output_10 follows output_9
    std::sort(found.begin(), found.end(),
        [](const std::pair<int, fs::path>& a, const std::pair<int, fs::path>& b) {
            return a.first < b.first;
        });

    fs::path output_dir = job.output_dir.empty() ? fs::current_path() : fs::path(job.output_dir);
    fs::create_directories(output_dir);
    std::string prefix = job.output_name.empty() ? std::string("figure") : job.output_name;

    int k = 1;
    for (const auto& item : found) {
        const fs::path& source = item.second;
        fs::path destination = output_dir / (prefix + "_" + std::to_string(k) + kArtifactExtension);
        try {
            move_file(source.string(), destination.string());
        } catch (const fs::filesystem_error& e) {
            logger_->log_warning(ctx, "Failed to collect artifact " + source.filename().string() + ": " + e.what());
            continue;
        }
        logger_->log_artifact(ctx, source.filename().string(), destination.string());
        artifacts.push_back(fs::absolute(destination).string());
        ++k;
    }

    return artifacts;
}

} // namespace sandlyst
