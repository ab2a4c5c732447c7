/**
 * @file sandbox_runner.hpp
 * @brief Runs one untrusted script in an isolated, resource-capped sandbox
 *
 * The SandboxRunner owns the isolation policy:
 * - No network, read-only root filesystem
 * - Memory, process and CPU ceilings fixed by SandboxConfig (not per job)
 * - Wall-clock timeout after which the process is killed
 * - Input files copied into a read-only data mount after a containment check
 * - Fresh scratch tree per job, removed before run() returns on every path
 *
 * In PLOT mode, figures saved by the instrumented footer are collected in
 * figure order and moved to {output_dir}/{output_name}_{k}.png. The footer
 * writes into a figure directory named fresh for each run; files the user
 * code leaves anywhere else under /out are never collected.
 */

#ifndef SANDLYST_SANDBOX_RUNNER_HPP
#define SANDLYST_SANDBOX_RUNNER_HPP

#include "execution_types.hpp"
#include "execution_backend.hpp"
#include "logger.hpp"
#include <string>
#include <vector>
#include <memory>

namespace sandlyst {

class ScratchArea;

/**
 * @brief Sandbox runner configuration
 */
struct SandboxConfig {
    std::string image;                   ///< Runtime image (default: agent-plotter)
    std::vector<std::string> command;    ///< Entry command (default: python /in/run.py)
    std::string scratch_root;            ///< Parent of per-job scratch trees (empty: system temp dir)
    std::string script_name;             ///< Instrumented script file name inside /in
    ResourceLimits limits;

    SandboxConfig()
        : image("agent-plotter"),
          command({"python", "/in/run.py"}),
          script_name("run.py") {}
};

/**
 * @brief Sandbox runner
 *
 * Usage Example:
 *   @code
 *   auto backend = std::make_unique<DockerBackend>(DockerBackendConfig());
 *   SandboxRunner runner(std::move(backend));
 *
 *   ExecutionJob job("print(pd.read_csv('/data/sales.csv').shape)", ExecutionMode::COMPUTE);
 *   job.input_files.emplace_back("/home/me/sales.csv");
 *
 *   ExecutionOutcome outcome = runner.run(job);
 *   std::cout << outcome.combined_log;
 *   @endcode
 *
 * Thread safety: run() keeps no state between calls and may be called
 * concurrently if the backend allows it.
 */
class SandboxRunner {
public:
    /**
     * @brief Constructor
     *
     * @param backend Execution backend (nullptr: every run reports BACKEND_UNAVAILABLE)
     * @param config Isolation image, command, scratch location and limits
     * @param logger Logger instance (optional, uses default if nullptr)
     */
    explicit SandboxRunner(
        std::unique_ptr<IExecutionBackend> backend,
        const SandboxConfig& config = SandboxConfig(),
        Logger* logger = nullptr
    );

    /**
     * @brief Execute one job
     *
     * Backend availability is checked before any filesystem state is created.
     * Never throws for sandbox-level failures: they are reported through
     * ExecutionOutcome::status.
     *
     * @param job Code, mode, input files and artifact destination
     * @param ctx Log context of the calling session
     * @return Outcome with exit code, combined log and collected artifacts
     */
    ExecutionOutcome run(const ExecutionJob& job, const LogContext& ctx = LogContext());

    /**
     * @brief Check backend availability without running anything
     */
    bool is_available();

    const SandboxConfig& config() const { return config_; }

private:
    std::unique_ptr<IExecutionBackend> backend_;
    SandboxConfig config_;
    Logger* logger_;

    ContainerSpec build_container_spec(const ScratchArea& scratch) const;
    void stage_inputs(ScratchArea& scratch, const ExecutionJob& job, const LogContext& ctx);
    std::vector<std::string> collect_artifacts(
        const ScratchArea& scratch,
        const std::string& figure_dir,
        const ExecutionJob& job,
        const LogContext& ctx
    );
};

/**
 * @brief Move a file, falling back to copy + remove across filesystems
 *
 * @throws std::filesystem::filesystem_error If neither strategy works
 */
void move_file(const std::string& source, const std::string& destination);

} // namespace sandlyst

#endif // SANDLYST_SANDBOX_RUNNER_HPP
