/**
 * @file analysis_service.hpp
 * @brief Entry point that wires settings, sandbox, planner and orchestrator
 *
 * The AnalysisService handles:
 * - Logger configuration from Settings
 * - Docker backend and sandbox runner construction
 * - Planner construction
 * - Dataset metadata for the files handed to interpret()
 * - Explicit shutdown (no implicit global instance)
 *
 * Design Pattern: Resource Manager, one explicitly constructed instance per
 * configuration.
 */

#ifndef SANDLYST_ANALYSIS_SERVICE_HPP
#define SANDLYST_ANALYSIS_SERVICE_HPP

#include "config_parser.hpp"
#include "orchestrator.hpp"
#include "planner_interface.hpp"
#include "../../sandlyst-sandbox/src/sandbox_runner.hpp"
#include "../../sandlyst-sandbox/src/io/dataset_metadata.hpp"
#include "../../sandlyst-sandbox/src/logger.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sandlyst {

/**
 * @brief Analysis service
 *
 * Usage Example:
 *   @code
 *   orchestrator::ConfigSources sources;
 *   sources.config_file = "sandlyst.json";
 *   sources.dotenv_file = ".env";
 *
 *   AnalysisService service(orchestrator::load_settings(sources));
 *   AnalysisResult result = service.interpret(
 *       "Differential expression results, 3 conditions",
 *       "RNA-seq experiment on liver tissue",
 *       {"/data/deg.csv"});
 *   std::cout << result.to_json().dump(2) << std::endl;
 *   service.shutdown();
 *   @endcode
 *
 * Thread safety: interpret() may run concurrently; shutdown() must not race
 * with it.
 */
class AnalysisService {
public:
    /**
     * @brief Build the production stack (Docker backend, chat planner)
     *
     * @throws PlannerError If no planner API key is configured
     * @throws SandboxUnavailableError If verify_backend is set and the backend is unreachable
     * @throws BackendError If the Docker host setting is invalid
     */
    explicit AnalysisService(const orchestrator::Settings& settings);

    /**
     * @brief Build the service around caller-supplied components
     *
     * @param settings Orchestrator, sandbox and metadata settings (logging is left as is)
     * @param backend Execution backend (may be nullptr)
     * @param planner Planning entity
     * @param logger Logger instance (optional, uses default if nullptr)
     */
    AnalysisService(
        const orchestrator::Settings& settings,
        std::unique_ptr<IExecutionBackend> backend,
        std::unique_ptr<IPlanner> planner,
        Logger* logger = nullptr
    );

    ~AnalysisService();

    AnalysisService(const AnalysisService&) = delete;
    AnalysisService& operator=(const AnalysisService&) = delete;

    /**
     * @brief Analyze a computation result and the files behind it
     *
     * Appends the metadata of file_paths to result_content and runs one
     * interactive session. Charts go to {results_dir}/{output_name}_{k}.png.
     *
     * @param result_content Text result to interpret
     * @param context_description What the result is about
     * @param file_paths Data files, mounted read-only at /data/<file name>
     * @param output_name Artifact prefix ("analysis_<8 hex>" when empty)
     *
     * @throws AnalysisError subclasses as documented on InteractiveOrchestrator::analyze
     * @throws std::logic_error If called after shutdown()
     */
    AnalysisResult interpret(
        const std::string& result_content,
        const std::string& context_description,
        const std::vector<std::string>& file_paths = {},
        const std::string& output_name = ""
    );

    /**
     * @brief Release backend and planner; idempotent
     */
    void shutdown();

    bool is_shutdown() const { return shut_down_; }

    const orchestrator::Settings& settings() const { return settings_; }

private:
    orchestrator::Settings settings_;
    Logger* logger_;
    std::unique_ptr<IPlanner> planner_;
    std::unique_ptr<SandboxRunner> runner_;
    std::unique_ptr<InteractiveOrchestrator> orchestrator_;
    DatasetMetadataExtractor extractor_;
    bool shut_down_;

    void wire();
};

} // namespace sandlyst

#endif // SANDLYST_ANALYSIS_SERVICE_HPP
