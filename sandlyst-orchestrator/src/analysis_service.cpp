#include "analysis_service.hpp"
#include "chat_planner.hpp"
#include "../../sandlyst-sandbox/src/docker/docker_backend.hpp"
#include <stdexcept>

namespace sandlyst {

AnalysisService::AnalysisService(const orchestrator::Settings& settings)
    : settings_(settings),
      logger_(&Logger::get_instance()),
      extractor_(settings.metadata),
      shut_down_(false) {
    logger_->configure(settings_.logging);
    logger_->log_info(LogContext(), "Starting analysis service", {{"settings", settings_.to_string()}});

    auto backend = std::make_unique<DockerBackend>(settings_.docker, logger_);
    if (settings_.verify_backend && !backend->is_available()) {
        throw SandboxUnavailableError("no Docker daemon at " + settings_.docker.docker_host);
    }

    planner_ = std::make_unique<ChatCompletionsPlanner>(settings_.planner, logger_);
    runner_ = std::make_unique<SandboxRunner>(std::move(backend), settings_.sandbox, logger_);
    wire();
}

AnalysisService::AnalysisService(
    const orchestrator::Settings& settings,
    std::unique_ptr<IExecutionBackend> backend,
    std::unique_ptr<IPlanner> planner,
    Logger* logger
)
    : settings_(settings),
      logger_(logger ? logger : &Logger::get_instance()),
      planner_(std::move(planner)),
      runner_(std::make_unique<SandboxRunner>(std::move(backend), settings.sandbox, logger_)),
      extractor_(settings.metadata),
      shut_down_(false) {
    if (!planner_) {
        throw std::invalid_argument("AnalysisService requires a planner");
    }
    wire();
}

AnalysisService::~AnalysisService() {
    shutdown();
}

void AnalysisService::wire() {
    orchestrator_ = std::make_unique<InteractiveOrchestrator>(
        *planner_, *runner_, settings_.orchestrator, logger_);
}

AnalysisResult AnalysisService::interpret(
    const std::string& result_content,
    const std::string& context_description,
    const std::vector<std::string>& file_paths,
    const std::string& output_name
) {
    if (shut_down_) {
        throw std::logic_error("AnalysisService has been shut down");
    }

    std::string full_content = result_content;
    if (!file_paths.empty()) {
        std::string file_metadata = extractor_.describe_files(file_paths);
        if (!file_metadata.empty()) {
            full_content += "\n\n" + file_metadata;
        }
    }

    std::vector<InputFile> input_files;
    input_files.reserve(file_paths.size());
    for (const auto& path : file_paths) {
        input_files.emplace_back(path);
    }

    std::string name = output_name.empty() ? generate_id("analysis") : output_name;
    return orchestrator_->analyze(context_description, full_content, input_files, name);
}

void AnalysisService::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    orchestrator_.reset();
    runner_.reset();
    planner_.reset();
    logger_->flush();
}

} // namespace sandlyst
