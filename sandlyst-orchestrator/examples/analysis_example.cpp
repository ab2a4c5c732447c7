/**
 * Example: interpret a computation result with the sandboxed analysis service
 *
 * Runs one interactive analysis over a CSV file. The planner explores the data
 * through sandboxed Python, then returns a summary and chart code whose
 * figures are saved under the results directory.
 *
 * Run:
 *   export QWEN_API_KEY="your-api-key"
 *   export SANDLYST_RESULTS_DIR="./results"
 *   ./sandlyst_analysis_example sales.csv "Monthly sales per region, 2023"
 *
 * Optional:
 *   SANDLYST_CONFIG   JSON configuration file
 *   DOCKER_HOST       Docker daemon (default unix:///var/run/docker.sock)
 */

#include "analysis_service.hpp"
#include <iostream>
#include <cstdlib>
#include <vector>

using namespace sandlyst;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <data-file> <context description> [output-name]\n";
        return 2;
    }

    std::string data_file = argv[1];
    std::string context = argv[2];
    std::string output_name = argc > 3 ? argv[3] : "";

    orchestrator::ConfigSources sources;
    sources.dotenv_file = ".env";
    if (const char* config_file = std::getenv("SANDLYST_CONFIG")) {
        sources.config_file = config_file;
    }
    sources.overrides["verify_backend"] = "true";

    try {
        orchestrator::Settings settings = orchestrator::load_settings(sources);
        std::cout << "Using " << settings.to_string() << "\n";

        AnalysisService service(settings);

        AnalysisResult result = service.interpret(
            "Please summarize the attached data and chart its main trends.",
            context,
            {data_file},
            output_name
        );

        std::cout << "\n" << result.analysis_markdown << "\n\n";
        std::cout << "Charts (" << result.charts.size() << "):\n";
        for (const auto& chart : result.charts) {
            std::cout << "  " << chart << "\n";
        }
        std::cout << "Turns used: " << result.turns_used << "/" << settings.orchestrator.max_turns << "\n";

        service.shutdown();
        return 0;

    } catch (const orchestrator::ConfigParseError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const AnalysisError& e) {
        std::cerr << "Analysis failed: " << e.to_json().dump(2) << "\n";
        return 1;
    } catch (const SandboxError& e) {
        std::cerr << "Sandbox error: " << e.what() << "\n";
        return 1;
    }
}
