#include "report_assembler.hpp"

namespace sandlyst {

Report::Report(const std::string& summary_markdown, const std::vector<ReportSection>& sections)
    : summary_markdown_(summary_markdown), sections_(sections) {}

std::string Report::to_markdown() const {
    std::vector<std::string> blocks;

    blocks.push_back(trim(summary_markdown_));
    for (const auto& section : sections_) {
        blocks.push_back("### " + section.title + "\n");
        if (section.has_image()) {
            blocks.push_back("![" + section.title + "](" + section.image_path + ")\n");
        }
        blocks.push_back(trim(section.description));
    }

    std::string markdown;
    for (const auto& block : blocks) {
        if (block.empty()) {
            continue;
        }
        if (!markdown.empty()) {
            markdown += "\n\n";
        }
        markdown += block;
    }
    return markdown;
}

nlohmann::json Report::to_json() const {
    nlohmann::json sections = nlohmann::json::array();
    for (const auto& section : sections_) {
        nlohmann::json entry = {
            {"title", section.title},
            {"description", section.description}
        };
        if (section.has_image()) {
            entry["image_path"] = section.image_path;
        } else {
            entry["image_path"] = nullptr;
        }
        sections.push_back(entry);
    }
    return {
        {"summary_markdown", summary_markdown_},
        {"sections", sections}
    };
}

Report build_report(
    const std::string& summary,
    const std::vector<FigureSpec>& figures,
    const std::vector<std::string>& artifact_paths
) {
    std::vector<ReportSection> sections;
    sections.reserve(figures.size());

    for (size_t i = 0; i < figures.size(); ++i) {
        ReportSection section;
        section.title = figures[i].title.empty() ? "Figure " + std::to_string(i + 1) : figures[i].title;
        section.description = figures[i].description;
        if (i < artifact_paths.size()) {
            section.image_path = artifact_paths[i];
        }
        sections.push_back(section);
    }

    return Report(summary, sections);
}

} // namespace sandlyst
