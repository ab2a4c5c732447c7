#ifndef SANDLYST_REPORT_ASSEMBLER_HPP
#define SANDLYST_REPORT_ASSEMBLER_HPP

#include "action_decoder.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sandlyst {

struct ReportSection {
    std::string title;
    std::string image_path;     // Empty for text-only sections
    std::string description;

    bool has_image() const { return !image_path.empty(); }
};

/**
 * Final analysis document. Built once by build_report and not modified after.
 */
class Report {
public:
    Report(const std::string& summary_markdown, const std::vector<ReportSection>& sections);

    const std::string& summary_markdown() const { return summary_markdown_; }
    const std::vector<ReportSection>& sections() const { return sections_; }

    // Summary, then per section "### title", image link if any, description;
    // non-empty blocks joined by blank lines
    std::string to_markdown() const;

    nlohmann::json to_json() const;

private:
    std::string summary_markdown_;
    std::vector<ReportSection> sections_;
};

/**
 * Pair figures with artifacts by position. Figures beyond the artifacts become
 * text-only sections; artifacts beyond the figures are not referenced (and not
 * touched). Missing titles become "Figure {i}" (1-based).
 */
Report build_report(
    const std::string& summary,
    const std::vector<FigureSpec>& figures,
    const std::vector<std::string>& artifact_paths
);

} // namespace sandlyst

#endif // SANDLYST_REPORT_ASSEMBLER_HPP
