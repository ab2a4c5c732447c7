/**
 * @file action_decoder.hpp
 * @brief Strict decoding of planner replies into the two-action contract
 *
 * A reply is exactly one of:
 * - Compute: run code in the sandbox and feed the output back
 * - Final: render the charts and finish
 * - Malformed: anything else (costs a turn, triggers a corrective message)
 *
 * Decoding never throws.
 */

#ifndef SANDLYST_ACTION_DECODER_HPP
#define SANDLYST_ACTION_DECODER_HPP

#include <string>
#include <vector>
#include <variant>

namespace sandlyst {

/**
 * @brief Planner-requested figure annotation
 */
struct FigureSpec {
    std::string title;          ///< Empty if the planner gave none
    std::string description;    ///< Markdown

    FigureSpec() = default;
    FigureSpec(const std::string& title_, const std::string& description_)
        : title(title_), description(description_) {}
};

/**
 * @brief Request to run code and see its output
 */
struct ComputeAction {
    std::string code;           ///< Extracted, normalized script (never empty)
    std::string reason;
};

/**
 * @brief Request to produce charts and end the session
 */
struct FinalAction {
    std::string summary;             ///< Markdown overview
    std::string chart_code;          ///< Extracted script, empty if missing
    std::vector<FigureSpec> figures;
};

/**
 * @brief Reply that does not satisfy the contract
 */
struct MalformedAction {
    std::string raw_text;
    std::string reason;         ///< Why decoding failed
};

using PlannerAction = std::variant<ComputeAction, FinalAction, MalformedAction>;

/**
 * @brief Action name for logs ("compute", "final", "malformed")
 */
std::string action_name(const PlannerAction& action);

/**
 * @brief Decode one raw planner reply
 *
 * Strips a leading fence line and trailing fence lines, parses strict JSON and
 * dispatches on "action" (case-insensitive, trimmed). A compute reply whose
 * code yields nothing is Malformed. A final reply without chart code decodes
 * to FinalAction with empty chart_code.
 */
PlannerAction decode_action(const std::string& raw_text);

/**
 * @brief Remove a leading ``` line and any trailing ``` lines, then trim
 */
std::string strip_code_fences(const std::string& text);

/**
 * @brief Extract a script from a field value
 *
 * First ```python block, else first generic ``` block, else the trimmed text.
 * The result is newline-normalized. Empty means no code.
 */
std::string extract_code(const std::string& text);

/**
 * @brief Replace literal "\n" escapes with newlines in single-line code
 *
 * Applies only when the code has at most one real newline, contains a literal
 * backslash-n, and the replacement adds newlines.
 */
std::string normalize_code_newlines(const std::string& code);

/**
 * @brief Trim ASCII whitespace on both ends
 */
std::string trim(const std::string& text);

} // namespace sandlyst

#endif // SANDLYST_ACTION_DECODER_HPP
