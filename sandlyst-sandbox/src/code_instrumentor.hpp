#ifndef SANDLYST_CODE_INSTRUMENTOR_HPP
#define SANDLYST_CODE_INSTRUMENTOR_HPP

#include "execution_types.hpp"
#include <string>

namespace sandlyst {

// Artifact naming inside the figure directory: /out/<figure_dir>/output_<n>.png
constexpr const char* kArtifactPrefix = "output_";
constexpr const char* kArtifactExtension = ".png";

// Figure directory under /out used when the caller does not pick one
constexpr const char* kDefaultFigureDir = ".figures";

// Wrap untrusted code with the sandbox environment header and, in PLOT mode,
// the pyplot guard and the figure persistence footer.
// Order is always header, [guard], user code, [footer].
// figure_dir is a single path component under /out.
std::string instrument(const std::string& code, ExecutionMode mode,
                       const std::string& figure_dir = kDefaultFigureDir);

// Environment header: writable cache/config dirs under /out and the
// non-interactive plotting backend selected before pyplot is imported
std::string instrumentation_header();

// Replaces plt.show and plt.savefig with no-ops so user code cannot
// produce figure files of its own
std::string plot_guard();

// Empties /out/<figure_dir>, then saves every open figure there as
// output_<i>.png, printing failures to the log
std::string plot_footer(const std::string& figure_dir = kDefaultFigureDir);

// Returns the <n> of "output_<n>.png", or -1 if the name does not match
int parse_artifact_index(const std::string& filename);

} // namespace sandlyst

#endif // SANDLYST_CODE_INSTRUMENTOR_HPP
