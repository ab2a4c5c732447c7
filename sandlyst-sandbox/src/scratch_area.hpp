#ifndef SANDLYST_SCRATCH_AREA_HPP
#define SANDLYST_SCRATCH_AREA_HPP

#include <string>
#include <filesystem>

namespace sandlyst {

// True if candidate, after lexical normalization, lies strictly inside base.
// Neither path needs to exist.
bool is_path_within(const std::filesystem::path& base, const std::filesystem::path& candidate);

/**
 * Per-job temporary directory tree, removed when the object is destroyed.
 *
 *   <root>/in    instrumented script, mounted read-only at /in
 *   <root>/out   working directory, mounted read-write at /out
 *   <root>/data  copies of the input files, mounted read-only at /data
 */
class ScratchArea {
public:
    // Creates a fresh unique root under parent (mkdtemp). Throws ScratchAreaError.
    explicit ScratchArea(const std::string& parent);
    ~ScratchArea();

    ScratchArea(const ScratchArea&) = delete;
    ScratchArea& operator=(const ScratchArea&) = delete;

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path in_dir() const { return root_ / "in"; }
    std::filesystem::path out_dir() const { return root_ / "out"; }
    std::filesystem::path data_dir() const { return root_ / "data"; }

    // Write the script the container runs. Returns its host path.
    std::filesystem::path write_script(const std::string& filename, const std::string& content);

    // Copy source into data/<name>. Returns false (and copies nothing) if
    // name escapes the data directory or the source is not a regular file.
    bool stage_input(const std::string& name, const std::string& source_path, std::string& error);

    // Remove the whole tree now. Safe to call more than once.
    void remove() noexcept;

private:
    std::filesystem::path root_;
    bool removed_;
};

} // namespace sandlyst

#endif // SANDLYST_SCRATCH_AREA_HPP
