#ifndef SANDLYST_DATASET_METADATA_HPP
#define SANDLYST_DATASET_METADATA_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>

namespace sandlyst {

class MetadataError : public std::runtime_error {
public:
    explicit MetadataError(const std::string& msg) : std::runtime_error(msg) {}
};

struct ColumnMetadata {
    std::string name;
    std::string dtype;                        // Arrow type name (int64, double, string, ...)
    std::vector<nlohmann::json> sample_values; // First non-null values, in row order
    int64_t null_count;
    int64_t unique_count;                     // -1 when the table exceeds the unique-count row cap

    ColumnMetadata() : null_count(0), unique_count(0) {}
};

struct DatasetMetadata {
    std::string filename;
    std::string file_format;                  // csv, tsv, parquet
    int64_t file_size_bytes;
    int64_t total_rows;
    int64_t total_columns;
    std::vector<ColumnMetadata> columns;

    DatasetMetadata() : file_size_bytes(0), total_rows(0), total_columns(0) {}

    nlohmann::json to_json() const;
};

struct MetadataConfig {
    size_t max_describe_bytes;     // Upper bound on describe() output
    size_t sample_count;           // Non-null sample values per column
    int64_t unique_row_cap;        // Above this many rows, unique counts are skipped

    MetadataConfig()
        : max_describe_bytes(8000),
          sample_count(5),
          unique_row_cap(100000) {}
};

/**
 * Turns tabular files into small JSON summaries a planner can reason over
 * without seeing raw data. CSV and TSV go through the Arrow CSV reader,
 * Parquet through the Parquet Arrow reader.
 */
class DatasetMetadataExtractor {
public:
    explicit DatasetMetadataExtractor(const MetadataConfig& config = MetadataConfig());

    /**
     * Full metadata for one file.
     * @throws MetadataError if the file is missing, unsupported or unreadable
     */
    DatasetMetadata extract(const std::string& path) const;

    /**
     * Metadata rendered as JSON text, at most max_describe_bytes long.
     * Never throws: failures become a short error text.
     */
    std::string describe(const std::string& path) const noexcept;

    /**
     * Markdown block per file, telling the planner where each file is
     * mounted inside the sandbox (/data/<name>) and what it contains.
     */
    std::string describe_files(const std::vector<std::string>& paths) const;

    static bool is_supported(const std::string& path);

private:
    MetadataConfig config_;

    std::string bounded_json(const DatasetMetadata& metadata) const;
};

} // namespace sandlyst

#endif // SANDLYST_DATASET_METADATA_HPP
