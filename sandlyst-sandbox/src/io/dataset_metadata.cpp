#include "dataset_metadata.hpp"
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <arrow/csv/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/exception.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace sandlyst {

namespace {

const char* const kMetadataErrorPrefix = "Error generating metadata: ";

std::string lower_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    return ext;
}

template <typename ArrayType>
nlohmann::json numeric_value(const arrow::Array& array, int64_t i) {
    return static_cast<const ArrayType&>(array).Value(i);
}

// JSON value of one non-null cell
nlohmann::json cell_value(const arrow::Array& array, int64_t i) {
    switch (array.type_id()) {
        case arrow::Type::BOOL: return numeric_value<arrow::BooleanArray>(array, i);
        case arrow::Type::INT8: return numeric_value<arrow::Int8Array>(array, i);
        case arrow::Type::INT16: return numeric_value<arrow::Int16Array>(array, i);
        case arrow::Type::INT32: return numeric_value<arrow::Int32Array>(array, i);
        case arrow::Type::INT64: return numeric_value<arrow::Int64Array>(array, i);
        case arrow::Type::UINT8: return numeric_value<arrow::UInt8Array>(array, i);
        case arrow::Type::UINT16: return numeric_value<arrow::UInt16Array>(array, i);
        case arrow::Type::UINT32: return numeric_value<arrow::UInt32Array>(array, i);
        case arrow::Type::UINT64: return numeric_value<arrow::UInt64Array>(array, i);
        case arrow::Type::FLOAT: return numeric_value<arrow::FloatArray>(array, i);
        case arrow::Type::DOUBLE: return numeric_value<arrow::DoubleArray>(array, i);
        case arrow::Type::STRING:
            return static_cast<const arrow::StringArray&>(array).GetString(i);
        case arrow::Type::LARGE_STRING:
            return static_cast<const arrow::LargeStringArray&>(array).GetString(i);
        default: {
            auto scalar = array.GetScalar(i);
            if (!scalar.ok()) {
                return nullptr;
            }
            return (*scalar)->ToString();
        }
    }
}

std::shared_ptr<arrow::io::ReadableFile> open_file(const std::string& path) {
    auto maybe_file = arrow::io::ReadableFile::Open(path, arrow::default_memory_pool());
    if (!maybe_file.ok()) {
        throw MetadataError("Cannot open file: " + path + " - " + maybe_file.status().ToString());
    }
    return *maybe_file;
}

std::shared_ptr<arrow::Table> read_delimited(const std::string& path, char delimiter) {
    auto infile = open_file(path);

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    parse_options.delimiter = delimiter;
    auto convert_options = arrow::csv::ConvertOptions::Defaults();

    auto maybe_reader = arrow::csv::TableReader::Make(
        arrow::io::default_io_context(), infile, read_options, parse_options, convert_options);
    if (!maybe_reader.ok()) {
        throw MetadataError("Cannot create CSV reader: " + maybe_reader.status().ToString());
    }

    auto maybe_table = (*maybe_reader)->Read();
    if (!maybe_table.ok()) {
        throw MetadataError("Cannot read table: " + maybe_table.status().ToString());
    }
    return *maybe_table;
}

std::shared_ptr<arrow::Table> read_parquet(const std::string& path) {
    auto infile = open_file(path);

    parquet::arrow::FileReaderBuilder builder;
    auto status = builder.Open(infile);
    if (!status.ok()) {
        throw MetadataError("Cannot open Parquet file: " + path + " - " + status.ToString());
    }

    std::unique_ptr<parquet::arrow::FileReader> reader;
    status = builder.Build(&reader);
    if (!status.ok()) {
        throw MetadataError("Cannot create Parquet reader: " + status.ToString());
    }

    std::shared_ptr<arrow::Table> table;
    status = reader->ReadTable(&table);
    if (!status.ok()) {
        throw MetadataError("Cannot read Parquet table: " + status.ToString());
    }
    return table;
}

ColumnMetadata describe_column(
    const std::string& name,
    const arrow::ChunkedArray& column,
    int64_t total_rows,
    const MetadataConfig& config
) {
    ColumnMetadata meta;
    meta.name = name;
    meta.dtype = column.type()->ToString();
    meta.null_count = column.null_count();

    bool count_unique = total_rows <= config.unique_row_cap;
    std::unordered_set<std::string> seen;

    for (const auto& chunk : column.chunks()) {
        bool samples_full = meta.sample_values.size() >= config.sample_count;
        if (samples_full && !count_unique) {
            break;
        }
        for (int64_t i = 0; i < chunk->length(); ++i) {
            if (chunk->IsNull(i)) {
                continue;
            }
            nlohmann::json value = cell_value(*chunk, i);
            if (meta.sample_values.size() < config.sample_count) {
                meta.sample_values.push_back(value);
            } else if (!count_unique) {
                break;
            }
            if (count_unique) {
                seen.insert(value.dump());
            }
        }
    }

    meta.unique_count = count_unique ? static_cast<int64_t>(seen.size()) : -1;
    return meta;
}

// Cut at max_bytes without splitting a UTF-8 sequence
std::string cut_utf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    size_t end = max_bytes;
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        --end;
    }
    return text.substr(0, end);
}

} // anonymous namespace

nlohmann::json DatasetMetadata::to_json() const {
    nlohmann::json columns_json = nlohmann::json::array();
    for (const auto& col : columns) {
        columns_json.push_back({
            {"name", col.name},
            {"dtype", col.dtype},
            {"sample_values", col.sample_values},
            {"null_count", col.null_count},
            {"unique_count", col.unique_count}
        });
    }
    return {
        {"filename", filename},
        {"file_format", file_format},
        {"file_size_bytes", file_size_bytes},
        {"total_rows", total_rows},
        {"total_columns", total_columns},
        {"columns", columns_json}
    };
}

DatasetMetadataExtractor::DatasetMetadataExtractor(const MetadataConfig& config)
    : config_(config) {}

bool DatasetMetadataExtractor::is_supported(const std::string& path) {
    std::string ext = lower_extension(path);
    return ext == "csv" || ext == "tsv" || ext == "parquet";
}

DatasetMetadata DatasetMetadataExtractor::extract(const std::string& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw MetadataError("File not found: " + path);
    }

    std::string ext = lower_extension(path);
    if (!is_supported(path)) {
        throw MetadataError("Unsupported file format: ." + ext + ". Only .csv, .tsv and .parquet are supported.");
    }

    std::shared_ptr<arrow::Table> table;
    try {
        if (ext == "parquet") {
            table = read_parquet(path);
        } else {
            table = read_delimited(path, ext == "tsv" ? '\t' : ',');
        }
    } catch (const parquet::ParquetException& e) {
        throw MetadataError(std::string("Failed to read file: ") + e.what());
    }

    DatasetMetadata metadata;
    metadata.filename = fs::path(path).filename().string();
    metadata.file_format = ext;
    metadata.file_size_bytes = static_cast<int64_t>(fs::file_size(path, ec));
    metadata.total_rows = table->num_rows();
    metadata.total_columns = table->num_columns();

    auto schema = table->schema();
    for (int col_idx = 0; col_idx < table->num_columns(); ++col_idx) {
        metadata.columns.push_back(describe_column(
            schema->field(col_idx)->name(), *table->column(col_idx), metadata.total_rows, config_));
    }

    return metadata;
}

std::string DatasetMetadataExtractor::bounded_json(const DatasetMetadata& metadata) const {
    nlohmann::json j = metadata.to_json();
    auto render = [](const nlohmann::json& value) {
        return value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    };

    std::string text = render(j);
    if (text.size() <= config_.max_describe_bytes) {
        return text;
    }

    // Samples carry most of the weight on wide tables
    for (auto& col : j["columns"]) {
        col["sample_values"] = nlohmann::json::array();
    }
    text = render(j);

    size_t total_columns = j["columns"].size();
    while (text.size() > config_.max_describe_bytes && !j["columns"].empty()) {
        j["columns"].erase(j["columns"].size() - 1);
        j["columns_omitted"] = total_columns - j["columns"].size();
        text = render(j);
    }

    return cut_utf8(text, config_.max_describe_bytes);
}

std::string DatasetMetadataExtractor::describe(const std::string& path) const noexcept {
    try {
        return bounded_json(extract(path));
    } catch (const std::exception& e) {
        return cut_utf8(std::string(kMetadataErrorPrefix) + e.what(), config_.max_describe_bytes);
    }
}

std::string DatasetMetadataExtractor::describe_files(const std::vector<std::string>& paths) const {
    std::vector<std::string> sections;

    for (const auto& path : paths) {
        std::string file_name = fs::path(path).filename().string();
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            sections.push_back("### File: " + file_name + "\nStatus: File not found: " + path);
            continue;
        }

        std::string docker_path = "/data/" + file_name;
        std::ostringstream oss;
        if (is_supported(path)) {
            oss << "### File Metadata: " << file_name << "\n";
            oss << "- **Docker Path**: `" << docker_path << "`\n";
            std::string metadata = describe(path);
            if (metadata.rfind(kMetadataErrorPrefix, 0) == 0) {
                oss << "Status: " << metadata;
            } else {
                oss << "- **Metadata (JSON)**:\n";
                oss << "```json\n" << metadata << "\n```\n";
                oss << "(Note: The full file is available at `" << docker_path << "`. "
                    << "If you need raw data for charts, read it inside code using pandas.)";
            }
        } else {
            oss << "### File: " << file_name << "\n";
            oss << "- **Docker Path**: `" << docker_path << "`\n";
            oss << "(Unsupported for metadata extraction; please read content from `"
                << docker_path << "` if needed.)";
        }
        sections.push_back(oss.str());
    }

    std::string result;
    for (size_t i = 0; i < sections.size(); ++i) {
        if (i > 0) {
            result += "\n\n";
        }
        result += sections[i];
    }
    return result;
}

} // namespace sandlyst
