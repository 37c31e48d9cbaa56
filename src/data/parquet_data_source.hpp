#pragma once

#include "core/errors.hpp"
#include "core/logging.hpp"
#include "data/raw_data_source.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>

#include <filesystem>
#include <limits>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace parquet_io {

// Read a whole Parquet file into an Arrow table. Throws DataSourceError.
inline std::shared_ptr<arrow::Table> read_table(const std::string& path) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) {
        throw DataSourceError("Cannot open Parquet file " + path + ": " +
                              open_result.status().ToString());
    }

    auto file_reader_result = parquet::arrow::OpenFile(
        open_result.ValueOrDie(), arrow::default_memory_pool());
    if (!file_reader_result.ok()) {
        throw DataSourceError("Not a readable Parquet file " + path + ": " +
                              file_reader_result.status().ToString());
    }
    auto reader = file_reader_result.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> table;
    auto status = reader->ReadTable(&table);
    if (!status.ok()) {
        throw DataSourceError("Failed to read Parquet file " + path + ": " + status.ToString());
    }

    // Columns are walked chunk by chunk in lockstep, so align their chunking.
    auto combined = table->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        throw DataSourceError("Failed to combine chunks of " + path + ": " +
                              combined.status().ToString());
    }
    return combined.MoveValueUnsafe();
}

// Column lookup with type check; nullptr when optional and absent.
inline std::shared_ptr<arrow::ChunkedArray> column(const arrow::Table& table,
                                                   const std::string& name,
                                                   arrow::Type::type expected,
                                                   const std::string& path,
                                                   bool required = true) {
    auto col = table.GetColumnByName(name);
    if (!col) {
        if (!required) return nullptr;
        throw DataSourceError("Schema mismatch in " + path + ": missing column '" + name + "'");
    }
    if (col->type()->id() != expected) {
        throw DataSourceError("Schema mismatch in " + path + ": column '" + name +
                              "' has type " + col->type()->ToString());
    }
    return col;
}

inline std::set<std::string> split_segments(const std::string& s) {
    std::set<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.insert(item);
    }
    return out;
}

}  // namespace parquet_io

// ---------------------------------------------------------------------------
// ParquetSourceConfig — file locations of the raw dataset
// ---------------------------------------------------------------------------
struct ParquetSourceConfig {
    std::string enrollments_path;
    std::string events_path;

    void validate() const {
        if (enrollments_path.empty()) throw ConfigError("enrollments_path is required");
        if (events_path.empty()) throw ConfigError("events_path is required");
    }
};

// ---------------------------------------------------------------------------
// ParquetDataSource — raw dataset backed by two Parquet files.
//
// Enrollments: unit_id (utf8), branch (utf8), enrollment_ts (int64 ns),
//              optional experiment_id (utf8), optional segments (utf8, comma list)
// Events:      unit_id (utf8), branch (utf8), ts (int64 ns), event_name (utf8),
//              value (float64, nullable)
//
// Files are re-read on every call so each run sees the current dataset.
// ---------------------------------------------------------------------------
class ParquetDataSource : public RawDataSource {
public:
    explicit ParquetDataSource(ParquetSourceConfig config) : config_(std::move(config)) {
        config_.validate();
    }

    std::vector<AnalysisUnitRecord> enrollments(const Experiment& experiment) override {
        const auto& path = config_.enrollments_path;
        if (!std::filesystem::exists(path)) {
            throw DataSourceError("Enrollments file not found: " + path);
        }
        auto table = parquet_io::read_table(path);

        auto unit_col = parquet_io::column(*table, "unit_id", arrow::Type::STRING, path);
        auto branch_col = parquet_io::column(*table, "branch", arrow::Type::STRING, path);
        auto ts_col = parquet_io::column(*table, "enrollment_ts", arrow::Type::INT64, path);
        auto exp_col = parquet_io::column(*table, "experiment_id", arrow::Type::STRING, path, false);
        auto seg_col = parquet_io::column(*table, "segments", arrow::Type::STRING, path, false);

        std::vector<AnalysisUnitRecord> units;
        for (int c = 0; c < unit_col->num_chunks(); ++c) {
            auto units_arr = std::static_pointer_cast<arrow::StringArray>(unit_col->chunk(c));
            auto branch_arr = std::static_pointer_cast<arrow::StringArray>(branch_col->chunk(c));
            auto ts_arr = std::static_pointer_cast<arrow::Int64Array>(ts_col->chunk(c));
            std::shared_ptr<arrow::StringArray> exp_arr;
            std::shared_ptr<arrow::StringArray> seg_arr;
            if (exp_col) exp_arr = std::static_pointer_cast<arrow::StringArray>(exp_col->chunk(c));
            if (seg_col) seg_arr = std::static_pointer_cast<arrow::StringArray>(seg_col->chunk(c));

            for (int64_t i = 0; i < units_arr->length(); ++i) {
                if (exp_arr && (exp_arr->IsNull(i) || exp_arr->GetString(i) != experiment.id)) {
                    continue;
                }
                if (units_arr->IsNull(i) || branch_arr->IsNull(i) || ts_arr->IsNull(i) ||
                    ts_arr->Value(i) < 0) {
                    throw DataSourceError("Malformed enrollment row " + std::to_string(i) +
                                          " in " + path);
                }
                AnalysisUnitRecord u;
                u.unit_id = units_arr->GetString(i);
                u.branch = branch_arr->GetString(i);
                u.enrollment_ts = static_cast<uint64_t>(ts_arr->Value(i));
                if (seg_arr && !seg_arr->IsNull(i)) {
                    u.segments = parquet_io::split_segments(seg_arr->GetString(i));
                }
                units.push_back(std::move(u));
            }
        }
        analysis_log::logger()->debug("Loaded {} enrollments for {} from {}",
                                      units.size(), experiment.id, path);
        return units;
    }

    std::vector<RawEvent> query_events(const EventQuery& query) override {
        const auto& path = config_.events_path;
        if (!std::filesystem::exists(path)) {
            throw DataSourceError("Events file not found: " + path);
        }
        auto table = parquet_io::read_table(path);

        auto unit_col = parquet_io::column(*table, "unit_id", arrow::Type::STRING, path);
        auto branch_col = parquet_io::column(*table, "branch", arrow::Type::STRING, path);
        auto ts_col = parquet_io::column(*table, "ts", arrow::Type::INT64, path);
        auto name_col = parquet_io::column(*table, "event_name", arrow::Type::STRING, path);
        auto value_col = parquet_io::column(*table, "value", arrow::Type::DOUBLE, path);

        std::vector<RawEvent> out;
        for (int c = 0; c < unit_col->num_chunks(); ++c) {
            auto units_arr = std::static_pointer_cast<arrow::StringArray>(unit_col->chunk(c));
            auto branch_arr = std::static_pointer_cast<arrow::StringArray>(branch_col->chunk(c));
            auto ts_arr = std::static_pointer_cast<arrow::Int64Array>(ts_col->chunk(c));
            auto name_arr = std::static_pointer_cast<arrow::StringArray>(name_col->chunk(c));
            auto value_arr = std::static_pointer_cast<arrow::DoubleArray>(value_col->chunk(c));

            for (int64_t i = 0; i < units_arr->length(); ++i) {
                if (units_arr->IsNull(i) || ts_arr->IsNull(i) || name_arr->IsNull(i) ||
                    ts_arr->Value(i) < 0) {
                    throw DataSourceError("Malformed event row " + std::to_string(i) +
                                          " in " + path);
                }
                int64_t ts = ts_arr->Value(i);

                RawEvent e;
                e.unit_id = units_arr->GetString(i);
                e.ts = static_cast<uint64_t>(ts);
                e.event_name = name_arr->GetString(i);
                if (!query.matches(e)) continue;

                e.branch = branch_arr->IsNull(i) ? std::string() : branch_arr->GetString(i);
                e.value = value_arr->IsNull(i) ? std::numeric_limits<double>::quiet_NaN()
                                               : value_arr->Value(i);
                out.push_back(std::move(e));
            }
        }
        return out;
    }

private:
    ParquetSourceConfig config_;
};
