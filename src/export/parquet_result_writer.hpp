#pragma once

#include "core/errors.hpp"
#include "export/result_sink.hpp"
#include "export/statistical_result.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <arrow/util/key_value_metadata.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace parquet_results {

// Stable, additive-only column order of exported result tables.
inline std::vector<std::string> column_names() {
    return {"metric", "statistic", "parameter", "branch", "comparison",
            "comparison_to_branch", "window_kind", "window_index", "segment",
            "point", "lower", "upper", "ci_width", "sample_size", "status"};
}

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw ExportError(what + ": " + status.ToString());
    }
}

inline std::shared_ptr<arrow::Array> string_column(
    const std::vector<StatisticalResult>& rows,
    const std::function<std::string(const StatisticalResult&)>& get) {
    arrow::StringBuilder b;
    for (const auto& r : rows) check(b.Append(get(r)), "append string");
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "finish string column");
    return arr;
}

inline std::shared_ptr<arrow::Array> optional_double_column(
    const std::vector<StatisticalResult>& rows,
    const std::function<std::optional<double>(const StatisticalResult&)>& get) {
    arrow::DoubleBuilder b;
    for (const auto& r : rows) {
        auto v = get(r);
        check(v.has_value() ? b.Append(*v) : b.AppendNull(), "append double");
    }
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "finish double column");
    return arr;
}

inline std::shared_ptr<arrow::Table> to_arrow_table(const ResultTable& table) {
    const auto& rows = table.results;

    arrow::FieldVector fields;
    fields.push_back(arrow::field("metric", arrow::utf8()));
    fields.push_back(arrow::field("statistic", arrow::utf8()));
    fields.push_back(arrow::field("parameter", arrow::float64()));
    fields.push_back(arrow::field("branch", arrow::utf8()));
    fields.push_back(arrow::field("comparison", arrow::utf8()));
    fields.push_back(arrow::field("comparison_to_branch", arrow::utf8()));
    fields.push_back(arrow::field("window_kind", arrow::utf8()));
    fields.push_back(arrow::field("window_index", arrow::int64()));
    fields.push_back(arrow::field("segment", arrow::utf8()));
    fields.push_back(arrow::field("point", arrow::float64()));
    fields.push_back(arrow::field("lower", arrow::float64()));
    fields.push_back(arrow::field("upper", arrow::float64()));
    fields.push_back(arrow::field("ci_width", arrow::float64()));
    fields.push_back(arrow::field("sample_size", arrow::int64()));
    fields.push_back(arrow::field("status", arrow::utf8()));

    auto metadata = arrow::key_value_metadata(
        {"experiment_id", "window", "as_of_date", "schema_version", "is_final"},
        {table.experiment_id, table.window.key(), std::to_string(table.as_of_date),
         std::to_string(table.schema_version), table.is_final ? "true" : "false"});
    auto schema = arrow::schema(fields, metadata);

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> arr;

    arrays.push_back(string_column(rows, [](const auto& r) { return r.metric; }));
    arrays.push_back(string_column(rows, [](const auto& r) { return r.statistic; }));
    arrays.push_back(optional_double_column(rows, [](const auto& r) { return r.parameter; }));
    arrays.push_back(string_column(rows, [](const auto& r) { return r.branch; }));
    arrays.push_back(string_column(rows, [](const auto& r) { return r.comparison; }));
    arrays.push_back(string_column(rows, [](const auto& r) { return r.comparison_to_branch; }));
    arrays.push_back(string_column(rows, [](const auto& r) {
        return window_kind_name(r.window_kind);
    }));
    // window_index (INT64)
    {
        arrow::Int64Builder b;
        for (const auto& r : rows) check(b.Append(r.window_index), "append window_index");
        check(b.Finish(&arr), "finish window_index");
        arrays.push_back(arr);
    }
    arrays.push_back(string_column(rows, [](const auto& r) { return r.segment; }));
    arrays.push_back(optional_double_column(rows, [](const auto& r) { return r.point; }));
    arrays.push_back(optional_double_column(rows, [](const auto& r) { return r.lower; }));
    arrays.push_back(optional_double_column(rows, [](const auto& r) { return r.upper; }));
    // ci_width (DOUBLE)
    {
        arrow::DoubleBuilder b;
        for (const auto& r : rows) check(b.Append(r.ci_width), "append ci_width");
        check(b.Finish(&arr), "finish ci_width");
        arrays.push_back(arr);
    }
    // sample_size (INT64)
    {
        arrow::Int64Builder b;
        for (const auto& r : rows) check(b.Append(r.sample_size), "append sample_size");
        check(b.Finish(&arr), "finish sample_size");
        arrays.push_back(arr);
    }
    arrays.push_back(string_column(rows, [](const auto& r) {
        return result_status_name(r.status);
    }));

    return arrow::Table::Make(schema, arrays);
}

}  // namespace parquet_results

// ---------------------------------------------------------------------------
// ParquetResultWriter — one ZSTD "<table>.parquet" per (experiment, window).
// Table metadata travels in the Arrow schema's key/value metadata.
// ---------------------------------------------------------------------------
class ParquetResultWriter : public ResultSink {
public:
    explicit ParquetResultWriter(std::filesystem::path output_dir)
        : output_dir_(std::move(output_dir)) {}

    std::filesystem::path path_for(const std::string& table) const {
        return output_dir_ / (table + ".parquet");
    }

    void replace_window(const ResultTable& table) override {
        result_files::ensure_directory(output_dir_);
        const std::string name = table.name();
        auto dest = path_for(name);
        auto tmp = output_dir_ / (name + ".parquet.tmp");

        auto arrow_table = parquet_results::to_arrow_table(table);

        auto outfile_result = arrow::io::FileOutputStream::Open(tmp.string());
        if (!outfile_result.ok()) {
            throw ExportError("Cannot open Parquet output file " + tmp.string() + ": " +
                              outfile_result.status().ToString());
        }
        auto outfile = *outfile_result;

        auto props = parquet::WriterProperties::Builder()
            .compression(parquet::Compression::ZSTD)
            ->build();

        int64_t chunk_size = std::max<int64_t>(1, arrow_table->num_rows());
        auto status = parquet::arrow::WriteTable(
            *arrow_table, arrow::default_memory_pool(), outfile, chunk_size, props);
        auto close_status = outfile->Close();
        if (!status.ok() || !close_status.ok()) {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            throw ExportError("Failed to write Parquet " + tmp.string() + ": " +
                              (status.ok() ? close_status.ToString() : status.ToString()));
        }

        result_files::commit(tmp, dest);
        if (table.is_final) result_files::mark_final(output_dir_, name);
    }

    bool has_final(const std::string& experiment_id, const AnalysisWindow& window) override {
        return std::filesystem::exists(
            result_files::final_marker_path(output_dir_, table_name(experiment_id, window)));
    }

private:
    std::filesystem::path output_dir_;
};
