#pragma once

#include "core/errors.hpp"
#include "export/statistical_result.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

// ---------------------------------------------------------------------------
// ResultSink — export collaborator. replace_window must make the new table
// visible all-or-nothing, superseding any previous table for the same
// (experiment, window).
// ---------------------------------------------------------------------------
class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual void replace_window(const ResultTable& table) = 0;
    virtual bool has_final(const std::string& experiment_id, const AnalysisWindow& window) = 0;
};

// ---------------------------------------------------------------------------
// InMemoryResultStore — tables keyed by table name
// ---------------------------------------------------------------------------
class InMemoryResultStore : public ResultSink {
public:
    void replace_window(const ResultTable& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        tables_[table.name()] = table;
        ++write_count_;
    }

    bool has_final(const std::string& experiment_id, const AnalysisWindow& window) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tables_.find(table_name(experiment_id, window));
        return it != tables_.end() && it->second.is_final;
    }

    std::optional<ResultTable> get(const std::string& experiment_id,
                                   const AnalysisWindow& window) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tables_.find(table_name(experiment_id, window));
        if (it == tables_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<std::string> table_names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [name, _] : tables_) names.push_back(name);
        return names;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tables_.size();
    }

    int write_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return write_count_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ResultTable> tables_;
    int write_count_ = 0;
};

// ---------------------------------------------------------------------------
// File helpers shared by the on-disk writers. A table is written to a temp
// file in the target directory and renamed over the destination; a final
// table additionally gets an empty "<table>.final" marker.
// ---------------------------------------------------------------------------
namespace result_files {

inline std::filesystem::path final_marker_path(const std::filesystem::path& dir,
                                               const std::string& table) {
    return dir / (table + ".final");
}

inline void ensure_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw ExportError("Cannot create output directory " + dir.string() + ": " + ec.message());
    }
}

inline void commit(const std::filesystem::path& tmp, const std::filesystem::path& dest) {
    std::error_code ec;
    std::filesystem::rename(tmp, dest, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw ExportError("Cannot move " + tmp.string() + " to " + dest.string());
    }
}

inline void mark_final(const std::filesystem::path& dir, const std::string& table) {
    std::ofstream marker(final_marker_path(dir, table));
    if (!marker.is_open()) {
        throw ExportError("Cannot write final marker for " + table);
    }
}

}  // namespace result_files
