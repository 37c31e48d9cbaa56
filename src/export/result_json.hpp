#pragma once

#include "core/errors.hpp"
#include "export/result_sink.hpp"
#include "export/statistical_result.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace result_json {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    unsigned code = static_cast<unsigned char>(c);
                    std::snprintf(buf, sizeof(buf), "\\u%04x", code);
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

inline void write_optional(std::ostringstream& ss, const std::optional<double>& v) {
    if (v.has_value()) {
        ss << *v;
    } else {
        ss << "null";
    }
}

inline std::string to_json(const StatisticalResult& r) {
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10);
    ss << "{";
    ss << "\"metric\":\"" << json_escape(r.metric) << "\"";
    ss << ",\"statistic\":\"" << json_escape(r.statistic) << "\"";
    ss << ",\"parameter\":";
    write_optional(ss, r.parameter);
    ss << ",\"branch\":\"" << json_escape(r.branch) << "\"";
    ss << ",\"comparison\":\"" << json_escape(r.comparison) << "\"";
    ss << ",\"comparison_to_branch\":\"" << json_escape(r.comparison_to_branch) << "\"";
    ss << ",\"window_kind\":\"" << window_kind_name(r.window_kind) << "\"";
    ss << ",\"window_index\":" << r.window_index;
    ss << ",\"segment\":\"" << json_escape(r.segment) << "\"";
    ss << ",\"point\":";
    write_optional(ss, r.point);
    ss << ",\"lower\":";
    write_optional(ss, r.lower);
    ss << ",\"upper\":";
    write_optional(ss, r.upper);
    ss << ",\"ci_width\":" << r.ci_width;
    ss << ",\"sample_size\":" << r.sample_size;
    ss << ",\"status\":\"" << result_status_name(r.status) << "\"";
    ss << "}";
    return ss.str();
}

inline std::string to_json(const ResultTable& table) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"table\":\"" << json_escape(table.name()) << "\"";
    ss << ",\"experiment_id\":\"" << json_escape(table.experiment_id) << "\"";
    ss << ",\"window\":\"" << table.window.key() << "\"";
    ss << ",\"as_of_date\":" << table.as_of_date;
    ss << ",\"schema_version\":" << table.schema_version;
    ss << ",\"is_final\":" << (table.is_final ? "true" : "false");
    ss << ",\"results\":[";
    for (size_t i = 0; i < table.results.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(table.results[i]);
    }
    ss << "]";
    ss << "}";
    return ss.str();
}

}  // namespace result_json

// ---------------------------------------------------------------------------
// JsonResultWriter — one "<table>.json" per (experiment, window)
// ---------------------------------------------------------------------------
class JsonResultWriter : public ResultSink {
public:
    explicit JsonResultWriter(std::filesystem::path output_dir)
        : output_dir_(std::move(output_dir)) {}

    std::filesystem::path path_for(const std::string& table) const {
        return output_dir_ / (table + ".json");
    }

    void replace_window(const ResultTable& table) override {
        result_files::ensure_directory(output_dir_);
        const std::string name = table.name();
        auto dest = path_for(name);
        auto tmp = output_dir_ / (name + ".json.tmp");
        {
            std::ofstream out(tmp);
            if (!out.is_open()) {
                throw ExportError("Cannot open " + tmp.string() + " for writing");
            }
            out << result_json::to_json(table) << "\n";
            if (!out.good()) {
                throw ExportError("Failed writing " + tmp.string());
            }
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
