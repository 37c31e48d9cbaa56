#pragma once

#include "core/errors.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Experiment — read-only experiment definition supplied by the config side.
// Dates are YYYYMMDD; end_date is the last live day (inclusive).
// ---------------------------------------------------------------------------
struct Experiment {
    std::string id;
    int start_date = 0;
    std::optional<int> end_date;
    std::vector<std::string> branches;
    std::optional<std::string> control_branch;
    std::string enrollment_criteria;
    std::vector<std::string> metrics;
    std::vector<std::string> segments;

    bool has_branch(const std::string& branch) const {
        return std::find(branches.begin(), branches.end(), branch) != branches.end();
    }

    // Throws ConfigError describing the first problem found.
    void validate() const {
        if (id.empty()) {
            throw ConfigError("Experiment id must not be empty");
        }
        if (!time_utils::is_valid_date(start_date)) {
            throw ConfigError("Experiment '" + id + "' has invalid start date " +
                              std::to_string(start_date));
        }
        if (end_date.has_value()) {
            if (!time_utils::is_valid_date(*end_date)) {
                throw ConfigError("Experiment '" + id + "' has invalid end date " +
                                  std::to_string(*end_date));
            }
            if (*end_date < start_date) {
                throw ConfigError("Experiment '" + id + "' ends before it starts");
            }
        }
        if (branches.size() < 2) {
            throw ConfigError("Experiment '" + id + "' needs at least two branches");
        }
        std::set<std::string> seen;
        for (const auto& b : branches) {
            if (b.empty()) {
                throw ConfigError("Experiment '" + id + "' has an empty branch name");
            }
            if (!seen.insert(b).second) {
                throw ConfigError("Experiment '" + id + "' has duplicate branch '" + b + "'");
            }
        }
        if (control_branch.has_value() && !has_branch(*control_branch)) {
            throw ConfigError("Control branch '" + *control_branch +
                              "' is not a branch of experiment '" + id + "'");
        }
        std::set<std::string> seg_seen;
        for (const auto& s : segments) {
            if (s.empty() || s == "all") {
                throw ConfigError("Experiment '" + id + "' has reserved or empty segment name '" +
                                  s + "'");
            }
            if (!seg_seen.insert(s).second) {
                throw ConfigError("Experiment '" + id + "' has duplicate segment '" + s + "'");
            }
        }
    }
};

// ---------------------------------------------------------------------------
// AnalysisUnitRecord — one enrolled unit; branch is fixed at enrollment.
// ---------------------------------------------------------------------------
struct AnalysisUnitRecord {
    std::string unit_id;
    std::string branch;
    uint64_t enrollment_ts = 0;
    std::set<std::string> segments;
};

// Lowercase, non-alphanumerics replaced by '_' (table-name safe).
inline std::string normalize_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        out += std::isalnum(uc) ? static_cast<char>(std::tolower(uc)) : '_';
    }
    return out;
}
