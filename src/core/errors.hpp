#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// Error taxonomy for the analysis engine. Window-scoped errors are caught and
// recorded by RunOrchestrator; ConfigError aborts a run before any window.
// ---------------------------------------------------------------------------
class AnalysisError : public std::runtime_error {
public:
    explicit AnalysisError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Unresolvable or invalid experiment definition / analysis configuration.
class ConfigError : public AnalysisError {
public:
    explicit ConfigError(std::string msg) : AnalysisError(std::move(msg)) {}
};

// Raw dataset unreachable, timed out, or returned rows that do not match the query.
class DataSourceError : public AnalysisError {
public:
    explicit DataSourceError(std::string msg) : AnalysisError(std::move(msg)) {}
};

// Numeric failure while resampling (e.g. non-finite input).
class StatisticalComputationError : public AnalysisError {
public:
    explicit StatisticalComputationError(std::string msg) : AnalysisError(std::move(msg)) {}
};

// Result table could not be written to its destination.
class ExportError : public AnalysisError {
public:
    explicit ExportError(std::string msg) : AnalysisError(std::move(msg)) {}
};
