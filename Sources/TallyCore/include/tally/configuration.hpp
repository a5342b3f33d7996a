#pragma once

#include "log.hpp"
#include <string>
#include <optional>
#include <stdexcept>

namespace tally {

/// Raised for structural misconfiguration: unknown models, columns or
/// relations, and counters declared on relations that cannot be counted.
class configuration_error : public std::logic_error {
public:
    explicit configuration_error(const std::string& msg) : std::logic_error(msg) {}
};

struct configuration {
    /// Database file path. Use ":memory:" for in-memory database.
    std::string path = ":memory:";

    /// When true, post_clear notifications carry the ids that were unlinked.
    /// When false they carry none, and counter trackers fall back to the ids
    /// captured during pre_clear.
    bool report_cleared_ids = false;

    /// Applied to the global logger when a store is opened, if set.
    std::optional<log_level> log;

    // Default constructor - in-memory
    configuration() = default;

    // Path only - file-based
    explicit configuration(const std::string& p) : path(p) {}

    configuration(const std::string& p, bool report_cleared)
        : path(p), report_cleared_ids(report_cleared) {}

    /// Parse a JSON document such as
    ///   {"path": "app.db", "report_cleared_ids": true, "log_level": "debug"}
    /// Missing keys keep their defaults. Throws configuration_error.
    static configuration from_json(const std::string& text);

    /// Read and parse a JSON configuration file. Throws configuration_error.
    static configuration from_file(const std::string& file_path);
};

log_level log_level_from_string(const std::string& name);

} // namespace tally
