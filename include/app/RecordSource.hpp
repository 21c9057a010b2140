#pragma once

#include "model/Records.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace vigil::app {

// All loaders read the whole file once and preserve source order. Whole-file
// failures throw SourceError; per-row failures come back as rejected rows.

// users.csv: username,last_login_days,status (header row optional)
[[nodiscard]] auto load_user_roster(const std::filesystem::path& path)
    -> model::SourceRows<model::UserRecord>;

// events.json: {"events": [{"user": "...", "event": "...", "timestamp": ...}, ...]}
[[nodiscard]] auto load_event_feed(const std::filesystem::path& path)
    -> model::SourceRows<model::EventRecord>;

// Service export CSV with a Name column and an optional Status column
// (Get-Service | Export-Csv). A leading "#TYPE" line is ignored.
[[nodiscard]] auto load_service_listing(const std::filesystem::path& path)
    -> model::SourceRows<model::ServiceRecord>;

// {"processes": [{"name": "...", "pid": N} | "name", ...]}
[[nodiscard]] auto load_process_inventory(const std::filesystem::path& path)
    -> model::SourceRows<model::ProcessRecord>;

// Plain text log, one entry per line (trailing CR stripped).
[[nodiscard]] auto load_text_lines(const std::filesystem::path& path) -> std::vector<std::string>;

// Overwrites path with a process inventory in the format load_process_inventory
// reads. Throws ExportError if the file cannot be written.
void write_process_inventory(const std::filesystem::path& path,
                             const std::vector<model::ProcessRecord>& procs);

} // namespace vigil::app
