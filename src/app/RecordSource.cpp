#include "app/RecordSource.hpp"
#include "app/Errors.hpp"
#include "util/AsciiLower.hpp"
#include "util/Csv.hpp"
#include "util/Utf8.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <string_view>

namespace fs = std::filesystem;
using nlohmann::json;

namespace vigil::app {

using model::SourceRow;
using model::SourceRows;

// Structured inputs must be valid UTF-8; free-form logs are taken as-is.
static std::string read_source_text(const fs::path& path, bool require_utf8 = true) {
  std::error_code ec;
  if (!fs::exists(path, ec) || fs::is_directory(path, ec)) {
    throw SourceError(SourceErrorKind::NotFound, path, "no such file");
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw SourceError(SourceErrorKind::NotFound, path, std::strerror(errno));
  }
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw SourceError(SourceErrorKind::NotFound, path, "read failed");
  }
  if (require_utf8 && !util::is_valid_utf8(text)) {
    throw SourceError(SourceErrorKind::EncodingError, path, "input is not valid UTF-8");
  }
  return std::string(util::strip_bom(text));
}

// Calls fn(line_no, line) for every line; line_no is 1-based, CR stripped.
template <typename Fn>
static void for_each_line(std::string_view text, Fn&& fn) {
  size_t line_no = 0;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    fn(++line_no, line);
    start = end + 1;
  }
}

static json parse_json_document(const std::string& text, const fs::path& path) {
  try {
    return json::parse(text);
  } catch (const json::parse_error& e) {
    throw SourceError(SourceErrorKind::MalformedShape, path, e.what());
  }
}

// ---------------------------------------------------------------------------
// users.csv
// ---------------------------------------------------------------------------

static bool is_roster_header(const std::vector<std::string>& f) {
  return f.size() == 3 && util::ascii_iequals(f[0], "username") &&
         util::ascii_iequals(f[1], "last_login_days") && util::ascii_iequals(f[2], "status");
}

static std::optional<model::UserStatus> parse_status(std::string_view s) {
  if (util::ascii_iequals(s, "active")) return model::UserStatus::Active;
  if (util::ascii_iequals(s, "disabled")) return model::UserStatus::Disabled;
  return std::nullopt;
}

static SourceRow<model::UserRecord> parse_roster_row(const std::vector<std::string>& f, size_t line_no) {
  SourceRow<model::UserRecord> row{line_no, std::nullopt, {}};
  if (f.size() != 3) {
    row.error = "expected 3 fields (username,last_login_days,status), got " + std::to_string(f.size());
    return row;
  }
  if (f[0].empty()) { row.error = "empty username"; return row; }
  if (f[1].empty()) { row.error = "empty last_login_days"; return row; }
  if (f[2].empty()) { row.error = "empty status"; return row; }

  int days = 0;
  const auto& d = f[1];
  auto [ptr, ec] = std::from_chars(d.data(), d.data() + d.size(), days);
  if (ec != std::errc{} || ptr != d.data() + d.size()) {
    row.error = "last_login_days is not an integer: '" + d + "'";
    return row;
  }
  if (days < 0) {
    row.error = "last_login_days is negative: " + d;
    return row;
  }
  auto status = parse_status(f[2]);
  if (!status) {
    row.error = "unknown status '" + f[2] + "'";
    return row;
  }
  row.record = model::UserRecord{f[0], days, *status};
  return row;
}

auto load_user_roster(const fs::path& path) -> SourceRows<model::UserRecord> {
  const std::string text = read_source_text(path);
  SourceRows<model::UserRecord> rows;
  for_each_line(text, [&](size_t line_no, std::string_view line){
    if (util::trim(line).empty()) return;
    auto fields = util::split_csv_line(line);
    if (!fields) {
      rows.push_back(SourceRow<model::UserRecord>{line_no, std::nullopt, "malformed quoting"});
      return;
    }
    if (is_roster_header(*fields)) return;
    rows.push_back(parse_roster_row(*fields, line_no));
  });
  return rows;
}

// ---------------------------------------------------------------------------
// events.json
// ---------------------------------------------------------------------------

static std::optional<std::string> string_member(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return std::nullopt;
  auto s = it->get<std::string>();
  if (s.empty()) return std::nullopt;
  return s;
}

auto load_event_feed(const fs::path& path) -> SourceRows<model::EventRecord> {
  const std::string text = read_source_text(path);
  const json doc = parse_json_document(text, path);
  if (!doc.is_object()) {
    throw SourceError(SourceErrorKind::MalformedShape, path, "top level is not a JSON object");
  }
  auto events = doc.find("events");
  if (events == doc.end() || !events->is_array()) {
    throw SourceError(SourceErrorKind::MalformedShape, path, "missing \"events\" array");
  }

  SourceRows<model::EventRecord> rows;
  rows.reserve(events->size());
  size_t idx = 0;
  for (const auto& e : *events) {
    SourceRow<model::EventRecord> row{++idx, std::nullopt, {}};
    if (!e.is_object()) {
      row.error = "event is not an object";
    } else if (auto user = string_member(e, "user"); !user) {
      row.error = "event has no \"user\" string";
    } else if (auto type = string_member(e, "event"); !type) {
      row.error = "event has no \"event\" string";
    } else {
      model::EventRecord rec{*user, *type, {}};
      if (auto ts = e.find("timestamp"); ts != e.end() && !ts->is_null()) {
        rec.timestamp = ts->is_string() ? ts->get<std::string>() : ts->dump();
      }
      row.record = std::move(rec);
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

// ---------------------------------------------------------------------------
// service export CSV
// ---------------------------------------------------------------------------

auto load_service_listing(const fs::path& path) -> SourceRows<model::ServiceRecord> {
  const std::string text = read_source_text(path);
  SourceRows<model::ServiceRecord> rows;
  std::optional<size_t> name_col;
  std::optional<size_t> status_col;
  bool have_header = false;

  for_each_line(text, [&](size_t line_no, std::string_view line){
    auto t = util::trim(line);
    if (t.empty()) return;
    if (!have_header) {
      if (t.rfind("#TYPE", 0) == 0) return;
      auto header = util::split_csv_line(t);
      if (!header) {
        throw SourceError(SourceErrorKind::MalformedShape, path,
                          "malformed quoting in header (line " + std::to_string(line_no) + ")");
      }
      for (size_t i = 0; i < header->size(); ++i) {
        if (!name_col && util::ascii_iequals((*header)[i], "name")) name_col = i;
        else if (!status_col && util::ascii_iequals((*header)[i], "status")) status_col = i;
      }
      if (!name_col) {
        throw SourceError(SourceErrorKind::MalformedShape, path,
                          "header has no Name column (line " + std::to_string(line_no) + ")");
      }
      have_header = true;
      return;
    }
    auto fields = util::split_csv_line(t);
    SourceRow<model::ServiceRecord> row{line_no, std::nullopt, {}};
    if (!fields) {
      row.error = "malformed quoting";
    } else if (*name_col >= fields->size() || (*fields)[*name_col].empty()) {
      row.error = "empty service name";
    } else {
      model::ServiceRecord rec{(*fields)[*name_col], {}};
      if (status_col && *status_col < fields->size()) rec.status = (*fields)[*status_col];
      row.record = std::move(rec);
    }
    rows.push_back(std::move(row));
  });

  if (!have_header) {
    throw SourceError(SourceErrorKind::MalformedShape, path, "no header row");
  }
  return rows;
}

// ---------------------------------------------------------------------------
// process inventory JSON
// ---------------------------------------------------------------------------

auto load_process_inventory(const fs::path& path) -> SourceRows<model::ProcessRecord> {
  const std::string text = read_source_text(path);
  const json doc = parse_json_document(text, path);
  if (!doc.is_object()) {
    throw SourceError(SourceErrorKind::MalformedShape, path, "top level is not a JSON object");
  }
  auto procs = doc.find("processes");
  if (procs == doc.end() || !procs->is_array()) {
    throw SourceError(SourceErrorKind::MalformedShape, path, "missing \"processes\" array");
  }

  SourceRows<model::ProcessRecord> rows;
  rows.reserve(procs->size());
  size_t idx = 0;
  for (const auto& p : *procs) {
    SourceRow<model::ProcessRecord> row{++idx, std::nullopt, {}};
    std::string name;
    int32_t pid = 0;
    if (p.is_string()) {
      name = std::string(util::trim(p.get<std::string>()));
    } else if (p.is_object()) {
      if (auto n = string_member(p, "name")) name = std::string(util::trim(*n));
      if (auto it = p.find("pid"); it != p.end() && !it->is_null()) {
        // pids are non-negative and fit pid_t
        if (it->is_number_unsigned() &&
            it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
          pid = static_cast<int32_t>(it->get<uint64_t>());
        } else {
          row.error = "pid out of range: " + it->dump();
        }
      }
    }
    if (row.error.empty()) {
      if (name.empty()) row.error = "process entry has no name";
      else row.record = model::ProcessRecord{pid, std::move(name)};
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

void write_process_inventory(const fs::path& path, const std::vector<model::ProcessRecord>& procs) {
  json list = json::array();
  for (const auto& p : procs) {
    list.push_back({{"name", p.name}, {"pid", p.pid}});
  }
  const json doc = {{"processes", std::move(list)}};

  std::error_code ec;
  if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    throw ExportError("cannot write process inventory " + path.string() + ": " + std::strerror(errno));
  }
  // comm names are raw kernel bytes; replace anything that is not UTF-8
  out << doc.dump(2, ' ', false, json::error_handler_t::replace) << '\n';
  out.flush();
  if (!out) {
    throw ExportError("write failed for process inventory " + path.string());
  }
}

// ---------------------------------------------------------------------------
// plain text
// ---------------------------------------------------------------------------

auto load_text_lines(const fs::path& path) -> std::vector<std::string> {
  const std::string text = read_source_text(path, false);
  std::vector<std::string> lines;
  for_each_line(text, [&](size_t, std::string_view line){ lines.emplace_back(line); });
  return lines;
}

} // namespace vigil::app
