#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace vigil::app {

enum class SourceErrorKind { NotFound, MalformedRow, MalformedShape, EncodingError };

inline const char* source_error_kind_name(SourceErrorKind k) {
  switch (k) {
    case SourceErrorKind::NotFound:       return "not found";
    case SourceErrorKind::MalformedRow:   return "malformed row";
    case SourceErrorKind::MalformedShape: return "malformed shape";
    case SourceErrorKind::EncodingError:  return "encoding error";
  }
  return "source error";
}

// An input file could not be read as a whole. Per-row problems are reported
// through SourceRow::error instead.
struct SourceError : public std::runtime_error {
  SourceError(SourceErrorKind k, const std::filesystem::path& p, const std::string& detail)
    : std::runtime_error(p.string() + ": " + source_error_kind_name(k) + ": " + detail),
      kind(k), path(p) {}

  SourceErrorKind kind;
  std::filesystem::path path;
};

// The log destination (or another output file) cannot be created or written.
struct SinkError : public std::runtime_error { using std::runtime_error::runtime_error; };

// A secondary output file (the process inventory export) cannot be written.
// Unlike SinkError this does not stop the run.
struct ExportError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Live OS enumeration failed.
struct CollectorError : public std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace vigil::app
