#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace aerojudge {

// Configuration for the rolling per-round audit records.
//
// Audit records are intended to be:
//  - crash-safe (uses write_text_file's temp+rename strategy)
//  - ordered by round (zero-padded round index in the filename)
//  - bounded (keeps the newest N matching files)
struct AuditConfig {
  bool enabled{false};

  // Directory where records are written.
  std::string dir{"audit"};

  // Filename prefix (e.g. "round_").
  std::string prefix{"round_"};

  // File extension (including dot).
  std::string extension{".json"};

  // How many records to keep (newest first). Values <= 0 disable pruning.
  int keep_files{256};
};

struct AuditRecordInfo {
  std::string path;
  std::string filename;
  std::uintmax_t size_bytes{0};
};

struct AuditScanResult {
  bool ok{false};
  std::string error;
  std::vector<AuditRecordInfo> files;
};

struct AuditWriteResult {
  bool saved{false};
  std::string path;
  int pruned{0};
  std::string error;
};

// "round_000000000042.json" for round 42 with the default config.
std::string audit_record_filename(const AuditConfig& cfg, std::int64_t round_index);

// Scan cfg.dir for records matching prefix and extension. Returns newest
// (highest round) first.
AuditScanResult scan_audit_records(const AuditConfig& cfg, int max_files = 32);

// Remove records beyond cfg.keep_files. Returns number of files removed, or
// -1 on failure (optionally filling error).
int prune_audit_records(const AuditConfig& cfg, std::string* error = nullptr);

// Write one round's record (serialize_json must return the full document),
// then prune. Never throws; failures are reported in the result.
AuditWriteResult write_audit_record(const AuditConfig& cfg, std::int64_t round_index,
                                    const std::function<std::string()>& serialize_json);

} // namespace aerojudge
