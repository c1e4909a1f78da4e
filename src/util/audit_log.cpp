#include "aerojudge/util/audit_log.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "aerojudge/util/file_io.h"

namespace aerojudge {
namespace {

namespace fs = std::filesystem;

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string zero_padded(std::int64_t v, int width) {
  std::string digits = std::to_string(v < 0 ? 0 : v);
  if (static_cast<int>(digits.size()) < width) {
    digits.insert(0, static_cast<std::size_t>(width) - digits.size(), '0');
  }
  return digits;
}

AuditScanResult scan_audit_records_impl(const AuditConfig& cfg, int max_files) {
  AuditScanResult out;
  out.ok = true;
  if (max_files <= 0 || cfg.dir.empty()) return out;

  std::error_code ec;
  const fs::path dir(cfg.dir);
  if (!fs::exists(dir, ec) || ec) return out;

  std::vector<AuditRecordInfo> files;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (ec) break;
    if (!entry.is_regular_file(ec) || ec) continue;

    const fs::path p = entry.path();
    const std::string name = p.filename().string();
    if (!starts_with(name, cfg.prefix)) continue;
    if (!cfg.extension.empty() && p.extension().string() != cfg.extension) continue;

    AuditRecordInfo info;
    info.path = p.string();
    info.filename = name;
    info.size_bytes = entry.file_size(ec);
    if (ec) {
      ec.clear();
      info.size_bytes = 0;
    }
    files.push_back(std::move(info));
  }
  if (ec) {
    out.ok = false;
    out.error = "failed to scan audit directory: " + ec.message();
    return out;
  }

  // Zero-padded round indices sort lexicographically in round order.
  std::sort(files.begin(), files.end(),
            [](const AuditRecordInfo& a, const AuditRecordInfo& b) { return a.filename > b.filename; });

  if (static_cast<int>(files.size()) > max_files) files.resize(static_cast<std::size_t>(max_files));
  out.files = std::move(files);
  return out;
}

int prune_audit_records_impl(const AuditConfig& cfg, std::string* error) {
  if (cfg.keep_files <= 0 || cfg.dir.empty()) return 0;

  const AuditScanResult scan = scan_audit_records_impl(cfg, 1000000);
  if (!scan.ok) {
    if (error) *error = scan.error;
    return -1;
  }
  if (static_cast<int>(scan.files.size()) <= cfg.keep_files) return 0;

  int removed = 0;
  for (std::size_t i = static_cast<std::size_t>(cfg.keep_files); i < scan.files.size(); ++i) {
    std::error_code ec;
    fs::remove(fs::path(scan.files[i].path), ec);
    if (!ec) ++removed;
  }
  return removed;
}

} // namespace

std::string audit_record_filename(const AuditConfig& cfg, std::int64_t round_index) {
  return cfg.prefix + zero_padded(round_index, 12) + cfg.extension;
}

AuditScanResult scan_audit_records(const AuditConfig& cfg, int max_files) {
  try {
    return scan_audit_records_impl(cfg, max_files);
  } catch (const std::exception& e) {
    AuditScanResult out;
    out.ok = false;
    out.error = e.what();
    return out;
  }
}

int prune_audit_records(const AuditConfig& cfg, std::string* error) {
  try {
    return prune_audit_records_impl(cfg, error);
  } catch (const std::exception& e) {
    if (error) *error = e.what();
    return -1;
  }
}

AuditWriteResult write_audit_record(const AuditConfig& cfg, std::int64_t round_index,
                                    const std::function<std::string()>& serialize_json) {
  AuditWriteResult r;
  if (cfg.dir.empty()) {
    r.error = "audit directory is empty";
    return r;
  }
  if (cfg.prefix.empty()) {
    r.error = "audit prefix is empty";
    return r;
  }

  const fs::path path = fs::path(cfg.dir) / audit_record_filename(cfg, round_index);
  try {
    write_text_file(path.string(), serialize_json());
  } catch (const std::exception& e) {
    r.error = e.what();
    return r;
  }
  r.saved = true;
  r.path = path.string();

  // Record written; pruning is best-effort.
  const int pruned = prune_audit_records(cfg, nullptr);
  r.pruned = pruned < 0 ? 0 : pruned;
  return r;
}

} // namespace aerojudge
