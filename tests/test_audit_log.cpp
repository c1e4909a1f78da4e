#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "aerojudge/util/audit_log.h"
#include "aerojudge/util/file_io.h"

#define AJ_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_audit_log() {
  namespace fs = std::filesystem;

  // Prefer the system temp dir, but fall back to the working directory if not available.
  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "aerojudge_test_audit_log";
  dir /= std::to_string(static_cast<long long>(nonce));

  aerojudge::AuditConfig cfg;
  cfg.enabled = true;
  cfg.dir = dir.string();
  cfg.keep_files = 3;

  AJ_ASSERT(aerojudge::audit_record_filename(cfg, 42) == "round_000000000042.json");

  // Scanning a directory that does not exist yet is not an error.
  {
    const auto scan = aerojudge::scan_audit_records(cfg);
    AJ_ASSERT(scan.ok);
    AJ_ASSERT(scan.files.empty());
  }

  // Write one record and read it back.
  {
    const auto r = aerojudge::write_audit_record(cfg, 1, [] { return std::string("{\"round\":1}\n"); });
    AJ_ASSERT(r.saved);
    AJ_ASSERT(r.error.empty());
    AJ_ASSERT(aerojudge::read_text_file(r.path).find("\"round\":1") != std::string::npos);
  }

  // Write enough records to require pruning; rounds 9, 10 and 11 survive.
  for (int round = 2; round <= 11; ++round) {
    const auto r = aerojudge::write_audit_record(cfg, round, [] { return std::string("{}\n"); });
    AJ_ASSERT(r.saved);
  }
  {
    const auto scan = aerojudge::scan_audit_records(cfg, 100);
    AJ_ASSERT(scan.ok);
    AJ_ASSERT(scan.files.size() == 3);
    AJ_ASSERT(scan.files[0].filename == aerojudge::audit_record_filename(cfg, 11));
    AJ_ASSERT(scan.files[2].filename == aerojudge::audit_record_filename(cfg, 9));
  }

  // Unrelated files in the directory are left alone.
  {
    aerojudge::write_text_file((dir / "notes.txt").string(), "keep me\n");
    AJ_ASSERT(aerojudge::prune_audit_records(cfg) == 0);
    AJ_ASSERT(aerojudge::file_exists((dir / "notes.txt").string()));
  }

  // A serializer that throws is reported, not propagated.
  {
    const auto r = aerojudge::write_audit_record(cfg, 12, []() -> std::string {
      throw std::runtime_error("boom");
    });
    AJ_ASSERT(!r.saved);
    AJ_ASSERT(r.error.find("boom") != std::string::npos);
  }

  // Missing directory setting is rejected.
  {
    aerojudge::AuditConfig bad = cfg;
    bad.dir.clear();
    const auto r = aerojudge::write_audit_record(bad, 1, [] { return std::string("{}\n"); });
    AJ_ASSERT(!r.saved);
  }

  fs::remove_all(dir, ec);
  return 0;
}
