#include "aerojudge/util/file_io.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace aerojudge {

namespace {

namespace fs = std::filesystem;

std::atomic<std::uint64_t> g_stage_serial{0};

// A sibling file that becomes `target` on commit() and is removed otherwise.
// Checkpoints and audit records are only ever seen complete.
class StagedFile {
 public:
  explicit StagedFile(fs::path target) : target_(std::move(target)) {
    const std::string stem = target_.filename().string() + ".tmp.";
    const auto clock = std::chrono::steady_clock::now().time_since_epoch().count();
    for (int tries = 0; tries < 64; ++tries) {
      const std::string name =
          stem + std::to_string(clock) + "." + std::to_string(g_stage_serial.fetch_add(1, std::memory_order_relaxed));
      fs::path candidate = target_.has_parent_path() ? target_.parent_path() / name : fs::path(name);
      std::error_code ec;
      if (!fs::exists(candidate, ec) && !ec) {
        staged_ = std::move(candidate);
        return;
      }
    }
    throw std::runtime_error("No free temporary name next to " + target_.string());
  }

  StagedFile(const StagedFile&) = delete;
  StagedFile& operator=(const StagedFile&) = delete;

  ~StagedFile() {
    if (committed_) return;
    std::error_code ec;
    fs::remove(staged_, ec);
  }

  void write(const std::string& contents) {
    std::ofstream out(staged_, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot open " + staged_.string() + " for writing");
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) throw std::runtime_error("Short write to " + staged_.string());
  }

  void commit() {
    std::error_code ec;
    fs::rename(staged_, target_, ec);
    if (ec) {
      // Windows will not rename over an existing file.
      std::error_code ignored;
      fs::remove(target_, ignored);
      ec.clear();
      fs::rename(staged_, target_, ec);
    }
    if (ec) throw std::runtime_error("Cannot replace " + target_.string() + ": " + ec.message());
    committed_ = true;
  }

 private:
  fs::path target_;
  fs::path staged_;
  bool committed_{false};
};

} // namespace

std::string read_text_file(const std::string& path) {
  std::ifstream in(fs::path(path), std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Cannot open " + path + " for reading");
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) throw std::runtime_error("Read error on " + path);
  return text;
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) throw std::runtime_error("Cannot create directory " + path + ": " + ec.message());
}

bool file_exists(const std::string& path) {
  std::error_code ec;
  const bool regular = fs::is_regular_file(fs::path(path), ec);
  return regular && !ec;
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  if (target.has_parent_path()) ensure_dir(target.parent_path().string());

  StagedFile staged(target);
  staged.write(contents);
  staged.commit();
}

} // namespace aerojudge
