#include "slingnet/util/file_io.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace slingnet {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned> g_temp_counter{0};

// Removes the temporary file unless the write was committed.
class PendingTempFile {
 public:
  explicit PendingTempFile(fs::path p) : path_(std::move(p)) {}
  ~PendingTempFile() {
    if (committed_) return;
    std::error_code ec;
    fs::remove(path_, ec);
  }
  PendingTempFile(const PendingTempFile&) = delete;
  PendingTempFile& operator=(const PendingTempFile&) = delete;

  const fs::path& path() const { return path_; }
  void commit() { committed_ = true; }

 private:
  fs::path path_;
  bool committed_{false};
};

fs::path temp_sibling(const fs::path& target) {
  const unsigned n = g_temp_counter.fetch_add(1);
  fs::path tmp = target;
  tmp += ".tmp" + std::to_string(n);
  return tmp;
}

std::vector<fs::path> search_roots() {
  std::vector<fs::path> roots;
#ifdef SLINGNET_SOURCE_DIR
  roots.emplace_back(SLINGNET_SOURCE_DIR);
#endif
  std::error_code ec;
  fs::path dir = fs::current_path(ec);
  if (ec) return roots;
  // Build trees are usually a few levels below the checkout.
  for (int depth = 0; depth < 6 && !dir.empty(); ++depth) {
    roots.push_back(dir);
    const fs::path parent = dir.parent_path();
    if (parent == dir) break;
    dir = parent;
  }
  return roots;
}

fs::path locate(const fs::path& requested) {
  std::error_code ec;
  if (requested.empty() || requested.is_absolute() || fs::exists(requested, ec)) return requested;
  for (const fs::path& root : search_roots()) {
    const fs::path candidate = root / requested;
    ec.clear();
    if (fs::exists(candidate, ec) && !ec) return candidate;
  }
  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  const fs::path resolved = locate(fs::path(path));
  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);

  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("Failed to read file: " + path);
  return ss.str();
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("Failed to create directory: " + target.parent_path().string() + " (" +
                               ec.message() + ")");
    }
  }

  PendingTempFile tmp(temp_sibling(target));
  {
    std::ofstream out(tmp.path(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.path().string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.path().string());
  }

  fs::rename(tmp.path(), target, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    fs::remove(target, rm_ec);
    ec.clear();
    fs::rename(tmp.path(), target, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  tmp.commit();
}

} // namespace slingnet
