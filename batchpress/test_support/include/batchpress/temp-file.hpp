#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace batchpress::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "batchpress-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// Create (or truncate) 'relPath' under 'dir' with 'content', creating intermediate directories.
// Returns the full path.
std::filesystem::path WriteTestFile(const std::filesystem::path& dir, std::string_view relPath,
                                    std::string_view content);

// Read the whole content of 'path'. Throws std::runtime_error if it cannot be opened.
std::string ReadTestFile(const std::filesystem::path& path);

// Names of all entries directly under 'dir', sorted.
std::vector<std::string> ListDirectory(const std::filesystem::path& dir);

}  // namespace batchpress::test
