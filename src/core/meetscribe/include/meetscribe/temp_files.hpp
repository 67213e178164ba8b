#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace meetscribe
{

/// Unique path under `directory`: <prefix>_<pid>_<epoch_ms>_<seq><extension>
std::string make_temp_path(
  const std::string & directory,
  const std::string & prefix,
  const std::string & extension);

bool write_file_bytes(const std::string & path, const std::vector<uint8_t> & data);
bool read_file_bytes(const std::string & path, std::vector<uint8_t> & out);

/// Owns every temporary path handed out through it and deletes them on
/// cleanup() or destruction, whichever comes first.
class TempFileRegistry
{
public:
  explicit TempFileRegistry(const std::string & directory = "");
  ~TempFileRegistry();

  TempFileRegistry(const TempFileRegistry &) = delete;
  TempFileRegistry & operator=(const TempFileRegistry &) = delete;

  std::string allocate(const std::string & prefix, const std::string & extension);
  /// Allocates a path and writes `data` to it; empty string on failure
  std::string write(
    const std::string & prefix,
    const std::string & extension,
    const std::vector<uint8_t> & data);
  void adopt(const std::string & path);

  /// Returns the number of files that could not be removed
  size_t cleanup();

  std::vector<std::string> paths() const;
  const std::string & directory() const { return directory_; }

private:
  std::string directory_;
  mutable std::mutex mutex_;
  std::vector<std::string> paths_;
};

/// Single temporary file removed when the object goes out of scope
class ScopedTempFile
{
public:
  ScopedTempFile(
    const std::string & directory,
    const std::string & prefix,
    const std::string & extension);
  ~ScopedTempFile();

  ScopedTempFile(const ScopedTempFile &) = delete;
  ScopedTempFile & operator=(const ScopedTempFile &) = delete;

  bool write(const std::vector<uint8_t> & data);
  const std::string & path() const { return path_; }

private:
  std::string path_;
};

}  // namespace meetscribe
