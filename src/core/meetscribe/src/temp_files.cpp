#include "meetscribe/temp_files.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>

#include <unistd.h>

using namespace std;


namespace meetscribe
{
namespace
{

atomic<uint64_t> temp_sequence{0};

string resolve_directory(const string & directory)
{
  if (!directory.empty()) {
    return directory;
  }
  error_code ec;
  const auto tmp = filesystem::temp_directory_path(ec);
  return ec ? string("/tmp") : tmp.string();
}

}  // namespace

string make_temp_path(const string & directory, const string & prefix, const string & extension)
{
  const string dir = resolve_directory(directory);
  error_code ec;
  filesystem::create_directories(dir, ec);

  const auto now_ms = chrono::duration_cast<chrono::milliseconds>(
    chrono::system_clock::now().time_since_epoch()).count();
  return (filesystem::path(dir) /
         (prefix + "_" + to_string(getpid()) + "_" + to_string(now_ms) + "_" +
         to_string(++temp_sequence) + extension)).string();
}

bool write_file_bytes(const string & path, const vector<uint8_t> & data)
{
  ofstream ofs(path, ios::binary | ios::trunc);
  if (!ofs) {
    return false;
  }
  ofs.write(reinterpret_cast<const char *>(data.data()), static_cast<streamsize>(data.size()));
  return static_cast<bool>(ofs);
}

bool read_file_bytes(const string & path, vector<uint8_t> & out)
{
  ifstream ifs(path, ios::binary);
  if (!ifs) {
    return false;
  }
  out.assign(istreambuf_iterator<char>(ifs), istreambuf_iterator<char>());
  return !ifs.bad();
}

TempFileRegistry::TempFileRegistry(const string & directory)
: directory_(resolve_directory(directory))
{
}

TempFileRegistry::~TempFileRegistry()
{
  cleanup();
}

string TempFileRegistry::allocate(const string & prefix, const string & extension)
{
  const string path = make_temp_path(directory_, prefix, extension);
  adopt(path);
  return path;
}

string TempFileRegistry::write(
  const string & prefix,
  const string & extension,
  const vector<uint8_t> & data)
{
  const string path = allocate(prefix, extension);
  if (!write_file_bytes(path, data)) {
    return "";
  }
  return path;
}

void TempFileRegistry::adopt(const string & path)
{
  lock_guard<mutex> lock(mutex_);
  paths_.push_back(path);
}

size_t TempFileRegistry::cleanup()
{
  lock_guard<mutex> lock(mutex_);
  size_t failed = 0;
  for (const auto & path : paths_) {
    error_code ec;
    filesystem::remove(path, ec);
    if (ec) {
      ++failed;
    }
  }
  paths_.clear();
  return failed;
}

vector<string> TempFileRegistry::paths() const
{
  lock_guard<mutex> lock(mutex_);
  return paths_;
}

ScopedTempFile::ScopedTempFile(const string & directory, const string & prefix, const string & extension)
: path_(make_temp_path(directory, prefix, extension))
{
}

ScopedTempFile::~ScopedTempFile()
{
  error_code ec;
  filesystem::remove(path_, ec);
}

bool ScopedTempFile::write(const vector<uint8_t> & data)
{
  return write_file_bytes(path_, data);
}

}  // namespace meetscribe
