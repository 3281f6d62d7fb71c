// codesynth/test_support/temp_dir.hpp - scratch directories for unit tests
#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace codesynth::test_support
{

/// Directory under the system temp path, removed with its contents on destruction
struct TempDir
{
  std::filesystem::path path;

  explicit TempDir(const std::string & name)
  : path(std::filesystem::temp_directory_path() / name)
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  /// Write `content` to `relative` (parent directories are created)
  std::filesystem::path write(const std::filesystem::path & relative, const std::string & content) const
  {
    const std::filesystem::path file = path / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file);
    out << content;
    return file;
  }
};

}  // namespace codesynth::test_support
