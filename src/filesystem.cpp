/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * tftpkit is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * tftpkit is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with tftpkit.  If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file filesystem.cpp
 * @brief This file implements filesystem utilities.
 */
#include "tftpkit/filesystem.hpp"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>
namespace tftpkit::filesystem {
auto canonical_root(const std::filesystem::path &root,
                    std::error_code &err) -> std::filesystem::path
{
  using std::filesystem::file_type;
  err.clear();

  auto path = std::filesystem::canonical(root, err);
  if (err)
    return {};

  if (std::filesystem::status(path, err).type() != file_type::directory)
  {
    if (!err)
      err = std::make_error_code(std::errc::not_a_directory);
    return {};
  }

  if (::access(path.c_str(), R_OK | X_OK) != 0)
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  return path;
}

auto is_writable(const std::filesystem::path &dir) noexcept -> bool
{
  return ::access(dir.c_str(), W_OK | X_OK) == 0;
}

auto resolve(const std::filesystem::path &root, std::string_view filename,
             std::error_code &err) -> std::filesystem::path
{
  err.clear();
  if (filename.empty())
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  auto requested = std::filesystem::path(filename);
  if (requested.is_relative())
    requested = root / requested;

  auto path = std::filesystem::weakly_canonical(requested, err);
  if (err)
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  // The root itself and anything above it are off limits.
  const auto relative = path.lexically_relative(root);
  if (relative.empty() || relative == "." || *relative.begin() == "..")
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  // weakly_canonical leaves dangling links unresolved, so any link still
  // on the path may point anywhere once the file is created.
  auto prefix = root;
  for (const auto &component : relative)
  {
    prefix /= component;
    auto status = std::filesystem::symlink_status(prefix, err);
    if (err || std::filesystem::is_symlink(status))
    {
      err = std::make_error_code(std::errc::permission_denied);
      return {};
    }
    if (!std::filesystem::exists(status))
      break;
  }

  return path;
}

auto touch(const std::filesystem::path &file) -> std::error_code
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  const int fd = ::open(file.c_str(),
                        O_WRONLY | O_CREAT | O_APPEND | O_NOFOLLOW | O_CLOEXEC,
                        0644);
  if (fd < 0)
    return {errno, std::generic_category()};

  if (::close(fd) != 0)
    return {errno, std::generic_category()};

  return {};
}

auto open_read(const std::filesystem::path &file,
               std::error_code &err) -> std::unique_ptr<std::fstream>
{
  using std::filesystem::file_type;
  err.clear();

  switch (std::filesystem::status(file, err).type())
  {
    case file_type::not_found:
      err = std::make_error_code(std::errc::no_such_file_or_directory);
      return {};

    case file_type::directory:
      err = std::make_error_code(std::errc::is_a_directory);
      return {};

    default:
      break;
  }

  auto fstream =
      std::make_unique<std::fstream>(file, std::ios::in | std::ios::binary);
  if (!fstream->is_open())
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  err.clear();
  return fstream;
}

auto open_write(const std::filesystem::path &file,
                std::error_code &err) -> std::unique_ptr<std::fstream>
{
  err = touch(file);
  if (err)
    return {};

  auto fstream = std::make_unique<std::fstream>(
      file, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!fstream->is_open())
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  return fstream;
}

} // namespace tftpkit::filesystem
