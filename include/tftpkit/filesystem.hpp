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
 * @file filesystem.hpp
 * @brief This file declares functions for filesystem management.
 */
#pragma once
#ifndef TFTPKIT_FILESYSTEM_HPP
#define TFTPKIT_FILESYSTEM_HPP
#include <filesystem>
#include <fstream>
#include <memory>
#include <string_view>
#include <system_error>
/** @brief For TFTP filesystem management. */
namespace tftpkit::filesystem {
/**
 * @brief Validates a server root directory.
 * @details The root must exist, be a directory and be readable.
 * @param root The configured root.
 * @param[out] err Cleared on success. Set to no_such_file_or_directory,
 * not_a_directory or permission_denied otherwise.
 * @returns The canonical root, or an empty path on error.
 */
auto canonical_root(const std::filesystem::path &root,
                    std::error_code &err) -> std::filesystem::path;

/**
 * @brief Checks whether files can be created in a directory.
 * @param dir The directory.
 * @returns true if the current process may write to dir.
 */
auto is_writable(const std::filesystem::path &dir) noexcept -> bool;

/**
 * @brief Resolves a requested filename inside a root directory.
 * @details Relative names are resolved against the root. Absolute names are
 * accepted only if they already lie inside the root. Symbolic links are
 * followed before the check, so a link cannot escape the root either.
 * @param root A canonical root directory.
 * @param filename The filename from the request.
 * @param[out] err Cleared on success, set to permission_denied if the name is
 * empty or escapes the root.
 * @returns The resolved path, or an empty path on error.
 */
auto resolve(const std::filesystem::path &root, std::string_view filename,
             std::error_code &err) -> std::filesystem::path;

/**
 * @brief Creates a file or updates its modification time if it exists.
 * @param file Path to the file to touch.
 * @return Error code indicating success or failure of the operation.
 */
auto touch(const std::filesystem::path &file) -> std::error_code;

/**
 * @brief Opens a file for reading.
 * @param file The file to open.
 * @param[out] err An error code that is cleared on success and set on error.
 * @returns An open file stream, or nullptr on error.
 */
auto open_read(const std::filesystem::path &file,
               std::error_code &err) -> std::unique_ptr<std::fstream>;

/**
 * @brief Opens a file for writing.
 * @details The file is created if it does not exist and truncated if it
 * does. An interrupted transfer leaves the partial file in place.
 * @param file The file to open.
 * @param[out] err An error code that is cleared on success and set on error.
 * @returns An open file stream, or nullptr on error.
 */
auto open_write(const std::filesystem::path &file,
                std::error_code &err) -> std::unique_ptr<std::fstream>;
} // namespace tftpkit::filesystem
#endif // TFTPKIT_FILESYSTEM_HPP
