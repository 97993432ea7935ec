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
 * @file error.cpp
 * @brief This file defines the tftpkit error categories.
 */
#include "tftpkit/error.hpp"
#include "tftpkit/protocol/tftp_protocol.hpp"

#include <string>
namespace tftpkit {
namespace {
class codec_category_t : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override
  {
    return "tftpkit.codec";
  }

  [[nodiscard]] auto message(int value) const -> std::string override
  {
    switch (static_cast<codec_errc>(value))
    {
      case codec_errc::truncated_header:
        return "Truncated header";

      case codec_errc::unknown_opcode:
        return "Unknown opcode";

      case codec_errc::missing_terminator:
        return "Missing string terminator";

      case codec_errc::payload_too_large:
        return "Payload exceeds the maximum block size";

      case codec_errc::embedded_null:
        return "Embedded null in a string field";

      default:
        return "Unknown codec error";
    }
  }
};

class transfer_category_t : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override
  {
    return "tftpkit.transfer";
  }

  [[nodiscard]] auto message(int value) const -> std::string override
  {
    switch (static_cast<transfer_errc>(value))
    {
      case transfer_errc::malformed_packet:
        return "Malformed packet";

      case transfer_errc::unknown_transfer:
        return "Unknown transfer ID";

      case transfer_errc::file_not_found:
        return "File not found";

      case transfer_errc::access_violation:
        return "Access violation";

      case transfer_errc::disk_full:
        return "Disk full or allocation exceeded";

      case transfer_errc::illegal_operation:
        return "Illegal TFTP operation";

      case transfer_errc::peer_reported_error:
        return "Peer reported an error";

      case transfer_errc::timeout:
        return "Timed out";

      case transfer_errc::aborted:
        return "Transfer aborted";

      default:
        return "Unknown transfer error";
    }
  }
};
} // namespace

auto codec_category() noexcept -> const std::error_category &
{
  static const auto category = codec_category_t{};
  return category;
}

auto transfer_category() noexcept -> const std::error_category &
{
  static const auto category = transfer_category_t{};
  return category;
}

auto make_error_code(codec_errc err) noexcept -> std::error_code
{
  return {static_cast<int>(err), codec_category()};
}

auto make_error_code(transfer_errc err) noexcept -> std::error_code
{
  return {static_cast<int>(err), transfer_category()};
}

auto to_transfer_error(const std::error_code &err) noexcept -> std::error_code
{
  if (!err || err.category() == transfer_category())
    return err;

  if (err.category() == codec_category())
    return transfer_errc::malformed_packet;

  if (err == std::errc::no_such_file_or_directory)
    return transfer_errc::file_not_found;

  if (err == std::errc::no_space_on_device ||
      err == std::errc::file_too_large)
  {
    return transfer_errc::disk_full;
  }

  // Permission, directory and read-only errors all deny access.
  return transfer_errc::access_violation;
}

auto to_tftp_error(const std::error_code &err) noexcept -> std::uint16_t
{
  using enum messages::error_t;
  const auto transfer_err = to_transfer_error(err);
  if (transfer_err.category() != transfer_category())
    return NOT_DEFINED;

  switch (static_cast<transfer_errc>(transfer_err.value()))
  {
    case transfer_errc::file_not_found:
      return FILE_NOT_FOUND;

    case transfer_errc::access_violation:
      return ACCESS_VIOLATION;

    case transfer_errc::disk_full:
      return DISK_FULL;

    case transfer_errc::illegal_operation:
    case transfer_errc::malformed_packet:
      return ILLEGAL_OPERATION;

    case transfer_errc::unknown_transfer:
      return UNKNOWN_TID;

    case transfer_errc::timeout:
      return TIMED_OUT;

    default:
      return NOT_DEFINED;
  }
}

auto from_tftp_error(std::uint16_t error) noexcept -> std::error_code
{
  using enum messages::error_t;
  switch (error)
  {
    case FILE_NOT_FOUND:
      return transfer_errc::file_not_found;

    case ACCESS_VIOLATION:
      return transfer_errc::access_violation;

    case DISK_FULL:
      return transfer_errc::disk_full;

    case ILLEGAL_OPERATION:
      return transfer_errc::illegal_operation;

    case UNKNOWN_TID:
      return transfer_errc::unknown_transfer;

    default:
      return transfer_errc::peer_reported_error;
  }
}
} // namespace tftpkit
