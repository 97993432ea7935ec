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
 * @file tftp_protocol.hpp
 * @brief This file declares constants and utilities for the TFTP protocol.
 */
#pragma once
#ifndef TFTPKIT_TFTP_PROTOCOL_HPP
#define TFTPKIT_TFTP_PROTOCOL_HPP
#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string_view>
/** @brief TFTP related utilities. */
namespace tftpkit {
// NOLINTBEGIN(performance-enum-size)
/** @brief Protocol definitions shared by the codec and the sessions. */
struct messages {
  /**
   * @brief Protocol defined operations (opcodes).
   * These are the valid TFTP operation codes as defined in RFC 1350.
   */
  enum opcode_t : std::uint16_t { RRQ = 1, WRQ, DATA, ACK, ERROR };

  /**
   * @brief Protocol defined transfer modes.
   * These are the TFTP transfer modes as defined in RFC 1350.
   */
  enum mode_t : std::uint8_t { NETASCII = 1, OCTET, MAIL };

  /**
   * @brief Protocol defined error codes.
   * These are the standard TFTP error codes as defined in RFC 1350.
   */
  enum error_t : std::uint16_t {
    NOT_DEFINED = 0,
    FILE_NOT_FOUND,
    ACCESS_VIOLATION,
    DISK_FULL,
    ILLEGAL_OPERATION,
    UNKNOWN_TID,
    FILE_ALREADY_EXISTS,
    NO_SUCH_USER,
    // Errors below this point are all ALIASES to NOT_DEFINED.
    TIMED_OUT
  };

  /** @brief The size of the opcode field. */
  static constexpr auto OPCODE_LEN = sizeof(std::uint16_t);
  /** @brief The size of a DATA, ACK or ERROR header. */
  static constexpr auto HEADER_LEN = 2 * sizeof(std::uint16_t);
  /** @brief The maximum data payload size in bytes (512 bytes per RFC 1350). */
  static constexpr auto DATALEN = 512UL;
  /** @brief The maximum total size of a DATA message (header + payload). */
  static constexpr auto DATAMSG_MAXLEN = HEADER_LEN + DATALEN;
  /** @brief The well-known TFTP server port. */
  static constexpr std::uint16_t PORT = 69;
};
// NOLINTEND(performance-enum-size)

/** @brief Error messages. */
struct errors {
  /**
   * @brief Converts a TFTP error to the string sent on the wire.
   * @param error The TFTP error.
   * @returns A string_view containing the relevant error message.
   */
  static constexpr auto errstr(std::uint16_t error) noexcept -> std::string_view
  {
    using enum messages::error_t;
    switch (error)
    {
      case ACCESS_VIOLATION:
        return "Access violation";

      case FILE_NOT_FOUND:
        return "File not found";

      case DISK_FULL:
        return "Disk full or allocation exceeded";

      case NO_SUCH_USER:
        return "No such user";

      case FILE_ALREADY_EXISTS:
        return "File already exists";

      case UNKNOWN_TID:
        return "Unknown transfer ID";

      case ILLEGAL_OPERATION:
        return "Illegal TFTP operation";

      case TIMED_OUT:
        return "Timed out";

      default:
        return "Not defined";
    }
  }

  /**
   * @brief Maps an internal error to the code carried in an ERROR packet.
   * @details TIMED_OUT has no wire representation and is sent as
   * NOT_DEFINED.
   * @param error The TFTP error.
   * @returns The wire error code.
   */
  static constexpr auto wire_code(std::uint16_t error) noexcept -> std::uint16_t
  {
    using enum messages::error_t;
    return error > NO_SUCH_USER ? NOT_DEFINED : error;
  }
};

/**
 * @brief Converts a mode string to a TFTP mode.
 * @details Mode strings are case insensitive.
 * @param mode The mode string from a request.
 * @returns The mode, or 0 if the string is not a TFTP mode.
 */
inline auto to_mode(std::string_view mode) noexcept -> messages::mode_t
{
  using enum messages::mode_t;
  constexpr auto BUFSIZE = sizeof("netascii");

  if (mode.size() >= BUFSIZE)
    return {};

  auto buf = std::array<char, BUFSIZE>{};
  std::ranges::transform(mode, buf.begin(), [](unsigned char chr) {
    return static_cast<char>(std::tolower(chr));
  });

  const auto lower = std::string_view(buf.data(), mode.size());
  if (lower == "netascii")
    return NETASCII;

  if (lower == "octet")
    return OCTET;

  if (lower == "mail")
    return MAIL;

  return {};
}

/**
 * @brief Converts a TFTP mode to its canonical wire string.
 * @param mode The TFTP mode.
 * @returns The mode string, or an empty view for an invalid mode.
 */
constexpr auto to_string(messages::mode_t mode) noexcept -> std::string_view
{
  using enum messages::mode_t;
  switch (mode)
  {
    case NETASCII:
      return "netascii";

    case OCTET:
      return "octet";

    case MAIL:
      return "mail";

    default:
      return {};
  }
}

} // namespace tftpkit
#endif // TFTPKIT_TFTP_PROTOCOL_HPP
