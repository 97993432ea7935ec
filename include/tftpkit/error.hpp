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
 * @file error.hpp
 * @brief This file declares the tftpkit error categories.
 */
#pragma once
#ifndef TFTPKIT_ERROR_HPP
#define TFTPKIT_ERROR_HPP
#include <cstdint>
#include <system_error>
/** @brief TFTP related utilities. */
namespace tftpkit {
// NOLINTBEGIN(performance-enum-size)
/** @brief Packet encoding and decoding failures. */
enum class codec_errc : int {
  /** @brief The datagram is shorter than its fixed header. */
  truncated_header = 1,
  /** @brief The opcode is not one of RRQ, WRQ, DATA, ACK or ERROR. */
  unknown_opcode,
  /** @brief A string field is not NUL-terminated. */
  missing_terminator,
  /** @brief A DATA payload is longer than 512 bytes. */
  payload_too_large,
  /** @brief A string field contains an embedded NUL byte. */
  embedded_null
};

/** @brief Transfer failures surfaced to the owner of a session. */
enum class transfer_errc : int {
  malformed_packet = 1,
  unknown_transfer,
  file_not_found,
  access_violation,
  disk_full,
  illegal_operation,
  peer_reported_error,
  timeout,
  aborted
};
// NOLINTEND(performance-enum-size)

/**
 * @brief Returns the category of codec errors.
 * @returns A reference to the static codec category.
 */
auto codec_category() noexcept -> const std::error_category &;

/**
 * @brief Returns the category of transfer errors.
 * @returns A reference to the static transfer category.
 */
auto transfer_category() noexcept -> const std::error_category &;

/** @brief Makes an error_code from a codec error. */
auto make_error_code(codec_errc err) noexcept -> std::error_code;

/** @brief Makes an error_code from a transfer error. */
auto make_error_code(transfer_errc err) noexcept -> std::error_code;

/**
 * @brief Classifies an error into the transfer taxonomy.
 * @details Filesystem errors (std::errc) are mapped to file_not_found,
 * access_violation or disk_full. Codec errors map to malformed_packet.
 * @param err Any error code.
 * @returns The matching transfer error, or an empty error_code if err is
 * empty.
 */
auto to_transfer_error(const std::error_code &err) noexcept -> std::error_code;

/**
 * @brief Maps an error to the TFTP error code sent in an ERROR packet.
 * @param err Any error code.
 * @returns One of messages::error_t.
 */
auto to_tftp_error(const std::error_code &err) noexcept -> std::uint16_t;

/**
 * @brief Classifies an ERROR packet received from a peer.
 * @details Codes 1 to 5 map to their transfer error. Every other code is
 * peer_reported_error.
 * @param error The code carried in the ERROR packet.
 * @returns A transfer error.
 */
auto from_tftp_error(std::uint16_t error) noexcept -> std::error_code;

} // namespace tftpkit

template <> struct std::is_error_code_enum<tftpkit::codec_errc> : true_type {};
template <>
struct std::is_error_code_enum<tftpkit::transfer_errc> : true_type {};

#endif // TFTPKIT_ERROR_HPP
