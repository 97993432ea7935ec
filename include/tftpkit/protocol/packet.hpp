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
 * @file packet.hpp
 * @brief This file declares the TFTP packet types and their wire codec.
 */
#pragma once
#ifndef TFTPKIT_PACKET_HPP
#define TFTPKIT_PACKET_HPP
#include "tftpkit/error.hpp"
#include "tftpkit/protocol/tftp_protocol.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>
/** @brief TFTP related utilities. */
namespace tftpkit {
/** @brief Decoded TFTP packets. */
namespace packets {
/** @brief An RFC 2347 option (name, value) pair. */
using option = std::pair<std::string, std::string>;

/** @brief A read request (RRQ). */
struct read_request {
  /** @brief The requested file. */
  std::string filename;
  /** @brief The transfer mode as sent by the peer. */
  std::string mode;
  /** @brief Options appended after the mode, in wire order. */
  std::vector<option> options;

  auto operator==(const read_request &) const -> bool = default;
};

/** @brief A write request (WRQ). */
struct write_request {
  /** @brief The file to write. */
  std::string filename;
  /** @brief The transfer mode as sent by the peer. */
  std::string mode;
  /** @brief Options appended after the mode, in wire order. */
  std::vector<option> options;

  auto operator==(const write_request &) const -> bool = default;
};

/** @brief A DATA block. */
struct data {
  /** @brief The block number (starts at 1, wraps at 65536). */
  std::uint16_t block_num = 0;
  /** @brief Up to messages::DATALEN bytes of file data. */
  std::vector<char> payload;

  auto operator==(const data &) const -> bool = default;
};

/** @brief An acknowledgement. */
struct ack {
  /** @brief The acknowledged block number. */
  std::uint16_t block_num = 0;

  auto operator==(const ack &) const -> bool = default;
};

/** @brief An ERROR packet. */
struct error {
  /** @brief A messages::error_t code. */
  std::uint16_t code = 0;
  /** @brief The human readable message. */
  std::string message;

  auto operator==(const error &) const -> bool = default;
};
} // namespace packets

/** @brief Any TFTP packet. */
using packet = std::variant<packets::read_request, packets::write_request,
                            packets::data, packets::ack, packets::error>;

/**
 * @brief Returns the opcode of a packet.
 * @param pkt The packet.
 * @returns The packet's messages::opcode_t.
 */
auto opcode(const packet &pkt) noexcept -> messages::opcode_t;

/**
 * @brief Encodes a packet into its wire representation.
 * @param pkt The packet to encode.
 * @param[out] err Cleared on success. Set to codec_errc::payload_too_large or
 * codec_errc::embedded_null on failure.
 * @returns The encoded bytes, or an empty buffer on failure.
 */
auto encode(const packet &pkt, std::error_code &err) -> std::vector<char>;

/**
 * @brief Decodes a datagram.
 * @details Decoding is total: every byte sequence produces either a packet or
 * a codec error.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set to a codec_errc on failure.
 * @returns The decoded packet, or std::nullopt on failure.
 */
auto decode(std::span<const std::byte> buf,
            std::error_code &err) -> std::optional<packet>;

/**
 * @brief Decodes a datagram held in a char buffer.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set to a codec_errc on failure.
 * @returns The decoded packet, or std::nullopt on failure.
 */
inline auto decode(std::span<const char> buf,
                   std::error_code &err) -> std::optional<packet>
{
  return decode(std::as_bytes(buf), err);
}

/**
 * @brief Builds an ERROR packet carrying the standard message for a code.
 * @param error A messages::error_t value (internal aliases included).
 * @returns The ERROR packet.
 */
auto make_error(std::uint16_t error) -> packets::error;

} // namespace tftpkit
#endif // TFTPKIT_PACKET_HPP
