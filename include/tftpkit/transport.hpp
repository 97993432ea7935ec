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
 * @file transport.hpp
 * @brief This file declares the datagram transport used by sessions.
 */
#pragma once
#ifndef TFTPKIT_TRANSPORT_HPP
#define TFTPKIT_TRANSPORT_HPP
#include <net/cppnet.hpp>

#include <chrono>
#include <span>
/** @brief TFTP related utilities. */
namespace tftpkit {
/**
 * @brief The datagram endpoint of one transfer.
 * @details A transport sends to exactly one peer from one local port (the
 * session's TID) and delivers one retransmission deadline at a time back to
 * the owner of the session. Delivery of datagrams and deadlines is the
 * owner's concern; sessions only push packets and deadlines out.
 */
class transport {
public:
  /** @brief The deadline clock. */
  using clock = std::chrono::steady_clock;
  /** @brief A deadline. */
  using timestamp = clock::time_point;
  /** @brief The native socket type. */
  using socket_type = io::socket::native_socket_type;
  /** @brief The invalid socket constant. */
  static constexpr auto INVALID_SOCKET = io::socket::INVALID_SOCKET;

  transport() = default;
  transport(const transport &) = delete;
  transport(transport &&) = delete;
  auto operator=(const transport &) -> transport & = delete;
  auto operator=(transport &&) -> transport & = delete;
  virtual ~transport() = default;

  /**
   * @brief Sends one datagram to the peer.
   * @details The transport copies the bytes if the send completes later.
   * Send failures are absorbed by retransmission.
   * @param msg The encoded packet.
   */
  virtual auto send(std::span<const char> msg) -> void = 0;

  /**
   * @brief Arms the retransmission deadline, replacing any pending one.
   * @param deadline When the owner must call the session's on_timeout().
   */
  virtual auto schedule(timestamp deadline) -> void = 0;

  /** @brief Disarms the pending deadline. */
  virtual auto cancel() noexcept -> void = 0;

  /**
   * @brief Returns the local socket that identifies the transfer.
   * @returns The native socket, or INVALID_SOCKET if there is none.
   */
  [[nodiscard]] virtual auto native_handle() const noexcept -> socket_type = 0;
};

} // namespace tftpkit
#endif // TFTPKIT_TRANSPORT_HPP
