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
 * @file tftp_session.hpp
 * @brief This file declares the TFTP transfer session state machine.
 */
#pragma once
#ifndef TFTPKIT_TFTP_SESSION_HPP
#define TFTPKIT_TFTP_SESSION_HPP
#include "tftpkit/config.hpp"
#include "tftpkit/events.hpp"
#include "tftpkit/protocol/packet.hpp"
#include "tftpkit/transport.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
/** @brief TFTP related utilities. */
namespace tftpkit {

/**
 * @brief One in-flight file transfer.
 * @details A session is advanced only by packets from its peer (on_packet)
 * and by its own retransmission deadline (on_timeout). It owns its file
 * stream and its transport for its whole lifetime. Once it reaches
 * COMPLETED, FAILED or ABORTED every further input is ignored.
 */
class session {
public:
  /** @brief The session clock. */
  using clock = std::chrono::steady_clock;
  /** @brief The session timestamp. */
  using timestamp = clock::time_point;

  // NOLINTBEGIN(performance-enum-size)
  /** @brief Which side of the protocol this session plays. */
  enum role_t : std::uint8_t { SERVER, CLIENT };

  /** @brief Data direction as seen by this engine. */
  enum direction_t : std::uint8_t {
    /** @brief This engine reads the file and sends DATA. */
    UPLOAD,
    /** @brief This engine receives DATA and writes the file. */
    DOWNLOAD
  };

  /** @brief Session states. */
  enum state_t : std::uint8_t {
    /** @brief Client upload: WRQ sent, waiting for ACK 0. */
    AWAITING_FIRST_ACK,
    /** @brief This engine is the data source. */
    SENDING,
    /** @brief The peer is the data source. */
    RECEIVING,
    COMPLETED,
    FAILED,
    ABORTED
  };
  // NOLINTEND(performance-enum-size)

  /** @brief Fixed session parameters. */
  struct parameters {
    /** @brief Server or client. */
    role_t role = SERVER;
    /** @brief Upload or download. */
    direction_t direction = UPLOAD;
    /** @brief The filename on the wire. */
    std::string filename;
    /** @brief The transfer mode. */
    messages::mode_t mode = messages::OCTET;
    /** @brief Retransmission settings. */
    session_options options;
    /** @brief Log prefix, e.g. "RRQ:127.0.0.1:5000". */
    std::string tag;
  };

  /**
   * @brief Constructs an idle session.
   * @param params The session parameters.
   * @param file The open file stream, or nullptr if opening failed.
   * @param transport The transport to the peer.
   * @param sink Receives the session's events. May be empty.
   */
  session(parameters params, std::unique_ptr<std::fstream> file,
          std::unique_ptr<transport> transport, event_sink sink = {});

  session(const session &) = delete;
  session(session &&) = delete;
  auto operator=(const session &) -> session & = delete;
  auto operator=(session &&) -> session & = delete;
  ~session() = default;

  /**
   * @brief Sends the first packet of the transfer.
   * @details If open_error is set the transfer loop is never entered: a
   * server session reports the mapped error to its peer and the session
   * fails.
   * @param open_error Why the file could not be opened, if it could not.
   */
  auto start(std::error_code open_error = {}) -> void;

  /**
   * @brief Advances the state machine with a packet from the peer.
   * @param pkt The decoded packet.
   */
  auto on_packet(const packet &pkt) -> void;

  /** @brief Handles expiry of the retransmission deadline. */
  auto on_timeout() -> void;

  /**
   * @brief Cancels a live session.
   * @details The file is closed where it stands; a partial download stays
   * on disk.
   */
  auto abort() -> void;

  /** @brief Returns the current state. */
  [[nodiscard]] auto state() const noexcept -> state_t { return state_; }

  /** @brief Returns true once the session is terminal. */
  [[nodiscard]] auto done() const noexcept -> bool
  {
    return state_ == COMPLETED || state_ == FAILED || state_ == ABORTED;
  }

  /**
   * @brief Returns the current block number.
   * @details For uploads this is the last block sent, for downloads the
   * last block written.
   */
  [[nodiscard]] auto block_num() const noexcept -> std::uint16_t
  {
    return block_num_;
  }

  /** @brief Returns the number of consecutive timeouts. */
  [[nodiscard]] auto retries() const noexcept -> unsigned { return retries_; }

  /** @brief Returns the failure, empty unless FAILED or ABORTED. */
  [[nodiscard]] auto error() const noexcept -> const std::error_code &
  {
    return error_;
  }

  /** @brief Returns a human readable failure reason. */
  [[nodiscard]] auto reason() const noexcept -> const std::string &
  {
    return reason_;
  }

  /** @brief Returns the ERROR packet received from the peer, if any. */
  [[nodiscard]] auto peer_error() const noexcept
      -> const std::optional<packets::error> &
  {
    return peer_error_;
  }

  /** @brief Returns the transfer statistics. */
  [[nodiscard]] auto statistics() const noexcept -> const transfer_statistics &
  {
    return statistics_;
  }

  /** @brief Returns the session parameters. */
  [[nodiscard]] auto params() const noexcept -> const parameters &
  {
    return params_;
  }

  /** @brief Returns the session transport. */
  [[nodiscard]] auto get_transport() const noexcept -> transport &
  {
    return *transport_;
  }

private:
  /** @brief Fixed parameters. */
  parameters params_;
  /** @brief The file stream, released when the session ends. */
  std::unique_ptr<std::fstream> file_;
  /** @brief The transport to the peer. */
  std::unique_ptr<transport> transport_;
  /** @brief Event sink. */
  event_sink sink_;
  /** @brief The last packet sent, kept for retransmission. */
  std::vector<char> last_sent_;
  /** @brief NETASCII output that did not fit in the last block. */
  std::vector<char> pending_;
  /** @brief Statistics. */
  transfer_statistics statistics_;
  /** @brief The peer's ERROR packet. */
  std::optional<packets::error> peer_error_;
  /** @brief Failure code. */
  std::error_code error_;
  /** @brief Failure reason. */
  std::string reason_;
  /** @brief Consecutive timeouts. */
  unsigned retries_ = 0;
  /** @brief The current block number. */
  std::uint16_t block_num_ = 0;
  /** @brief The state. */
  state_t state_ = AWAITING_FIRST_ACK;
  /** @brief True once the final (short) DATA block has been sent. */
  bool final_sent_ = false;
  /** @brief True once an ACK has been sent. */
  bool acked_ = false;
  /** @brief A NETASCII CR that ended the previous block. */
  bool cr_pending_ = false;

  /** @brief Encodes and sends a new packet and arms the deadline. */
  auto send(const packet &pkt) -> void;
  /** @brief Reads and sends the next DATA block. */
  auto send_next() -> void;
  /** @brief Handles DATA while RECEIVING. */
  auto receive(const packets::data &data) -> void;
  /** @brief Handles ACK while sending. */
  auto acknowledge(const packets::ack &ack) -> void;
  /** @brief Writes a payload to the file. */
  auto write(const std::vector<char> &payload) -> bool;
  /** @brief Moves to COMPLETED. */
  auto complete() -> void;
  /**
   * @brief Moves to FAILED.
   * @param err The failure.
   * @param notify_peer Whether to send an ERROR packet to the peer.
   */
  auto fail(std::error_code err, bool notify_peer) -> void;
  /** @brief Common terminal bookkeeping. */
  auto finish(state_t state) -> void;
  /** @brief Emits an event to the sink. */
  auto emit(transfer_event::kind_t kind, std::uint16_t block_num = 0,
            std::size_t bytes = 0) const -> void;
};

} // namespace tftpkit
#endif // TFTPKIT_TFTP_SESSION_HPP
