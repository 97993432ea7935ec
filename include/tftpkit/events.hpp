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
 * @file events.hpp
 * @brief This file declares the transfer events and statistics.
 */
#pragma once
#ifndef TFTPKIT_EVENTS_HPP
#define TFTPKIT_EVENTS_HPP
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
/** @brief TFTP related utilities. */
namespace tftpkit {
/** @brief Transfer statistics aggregate. */
struct transfer_statistics {
  /** @brief The statistics clock. */
  using clock = std::chrono::steady_clock;

  /** @brief File bytes sent or received. */
  std::uint64_t bytes = 0;
  /** @brief Data blocks sent or received (first transmissions only). */
  std::uint64_t blocks = 0;
  /** @brief Packets sent again after a timeout. */
  std::uint64_t retransmits = 0;
  /** @brief Payload bytes sent again after a timeout. */
  std::uint64_t resent_bytes = 0;
  /** @brief Duplicate or stale packets received. */
  std::uint64_t duplicates = 0;
  /** @brief When the session started. */
  clock::time_point start_time{};
  /** @brief When the session reached a terminal state. */
  clock::time_point end_time{};

  /** @brief Returns the transfer duration. */
  [[nodiscard]] auto duration() const noexcept -> std::chrono::duration<double>
  {
    return end_time - start_time;
  }

  /** @brief Returns the average rate in kbit/s, or 0 if undetermined. */
  [[nodiscard]] auto kbps() const noexcept -> double
  {
    constexpr auto BYTES_PER_KBIT = 1000.0 / 8.0;
    const auto secs = duration().count();
    if (secs <= 0.0)
      return 0.0;

    return static_cast<double>(bytes) / BYTES_PER_KBIT / secs;
  }
};

/** @brief An event emitted by a session for presentation layers. */
struct transfer_event {
  // NOLINTNEXTLINE(performance-enum-size)
  enum kind_t : std::uint8_t {
    SESSION_STARTED,
    BLOCK_TRANSFERRED,
    SESSION_COMPLETED,
    SESSION_FAILED
  };

  /** @brief The kind of event. */
  kind_t kind = SESSION_STARTED;
  /** @brief The session tag, e.g. "RRQ:127.0.0.1:5000". */
  std::string_view session;
  /** @brief The file named in the request. */
  std::string_view filename;
  /** @brief The block number (BLOCK_TRANSFERRED). */
  std::uint16_t block_num = 0;
  /** @brief Bytes in this block (BLOCK_TRANSFERRED). */
  std::size_t bytes = 0;
  /** @brief Running statistics of the session. */
  const transfer_statistics *statistics = nullptr;
  /** @brief The failure (SESSION_FAILED). */
  std::error_code error;
  /** @brief Human readable failure reason (SESSION_FAILED). */
  std::string_view reason;
};

/** @brief Receives transfer events. */
using event_sink = std::function<void(const transfer_event &)>;

} // namespace tftpkit
#endif // TFTPKIT_EVENTS_HPP
