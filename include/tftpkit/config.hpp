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
 * @file config.hpp
 * @brief This file declares the engine configuration.
 */
#pragma once
#ifndef TFTPKIT_CONFIG_HPP
#define TFTPKIT_CONFIG_HPP
#include "tftpkit/protocol/tftp_protocol.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
/** @brief TFTP related utilities. */
namespace tftpkit {
/** @brief Retransmission settings shared by every session. */
struct session_options {
  /** @brief Default time to wait for a response before retransmitting. */
  static constexpr auto DEFAULT_TIMEOUT = std::chrono::milliseconds(1000);
  /** @brief Default number of consecutive timeouts tolerated. */
  static constexpr auto DEFAULT_RETRIES = 5U;

  /** @brief Fixed retransmission timeout. */
  std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
  /** @brief The session fails on this many consecutive timeouts. */
  unsigned max_retries = DEFAULT_RETRIES;
};

/** @brief Server listener configuration. */
struct server_config {
  /** @brief Local address to bind (IPv4 or IPv6 literal). */
  std::string address = "::";
  /** @brief Local port to bind. */
  std::uint16_t port = messages::PORT;
  /** @brief Directory that every request is confined to. */
  std::filesystem::path root = ".";
  /** @brief Session retransmission settings. */
  session_options session;
};

/** @brief Client driver configuration. */
struct client_config {
  /** @brief The server port that requests are sent to. */
  std::uint16_t port = messages::PORT;
  /** @brief Optional local address to bind; empty binds any. */
  std::string local_address;
  /** @brief Session retransmission settings. */
  session_options session;
};

} // namespace tftpkit
#endif // TFTPKIT_CONFIG_HPP
