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
 * @file client.hpp
 * @brief This file declares the TFTP client driver.
 */
#pragma once
#ifndef TFTPKIT_CLIENT_HPP
#define TFTPKIT_CLIENT_HPP
#include "tftpkit/config.hpp"
#include "tftpkit/events.hpp"
#include "tftpkit/protocol/tftp_session.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
/** @brief TFTP related utilities. */
namespace tftpkit {
/** @brief The outcome of one client transfer. */
struct transfer_result {
  /** @brief Empty on success, a transfer_errc otherwise. */
  std::error_code error;
  /** @brief Human readable failure reason. */
  std::string reason;
  /** @brief Transfer statistics. */
  transfer_statistics statistics;
  /** @brief The last block transferred. */
  std::uint16_t block_num = 0;

  /** @brief Returns true if the transfer completed. */
  [[nodiscard]] explicit operator bool() const noexcept { return !error; }
};

/**
 * @brief Runs one transfer at a time against a TFTP server.
 * @details Transfers run on the calling thread and block until the session
 * terminates. cancel() may be called from any thread.
 */
class client {
public:
  /**
   * @brief Constructs a client.
   * @param config The client configuration.
   * @param sink Receives the events of every transfer.
   */
  explicit client(client_config config = {}, event_sink sink = {});

  /**
   * @brief Downloads a file.
   * @param host The server host.
   * @param remote The filename on the server.
   * @param local Where to write the file.
   * @param mode The transfer mode.
   * @returns The transfer result.
   */
  auto download(std::string_view host, std::string_view remote,
                const std::filesystem::path &local,
                messages::mode_t mode = messages::OCTET) -> transfer_result;

  /**
   * @brief Uploads a file.
   * @param host The server host.
   * @param local The file to send.
   * @param remote The filename on the server.
   * @param mode The transfer mode.
   * @returns The transfer result.
   */
  auto upload(std::string_view host, const std::filesystem::path &local,
              std::string_view remote,
              messages::mode_t mode = messages::OCTET) -> transfer_result;

  /**
   * @brief Aborts the running transfer, or the next one if none is
   * running yet.
   */
  auto cancel() noexcept -> void { cancelled_ = true; }

private:
  /** @brief The configuration. */
  client_config config_;
  /** @brief The event sink. */
  event_sink sink_;
  /** @brief Set by cancel(). */
  std::atomic<bool> cancelled_{false};

  /** @brief Drives one session to completion. */
  auto run(std::string_view host, session::parameters params,
           std::unique_ptr<std::fstream> file,
           std::error_code open_error) -> transfer_result;
};

} // namespace tftpkit
#endif // TFTPKIT_CLIENT_HPP
