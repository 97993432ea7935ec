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
 * @file tftpkit.hpp
 * @brief This file declares the tftpkit engine API.
 */
#pragma once
#ifndef TFTPKIT_HPP
#define TFTPKIT_HPP
#include "tftpkit/client.hpp"
#include "tftpkit/config.hpp"
#include "tftpkit/error.hpp"
#include "tftpkit/events.hpp"
#include "tftpkit/server.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string_view>
#include <system_error>
/** @namespace For top-level tftpkit services. */
namespace tftpkit {
/** @brief How stop_server treats live sessions. */
enum class stop_mode : std::uint8_t {
  /** @brief Abort every live session now. */
  immediate,
  /** @brief Refuse new requests and let live sessions finish. */
  graceful
};

/** @brief A running server. */
class server_handle {
public:
  /** @brief The server thread type. */
  using service_type = net::service::context_thread<server>;
  /** @brief Default time given to live sessions by a graceful stop. */
  static constexpr auto DEFAULT_GRACE = std::chrono::milliseconds(5000);

  server_handle();
  server_handle(const server_handle &) = delete;
  server_handle(server_handle &&) = delete;
  auto operator=(const server_handle &) -> server_handle & = delete;
  auto operator=(server_handle &&) -> server_handle & = delete;
  /** @brief Stops the server immediately if it is still running. */
  ~server_handle();

  /**
   * @brief Stops the server and waits for its thread.
   * @param mode Whether live sessions are aborted or allowed to finish.
   * @param grace The longest a graceful stop waits for live sessions.
   */
  auto stop(stop_mode mode = stop_mode::immediate,
            std::chrono::milliseconds grace = DEFAULT_GRACE) -> void;

  /** @brief Refuses new requests. Live sessions continue. */
  auto drain() noexcept -> void;

  /** @brief Asks the event loop to stop without waiting. */
  auto terminate() -> void;

  /**
   * @brief Waits for the event loop to stop.
   * @param timeout The longest time to wait.
   * @returns true if the event loop has stopped.
   */
  auto wait_for(std::chrono::milliseconds timeout) -> bool;

  /** @brief Returns the number of live sessions. */
  [[nodiscard]] auto active() const noexcept -> std::size_t;

  /** @brief Returns true while new requests are refused. */
  [[nodiscard]] auto draining() const noexcept -> bool;

  /** @brief Returns true while the event loop runs. */
  [[nodiscard]] auto running() const noexcept -> bool;

private:
  friend auto start_server(const server_config &config, event_sink sink,
                           std::error_code &err)
      -> std::unique_ptr<server_handle>;

  /** @brief Guards service_. */
  mutable std::mutex mtx_;
  /** @brief The server thread. */
  std::unique_ptr<service_type> service_;
  /** @brief State shared with the server. */
  std::shared_ptr<server_control> control_;
};

/**
 * @brief Starts a server on its own thread.
 * @param config The server configuration.
 * @param sink Receives the events of every session, on the server thread.
 * @param[out] err Cleared on success. Set if the root or the address is
 * invalid or if the listener could not be started.
 * @returns A handle to the running server, or nullptr on error.
 */
auto start_server(const server_config &config, event_sink sink,
                  std::error_code &err) -> std::unique_ptr<server_handle>;

/**
 * @brief Stops a server.
 * @param handle The server.
 * @param mode Whether live sessions are aborted or allowed to finish.
 * @param grace The longest a graceful stop waits for live sessions.
 */
auto stop_server(server_handle &handle, stop_mode mode = stop_mode::immediate,
                 std::chrono::milliseconds grace = server_handle::DEFAULT_GRACE)
    -> void;

/**
 * @brief Uploads a file to a server.
 * @param host The server host.
 * @param local The file to send.
 * @param remote The filename on the server.
 * @param config The client configuration.
 * @param sink Receives the transfer's events.
 * @param mode The transfer mode.
 * @returns The transfer result.
 */
auto upload_file(std::string_view host, const std::filesystem::path &local,
                 std::string_view remote, const client_config &config = {},
                 event_sink sink = {},
                 messages::mode_t mode = messages::OCTET) -> transfer_result;

/**
 * @brief Downloads a file from a server.
 * @param host The server host.
 * @param remote The filename on the server.
 * @param local Where to write the file.
 * @param config The client configuration.
 * @param sink Receives the transfer's events.
 * @param mode The transfer mode.
 * @returns The transfer result.
 */
auto download_file(std::string_view host, std::string_view remote,
                   const std::filesystem::path &local,
                   const client_config &config = {}, event_sink sink = {},
                   messages::mode_t mode = messages::OCTET) -> transfer_result;
} // namespace tftpkit
#endif // TFTPKIT_HPP
