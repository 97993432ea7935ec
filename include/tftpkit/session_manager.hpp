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
 * @file session_manager.hpp
 * @brief This file declares the routing table of server sessions.
 */
#pragma once
#ifndef TFTPKIT_SESSION_MANAGER_HPP
#define TFTPKIT_SESSION_MANAGER_HPP
#include "tftpkit/config.hpp"
#include "tftpkit/detail/address.hpp"
#include "tftpkit/events.hpp"
#include "tftpkit/protocol/tftp_session.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <span>
/** @brief TFTP related utilities. */
namespace tftpkit {
/** @brief State shared between a running server and its controller. */
struct server_control {
  /** @brief New requests are discarded while set. */
  std::atomic<bool> draining{false};
  /** @brief The number of sessions in the routing table. */
  std::atomic<std::size_t> active{0};
};

/**
 * @brief Owns every server session and routes datagrams to them.
 * @details Sessions are keyed on (peer address, local socket). The table
 * has a single owner: every member function must be called from the
 * thread that runs the listener.
 */
class session_manager {
public:
  /** @brief The socket address type. */
  using address_type = detail::address_type;
  /** @brief The native socket type. */
  using socket_type = transport::socket_type;

  /** @brief The I/O operations that the manager needs from its owner. */
  class provider {
  public:
    provider() = default;
    provider(const provider &) = delete;
    provider(provider &&) = delete;
    auto operator=(const provider &) -> provider & = delete;
    auto operator=(provider &&) -> provider & = delete;
    virtual ~provider() = default;

    /**
     * @brief Opens a fresh transfer ID towards the current peer.
     * @returns The new transport, or nullptr if no socket could be opened.
     */
    virtual auto open() -> std::unique_ptr<transport> = 0;

    /**
     * @brief Replies to the current peer from the receiving socket.
     * @param msg The encoded packet.
     */
    virtual auto reply(std::span<const char> msg) -> void = 0;
  };

  /**
   * @brief Constructs an empty routing table.
   * @param root The canonical root directory.
   * @param options Retransmission settings for new sessions.
   * @param sink Receives the events of every session.
   * @param control Shared state; a private one is created if empty.
   */
  session_manager(std::filesystem::path root, session_options options,
                  event_sink sink = {},
                  std::shared_ptr<server_control> control = {});

  /**
   * @brief Routes one datagram.
   * @param peer The datagram's source.
   * @param socket The socket that received the datagram.
   * @param buf The datagram.
   * @param io The owner's I/O operations.
   */
  auto route_inbound(const address_type &peer, socket_type socket,
                     std::span<const std::byte> buf, provider &io) -> void;

  /**
   * @brief Delivers an expired deadline to its session.
   * @param peer The session's peer.
   * @param socket The session's transfer ID.
   */
  auto expire(const address_type &peer, socket_type socket) -> void;

  /** @brief Aborts and removes every session. */
  auto abort_all() -> void;

  /**
   * @brief Checks whether a socket is the transfer ID of a session.
   * @param socket A native socket.
   * @returns true if a session owns the socket.
   */
  [[nodiscard]] auto owns(socket_type socket) const noexcept -> bool;

  /**
   * @brief Looks a session up.
   * @param peer The session's peer.
   * @param socket The session's transfer ID.
   * @returns The session, or nullptr if there is none.
   */
  [[nodiscard]] auto find(const address_type &peer,
                          socket_type socket) const noexcept -> session *;

  /** @brief Returns the number of sessions. */
  [[nodiscard]] auto size() const noexcept -> std::size_t
  {
    return sessions_.size();
  }

  /** @brief Returns the root directory. */
  [[nodiscard]] auto root() const noexcept -> const std::filesystem::path &
  {
    return root_;
  }

private:
  /** @brief The TFTP sessions container. */
  using sessions_t = std::multimap<address_type, std::unique_ptr<session>>;
  /** @brief The TFTP sessions iterator. */
  using iterator_t = sessions_t::iterator;

  /** @brief The sessions. */
  sessions_t sessions_;
  /** @brief The canonical root. */
  std::filesystem::path root_;
  /** @brief Settings for new sessions. */
  session_options options_;
  /** @brief Event sink handed to new sessions. */
  event_sink sink_;
  /** @brief Shared state. */
  std::shared_ptr<server_control> control_;

  /** @brief Finds the iterator of a session. */
  auto lookup(const address_type &peer, socket_type socket) -> iterator_t;
  /** @brief Starts a session for a new request. */
  auto request(const address_type &peer, const packet &pkt,
               provider &io) -> void;
  /** @brief Removes a session if it is terminal. */
  auto retire(iterator_t siter) -> void;
};

} // namespace tftpkit
#endif // TFTPKIT_SESSION_MANAGER_HPP
