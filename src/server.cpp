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
 * @file server.cpp
 * @brief This file defines the TFTP server listener.
 */
#include "tftpkit/server.hpp"

#include <net/timers/timers.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <vector>

#include <netinet/in.h>
#include <sys/socket.h>
namespace tftpkit {
/** @brief Milliseconds type. */
using milliseconds = std::chrono::milliseconds;

/** @brief Sends a datagram to a peer without waiting for completion. */
static auto send_to(server::async_context &ctx,
                    const server::socket_dialog &socket,
                    const server::address_type &peer,
                    std::span<const char> msg) -> void
{
  using namespace stdexec;
  using socket_message = server::socket_message;

  // The buffer must outlive the asynchronous send.
  auto buf = std::make_shared<std::vector<char>>(msg.begin(), msg.end());
  sender auto sendmsg =
      io::sendmsg(socket, socket_message{.address = {peer}, .buffers = *buf},
                  0) |
      then([buf](auto &&) {}) | upon_error([buf, peer](auto &&) {
        spdlog::warn("{}:Send failed.", detail::to_string(peer)); // GCOVR_EXCL_LINE
      });

  ctx.scope.spawn(std::move(sendmsg));
}

/** @brief A transfer ID socket owned by one server session. */
class server_transport : public transport {
public:
  /** @brief The session timer. */
  using timer_id = net::timers::timer_id;
  /** @brief The invalid timer value. */
  static constexpr auto INVALID_TIMER = net::timers::INVALID_TIMER;

  server_transport(server &srv, server::async_context &ctx,
                   server::socket_dialog socket,
                   server::address_type peer) noexcept
      : server_{srv}, ctx_{ctx}, socket_{std::move(socket)}, peer_{peer},
        native_{static_cast<socket_type>(*socket_.socket)}
  {}

  server_transport(const server_transport &) = delete;
  server_transport(server_transport &&) = delete;
  auto operator=(const server_transport &) -> server_transport & = delete;
  auto operator=(server_transport &&) -> server_transport & = delete;

  ~server_transport() override
  {
    if (server_.stopped())
      return;

    cancel();
    // Shutdown the read-side of the socket.
    // This removes the socket from the underlying event-loop.
    io::shutdown(socket_, SHUT_RD);
  }

  auto send(std::span<const char> msg) -> void override
  {
    if (!server_.stopped())
      send_to(ctx_, socket_, peer_, msg);
  }

  auto schedule(timestamp deadline) -> void override
  {
    if (server_.stopped())
      return;

    auto timeout = std::chrono::duration_cast<milliseconds>(deadline -
                                                            clock::now());
    timeout = std::max(timeout, milliseconds(0));

    timer_ = ctx_.timers.remove(timer_);
    timer_ = ctx_.timers.add(timeout, [this](auto) {
      timer_ = INVALID_TIMER;
      server_.expire(peer_, native_);
    });
  }

  auto cancel() noexcept -> void override
  {
    if (!server_.stopped() && timer_ != INVALID_TIMER)
      timer_ = ctx_.timers.remove(timer_);
  }

  [[nodiscard]] auto native_handle() const noexcept -> socket_type override
  {
    return native_;
  }

private:
  server &server_;
  server::async_context &ctx_;
  server::socket_dialog socket_;
  server::address_type peer_;
  socket_type native_;
  timer_id timer_{INVALID_TIMER};
};

/** @brief The server's side of session_manager::provider for one datagram. */
struct server_provider : public session_manager::provider {
  server_provider(server &srv, server::async_context &ctx,
                  const server::socket_dialog &socket,
                  const server::address_type &peer) noexcept
      : srv{srv}, ctx{ctx}, socket{socket}, peer{peer}
  {}

  auto open() -> std::unique_ptr<transport> override
  {
    opened = ctx.poller.emplace(peer->sin6_family, SOCK_DGRAM, 0);
    return std::make_unique<server_transport>(srv, ctx, *opened, peer);
  }

  auto reply(std::span<const char> msg) -> void override
  {
    send_to(ctx, socket, peer, msg);
  }

  server &srv;
  server::async_context &ctx;
  const server::socket_dialog &socket;
  server::address_type peer;
  std::optional<server::socket_dialog> opened;
};

server::~server()
{
  // The event loop is gone; sessions only release their files.
  stopped_ = true;
  sessions_.abort_all();
}

auto server::expire(const address_type &peer,
                    session_manager::socket_type socket) -> void
{
  sessions_.expire(peer, socket);
}

auto server::operator()(async_context &ctx, const socket_dialog &socket,
                        const std::shared_ptr<read_context> &rctx,
                        std::span<const std::byte> buf) -> void
{
  using namespace io::socket;
  if (!rctx)
    return;

  const auto native = static_cast<session_manager::socket_type>(*socket.socket);
  const auto tid = sessions_.owns(native);
  const auto address = detail::normalize(*rctx->msg.address);

  auto provider = server_provider(*this, ctx, socket, address);
  if (rctx->msg.flags & MSG_TRUNC)
  {
    spdlog::debug("{}:Dropped truncated datagram.",
                  detail::to_string(address));
  }
  else
  {
    sessions_.route_inbound(address, native, buf, provider);
  }

  // Start reading on a transfer ID opened for a new session. If the
  // session already failed its read side is shut down, so the read
  // completes at once and releases the socket from the event loop.
  if (provider.opened)
    reader(ctx, *provider.opened, std::make_shared<read_context>());

  // A transfer ID stops reading when its session is gone.
  if (!tid || sessions_.owns(native))
    reader(ctx, socket, rctx);
}
} // namespace tftpkit
