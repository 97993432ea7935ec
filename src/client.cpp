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
 * @file client.cpp
 * @brief This file defines the TFTP client driver.
 */
#include "tftpkit/client.hpp"
#include "tftpkit/detail/address.hpp"
#include "tftpkit/error.hpp"
#include "tftpkit/filesystem.hpp"

#include <net/cppnet.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <format>
#include <optional>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
namespace tftpkit {
/** @brief Milliseconds type. */
using milliseconds = std::chrono::milliseconds;
/** @brief The socket message type. */
using socket_message = io::socket::socket_message<sockaddr_in6>;

/** @brief How often a blocked transfer checks for cancellation. */
static constexpr auto POLL_INTERVAL = milliseconds(100);

/** @brief The client's transfer socket. */
class client_transport : public transport {
public:
  client_transport(io::socket::socket_handle &socket,
                   detail::address_type peer) noexcept
      : socket_{socket}, peer_{peer}
  {}

  auto send(std::span<const char> msg) -> void override
  {
    buffer_.assign(msg.begin(), msg.end());
    auto len = io::sendmsg(
        socket_, socket_message{.address = {peer_}, .buffers = buffer_}, 0);
    if (len < 0)
      spdlog::warn("{}:Send failed.", detail::to_string(peer_)); // GCOVR_EXCL_LINE
  }

  auto schedule(timestamp deadline) -> void override { deadline_ = deadline; }

  auto cancel() noexcept -> void override { deadline_.reset(); }

  [[nodiscard]] auto native_handle() const noexcept -> socket_type override
  {
    return static_cast<socket_type>(socket_);
  }

  /** @brief Sends every further packet to the server's transfer ID. */
  auto lock(const detail::address_type &peer) noexcept -> void
  {
    peer_ = peer;
  }

  /** @brief Returns the pending deadline. */
  [[nodiscard]] auto deadline() const noexcept
      -> const std::optional<timestamp> &
  {
    return deadline_;
  }

private:
  io::socket::socket_handle &socket_;
  detail::address_type peer_;
  std::vector<char> buffer_;
  std::optional<timestamp> deadline_;
};

client::client(client_config config, event_sink sink)
    : config_{std::move(config)}, sink_{std::move(sink)}
{}

auto client::download(std::string_view host, std::string_view remote,
                      const std::filesystem::path &local,
                      messages::mode_t mode) -> transfer_result
{
  auto err = std::error_code();
  auto file = std::unique_ptr<std::fstream>();
  if (mode != messages::NETASCII && mode != messages::OCTET)
    err = transfer_errc::illegal_operation;
  else
    file = filesystem::open_write(local, err);

  auto created = static_cast<bool>(file);
  auto result = run(host,
                    session::parameters{.role = session::CLIENT,
                                        .direction = session::DOWNLOAD,
                                        .filename = std::string(remote),
                                        .mode = mode,
                                        .options = config_.session},
                    std::move(file), err);

  // Nothing was received, so there is no partial file to keep.
  if (created && result.error && result.statistics.blocks == 0)
  {
    auto remove_err = std::error_code();
    std::filesystem::remove(local, remove_err);
  }

  return result;
}

auto client::upload(std::string_view host, const std::filesystem::path &local,
                     std::string_view remote,
                     messages::mode_t mode) -> transfer_result
{
  auto err = std::error_code();
  auto file = std::unique_ptr<std::fstream>();
  if (mode != messages::NETASCII && mode != messages::OCTET)
    err = transfer_errc::illegal_operation;
  else
    file = filesystem::open_read(local, err);

  return run(host,
             session::parameters{.role = session::CLIENT,
                                 .direction = session::UPLOAD,
                                 .filename = std::string(remote),
                                 .mode = mode,
                                 .options = config_.session},
             std::move(file), err);
}

auto client::run(std::string_view host, session::parameters params,
                 std::unique_ptr<std::fstream> file,
                 std::error_code open_error) -> transfer_result
{
  using namespace io::socket;

  auto err = std::error_code();
  auto server = detail::make_address(host, config_.port, err);
  if (err)
  {
    spdlog::error("Unable to resolve host {}.", host);
    cancelled_ = false;
    return {.error = err, .reason = std::format("Unknown host: {}", host)};
  }

  auto sock = socket_handle(server->sin6_family, SOCK_DGRAM, 0);
  if (!config_.local_address.empty())
  {
    auto local = detail::make_address(config_.local_address, 0, err);
    if (!err && local->sin6_family != server->sin6_family)
      err = std::make_error_code(std::errc::address_family_not_supported);

    const auto len = (local->sin6_family == AF_INET) ? sizeof(sockaddr_in)
                                                     : sizeof(sockaddr_in6);
    if (!err &&
        ::bind(static_cast<native_socket_type>(sock),
               // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
               reinterpret_cast<const sockaddr *>(std::ranges::data(local)),
               static_cast<socklen_t>(len)) != 0)
    {
      err = {errno, std::system_category()};
    }

    if (err)
    {
      spdlog::error("Unable to bind {}: {}", config_.local_address,
                    err.message());
      cancelled_ = false;
      return {.error = err, .reason = err.message()};
    }
  }

  const auto *opc = (params.direction == session::DOWNLOAD) ? "RRQ" : "WRQ";
  params.tag = std::format("{}:{}", opc, detail::to_string(server));

  auto tport = std::make_unique<client_transport>(sock, server);
  auto &tid = *tport;
  auto sess = session(std::move(params), std::move(file), std::move(tport),
                      sink_);

  sess.start(open_error);

  auto locked = false;
  auto recvbuf = std::vector<char>(messages::DATAMSG_MAXLEN);
  while (!sess.done())
  {
    if (cancelled_)
    {
      sess.abort();
      break;
    }

    auto wait = POLL_INTERVAL;
    if (const auto &deadline = tid.deadline())
    {
      const auto now = transport::clock::now();
      if (now >= *deadline)
      {
        sess.on_timeout();
        continue;
      }

      wait = std::min(
          wait, std::chrono::duration_cast<milliseconds>(*deadline - now) +
                    milliseconds(1));
    }

    auto pfd = pollfd{.fd = tid.native_handle(), .events = POLLIN};
    auto ready = ::poll(&pfd, 1, static_cast<int>(wait.count()));
    if (ready < 0 && errno != EINTR) [[unlikely]]
    {
      auto poll_err = std::error_code(errno, std::system_category());
      spdlog::error("{}:{}", sess.params().tag, poll_err.message());
      sess.abort();
      break;
    }

    if (ready <= 0)
      continue;

    auto msg = socket_message{.address = {socket_address<sockaddr_in6>()},
                              .buffers = recvbuf};
    auto len = io::recvmsg(sock, msg, 0);
    if (len <= 0)
      continue;

    auto from = detail::normalize(*msg.address);
    auto pkt = decode(
        std::span<const char>(recvbuf.data(), static_cast<std::size_t>(len)),
        err);

    if (!locked)
    {
      // The first well-formed reply from the server host fixes its
      // transfer ID. Anything else is noise.
      if (!pkt || !detail::same_host(from, server))
      {
        spdlog::debug("{}:Dropped datagram before the transfer ID was set.",
                      detail::to_string(from));
        continue;
      }

      tid.lock(from);
      server = from;
      locked = true;
    }
    else if (!detail::same_endpoint(from, server))
    {
      // Error packets are never answered.
      if (!pkt || std::holds_alternative<packets::error>(*pkt))
        continue;

      spdlog::warn("{}:Unknown transfer ID.", detail::to_string(from));
      auto reply = encode(make_error(messages::UNKNOWN_TID), err);
      if (!err)
      {
        auto sent = io::sendmsg(
            sock, socket_message{.address = {from}, .buffers = reply}, 0);
        if (sent < 0)
          spdlog::warn("{}:Send failed.", detail::to_string(from)); // GCOVR_EXCL_LINE
      }
      continue;
    }

    if (!pkt)
    {
      spdlog::debug("{}:Dropped malformed datagram: {}.",
                    detail::to_string(from), err.message());
      continue;
    }

    sess.on_packet(*pkt);
  }

  cancelled_ = false;
  return {.error = sess.error(),
          .reason = sess.reason(),
          .statistics = sess.statistics(),
          .block_num = sess.block_num()};
}

} // namespace tftpkit
