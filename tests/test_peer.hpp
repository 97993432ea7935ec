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
// NOLINTBEGIN
#pragma once
#ifndef TFTPKIT_TEST_PEER_HPP
#define TFTPKIT_TEST_PEER_HPP
#include "tftpkit/detail/address.hpp"
#include "tftpkit/protocol/packet.hpp"

#include <net/cppnet.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

/** @brief A hand driven TFTP peer on a loopback socket. */
class test_peer {
public:
  using address_type = tftpkit::detail::address_type;
  using socket_message = io::socket::socket_message<sockaddr_in6>;

  test_peer() : sock_(AF_INET, SOCK_DGRAM, 0)
  {
    // Never block a test forever on a lost reply.
    auto timeout = timeval{.tv_sec = 2, .tv_usec = 0};
    ::setsockopt(static_cast<io::socket::native_socket_type>(sock_),
                 SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
  }

  /** @brief Binds the peer to a loopback address and port. */
  auto bind(const char *host, std::uint16_t port) -> bool
  {
    auto addr = sockaddr_in{.sin_family = AF_INET, .sin_port = htons(port)};
    ::inet_pton(AF_INET, host, &addr.sin_addr);
    return ::bind(static_cast<io::socket::native_socket_type>(sock_),
                  reinterpret_cast<const sockaddr *>(&addr),
                  sizeof(addr)) == 0;
  }

  /** @brief Sends bytes that need not be a valid packet. */
  auto send_raw(std::vector<char> buf, const address_type &to) -> void
  {
    auto len =
        io::sendmsg(sock_, socket_message{.address = {to}, .buffers = buf}, 0);
    ASSERT_EQ(len, buf.size());
  }

  auto send(const tftpkit::packet &pkt, const address_type &to) -> void
  {
    auto err = std::error_code();
    auto buf = tftpkit::encode(pkt, err);
    ASSERT_FALSE(err);
    auto len =
        io::sendmsg(sock_, socket_message{.address = {to}, .buffers = buf}, 0);
    ASSERT_EQ(len, buf.size());
  }

  /** @brief Receives and decodes one datagram. */
  auto receive() -> std::optional<std::pair<tftpkit::packet, address_type>>
  {
    auto buf = std::vector<char>(tftpkit::messages::DATAMSG_MAXLEN);
    auto msg = socket_message{
        .address = {io::socket::socket_address<sockaddr_in6>()},
        .buffers = buf};
    auto len = io::recvmsg(sock_, msg, 0);
    if (len < 0)
      return std::nullopt;

    auto err = std::error_code();
    auto pkt = tftpkit::decode(
        std::span<const char>(buf.data(), static_cast<std::size_t>(len)), err);
    if (!pkt)
      return std::nullopt;

    return std::make_pair(*pkt, tftpkit::detail::normalize(*msg.address));
  }

private:
  io::socket::socket_handle sock_;
};
#endif // TFTPKIT_TEST_PEER_HPP
// NOLINTEND
