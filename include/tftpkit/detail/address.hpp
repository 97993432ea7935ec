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
 * @file address.hpp
 * @brief This file declares socket address helpers.
 */
#pragma once
#ifndef TFTPKIT_ADDRESS_HPP
#define TFTPKIT_ADDRESS_HPP
#include <net/cppnet.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <netinet/in.h>
/** @brief For internal tftpkit implementation details. */
namespace tftpkit::detail {
/** @brief Peer addresses are stored in IPv6 sized storage. */
using address_type = io::socket::socket_address<sockaddr_in6>;

/** @brief Additional buffer length for <PORT>,[],: and null.  */
static constexpr auto ADDR_BUFLEN = 9UL;

/** @brief A buffer large enough to print any address and port. */
static constexpr auto ADDRSTR_LEN = INET6_ADDRSTRLEN + ADDR_BUFLEN;

/**
 * @brief Converts the socket address to a string inside buf.
 * @param buf A buffer of at least ADDRSTR_LEN bytes.
 * @param addr The address to print.
 * @returns A view of "a.b.c.d:port" or "[v6]:port" inside buf.
 */
auto to_str(std::span<char> buf, address_type addr) noexcept -> std::string_view;

/**
 * @brief Converts the socket address to a string.
 * @param addr The address to print.
 * @returns "a.b.c.d:port" or "[v6]:port".
 */
auto to_string(const address_type &addr) -> std::string;

/**
 * @brief Rewrites an IPv4 address read into IPv6 storage so that it
 * compares equal to the same address built from a sockaddr_in.
 * @param addr The address read off a socket.
 * @returns The normalized address.
 */
auto normalize(address_type addr) noexcept -> address_type;

/**
 * @brief Returns the port of an address in host byte order.
 * @param addr The address.
 * @returns The port.
 */
auto port_of(address_type addr) noexcept -> std::uint16_t;

/**
 * @brief Compares two addresses for the same host, ignoring the port.
 * @param lhs An address.
 * @param rhs Another address.
 * @returns true if both refer to the same host.
 */
auto same_host(address_type lhs, address_type rhs) noexcept -> bool;

/**
 * @brief Compares two addresses for the same host and port.
 * @param lhs An address.
 * @param rhs Another address.
 * @returns true if both refer to the same endpoint.
 */
auto same_endpoint(address_type lhs, address_type rhs) noexcept -> bool;

/**
 * @brief Builds an address from a host and port.
 * @details The host may be an IPv4 literal, an IPv6 literal or a name that
 * the system resolver knows.
 * @param host The host.
 * @param port The port in host byte order.
 * @param[out] err Cleared on success, set to invalid_argument if the host
 * does not resolve.
 * @returns The address.
 */
auto make_address(std::string_view host, std::uint16_t port,
                  std::error_code &err) -> address_type;
} // namespace tftpkit::detail
#endif // TFTPKIT_ADDRESS_HPP
