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
 * @file address.cpp
 * @brief This file defines socket address helpers.
 */
#include "tftpkit/detail/address.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <charconv>
#include <cstring>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
namespace tftpkit::detail {
template <typename T> using socket_address = ::io::socket::socket_address<T>;

/** @brief Bounds checked implementation of strlen. */
[[nodiscard]] static constexpr auto
strnlen(const char *str, std::size_t maxlen) noexcept -> std::size_t
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto *found = std::find(str, str + maxlen, '\0');
  return found - str;
}

/** @brief Views IPv4 storage inside an address. */
static inline auto as_v4(address_type &addr) noexcept -> sockaddr_in *
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return reinterpret_cast<sockaddr_in *>(std::ranges::data(addr));
}

auto to_str(std::span<char> buf, address_type addr) noexcept -> std::string_view
{
  assert(buf.size() >= ADDRSTR_LEN &&
         "Buffer must be large enough to print an IPv6 address and a port "
         "number.");

  using std::to_chars;

  std::memset(buf.data(), 0, buf.size());
  unsigned short port = 0;
  std::size_t len = 0;

  if (addr->sin6_family == AF_INET)
  {
    const auto *addr_v4 = as_v4(addr);
    inet_ntop(addr_v4->sin_family, &addr_v4->sin_addr, buf.data(), buf.size());
    port = ntohs(addr_v4->sin_port);
    len = strnlen(buf.data(), buf.size());
  }
  else
  {
    buf[0] = '[';
    inet_ntop(addr->sin6_family, &addr->sin6_addr, buf.data() + 1,
              buf.size() - 1);
    port = ntohs(addr->sin6_port);
    len = strnlen(buf.data(), buf.size());
    buf[len++] = ']';
  }

  buf[len++] = ':';
  auto [end, err] = to_chars(buf.data() + len, buf.data() + buf.size(), port);
  return {buf.data(), end};
}

auto to_string(const address_type &addr) -> std::string
{
  auto buf = std::array<char, ADDRSTR_LEN>{};
  return std::string(to_str(buf, addr));
}

auto normalize(address_type addr) noexcept -> address_type
{
  if (addr->sin6_family == AF_INET)
    addr = socket_address(as_v4(addr));

  return addr;
}

auto port_of(address_type addr) noexcept -> std::uint16_t
{
  if (addr->sin6_family == AF_INET)
    return ntohs(as_v4(addr)->sin_port);

  return ntohs(addr->sin6_port);
}

auto same_host(address_type lhs, address_type rhs) noexcept -> bool
{
  if (lhs->sin6_family != rhs->sin6_family)
    return false;

  if (lhs->sin6_family == AF_INET)
    return as_v4(lhs)->sin_addr.s_addr == as_v4(rhs)->sin_addr.s_addr;

  return std::memcmp(&lhs->sin6_addr, &rhs->sin6_addr,
                     sizeof(lhs->sin6_addr)) == 0;
}

auto same_endpoint(address_type lhs, address_type rhs) noexcept -> bool
{
  return same_host(lhs, rhs) && port_of(lhs) == port_of(rhs);
}

auto make_address(std::string_view host, std::uint16_t port,
                  std::error_code &err) -> address_type
{
  err.clear();
  auto addr = address_type{};
  const auto name = std::string(host);

  auto addr_v4 = sockaddr_in{};
  if (inet_pton(AF_INET, name.c_str(), &addr_v4.sin_addr) == 1)
  {
    addr_v4.sin_family = AF_INET;
    addr_v4.sin_port = htons(port);
    addr = socket_address(&addr_v4);
    return addr;
  }

  if (inet_pton(AF_INET6, name.c_str(), &addr->sin6_addr) == 1)
  {
    addr->sin6_family = AF_INET6;
    addr->sin6_port = htons(port);
    return addr;
  }

  auto hints = addrinfo{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_DGRAM;

  addrinfo *results = nullptr;
  if (getaddrinfo(name.c_str(), nullptr, &hints, &results) != 0 || !results)
  {
    err = std::make_error_code(std::errc::invalid_argument);
    return {};
  }

  // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
  if (results->ai_family == AF_INET)
  {
    std::memcpy(&addr_v4, results->ai_addr, sizeof(addr_v4));
    addr_v4.sin_port = htons(port);
    addr = socket_address(&addr_v4);
  }
  else
  {
    const auto *addr_v6 =
        reinterpret_cast<const sockaddr_in6 *>(results->ai_addr);
    addr->sin6_family = AF_INET6;
    addr->sin6_addr = addr_v6->sin6_addr;
    addr->sin6_scope_id = addr_v6->sin6_scope_id;
    addr->sin6_port = htons(port);
  }
  // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)

  freeaddrinfo(results);
  return addr;
}

} // namespace tftpkit::detail
