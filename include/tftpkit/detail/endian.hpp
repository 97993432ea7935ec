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
 * @file endian.hpp
 * @brief This file defines constexpr network byte-order helpers.
 */
#pragma once
#ifndef TFTPKIT_ENDIAN_HPP
#define TFTPKIT_ENDIAN_HPP
#include <cstddef>
#include <cstdint>
/** @brief Defines internal tftpkit implementation details. */
namespace tftpkit::detail {
// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)

/**
 * @brief Reads a big-endian 16-bit field from a byte buffer.
 * @details The buffer does not need to be aligned.
 * @param buf Pointer to the first of two bytes.
 * @returns The field value in host byte order.
 */
constexpr auto load_u16(const std::byte *buf) noexcept -> std::uint16_t
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return static_cast<std::uint16_t>((std::to_integer<unsigned>(buf[0]) << 8) |
                                    std::to_integer<unsigned>(buf[1]));
}

/**
 * @brief Appends a 16-bit value in network byte order.
 * @tparam Buffer A container of char with push_back.
 * @param buf The buffer to append to.
 * @param value The value in host byte order.
 */
template <typename Buffer>
constexpr auto store_u16(Buffer &buf, const std::uint16_t value) -> void
{
  buf.push_back(static_cast<char>((value >> 8) & 0xFF));
  buf.push_back(static_cast<char>(value & 0xFF));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
} // namespace tftpkit::detail
#endif // TFTPKIT_ENDIAN_HPP
