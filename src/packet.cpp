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
 * @file packet.cpp
 * @brief This file defines the TFTP packet codec.
 */
#include "tftpkit/protocol/packet.hpp"
#include "tftpkit/detail/endian.hpp"

#include <algorithm>
#include <string_view>
#include <type_traits>
namespace tftpkit {
namespace {
/** @brief Bounds checked implementation of strlen. */
[[nodiscard]] constexpr auto strnlen(const char *str,
                                     std::size_t maxlen) noexcept -> std::size_t
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto *found = std::find(str, str + maxlen, '\0');
  return found - str;
}

/** @brief A read cursor over a datagram. */
struct reader_t {
  const char *current;
  const char *end;

  [[nodiscard]] auto remaining() const noexcept -> std::size_t
  {
    return end - current;
  }

  /** @brief Reads the next NUL-terminated string, or fails. */
  auto string(std::string &out, std::error_code &err) -> bool
  {
    const auto len = strnlen(current, remaining());
    if (len == remaining())
    {
      err = codec_errc::missing_terminator;
      return false;
    }

    out.assign(current, len);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    current += len + 1;
    return true;
  }
};

/** @brief Appends a NUL-terminated string field. */
auto put_string(std::vector<char> &buf, std::string_view str,
                std::error_code &err) -> void
{
  if (str.find('\0') != std::string_view::npos)
  {
    err = codec_errc::embedded_null;
    return;
  }

  buf.insert(buf.end(), str.begin(), str.end());
  buf.push_back('\0');
}

template <typename Request>
auto decode_request(reader_t &rdr, std::error_code &err) -> std::optional<packet>
{
  auto req = Request{};
  if (!rdr.string(req.filename, err) || !rdr.string(req.mode, err))
    return std::nullopt;

  while (rdr.remaining() > 0)
  {
    auto &[name, value] = req.options.emplace_back();
    if (!rdr.string(name, err) || !rdr.string(value, err))
      return std::nullopt;
  }

  return req;
}

template <typename Request>
auto encode_request(std::vector<char> &buf, const Request &req,
                    std::error_code &err) -> void
{
  put_string(buf, req.filename, err);
  put_string(buf, req.mode, err);
  for (const auto &[name, value] : req.options)
  {
    put_string(buf, name, err);
    put_string(buf, value, err);
  }
}
} // namespace

auto opcode(const packet &pkt) noexcept -> messages::opcode_t
{
  // Alternatives are declared in opcode order.
  return static_cast<messages::opcode_t>(pkt.index() + 1);
}

auto encode(const packet &pkt, std::error_code &err) -> std::vector<char>
{
  using namespace detail;
  err.clear();

  auto buf = std::vector<char>();
  buf.reserve(messages::DATAMSG_MAXLEN);
  store_u16(buf, opcode(pkt));

  std::visit(
      [&](const auto &msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, packets::read_request> ||
                      std::is_same_v<T, packets::write_request>)
        {
          encode_request(buf, msg, err);
        }
        else if constexpr (std::is_same_v<T, packets::data>)
        {
          if (msg.payload.size() > messages::DATALEN)
          {
            err = codec_errc::payload_too_large;
            return;
          }
          store_u16(buf, msg.block_num);
          buf.insert(buf.end(), msg.payload.begin(), msg.payload.end());
        }
        else if constexpr (std::is_same_v<T, packets::ack>)
        {
          store_u16(buf, msg.block_num);
        }
        else
        {
          store_u16(buf, msg.code);
          put_string(buf, msg.message, err);
        }
      },
      pkt);

  if (err)
    buf.clear();

  return buf;
}

auto decode(std::span<const std::byte> buf,
            std::error_code &err) -> std::optional<packet>
{
  using enum messages::opcode_t;
  using namespace detail;
  err.clear();

  if (buf.size() < messages::OPCODE_LEN)
  {
    err = codec_errc::truncated_header;
    return std::nullopt;
  }

  const auto opc = load_u16(buf.data());
  if (opc < RRQ || opc > ERROR)
  {
    err = codec_errc::unknown_opcode;
    return std::nullopt;
  }

  // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
  auto rdr = reader_t{
      .current = reinterpret_cast<const char *>(buf.data()) +
                 messages::OPCODE_LEN,
      .end = reinterpret_cast<const char *>(buf.data()) + buf.size()};
  // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)

  if (opc == RRQ)
    return decode_request<packets::read_request>(rdr, err);

  if (opc == WRQ)
    return decode_request<packets::write_request>(rdr, err);

  if (buf.size() < messages::HEADER_LEN)
  {
    err = codec_errc::truncated_header;
    return std::nullopt;
  }

  const auto field = load_u16(buf.subspan(messages::OPCODE_LEN).data());
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  rdr.current += sizeof(field);

  switch (opc)
  {
    case DATA:
    {
      if (rdr.remaining() > messages::DATALEN)
      {
        err = codec_errc::payload_too_large;
        return std::nullopt;
      }
      return packets::data{.block_num = field,
                           .payload = std::vector<char>(rdr.current, rdr.end)};
    }

    case ACK:
      // Trailing bytes after the block number are ignored.
      return packets::ack{.block_num = field};

    default:
    {
      auto msg = packets::error{.code = field};
      if (!rdr.string(msg.message, err))
        return std::nullopt;

      return msg;
    }
  }
}

auto make_error(std::uint16_t error) -> packets::error
{
  return {.code = errors::wire_code(error),
          .message = std::string(errors::errstr(error))};
}

} // namespace tftpkit
