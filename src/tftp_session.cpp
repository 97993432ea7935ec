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
 * @file tftp_session.cpp
 * @brief This file defines the TFTP transfer session state machine.
 */
#include "tftpkit/protocol/tftp_session.hpp"
#include "tftpkit/error.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <format>
#include <utility>
namespace tftpkit {
/**
 * @brief Appends file bytes to an outgoing buffer, converting to NETASCII.
 * @details NETASCII conversion rules:
 *          - Line feeds (`\n`) are sent as `\r\n`.
 *          - Carriage returns (`\r`) are sent as `\r\0`.
 *          - Every other byte is sent unchanged.
 * @param[in,out] buffer The destination buffer.
 * @param[in] buf The file bytes.
 */
static inline auto insert_netascii(std::vector<char> &buffer,
                                   std::span<const char> buf) -> void
{
  for (const auto chr : buf)
  {
    if (chr == '\n')
    {
      buffer.push_back('\r');
      buffer.push_back('\n');
      continue;
    }

    buffer.push_back(chr);
    if (chr == '\r')
      buffer.push_back('\0');
  }
}

/**
 * @brief Converts a received NETASCII payload to local bytes.
 * @details `\r\n` becomes `\n` and `\r\0` becomes `\r`. A carriage return
 * that ends a block is held in cr_pending until the next block arrives.
 * @param[in] payload The received bytes.
 * @param[in,out] cr_pending The carriage return carried across blocks.
 * @returns The converted bytes.
 */
static inline auto extract_netascii(std::span<const char> payload,
                                    bool &cr_pending) -> std::vector<char>
{
  auto out = std::vector<char>();
  out.reserve(payload.size() + 1);

  for (const auto chr : payload)
  {
    if (cr_pending)
    {
      cr_pending = false;
      if (chr == '\n')
      {
        out.push_back('\n');
        continue;
      }

      out.push_back('\r');
      if (chr == '\0')
        continue;
    }

    if (chr == '\r')
    {
      cr_pending = true;
      continue;
    }

    out.push_back(chr);
  }

  return out;
}

session::session(parameters params, std::unique_ptr<std::fstream> file,
                 std::unique_ptr<transport> transport, event_sink sink)
    : params_{std::move(params)}, file_{std::move(file)},
      transport_{std::move(transport)}, sink_{std::move(sink)}
{
  state_ = (params_.direction == UPLOAD) ? AWAITING_FIRST_ACK : RECEIVING;
}

auto session::start(std::error_code open_error) -> void
{
  using enum transfer_event::kind_t;
  using enum messages::mode_t;

  statistics_.start_time = transfer_statistics::clock::now();
  emit(SESSION_STARTED);

  if (!open_error && !file_)
    open_error = transfer_errc::access_violation;

  if (open_error)
    return fail(to_transfer_error(open_error), params_.role == SERVER);

  const auto mode = std::string(to_string(params_.mode));
  if (params_.role == CLIENT)
  {
    if (params_.direction == UPLOAD)
      return send(packets::write_request{.filename = params_.filename,
                                         .mode = mode});

    return send(
        packets::read_request{.filename = params_.filename, .mode = mode});
  }

  // Server sessions.
  if (params_.direction == DOWNLOAD)
  {
    send(packets::ack{.block_num = 0});
    acked_ = true;
    return;
  }

  state_ = SENDING;
  send_next();
}

auto session::on_packet(const packet &pkt) -> void
{
  if (done())
    return;

  if (const auto *err = std::get_if<packets::error>(&pkt))
  {
    peer_error_ = *err;
    error_ = from_tftp_error(err->code);
    reason_ = std::format("{} (code {})", err->message, err->code);
    return finish(FAILED);
  }

  if (const auto *data = std::get_if<packets::data>(&pkt))
  {
    if (state_ == RECEIVING)
      return receive(*data);

    return fail(transfer_errc::illegal_operation, true);
  }

  if (const auto *ack = std::get_if<packets::ack>(&pkt))
  {
    if (state_ == SENDING || state_ == AWAITING_FIRST_ACK)
      return acknowledge(*ack);

    return fail(transfer_errc::illegal_operation, true);
  }

  // Requests are never valid on a transfer ID.
  fail(transfer_errc::illegal_operation, true);
}

auto session::on_timeout() -> void
{
  if (done())
    return;

  if (++retries_ >= params_.options.max_retries)
    return fail(transfer_errc::timeout, true);

  spdlog::debug("{}:Timeout, retransmitting ({}/{}).", params_.tag, retries_,
                params_.options.max_retries);

  statistics_.retransmits += 1;
  if (!last_sent_.empty() && last_sent_.size() >= messages::HEADER_LEN &&
      last_sent_[1] == static_cast<char>(messages::DATA))
  {
    statistics_.resent_bytes += last_sent_.size() - messages::HEADER_LEN;
  }

  transport_->send(last_sent_);
  transport_->schedule(transport::clock::now() + params_.options.timeout);
}

auto session::abort() -> void
{
  if (done())
    return;

  error_ = transfer_errc::aborted;
  reason_ = error_.message();
  finish(ABORTED);
}

auto session::send(const packet &pkt) -> void
{
  auto err = std::error_code();
  auto buf = encode(pkt, err);
  if (err) [[unlikely]]
    return fail(transfer_errc::illegal_operation, false); // GCOVR_EXCL_LINE

  last_sent_ = std::move(buf);
  transport_->send(last_sent_);
  transport_->schedule(transport::clock::now() + params_.options.timeout);
}

auto session::send_next() -> void
{
  using enum messages::mode_t;
  using enum transfer_event::kind_t;

  auto payload = std::vector<char>();
  if (params_.mode == NETASCII)
  {
    auto read_buf = std::array<char, messages::DATALEN>();
    while (pending_.size() < messages::DATALEN && file_->good())
    {
      file_->read(read_buf.data(), read_buf.size());
      insert_netascii(pending_,
                      std::span(read_buf.data(),
                                static_cast<std::size_t>(file_->gcount())));
    }

    const auto len = std::min(pending_.size(), messages::DATALEN);
    payload.assign(pending_.begin(), pending_.begin() + len);
    pending_.erase(pending_.begin(), pending_.begin() + len);
  }
  else
  {
    payload.resize(messages::DATALEN);
    file_->read(payload.data(), static_cast<std::streamsize>(payload.size()));
    payload.resize(static_cast<std::size_t>(file_->gcount()));
  }

  if (file_->bad()) [[unlikely]]
    return fail(transfer_errc::access_violation, true); // GCOVR_EXCL_LINE

  block_num_ += 1; // block_num wraps on overflow.
  final_sent_ = payload.size() < messages::DATALEN;
  statistics_.bytes += payload.size();
  statistics_.blocks += 1;

  const auto len = payload.size();
  send(packets::data{.block_num = block_num_, .payload = std::move(payload)});
  emit(BLOCK_TRANSFERRED, block_num_, len);
}

auto session::acknowledge(const packets::ack &ack) -> void
{
  // Stale or duplicate ACKs are not retransmission triggers.
  if (ack.block_num != block_num_)
  {
    statistics_.duplicates += 1;
    spdlog::debug("{}:Ignoring ACK {} while expecting {}.", params_.tag,
                  ack.block_num, block_num_);
    return;
  }

  retries_ = 0;
  if (state_ == AWAITING_FIRST_ACK)
  {
    state_ = SENDING;
    return send_next();
  }

  if (final_sent_)
    return complete();

  send_next();
}

auto session::write(const std::vector<char> &payload) -> bool
{
  using enum messages::mode_t;

  if (params_.mode == NETASCII)
  {
    auto out = extract_netascii(payload, cr_pending_);
    file_->write(out.data(), static_cast<std::streamsize>(out.size()));
  }
  else
  {
    file_->write(payload.data(), static_cast<std::streamsize>(payload.size()));
  }

  return !file_->fail();
}

auto session::receive(const packets::data &data) -> void
{
  using enum transfer_event::kind_t;

  const auto next_block = static_cast<std::uint16_t>(block_num_ + 1);
  if (data.block_num != next_block)
  {
    statistics_.duplicates += 1;
    spdlog::debug("{}:Duplicate DATA {}.", params_.tag, data.block_num);
    if (acked_)
      transport_->send(last_sent_);
    return;
  }

  if (!write(data.payload))
    return fail(transfer_errc::disk_full, true); // GCOVR_EXCL_LINE

  block_num_ = next_block;
  retries_ = 0;
  statistics_.bytes += data.payload.size();
  statistics_.blocks += 1;

  send(packets::ack{.block_num = block_num_});
  acked_ = true;
  emit(BLOCK_TRANSFERRED, block_num_, data.payload.size());

  if (data.payload.size() < messages::DATALEN)
    complete();
}

auto session::complete() -> void
{
  if (params_.direction == DOWNLOAD)
  {
    if (cr_pending_)
    {
      cr_pending_ = false;
      file_->put('\r');
    }

    file_->close();
    if (file_->fail()) [[unlikely]]
      return fail(transfer_errc::disk_full, false); // GCOVR_EXCL_LINE
  }

  finish(COMPLETED);
}

auto session::fail(std::error_code err, bool notify_peer) -> void
{
  error_ = err;
  reason_ = err.message();

  if (notify_peer)
  {
    auto encode_err = std::error_code();
    auto buf = encode(make_error(to_tftp_error(err)), encode_err);
    if (!encode_err)
      transport_->send(buf);
  }

  finish(FAILED);
}

auto session::finish(state_t state) -> void
{
  using enum transfer_event::kind_t;

  state_ = state;
  transport_->cancel();
  if (file_ && file_->is_open())
    file_->close();
  pending_.clear();
  statistics_.end_time = transfer_statistics::clock::now();

  if (state == COMPLETED)
  {
    spdlog::info("{}:Completed {}.", params_.tag, params_.filename);
    spdlog::info("{}:{} bytes in {} blocks, {:.3f}s, {:.2f} kbps, {} "
                 "retransmits, {} duplicates.",
                 params_.tag, statistics_.bytes, statistics_.blocks,
                 statistics_.duration().count(), statistics_.kbps(),
                 statistics_.retransmits, statistics_.duplicates);
    return emit(SESSION_COMPLETED);
  }

  if (state == ABORTED)
    spdlog::warn("{}:Aborted {}.", params_.tag, params_.filename);
  else
    spdlog::error("{}:{}", params_.tag, reason_);

  emit(SESSION_FAILED);
}

auto session::emit(transfer_event::kind_t kind, std::uint16_t block_num,
                   std::size_t bytes) const -> void
{
  if (!sink_)
    return;

  sink_(transfer_event{.kind = kind,
                       .session = params_.tag,
                       .filename = params_.filename,
                       .block_num = block_num,
                       .bytes = bytes,
                       .statistics = &statistics_,
                       .error = error_,
                       .reason = reason_});
}

} // namespace tftpkit
