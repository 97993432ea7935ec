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
 * @file session_manager.cpp
 * @brief This file defines the routing table of server sessions.
 */
#include "tftpkit/session_manager.hpp"
#include "tftpkit/error.hpp"
#include "tftpkit/filesystem.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <tuple>
#include <utility>
#include <variant>
namespace tftpkit {

session_manager::session_manager(std::filesystem::path root,
                                 session_options options, event_sink sink,
                                 std::shared_ptr<server_control> control)
    : root_{std::move(root)}, options_{options}, sink_{std::move(sink)},
      control_{control ? std::move(control)
                       : std::make_shared<server_control>()}
{}

auto session_manager::lookup(const address_type &peer,
                             socket_type socket) -> iterator_t
{
  auto [siter, last] = sessions_.equal_range(peer);
  for (; siter != last; ++siter)
  {
    auto &[key, session] = *siter;
    if (session->get_transport().native_handle() == socket)
      return siter;
  }

  return sessions_.end();
}

auto session_manager::find(const address_type &peer,
                           socket_type socket) const noexcept -> session *
{
  auto [siter, last] = sessions_.equal_range(peer);
  for (; siter != last; ++siter)
  {
    const auto &[key, session] = *siter;
    if (session->get_transport().native_handle() == socket)
      return session.get();
  }

  return nullptr;
}

auto session_manager::owns(socket_type socket) const noexcept -> bool
{
  return std::ranges::any_of(sessions_, [&](const auto &entry) {
    return entry.second->get_transport().native_handle() == socket;
  });
}

auto session_manager::route_inbound(const address_type &peer,
                                    socket_type socket,
                                    std::span<const std::byte> buf,
                                    provider &io) -> void
{
  auto err = std::error_code();
  auto pkt = decode(buf, err);
  if (!pkt)
  {
    spdlog::debug("{}:Dropped malformed datagram: {}.",
                  detail::to_string(peer), err.message());
    return;
  }

  if (auto siter = lookup(peer, socket); siter != sessions_.end())
  {
    siter->second->on_packet(*pkt);
    return retire(siter);
  }

  const auto is_request = std::holds_alternative<packets::read_request>(*pkt) ||
                          std::holds_alternative<packets::write_request>(*pkt);

  // Requests are only served on the listening socket.
  if (is_request && !owns(socket))
  {
    // Retransmitted request, the session already answered it.
    if (sessions_.contains(peer))
      return;

    return request(peer, *pkt, io);
  }

  // Error packets are never answered, or two endpoints could bounce
  // Error(5) at each other indefinitely.
  if (std::holds_alternative<packets::error>(*pkt))
  {
    spdlog::debug("{}:Dropped stray error packet.", detail::to_string(peer));
    return;
  }

  spdlog::warn("{}:Unknown transfer ID.", detail::to_string(peer));
  auto reply = encode(make_error(messages::UNKNOWN_TID), err);
  if (!err)
    io.reply(reply);
}

auto session_manager::request(const address_type &peer, const packet &pkt,
                              provider &io) -> void
{
  using enum messages::mode_t;

  auto fields = [](const auto &req) {
    return std::tie(req.filename, req.mode, req.options);
  };

  const auto *rrq = std::get_if<packets::read_request>(&pkt);
  const auto &[filename, modestr, options] =
      rrq ? fields(*rrq) : fields(std::get<packets::write_request>(pkt));

  auto tag = std::format("{}:{}", rrq ? "RRQ" : "WRQ", detail::to_string(peer));
  if (control_->draining)
  {
    spdlog::info("{}:Draining, request discarded.", tag);
    return;
  }

  spdlog::info("{}:New {} for {}.", tag, rrq ? "RRQ" : "WRQ", filename);
  if (!options.empty())
    spdlog::debug("{}:Ignoring {} request options.", tag, options.size());

  auto err = std::error_code();
  const auto mode = to_mode(modestr);
  if (mode == 0 || mode == MAIL)
    err = transfer_errc::illegal_operation;

  auto path = std::filesystem::path();
  if (!err)
  {
    path = filesystem::resolve(root_, filename, err);
    if (err)
      err = transfer_errc::access_violation;
  }

  auto file = std::unique_ptr<std::fstream>();
  if (!err)
  {
    file = rrq ? filesystem::open_read(path, err)
               : filesystem::open_write(path, err);
  }

  auto tport = io.open();
  if (!tport) [[unlikely]]
  {
    spdlog::error("{}:Unable to open a transfer socket.", tag); // GCOVR_EXCL_LINE
    return;                                                     // GCOVR_EXCL_LINE
  }

  auto params = session::parameters{
      .role = session::SERVER,
      .direction = rrq ? session::UPLOAD : session::DOWNLOAD,
      .filename = filename,
      .mode = mode ? mode : OCTET,
      .options = options_,
      .tag = std::move(tag)};

  auto siter = sessions_.emplace(
      peer, std::make_unique<session>(std::move(params), std::move(file),
                                      std::move(tport), sink_));
  control_->active = sessions_.size();

  siter->second->start(err);
  retire(siter);
}

auto session_manager::expire(const address_type &peer,
                             socket_type socket) -> void
{
  if (auto siter = lookup(peer, socket); siter != sessions_.end())
  {
    siter->second->on_timeout();
    retire(siter);
  }
}

auto session_manager::retire(iterator_t siter) -> void
{
  if (!siter->second->done())
    return;

  sessions_.erase(siter);
  control_->active = sessions_.size();
}

auto session_manager::abort_all() -> void
{
  for (auto &[key, session] : sessions_)
    session->abort();

  sessions_.clear();
  control_->active = 0;
}

} // namespace tftpkit
