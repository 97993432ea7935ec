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
 * @file tftpkit.cpp
 * @brief This file defines the tftpkit engine API.
 */
#include "tftpkit/tftpkit.hpp"
#include "tftpkit/filesystem.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
namespace tftpkit {
/** @brief How often a graceful stop checks the live sessions. */
static constexpr auto DRAIN_INTERVAL = std::chrono::milliseconds(10);

server_handle::server_handle()
    : control_{std::make_shared<server_control>()}
{}

server_handle::~server_handle() { stop(); }

auto server_handle::drain() noexcept -> void { control_->draining = true; }

auto server_handle::active() const noexcept -> std::size_t
{
  return control_->active;
}

auto server_handle::draining() const noexcept -> bool
{
  return control_->draining;
}

auto server_handle::running() const noexcept -> bool
{
  using enum net::service::async_context::context_states;
  auto lock = std::lock_guard{mtx_};
  return service_ && service_->state == STARTED;
}

auto server_handle::terminate() -> void
{
  auto lock = std::lock_guard{mtx_};
  if (service_)
    service_->signal(service_->terminate);
}

auto server_handle::wait_for(std::chrono::milliseconds timeout) -> bool
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (running())
  {
    if (std::chrono::steady_clock::now() >= deadline)
      return false;

    std::this_thread::sleep_for(DRAIN_INTERVAL);
  }

  return true;
}

auto server_handle::stop(stop_mode mode,
                         std::chrono::milliseconds grace) -> void
{
  using enum net::service::async_context::context_states;

  if (mode == stop_mode::graceful && running())
  {
    drain();
    spdlog::info("Draining {} active sessions.", active());

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (active() > 0 && std::chrono::steady_clock::now() < deadline)
      std::this_thread::sleep_for(DRAIN_INTERVAL);

    if (active() > 0)
      spdlog::warn("Aborting {} sessions after the grace period.", active());
  }

  auto service = std::unique_ptr<service_type>();
  {
    auto lock = std::lock_guard{mtx_};
    service = std::move(service_);
  }

  if (!service)
    return;

  if (service->state == STARTED)
  {
    service->signal(service->terminate);
    service->state.wait(STARTED);
  }

  // Destroying the server aborts the sessions that are still live.
  service.reset();
  control_->active = 0;
  spdlog::info("TFTP server stopped.");
}

auto start_server(const server_config &config, event_sink sink,
                  std::error_code &err) -> std::unique_ptr<server_handle>
{
  using enum net::service::async_context::context_states;
  using namespace io::socket;

  auto root = filesystem::canonical_root(config.root, err);
  if (err)
  {
    spdlog::error("Invalid root directory {}: {}", config.root.c_str(),
                  err.message());
    return {};
  }

  if (!filesystem::is_writable(root))
    spdlog::warn("Root directory {} is not writable.", root.c_str());

  auto handle = std::make_unique<server_handle>();
  handle->service_ = std::make_unique<server_handle::service_type>();
  auto &service = *handle->service_;

  const auto host = std::string(config.address);
  auto addr_v4 = socket_address<sockaddr_in>{};
  auto addr_v6 = socket_address<sockaddr_in6>{};
  if (inet_pton(AF_INET, host.c_str(), &addr_v4->sin_addr) == 1)
  {
    addr_v4->sin_family = AF_INET;
    addr_v4->sin_port = htons(config.port);
    service.start(addr_v4, root, config.session, handle->control_,
                  std::move(sink));
  }
  else if (inet_pton(AF_INET6, host.c_str(), &addr_v6->sin6_addr) == 1)
  {
    addr_v6->sin6_family = AF_INET6;
    addr_v6->sin6_port = htons(config.port);
    service.start(addr_v6, root, config.session, handle->control_,
                  std::move(sink));
  }
  else
  {
    err = std::make_error_code(std::errc::invalid_argument);
    spdlog::error("Invalid listen address {}.", config.address);
    handle->service_.reset();
    return {};
  }

  service.state.wait(PENDING);
  if (service.state != STARTED)
  {
    err = std::make_error_code(std::errc::address_not_available);
    spdlog::error("Unable to listen on {} port {}.", config.address,
                  config.port);
    handle->service_.reset();
    return {};
  }

  spdlog::info("TFTP server serving {} on {} port {}.", root.c_str(),
               config.address, config.port);
  return handle;
}

auto stop_server(server_handle &handle, stop_mode mode,
                 std::chrono::milliseconds grace) -> void
{
  handle.stop(mode, grace);
}

auto upload_file(std::string_view host, const std::filesystem::path &local,
                 std::string_view remote, const client_config &config,
                 event_sink sink, messages::mode_t mode) -> transfer_result
{
  auto driver = client(config, std::move(sink));
  return driver.upload(host, local, remote, mode);
}

auto download_file(std::string_view host, std::string_view remote,
                   const std::filesystem::path &local,
                   const client_config &config, event_sink sink,
                   messages::mode_t mode) -> transfer_result
{
  auto driver = client(config, std::move(sink));
  return driver.download(host, remote, local, mode);
}

} // namespace tftpkit
