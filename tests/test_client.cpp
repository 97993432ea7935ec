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
#include "test_peer.hpp"
#include "tftpkit/tftpkit.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace tftpkit;

static inline auto test_counter = std::atomic<std::uint16_t>();
class TftpClientTests : public ::testing::Test {
protected:
  static constexpr std::uint16_t PORT = 16970;

  auto SetUp() -> void override
  {
    dir = std::filesystem::temp_directory_path() /
          std::format("tftpkit.client.{}.{:05d}", ::getpid(), test_counter++);
    std::filesystem::create_directories(dir / "root");
    std::filesystem::create_directories(dir / "local");
    dir = std::filesystem::canonical(dir);

    auto config = server_config{
        .address = "127.0.0.1",
        .port = PORT,
        .root = dir / "root",
        .session = {.timeout = std::chrono::milliseconds(200)}};
    auto err = std::error_code();
    handle = start_server(config, {}, err);
    ASSERT_FALSE(err);
    ASSERT_TRUE(handle);
    ASSERT_TRUE(handle->running());

    client_conf.port = PORT;
    client_conf.session.timeout = std::chrono::milliseconds(200);
  }

  auto TearDown() -> void override
  {
    if (handle)
      stop_server(*handle);

    auto err = std::error_code();
    std::filesystem::remove_all(dir, err);
  }

  static auto write_file(const std::filesystem::path &path,
                         const std::string &content) -> void
  {
    std::ofstream(path, std::ios::binary) << content;
  }

  static auto read_file(const std::filesystem::path &path) -> std::string
  {
    auto file = std::ifstream(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(file), {}};
  }

  static auto random_content(std::size_t len) -> std::string
  {
    auto rng = std::mt19937(static_cast<unsigned>(len));
    auto octet = std::uniform_int_distribution<int>(0, 255);
    auto content = std::string(len, '\0');
    for (auto &chr : content)
      chr = static_cast<char>(octet(rng));
    return content;
  }

  std::filesystem::path dir;
  std::unique_ptr<server_handle> handle;
  client_config client_conf;
};

TEST_F(TftpClientTests, UploadSmallFile)
{
  using enum transfer_event::kind_t;
  write_file(dir / "local" / "hello.txt", "0123456789");

  auto kinds = std::vector<transfer_event::kind_t>();
  auto result = upload_file(
      "127.0.0.1", dir / "local" / "hello.txt", "hello.txt", client_conf,
      [&](const transfer_event &event) { kinds.push_back(event.kind); });

  ASSERT_TRUE(result) << result.reason;
  EXPECT_EQ(result.statistics.blocks, 1U);
  EXPECT_EQ(result.statistics.bytes, 10U);
  EXPECT_EQ(result.block_num, 1);
  EXPECT_EQ(kinds, (std::vector{SESSION_STARTED, BLOCK_TRANSFERRED,
                                SESSION_COMPLETED}));

  for (int i = 0; i < 100 && handle->active() > 0; ++i)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  EXPECT_EQ(read_file(dir / "root" / "hello.txt"), "0123456789");
}

TEST_F(TftpClientTests, DownloadMultipleBlocks)
{
  const auto content = random_content(1500);
  write_file(dir / "root" / "image.bin", content);

  auto result = download_file("127.0.0.1", "image.bin",
                              dir / "local" / "image.bin", client_conf);

  ASSERT_TRUE(result) << result.reason;
  EXPECT_EQ(result.statistics.blocks, 3U);
  EXPECT_EQ(read_file(dir / "local" / "image.bin"), content);
}

TEST_F(TftpClientTests, DownloadExactMultipleOfBlockSize)
{
  const auto content = random_content(2 * messages::DATALEN);
  write_file(dir / "root" / "exact.bin", content);

  auto result = download_file("127.0.0.1", "exact.bin",
                              dir / "local" / "exact.bin", client_conf);

  ASSERT_TRUE(result) << result.reason;
  EXPECT_EQ(result.statistics.blocks, 3U);
  EXPECT_EQ(result.statistics.bytes, 2 * messages::DATALEN);
  EXPECT_EQ(read_file(dir / "local" / "exact.bin"), content);
}

TEST_F(TftpClientTests, DownloadMissingFile)
{
  auto result = download_file("127.0.0.1", "missing.txt",
                              dir / "local" / "missing.txt", client_conf);

  EXPECT_FALSE(result);
  EXPECT_EQ(result.error, transfer_errc::file_not_found);
  EXPECT_EQ(result.reason, "File not found (code 1)");
  EXPECT_FALSE(std::filesystem::exists(dir / "local" / "missing.txt"));
}

TEST_F(TftpClientTests, NetasciiRoundTrip)
{
  write_file(dir / "local" / "motd.txt", "line one\nline two\r\n");

  auto result = upload_file("127.0.0.1", dir / "local" / "motd.txt",
                            "motd.txt", client_conf, {}, messages::NETASCII);
  ASSERT_TRUE(result) << result.reason;
  // The wire carries CR LF for every LF and CR NUL for the bare CR.
  EXPECT_EQ(result.statistics.bytes, 22U);

  result = download_file("127.0.0.1", "motd.txt", dir / "local" / "copy.txt",
                         client_conf, {}, messages::NETASCII);
  ASSERT_TRUE(result) << result.reason;
  EXPECT_EQ(read_file(dir / "local" / "copy.txt"), "line one\nline two\r\n");
}

TEST_F(TftpClientTests, UploadMissingLocalFile)
{
  auto result = upload_file("127.0.0.1", dir / "local" / "missing.txt",
                            "missing.txt", client_conf);

  EXPECT_EQ(result.error, transfer_errc::file_not_found);
  EXPECT_FALSE(std::filesystem::exists(dir / "root" / "missing.txt"));
}

TEST_F(TftpClientTests, UnknownHost)
{
  auto result = download_file("no such host.invalid", "hello.txt",
                              dir / "local" / "hello.txt", client_conf);

  EXPECT_EQ(result.error, std::errc::invalid_argument);
  EXPECT_EQ(result.reason, "Unknown host: no such host.invalid");
}

TEST_F(TftpClientTests, SilentServerTimesOut)
{
  auto conf = client_conf;
  conf.port = PORT + 1;
  conf.session = {.timeout = std::chrono::milliseconds(20), .max_retries = 3};

  auto result =
      download_file("127.0.0.1", "hello.txt", dir / "local" / "hello.txt", conf);

  EXPECT_EQ(result.error, transfer_errc::timeout);
  EXPECT_EQ(result.statistics.retransmits, 2U);
}

TEST_F(TftpClientTests, StrayDatagramsDoNotLockTransferId)
{
  constexpr std::uint16_t SCRIPTED = PORT + 2;
  auto listener = test_peer();
  ASSERT_TRUE(listener.bind("127.0.0.1", SCRIPTED));

  auto conf = client_conf;
  conf.port = SCRIPTED;
  auto result = transfer_result();
  auto worker = std::thread([&] {
    result = download_file("127.0.0.1", "hello.txt",
                           dir / "local" / "hello.txt", conf);
  });

  auto request = listener.receive();
  ASSERT_TRUE(request);
  const auto client_addr = request->second;

  // Garbage from another port on the server host.
  auto garbage = test_peer();
  garbage.send_raw({'\xff', '\xff'}, client_addr);

  // A well-formed packet from a different host.
  auto stranger = test_peer();
  ASSERT_TRUE(stranger.bind("127.0.0.2", 0));
  stranger.send(packets::data{.block_num = 1, .payload = {'b', 'a', 'd'}},
                client_addr);

  auto tid = test_peer();
  tid.send(packets::data{.block_num = 1, .payload = {'o', 'k'}}, client_addr);
  auto ack = tid.receive();
  worker.join();

  ASSERT_TRUE(ack);
  EXPECT_EQ(std::get<packets::ack>(ack->first).block_num, 1);
  ASSERT_TRUE(result) << result.reason;
  EXPECT_EQ(read_file(dir / "local" / "hello.txt"), "ok");
}

TEST_F(TftpClientTests, CancelBeforeTransferAbortsIt)
{
  write_file(dir / "root" / "hello.txt", "hello");
  auto tftp = client(client_conf);

  tftp.cancel();
  auto result =
      tftp.download("127.0.0.1", "hello.txt", dir / "local" / "hello.txt");
  EXPECT_EQ(result.error, transfer_errc::aborted);

  result = tftp.download("127.0.0.1", "hello.txt", dir / "local" / "hello.txt");
  ASSERT_TRUE(result) << result.reason;
  EXPECT_EQ(read_file(dir / "local" / "hello.txt"), "hello");
}

TEST_F(TftpClientTests, GracefulStopWaitsForIdleServer)
{
  EXPECT_FALSE(handle->draining());
  stop_server(*handle, stop_mode::graceful, std::chrono::milliseconds(100));

  EXPECT_FALSE(handle->running());
  EXPECT_TRUE(handle->wait_for(std::chrono::milliseconds(0)));
  EXPECT_EQ(handle->active(), 0U);
}

TEST(TftpServerStartTests, InvalidRootIsRejected)
{
  auto err = std::error_code();
  auto handle = start_server(server_config{.address = "127.0.0.1",
                                           .port = 16971,
                                           .root = "/nonexistent/tftp"},
                             {}, err);

  EXPECT_FALSE(handle);
  EXPECT_EQ(err, std::errc::no_such_file_or_directory);
}

TEST(TftpServerStartTests, InvalidAddressIsRejected)
{
  auto err = std::error_code();
  auto handle = start_server(
      server_config{.address = "not-an-address", .port = 16971, .root = "/tmp"},
      {}, err);

  EXPECT_FALSE(handle);
  EXPECT_EQ(err, std::errc::invalid_argument);
}
// NOLINTEND
