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
#include "test_session_fixture.hpp"
#include "tftpkit/error.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST_F(SessionTests, ServerReadSendsFirstBlockImmediately)
{
  using enum transfer_event::kind_t;
  auto path = write_file("hello.txt", "0123456789");
  auto &transfer = make_sender(session::SERVER, path);

  const auto before = transport::clock::now();
  transfer.start();

  EXPECT_EQ(transfer.state(), session::SENDING);
  ASSERT_EQ(io->sent.size(), 1U);
  EXPECT_EQ(std::get<packets::data>(io->last()),
            (packets::data{.block_num = 1,
                           .payload = {'0', '1', '2', '3', '4', '5', '6', '7',
                                       '8', '9'}}));
  ASSERT_TRUE(io->deadline);
  EXPECT_GE(*io->deadline, before + options.timeout);

  transfer.on_packet(ack(1));
  EXPECT_EQ(transfer.state(), session::COMPLETED);
  EXPECT_TRUE(transfer.done());
  EXPECT_FALSE(transfer.error());
  EXPECT_TRUE(io->cancelled);
  EXPECT_FALSE(io->deadline);
  EXPECT_EQ(io->sent.size(), 1U);

  EXPECT_EQ(transfer.statistics().bytes, 10U);
  EXPECT_EQ(transfer.statistics().blocks, 1U);
  EXPECT_EQ(events, (std::vector{SESSION_STARTED, BLOCK_TRANSFERRED,
                                 SESSION_COMPLETED}));
}

TEST_F(SessionTests, ServerWriteStoresSingleShortBlock)
{
  using enum transfer_event::kind_t;
  auto path = dir / "hello.txt";
  auto &transfer = make_receiver(session::SERVER, path);

  transfer.start();
  EXPECT_EQ(transfer.state(), session::RECEIVING);
  EXPECT_EQ(std::get<packets::ack>(io->last()).block_num, 0);

  auto payload = std::vector<char>{'h', 'e', 'l', 'l', 'o', ' ', 't', 'f', 't', 'p'};
  transfer.on_packet(data(1, payload));

  EXPECT_EQ(transfer.state(), session::COMPLETED);
  ASSERT_EQ(io->sent.size(), 2U);
  EXPECT_EQ(std::get<packets::ack>(io->last()).block_num, 1);
  EXPECT_EQ(transfer.block_num(), 1);
  EXPECT_EQ(read_file(path), "hello tftp");
  EXPECT_EQ(events, (std::vector{SESSION_STARTED, BLOCK_TRANSFERRED,
                                 SESSION_COMPLETED}));
}

TEST_F(SessionTests, DuplicateDataIsAcknowledgedNotWritten)
{
  auto path = dir / "dup.bin";
  auto &transfer = make_receiver(session::SERVER, path);
  transfer.start();

  transfer.on_packet(data(1, std::vector<char>(messages::DATALEN, 'a')));
  ASSERT_EQ(io->sent.size(), 2U);

  // The peer lost our ACK and sent block 1 again.
  transfer.on_packet(data(1, std::vector<char>(messages::DATALEN, 'a')));
  ASSERT_EQ(io->sent.size(), 3U);
  EXPECT_EQ(io->sent[2], io->sent[1]);
  EXPECT_EQ(transfer.statistics().duplicates, 1U);
  EXPECT_EQ(transfer.state(), session::RECEIVING);

  transfer.on_packet(data(2, {'e', 'n', 'd'}));
  EXPECT_EQ(transfer.state(), session::COMPLETED);
  EXPECT_EQ(read_file(path), std::string(messages::DATALEN, 'a') + "end");
  EXPECT_EQ(transfer.statistics().bytes, messages::DATALEN + 3);
}

TEST_F(SessionTests, OutOfOrderDataBeforeFirstBlockIsDropped)
{
  auto &transfer = make_receiver(session::CLIENT, dir / "early.bin");
  transfer.start();
  ASSERT_EQ(io->sent.size(), 1U);
  EXPECT_TRUE(std::holds_alternative<packets::read_request>(io->last()));

  transfer.on_packet(data(2, {'x'}));
  EXPECT_EQ(io->sent.size(), 1U);
  EXPECT_EQ(transfer.state(), session::RECEIVING);
  EXPECT_EQ(transfer.statistics().duplicates, 1U);
}

TEST_F(SessionTests, ExactMultipleEndsWithEmptyBlock)
{
  auto path = write_file("1k.bin", std::string(2 * messages::DATALEN, 'z'));
  auto &transfer = make_sender(session::SERVER, path);
  transfer.start();

  EXPECT_EQ(std::get<packets::data>(io->last()).payload.size(),
            messages::DATALEN);
  transfer.on_packet(ack(1));
  EXPECT_EQ(std::get<packets::data>(io->last()).payload.size(),
            messages::DATALEN);
  transfer.on_packet(ack(2));

  const auto last = std::get<packets::data>(io->last());
  EXPECT_EQ(last.block_num, 3);
  EXPECT_TRUE(last.payload.empty());
  EXPECT_EQ(transfer.state(), session::SENDING);

  transfer.on_packet(ack(3));
  EXPECT_EQ(transfer.state(), session::COMPLETED);
  EXPECT_EQ(transfer.statistics().blocks, 3U);
  EXPECT_EQ(transfer.statistics().bytes, 2 * messages::DATALEN);
}

TEST_F(SessionTests, ReceiverCompletesOnEmptyBlock)
{
  auto path = dir / "1k.bin";
  auto &transfer = make_receiver(session::CLIENT, path);
  transfer.start();

  transfer.on_packet(data(1, std::vector<char>(messages::DATALEN, 'q')));
  transfer.on_packet(data(2, std::vector<char>(messages::DATALEN, 'q')));
  EXPECT_EQ(transfer.state(), session::RECEIVING);

  transfer.on_packet(data(3));
  EXPECT_EQ(transfer.state(), session::COMPLETED);
  EXPECT_EQ(std::get<packets::ack>(io->last()).block_num, 3);
  EXPECT_EQ(std::filesystem::file_size(path), 2 * messages::DATALEN);
}

TEST_F(SessionTests, BlockNumbersWrapAround)
{
  auto file = std::make_unique<std::fstream>(
      "/dev/null", std::ios::out | std::ios::binary);
  auto &transfer = make(session::SERVER, session::DOWNLOAD, std::move(file));
  transfer.start();

  const auto block = std::vector<char>(messages::DATALEN, '\0');
  auto block_num = std::uint16_t{1};
  for (std::uint32_t i = 0; i < 65536; ++i, ++block_num)
  {
    transfer.on_packet(data(block_num, block));
    ASSERT_EQ(transfer.state(), session::RECEIVING);
    ASSERT_EQ(transfer.block_num(), block_num);
  }

  // Block 65535 was followed by block 0.
  EXPECT_EQ(block_num, 1);
  EXPECT_EQ(std::get<packets::ack>(io->last()).block_num, 0);
  EXPECT_EQ(transfer.statistics().duplicates, 0U);

  transfer.on_packet(data(block_num, {'!'}));
  EXPECT_EQ(transfer.state(), session::COMPLETED);
  EXPECT_EQ(std::get<packets::ack>(io->last()).block_num, 1);
  EXPECT_EQ(transfer.statistics().blocks, 65537U);
  EXPECT_EQ(transfer.statistics().bytes, 65536ULL * messages::DATALEN + 1);
}

TEST_F(SessionTests, TimeoutRetransmitsLastDataUnchanged)
{
  auto path = write_file("hello.txt", "0123456789");
  auto &transfer = make_sender(session::SERVER, path);
  transfer.start();
  ASSERT_EQ(io->sent.size(), 1U);

  // The client's ACK was lost.
  transfer.on_timeout();
  ASSERT_EQ(io->sent.size(), 2U);
  EXPECT_EQ(io->sent[1], io->sent[0]);
  EXPECT_EQ(transfer.retries(), 1U);
  EXPECT_EQ(transfer.statistics().retransmits, 1U);
  EXPECT_EQ(transfer.statistics().resent_bytes, 10U);
  EXPECT_TRUE(io->deadline);

  transfer.on_packet(ack(1));
  EXPECT_EQ(transfer.state(), session::COMPLETED);
  EXPECT_EQ(transfer.retries(), 0U);
  EXPECT_EQ(transfer.statistics().bytes, 10U);
  EXPECT_EQ(transfer.statistics().blocks, 1U);
}

TEST_F(SessionTests, RetransmittedDataIsNotWrittenTwice)
{
  auto path = dir / "retx.bin";
  auto &transfer = make_receiver(session::CLIENT, path);
  transfer.start();

  transfer.on_packet(data(1, std::vector<char>(messages::DATALEN, 'r')));
  const auto ack1 = io->sent.back();

  // Our ACK(1) was dropped, the server times out and resends DATA(1).
  transfer.on_packet(data(1, std::vector<char>(messages::DATALEN, 'r')));
  EXPECT_EQ(io->sent.back(), ack1);

  transfer.on_packet(data(2, {'s'}));
  EXPECT_EQ(transfer.state(), session::COMPLETED);
  EXPECT_EQ(read_file(path), std::string(messages::DATALEN, 'r') + "s");
}

TEST_F(SessionTests, ReceiverTimeoutResendsAck)
{
  auto &transfer = make_receiver(session::SERVER, dir / "slow.bin");
  transfer.start();

  transfer.on_timeout();
  ASSERT_EQ(io->sent.size(), 2U);
  EXPECT_EQ(std::get<packets::ack>(io->last()).block_num, 0);
  EXPECT_EQ(transfer.statistics().resent_bytes, 0U);
}

TEST_F(SessionTests, ConsecutiveTimeoutsFailTheSession)
{
  using enum transfer_event::kind_t;
  auto path = write_file("hello.txt", "0123456789");
  auto &transfer = make_sender(session::SERVER, path);
  transfer.start();

  for (unsigned i = 1; i < options.max_retries; ++i)
  {
    transfer.on_timeout();
    ASSERT_EQ(transfer.state(), session::SENDING);
    ASSERT_EQ(transfer.retries(), i);
  }

  transfer.on_timeout();
  EXPECT_EQ(transfer.state(), session::FAILED);
  EXPECT_EQ(transfer.error(), transfer_errc::timeout);
  EXPECT_EQ(transfer.statistics().retransmits, options.max_retries - 1);

  // DATA(1), the retransmissions and a final ERROR.
  ASSERT_EQ(io->sent.size(), options.max_retries + 1);
  const auto err = std::get<packets::error>(io->last());
  EXPECT_EQ(err.code, messages::NOT_DEFINED);
  EXPECT_EQ(err.message, "Timed out");
  EXPECT_FALSE(io->deadline);
  EXPECT_EQ(events.back(), SESSION_FAILED);

  transfer.on_timeout();
  EXPECT_EQ(io->sent.size(), options.max_retries + 1);
}

TEST_F(SessionTests, ProgressResetsRetries)
{
  auto path = write_file("big.bin", std::string(3 * messages::DATALEN, 'b'));
  auto &transfer = make_sender(session::SERVER, path);
  transfer.start();

  transfer.on_timeout();
  transfer.on_timeout();
  EXPECT_EQ(transfer.retries(), 2U);

  transfer.on_packet(ack(1));
  EXPECT_EQ(transfer.retries(), 0U);
  EXPECT_EQ(std::get<packets::data>(io->last()).block_num, 2);
}

TEST_F(SessionTests, StaleAcksAreIgnored)
{
  auto path = write_file("big.bin", std::string(2 * messages::DATALEN, 'b'));
  auto &transfer = make_sender(session::SERVER, path);
  transfer.start();
  transfer.on_packet(ack(1));
  ASSERT_EQ(io->sent.size(), 2U);

  transfer.on_packet(ack(1));
  transfer.on_packet(ack(0));
  transfer.on_packet(ack(9));
  EXPECT_EQ(io->sent.size(), 2U);
  EXPECT_EQ(transfer.state(), session::SENDING);
  EXPECT_EQ(transfer.statistics().duplicates, 3U);
}

TEST_F(SessionTests, ClientUploadWaitsForAckZero)
{
  auto path = write_file("hello.txt", "0123456789");
  auto &transfer = make_sender(session::CLIENT, path);
  transfer.start();

  EXPECT_EQ(transfer.state(), session::AWAITING_FIRST_ACK);
  EXPECT_EQ(std::get<packets::write_request>(io->last()),
            (packets::write_request{.filename = "test.bin", .mode = "octet"}));

  transfer.on_packet(ack(0));
  EXPECT_EQ(transfer.state(), session::SENDING);
  EXPECT_EQ(std::get<packets::data>(io->last()).block_num, 1);

  transfer.on_packet(ack(1));
  EXPECT_EQ(transfer.state(), session::COMPLETED);
  EXPECT_EQ(io->sent.size(), 2U);
}

TEST_F(SessionTests, ClientDownloadSendsReadRequest)
{
  auto &transfer =
      make_receiver(session::CLIENT, dir / "motd.txt", messages::NETASCII);
  transfer.start();

  EXPECT_EQ(std::get<packets::read_request>(io->last()),
            (packets::read_request{.filename = "test.bin",
                                   .mode = "netascii"}));
}

TEST_F(SessionTests, PeerErrorFailsWithoutReply)
{
  using enum transfer_event::kind_t;
  auto &transfer = make_receiver(session::CLIENT, dir / "missing.bin");
  transfer.start();

  transfer.on_packet(packets::error{.code = 1, .message = "File not found"});
  EXPECT_EQ(transfer.state(), session::FAILED);
  EXPECT_EQ(transfer.error(), transfer_errc::file_not_found);
  ASSERT_TRUE(transfer.peer_error());
  EXPECT_EQ(transfer.peer_error()->code, 1);
  EXPECT_EQ(transfer.peer_error()->message, "File not found");
  EXPECT_EQ(transfer.reason(), "File not found (code 1)");
  EXPECT_EQ(io->sent.size(), 1U);
  EXPECT_EQ(events, (std::vector{SESSION_STARTED, SESSION_FAILED}));

  // Terminal sessions ignore input.
  transfer.on_packet(data(1, {'x'}));
  EXPECT_EQ(io->sent.size(), 1U);
}

TEST_F(SessionTests, UndefinedPeerError)
{
  auto &transfer = make_receiver(session::CLIENT, dir / "x.bin");
  transfer.start();

  transfer.on_packet(packets::error{.code = 0, .message = "go away"});
  EXPECT_EQ(transfer.error(), transfer_errc::peer_reported_error);
  EXPECT_EQ(transfer.reason(), "go away (code 0)");
}

TEST_F(SessionTests, UnexpectedPacketsAreIllegal)
{
  auto path = write_file("hello.txt", "0123456789");
  auto &transfer = make_sender(session::SERVER, path);
  transfer.start();

  transfer.on_packet(data(1, {'x'}));
  EXPECT_EQ(transfer.state(), session::FAILED);
  EXPECT_EQ(transfer.error(), transfer_errc::illegal_operation);
  EXPECT_EQ(std::get<packets::error>(io->last()).code,
            messages::ILLEGAL_OPERATION);
}

TEST_F(SessionTests, RequestOnTransferIsIllegal)
{
  auto &transfer = make_receiver(session::SERVER, dir / "x.bin");
  transfer.start();

  transfer.on_packet(packets::write_request{.filename = "x.bin", .mode = "octet"});
  EXPECT_EQ(transfer.error(), transfer_errc::illegal_operation);
  EXPECT_EQ(std::get<packets::error>(io->last()).code,
            messages::ILLEGAL_OPERATION);
}

TEST_F(SessionTests, OpenErrorIsReportedToClient)
{
  auto &transfer = make(session::SERVER, session::UPLOAD, nullptr);
  transfer.start(std::make_error_code(std::errc::no_such_file_or_directory));

  EXPECT_EQ(transfer.state(), session::FAILED);
  EXPECT_EQ(transfer.error(), transfer_errc::file_not_found);
  ASSERT_EQ(io->sent.size(), 1U);
  const auto err = std::get<packets::error>(io->last());
  EXPECT_EQ(err.code, messages::FILE_NOT_FOUND);
  EXPECT_EQ(err.message, "File not found");
}

TEST_F(SessionTests, MissingFileIsAccessViolation)
{
  auto &transfer = make(session::SERVER, session::DOWNLOAD, nullptr);
  transfer.start();

  EXPECT_EQ(transfer.error(), transfer_errc::access_violation);
  EXPECT_EQ(std::get<packets::error>(io->last()).code,
            messages::ACCESS_VIOLATION);
}

TEST_F(SessionTests, ClientOpenErrorStaysLocal)
{
  auto &transfer = make(session::CLIENT, session::DOWNLOAD, nullptr);
  transfer.start(std::make_error_code(std::errc::permission_denied));

  EXPECT_EQ(transfer.error(), transfer_errc::access_violation);
  EXPECT_TRUE(io->sent.empty());
}

TEST_F(SessionTests, AbortReleasesTheSession)
{
  using enum transfer_event::kind_t;
  auto &transfer = make_receiver(session::SERVER, dir / "partial.bin");
  transfer.start();
  transfer.on_packet(data(1, std::vector<char>(messages::DATALEN, 'p')));

  transfer.abort();
  EXPECT_EQ(transfer.state(), session::ABORTED);
  EXPECT_EQ(transfer.error(), transfer_errc::aborted);
  EXPECT_TRUE(io->cancelled);
  EXPECT_EQ(io->sent.size(), 2U);
  EXPECT_EQ(events.back(), SESSION_FAILED);

  // The partial file is left on disk.
  EXPECT_EQ(std::filesystem::file_size(dir / "partial.bin"), messages::DATALEN);

  transfer.abort();
  EXPECT_EQ(events.size(), 3U);
}

TEST_F(SessionTests, NetasciiReceiveAcrossBlocks)
{
  auto path = dir / "motd.txt";
  auto &transfer = make_receiver(session::CLIENT, path, messages::NETASCII);
  transfer.start();

  auto first = std::vector<char>(messages::DATALEN - 1, 'a');
  first.push_back('\r');
  transfer.on_packet(data(1, first));

  transfer.on_packet(data(2, {'\n', 'b', '\r', '\0', 'c', '\r', '\n'}));
  EXPECT_EQ(transfer.state(), session::COMPLETED);
  EXPECT_EQ(read_file(path),
            std::string(messages::DATALEN - 1, 'a') + "\nb\rc\n");
}

TEST_F(SessionTests, NetasciiTrailingCarriageReturnIsKept)
{
  auto path = dir / "cr.txt";
  auto &transfer = make_receiver(session::CLIENT, path, messages::NETASCII);
  transfer.start();

  transfer.on_packet(data(1, {'x', '\r'}));
  EXPECT_EQ(transfer.state(), session::COMPLETED);
  EXPECT_EQ(read_file(path), "x\r");
}

TEST_F(SessionTests, NetasciiSend)
{
  auto path = write_file("motd.txt", "a\nb\rc");
  auto &transfer = make_sender(session::SERVER, path, messages::NETASCII);
  transfer.start();

  EXPECT_EQ(std::get<packets::data>(io->last()).payload,
            (std::vector<char>{'a', '\r', '\n', 'b', '\r', '\0', 'c'}));
  transfer.on_packet(ack(1));
  EXPECT_EQ(transfer.state(), session::COMPLETED);
}

TEST_F(SessionTests, NetasciiSendSplitsExpandedLines)
{
  auto path =
      write_file("lines.txt", std::string(messages::DATALEN - 1, 'l') + "\n");
  auto &transfer = make_sender(session::SERVER, path, messages::NETASCII);
  transfer.start();

  auto first = std::get<packets::data>(io->last());
  ASSERT_EQ(first.payload.size(), messages::DATALEN);
  EXPECT_EQ(first.payload.back(), '\r');

  transfer.on_packet(ack(1));
  auto second = std::get<packets::data>(io->last());
  EXPECT_EQ(second.block_num, 2);
  EXPECT_EQ(second.payload, std::vector<char>{'\n'});

  transfer.on_packet(ack(2));
  EXPECT_EQ(transfer.state(), session::COMPLETED);
}
// NOLINTEND
