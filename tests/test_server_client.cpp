/*
 * Copyright (C) 2025 Dan Arrhenius <dan@ultramarin.se>
 *
 * This file is part of libtftpio
 *
 * libtftpio is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <tftpio.hpp>
#include "test_util.hpp"
#include <memory>
#include <thread>
#include <chrono>
#include <atomic>
#include <arpa/inet.h>


using namespace tftpio;
using tftpio::test::temp_dir;
using tftpio::test::make_content;
using tftpio::test::write_file;
using tftpio::test::read_file;
using tftpio::test::file_exists;
using std::chrono::milliseconds;


//
// A server on 127.0.0.1 with an ephemeral port, serving files
// from a temporary directory, and a client talking to it.
//
class server_client_test : public ::testing::Test {
protected:
    server_client_test ()
    {
        srv_cfg.bind_addr = ip_addr ((uint32_t)INADDR_LOOPBACK, 0);
        srv_cfg.session.timeout = 500;
        cli_cfg.session.timeout = 500;
        cli_cfg.receive_dir = client_dir.path ();
    }

    ~server_client_test ()
    {
        if (srv)
            srv->stop ();
    }

    void start_server () {
        files = std::make_shared<directory_provider> (server_dir.path(), "", "", overwrite);
        srv.reset (new server(srv_cfg, files));
        ASSERT_EQ (0, srv->start());
        cli_cfg.port = srv->addr().port ();
    }

    // Wait until the server has the expected number of live sessions
    bool wait_sessions (size_t num, unsigned timeout=2000) {
        auto deadline = std::chrono::steady_clock::now() + milliseconds(timeout);
        while (srv->num_sessions() != num) {
            if (std::chrono::steady_clock::now() > deadline)
                return false;
            std::this_thread::sleep_for (milliseconds(10));
        }
        return true;
    }

    // Raw socket playing a client
    struct raw_client {
        raw_client () {
            tr.open (ip_addr((uint32_t)INADDR_LOOPBACK, 0));
        }
        void send (const packet& pkt, const ip_addr& to) {
            auto buf = pkt.encode ();
            tr.send (buf.data(), buf.size(), to);
        }
        bool recv (packet& pkt, ip_addr& from, unsigned timeout=2000) {
            std::vector<char> buf (max_blksize + tftp_header_size);
            auto result = tr.receive (buf.data(), buf.size(), from, timeout);
            return result >= 0 && pkt.parse (buf.data(), (size_t)result);
        }
        udp_transport tr;
    };

    temp_dir server_dir;
    temp_dir client_dir;
    bool overwrite = false;
    server_config_t srv_cfg;
    client_config_t cli_cfg;
    std::shared_ptr<directory_provider> files;
    std::unique_ptr<server> srv;
};


TEST_F (server_client_test, download)
{
    auto content = make_content (100000);
    ASSERT_TRUE (write_file(server_dir.file("image.bin"), content));
    start_server ();

    client cli (cli_cfg);
    auto result = cli.download ("127.0.0.1", "image.bin");
    ASSERT_TRUE (result.ok()) << result.message;
    EXPECT_EQ (100000u, result.bytes);

    std::vector<char> received;
    ASSERT_TRUE (read_file(client_dir.file("image.bin"), received));
    EXPECT_EQ (content, received);
}


TEST_F (server_client_test, download_with_options)
{
    auto content = make_content (250000, 2);
    ASSERT_TRUE (write_file(server_dir.file("big.bin"), content));
    start_server ();

    cli_cfg.wanted.blksize = 1428;
    cli_cfg.wanted.windowsize = 16;
    client cli (cli_cfg);
    auto result = cli.download ("127.0.0.1", "big.bin", "copy.bin");
    ASSERT_TRUE (result.ok()) << result.message;

    std::vector<char> received;
    ASSERT_TRUE (read_file(client_dir.file("copy.bin"), received));
    EXPECT_EQ (content, received);
}


TEST_F (server_client_test, download_empty_file)
{
    ASSERT_TRUE (write_file(server_dir.file("empty"), std::vector<char>()));
    start_server ();

    client cli (cli_cfg);
    auto result = cli.download ("127.0.0.1", "empty");
    ASSERT_TRUE (result.ok()) << result.message;
    EXPECT_EQ (0u, result.bytes);
    EXPECT_TRUE (file_exists(client_dir.file("empty")));
}


TEST_F (server_client_test, download_missing_file)
{
    start_server ();

    client cli (cli_cfg);
    auto result = cli.download ("127.0.0.1", "missing.bin");
    EXPECT_EQ (error_kind_t::peer_error, result.error);
    EXPECT_EQ (err_file_not_found, result.tftp_code);
    EXPECT_FALSE (file_exists(client_dir.file("missing.bin")));
}


TEST_F (server_client_test, download_outside_root_is_denied)
{
    start_server ();

    client cli (cli_cfg);
    auto result = cli.download ("127.0.0.1", "../etc/passwd", "passwd");
    EXPECT_EQ (error_kind_t::peer_error, result.error);
    EXPECT_EQ (err_access_violation, result.tftp_code);
}


TEST_F (server_client_test, upload)
{
    auto content = make_content (70000, 3);
    ASSERT_TRUE (write_file(client_dir.file("local.bin"), content));
    srv_cfg.allow_write = true;
    start_server ();

    cli_cfg.wanted.windowsize = 4;
    client cli (cli_cfg);
    auto result = cli.upload ("127.0.0.1", client_dir.file("local.bin"));
    ASSERT_TRUE (result.ok()) << result.message;
    EXPECT_EQ (70000u, result.bytes);

    // The server session may still be closing the file
    ASSERT_TRUE (wait_sessions(0));
    std::vector<char> stored;
    ASSERT_TRUE (read_file(server_dir.file("local.bin"), stored));
    EXPECT_EQ (content, stored);
}


TEST_F (server_client_test, upload_refused_when_read_only)
{
    ASSERT_TRUE (write_file(client_dir.file("local.bin"), make_content(100)));
    start_server ();

    client cli (cli_cfg);
    auto result = cli.upload ("127.0.0.1", client_dir.file("local.bin"), "remote.bin");
    EXPECT_EQ (error_kind_t::peer_error, result.error);
    EXPECT_EQ (err_access_violation, result.tftp_code);
    EXPECT_FALSE (file_exists(server_dir.file("remote.bin")));
}


TEST_F (server_client_test, upload_existing_file)
{
    ASSERT_TRUE (write_file(client_dir.file("local.bin"), make_content(100)));
    ASSERT_TRUE (write_file(server_dir.file("remote.bin"), make_content(10)));
    srv_cfg.allow_write = true;
    start_server ();

    client cli (cli_cfg);
    auto result = cli.upload ("127.0.0.1", client_dir.file("local.bin"), "remote.bin");
    EXPECT_EQ (error_kind_t::peer_error, result.error);
    EXPECT_EQ (err_file_exists, result.tftp_code);
}


TEST_F (server_client_test, upload_over_size_limit)
{
    ASSERT_TRUE (write_file(client_dir.file("local.bin"), make_content(5000)));
    srv_cfg.allow_write = true;
    srv_cfg.policy.max_write_size = 1000;
    srv_cfg.session.max_write_size = 1000;
    start_server ();

    // Refused up front from the declared tsize
    client cli (cli_cfg);
    auto result = cli.upload ("127.0.0.1", client_dir.file("local.bin"), "a.bin");
    EXPECT_EQ (error_kind_t::peer_error, result.error);
    EXPECT_EQ (err_disk_full, result.tftp_code);

    // Without options the limit is hit during the transfer
    cli_cfg.use_options = false;
    client plain (cli_cfg);
    result = plain.upload ("127.0.0.1", client_dir.file("local.bin"), "b.bin");
    EXPECT_EQ (error_kind_t::peer_error, result.error);
    EXPECT_EQ (err_disk_full, result.tftp_code);

    ASSERT_TRUE (wait_sessions(0));
    EXPECT_FALSE (file_exists(server_dir.file("a.bin")));
    EXPECT_FALSE (file_exists(server_dir.file("b.bin")));
}


TEST_F (server_client_test, rollover_to_zero)
{
    // More than 65535 blocks of 8 bytes
    auto content = make_content (65540 * 8 + 3, 4);
    ASSERT_TRUE (write_file(server_dir.file("long.bin"), content));
    start_server ();

    cli_cfg.wanted.blksize = 8;
    cli_cfg.wanted.windowsize = 64;
    client cli (cli_cfg);
    auto result = cli.download ("127.0.0.1", "long.bin");
    ASSERT_TRUE (result.ok()) << result.message;

    std::vector<char> received;
    ASSERT_TRUE (read_file(client_dir.file("long.bin"), received));
    EXPECT_EQ (content, received);
}


TEST_F (server_client_test, rollover_to_one)
{
    auto content = make_content (65540 * 8, 5);
    ASSERT_TRUE (write_file(client_dir.file("long.bin"), content));
    srv_cfg.allow_write = true;
    srv_cfg.session.rollover = rollover_enforce1;
    start_server ();

    cli_cfg.wanted.blksize = 8;
    cli_cfg.wanted.windowsize = 64;
    cli_cfg.session.rollover = rollover_enforce1;
    client cli (cli_cfg);
    auto result = cli.upload ("127.0.0.1", client_dir.file("long.bin"));
    ASSERT_TRUE (result.ok()) << result.message;

    ASSERT_TRUE (wait_sessions(0));
    std::vector<char> stored;
    ASSERT_TRUE (read_file(server_dir.file("long.bin"), stored));
    EXPECT_EQ (content, stored);
}


TEST_F (server_client_test, single_port)
{
    auto content = make_content (30000, 6);
    ASSERT_TRUE (write_file(server_dir.file("file.bin"), content));
    srv_cfg.single_port = true;
    start_server ();

    // All replies come from the request port
    raw_client raw;
    raw.send (packet::rrq("file.bin", "octet"), srv->addr());
    packet pkt;
    ip_addr from;
    ASSERT_TRUE (raw.recv(pkt, from));
    EXPECT_EQ (op_data, pkt.opcode);
    EXPECT_EQ (srv->addr().port(), from.port());
    raw.send (packet::error(err_undefined, "Done"), from);

    cli_cfg.wanted.windowsize = 8;
    client cli (cli_cfg);
    auto result = cli.download ("127.0.0.1", "file.bin");
    ASSERT_TRUE (result.ok()) << result.message;

    std::vector<char> received;
    ASSERT_TRUE (read_file(client_dir.file("file.bin"), received));
    EXPECT_EQ (content, received);
}


TEST_F (server_client_test, duplicate_request_is_ignored)
{
    ASSERT_TRUE (write_file(server_dir.file("file.bin"), make_content(2000)));
    srv_cfg.session.timeout = 2000;
    start_server ();

    raw_client raw;
    raw.send (packet::rrq("file.bin", "octet"), srv->addr());
    packet pkt;
    ip_addr session_addr;
    ASSERT_TRUE (raw.recv(pkt, session_addr));
    EXPECT_EQ (op_data, pkt.opcode);
    EXPECT_NE (srv->addr().port(), session_addr.port());
    ASSERT_TRUE (wait_sessions(1));

    // A retransmitted request doesn't start a second session
    raw.send (packet::rrq("file.bin", "octet"), srv->addr());
    ip_addr from;
    EXPECT_FALSE (raw.recv(pkt, from, 300));
    EXPECT_EQ (1u, srv->num_sessions());

    raw.send (packet::error(err_undefined, "Done"), session_addr);
    EXPECT_TRUE (wait_sessions(0));
}


TEST_F (server_client_test, max_clients)
{
    ASSERT_TRUE (write_file(server_dir.file("file.bin"), make_content(2000)));
    srv_cfg.max_clients = 1;
    srv_cfg.session.timeout = 2000;
    start_server ();

    raw_client first;
    first.send (packet::rrq("file.bin", "octet"), srv->addr());
    packet pkt;
    ip_addr session_addr;
    ASSERT_TRUE (first.recv(pkt, session_addr));
    ASSERT_TRUE (wait_sessions(1));

    raw_client second;
    second.send (packet::rrq("file.bin", "octet"), srv->addr());
    ip_addr from;
    ASSERT_TRUE (second.recv(pkt, from));
    EXPECT_EQ (op_error, pkt.opcode);
    EXPECT_EQ (err_undefined, pkt.error_code);
    EXPECT_EQ ("Server busy", pkt.message);

    first.send (packet::error(err_undefined, "Done"), session_addr);
    ASSERT_TRUE (wait_sessions(0));
}


TEST_F (server_client_test, invalid_requests)
{
    start_server ();
    raw_client raw;
    packet pkt;
    ip_addr from;

    // Not a request
    raw.send (packet::ack(1), srv->addr());
    ASSERT_TRUE (raw.recv(pkt, from));
    EXPECT_EQ (op_error, pkt.opcode);
    EXPECT_EQ (err_illegal_op, pkt.error_code);

    // Unsupported mode
    raw.send (packet::rrq("file.bin", "mail"), srv->addr());
    ASSERT_TRUE (raw.recv(pkt, from));
    EXPECT_EQ (op_error, pkt.opcode);
    EXPECT_EQ (err_illegal_op, pkt.error_code);

    // ERROR from an unknown peer and malformed datagrams are ignored
    raw.send (packet::error(err_undefined, "Hello"), srv->addr());
    char junk[] = {0, 9, 1, 2};
    raw.tr.send (junk, sizeof(junk), srv->addr());
    EXPECT_FALSE (raw.recv(pkt, from, 300));
}


TEST_F (server_client_test, stop_cancels_sessions)
{
    ASSERT_TRUE (write_file(server_dir.file("file.bin"), make_content(2000)));
    srv_cfg.session.timeout = 5000;
    std::atomic_int num_failed {0};
    srv_cfg.session.observer = [&num_failed](const session&, session_event_t event, const transfer_result_t& result) {
        if (event == event_failed && result.error == error_kind_t::cancelled)
            ++num_failed;
    };
    start_server ();

    raw_client raw;
    raw.send (packet::rrq("file.bin", "octet"), srv->addr());
    packet pkt;
    ip_addr from;
    ASSERT_TRUE (raw.recv(pkt, from));
    ASSERT_TRUE (wait_sessions(1));

    auto start = std::chrono::steady_clock::now ();
    srv->stop ();
    EXPECT_LT (std::chrono::steady_clock::now() - start, milliseconds(2000));
    EXPECT_EQ (0u, srv->num_sessions());
    EXPECT_EQ (1, num_failed.load());
}


TEST_F (server_client_test, upload_survives_lost_final_ack)
{
    auto content = make_content (1000, 9);
    ASSERT_TRUE (write_file(client_dir.file("local.bin"), content));
    srv_cfg.allow_write = true;
    srv_cfg.drop_filter = []() -> drop_filter_t {
        auto dropped = std::make_shared<bool> (false);
        return [dropped](direction_t dir, const void* buf, size_t size) {
            packet pkt;
            if (*dropped || dir != dir_outgoing || !pkt.parse(buf, size))
                return false;
            if (pkt.opcode == op_ack && pkt.block == 2) {
                *dropped = true;
                return true;
            }
            return false;
        };
    };
    start_server ();

    client cli (cli_cfg);
    auto result = cli.upload ("127.0.0.1", client_dir.file("local.bin"));
    ASSERT_TRUE (result.ok()) << result.message;
    EXPECT_EQ (1000u, result.bytes);

    ASSERT_TRUE (wait_sessions(0, 5000));
    std::vector<char> stored;
    ASSERT_TRUE (read_file(server_dir.file("local.bin"), stored));
    EXPECT_EQ (content, stored);
}


TEST_F (server_client_test, lossy_download)
{
    auto content = make_content (40000, 7);
    ASSERT_TRUE (write_file(server_dir.file("file.bin"), content));
    srv_cfg.session.timeout = 100;
    srv_cfg.session.max_retries = 30;
    auto seed = std::make_shared<std::atomic_uint> (1);
    srv_cfg.drop_filter = [seed]() {
        return drop_random (0.1, (*seed)++);
    };
    start_server ();

    cli_cfg.session.timeout = 100;
    cli_cfg.session.max_retries = 30;
    cli_cfg.session.linger = 1000;
    cli_cfg.wanted.windowsize = 4;
    cli_cfg.drop_filter = drop_random (0.1, 1234);
    client cli (cli_cfg);
    auto result = cli.download ("127.0.0.1", "file.bin");
    ASSERT_TRUE (result.ok()) << result.message;

    std::vector<char> received;
    ASSERT_TRUE (read_file(client_dir.file("file.bin"), received));
    EXPECT_EQ (content, received);
}


TEST_F (server_client_test, lossy_upload)
{
    auto content = make_content (40000, 8);
    ASSERT_TRUE (write_file(client_dir.file("local.bin"), content));
    srv_cfg.allow_write = true;
    srv_cfg.session.timeout = 100;
    srv_cfg.session.max_retries = 30;
    srv_cfg.session.linger = 1000;
    auto seed = std::make_shared<std::atomic_uint> (10);
    srv_cfg.drop_filter = [seed]() {
        return drop_random (0.1, (*seed)++);
    };
    start_server ();

    cli_cfg.session.timeout = 100;
    cli_cfg.session.max_retries = 30;
    cli_cfg.wanted.windowsize = 4;
    cli_cfg.drop_filter = drop_random (0.1, 4321);
    client cli (cli_cfg);
    auto result = cli.upload ("127.0.0.1", client_dir.file("local.bin"));
    ASSERT_TRUE (result.ok()) << result.message;

    ASSERT_TRUE (wait_sessions(0, 5000));
    std::vector<char> stored;
    ASSERT_TRUE (read_file(server_dir.file("local.bin"), stored));
    EXPECT_EQ (content, stored);
}


TEST_F (server_client_test, cancel_before_transfer_starts)
{
    ASSERT_TRUE (write_file(server_dir.file("file.bin"), make_content(100)));
    ASSERT_TRUE (write_file(client_dir.file("local.bin"), make_content(100)));
    srv_cfg.allow_write = true;
    start_server ();

    client cli (cli_cfg);
    cli.cancel ();

    auto result = cli.download ("127.0.0.1", "file.bin");
    EXPECT_EQ (transfer_state_t::failed, result.state);
    EXPECT_EQ (error_kind_t::cancelled, result.error);
    EXPECT_FALSE (file_exists(client_dir.file("file.bin")));

    result = cli.upload ("127.0.0.1", client_dir.file("local.bin"));
    EXPECT_EQ (error_kind_t::cancelled, result.error);

    // No request reached the server
    std::this_thread::sleep_for (milliseconds(100));
    EXPECT_EQ (0u, srv->num_sessions());
    EXPECT_FALSE (file_exists(server_dir.file("local.bin")));
}


TEST_F (server_client_test, local_path)
{
    cli_cfg.receive_dir = "/tmp/downloads";
    client cli (cli_cfg);
    EXPECT_EQ ("/tmp/downloads/file.bin", cli.local_path("boot/file.bin", ""));
    EXPECT_EQ ("/tmp/downloads/copy.bin", cli.local_path("boot/file.bin", "copy.bin"));
    EXPECT_EQ ("/var/copy.bin", cli.local_path("boot/file.bin", "/var/copy.bin"));
    EXPECT_EQ ("file.bin", base_name("a/b/file.bin"));
}
