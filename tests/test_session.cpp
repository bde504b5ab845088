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
#include <tftpio/session.hpp>
#include "test_util.hpp"
#include <future>
#include <chrono>
#include <vector>
#include <string>


using namespace tftpio;
using tftpio::test::memory_transport;
using tftpio::test::memory_source;
using tftpio::test::memory_sink;
using tftpio::test::make_content;
using std::chrono::milliseconds;


static option_list make_options (std::initializer_list<std::pair<const char*, const char*>> items)
{
    option_list options;
    for (auto& item : items)
        options.set (item.first, item.second);
    return options;
}


static std::vector<char> slice (const std::vector<char>& content, size_t offset, size_t size)
{
    return std::vector<char> (content.begin()+offset, content.begin()+offset+size);
}


//
// The session under test runs on a thread of its own with one end of
// an in-memory link. The test plays the peer on the other end.
//
class session_test : public ::testing::Test {
protected:
    session_test ()
        : sess_addr ((uint32_t)0x0a000001, 6969),
          peer_addr ((uint32_t)0x0a000002, 5555),
          sess_tr (sess_addr),
          peer_tr (peer_addr)
    {
        memory_transport::connect (sess_tr, peer_tr);
        cfg.timeout = 2000;
        // Receiving sessions end at the final ACK
        cfg.linger = 0;
    }

    // Wait for a packet with the expected opcode
    ::testing::AssertionResult expect (uint16_t opcode, packet& pkt, unsigned timeout=2000) {
        if (!peer_tr.recv_packet(pkt, timeout))
            return ::testing::AssertionFailure() << "No " << opcode_to_string(opcode) << " received";
        if (pkt.opcode != opcode)
            return ::testing::AssertionFailure() << "Expected " << opcode_to_string(opcode)
                                                 << ", got " << pkt.to_string();
        return ::testing::AssertionSuccess ();
    }

    ::testing::AssertionResult expect_data (uint16_t block, packet& pkt, unsigned timeout=2000) {
        auto result = expect (op_data, pkt, timeout);
        if (!result)
            return result;
        if (pkt.block != block)
            return ::testing::AssertionFailure() << "Expected DATA #" << block << ", got #" << pkt.block;
        return ::testing::AssertionSuccess ();
    }

    ::testing::AssertionResult expect_ack (uint16_t block, unsigned timeout=2000) {
        packet pkt;
        auto result = expect (op_ack, pkt, timeout);
        if (!result)
            return result;
        if (pkt.block != block)
            return ::testing::AssertionFailure() << "Expected ACK #" << block << ", got #" << pkt.block;
        return ::testing::AssertionSuccess ();
    }

    ::testing::AssertionResult expect_error (uint16_t code, unsigned timeout=2000) {
        packet pkt;
        auto result = expect (op_error, pkt, timeout);
        if (!result)
            return result;
        if (pkt.error_code != code)
            return ::testing::AssertionFailure() << "Expected ERROR " << code << ", got " << pkt.to_string();
        return ::testing::AssertionSuccess ();
    }

    bool nothing_sent (unsigned timeout=200) {
        packet pkt;
        return !peer_tr.recv_packet (pkt, timeout);
    }

    void send (const packet& pkt) {
        peer_tr.send_packet (pkt, sess_addr);
    }

    void send_data (uint16_t block, const std::vector<char>& payload) {
        send (packet::data(block, payload.data(), payload.size()));
    }

    std::future<transfer_result_t> serve_read (session& sess,
                                               data_source& src,
                                               const option_list& requested=option_list())
    {
        return std::async (std::launch::async, [this, &sess, &src, requested]{
                return sess.serve_read (peer_addr, "file.bin", src, requested, policy);
            });
    }

    std::future<transfer_result_t> serve_write (session& sess,
                                                data_sink& sink,
                                                const option_list& requested=option_list())
    {
        return std::async (std::launch::async, [this, &sess, &sink, requested]{
                return sess.serve_write (peer_addr, "file.bin", sink, requested, policy);
            });
    }

    // The client session sends its request to port 69 of the peer host,
    // the test answers from the peer's own port.
    ip_addr request_addr () const {
        ip_addr addr = peer_addr;
        addr.port (tftp_default_port);
        return addr;
    }

    ip_addr sess_addr;
    ip_addr peer_addr;
    memory_transport sess_tr;
    memory_transport peer_tr;
    session_config_t cfg;
    option_policy_t policy;
};


TEST_F (session_test, read_block_size_multiple_ends_with_empty_block)
{
    auto content = make_content (1024);
    memory_source src (content);
    session sess (sess_tr, cfg);
    auto result = serve_read (sess, src);

    packet pkt;
    ASSERT_TRUE (expect_data(1, pkt));
    EXPECT_EQ (slice(content, 0, 512), pkt.payload);
    send (packet::ack(1));

    ASSERT_TRUE (expect_data(2, pkt));
    EXPECT_EQ (slice(content, 512, 512), pkt.payload);
    send (packet::ack(2));

    ASSERT_TRUE (expect_data(3, pkt));
    EXPECT_TRUE (pkt.payload.empty());

    // Not complete until the empty block is acknowledged
    EXPECT_EQ (std::future_status::timeout, result.wait_for(milliseconds(100)));
    send (packet::ack(3));

    auto r = result.get ();
    EXPECT_TRUE (r.ok());
    EXPECT_EQ (transfer_state_t::completed, r.state);
    EXPECT_EQ (1024u, r.bytes);
    EXPECT_EQ (transfer_state_t::completed, sess.state());
}


TEST_F (session_test, retries_exhausted_without_error_packet)
{
    cfg.max_retries = 3;
    cfg.timeout = 50;
    memory_source src (make_content(100));
    session sess (sess_tr, cfg);
    auto result = serve_read (sess, src);

    // Three transmissions of block 1, none acknowledged
    packet pkt;
    for (int i=0; i<3; ++i)
        ASSERT_TRUE (expect_data(1, pkt)) << "transmission " << (i+1);

    auto r = result.get ();
    EXPECT_EQ (transfer_state_t::failed, r.state);
    EXPECT_EQ (error_kind_t::retries_exhausted, r.error);
    EXPECT_TRUE (nothing_sent(150));
}


TEST_F (session_test, duplicate_ack_is_ignored)
{
    auto content = make_content (1500);
    memory_source src (content);
    session sess (sess_tr, cfg);
    auto result = serve_read (sess, src);

    packet pkt;
    ASSERT_TRUE (expect_data(1, pkt));
    send (packet::ack(1));
    ASSERT_TRUE (expect_data(2, pkt));

    // A delayed duplicate ACK must not trigger a retransmission
    send (packet::ack(1));
    EXPECT_TRUE (nothing_sent());

    send (packet::ack(2));
    ASSERT_TRUE (expect_data(3, pkt));
    EXPECT_EQ (476u, pkt.payload.size());
    send (packet::ack(3));

    auto r = result.get ();
    EXPECT_TRUE (r.ok());
    EXPECT_EQ (1500u, r.bytes);
}


TEST_F (session_test, timeout_resends_whole_window)
{
    cfg.timeout = 500;
    auto content = make_content (40);
    memory_source src (content);
    session sess (sess_tr, cfg);
    auto result = serve_read (sess, src, make_options({{"blksize", "8"}, {"windowsize", "4"}, {"tsize", "0"}}));

    packet pkt;
    ASSERT_TRUE (expect(op_oack, pkt));
    std::string value;
    EXPECT_TRUE (pkt.options.get("blksize", value));
    EXPECT_EQ ("8", value);
    EXPECT_TRUE (pkt.options.get("windowsize", value));
    EXPECT_EQ ("4", value);
    EXPECT_TRUE (pkt.options.get("tsize", value));
    EXPECT_EQ ("40", value);
    send (packet::ack(0));

    for (uint16_t block=1; block<=4; ++block)
        ASSERT_TRUE (expect_data(block, pkt));

    // No ACK, the entire window is sent again
    for (uint16_t block=1; block<=4; ++block)
        ASSERT_TRUE (expect_data(block, pkt));

    // Cumulative ACK of block 2, the window moves two blocks
    send (packet::ack(2));
    for (uint16_t block=3; block<=6; ++block)
        ASSERT_TRUE (expect_data(block, pkt));
    EXPECT_TRUE (pkt.payload.empty());

    send (packet::ack(6));
    auto r = result.get ();
    EXPECT_TRUE (r.ok());
    EXPECT_EQ (40u, r.bytes);
    EXPECT_EQ (4u, sess.params().windowsize);
}


TEST_F (session_test, client_fails_on_error_during_negotiation)
{
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = std::async (std::launch::async, [&]{
            return sess.request_read (request_addr(), "missing.bin", "octet",
                                      make_options({{"blksize", "1024"}}), sink);
        });

    packet pkt;
    ASSERT_TRUE (expect(op_rrq, pkt));
    EXPECT_EQ ("missing.bin", pkt.filename);
    EXPECT_EQ (tftp_default_port, peer_tr.last_dest.port());
    send (packet::error(err_file_not_found, "No such file"));

    auto r = result.get ();
    EXPECT_EQ (transfer_state_t::failed, r.state);
    EXPECT_EQ (error_kind_t::peer_error, r.error);
    EXPECT_EQ (err_file_not_found, r.tftp_code);
    EXPECT_EQ ("No such file", r.message);
    EXPECT_TRUE (sink.discarded);

    // Never answer an ERROR
    EXPECT_TRUE (nothing_sent());
}


TEST_F (session_test, unknown_tid_gets_error_5)
{
    auto content = make_content (100);
    memory_source src (content);
    session sess (sess_tr, cfg);
    auto result = serve_read (sess, src);

    packet pkt;
    ASSERT_TRUE (expect_data(1, pkt));

    ip_addr stranger ((uint32_t)0x0a000003, 4444);
    peer_tr.send_packet_from (stranger, packet::ack(1), sess_addr);
    ASSERT_TRUE (expect_error(err_unknown_tid));
    EXPECT_EQ (stranger, peer_tr.last_dest);
    EXPECT_EQ (std::future_status::timeout, result.wait_for(milliseconds(50)));

    // An ERROR from a stranger is not answered
    peer_tr.send_packet_from (stranger, packet::error(err_undefined, "x"), sess_addr);
    EXPECT_TRUE (nothing_sent());

    send (packet::ack(1));
    auto r = result.get ();
    EXPECT_TRUE (r.ok());
}


TEST_F (session_test, receiver_recovers_from_window_gap)
{
    auto content = make_content (45);
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = serve_write (sess, sink, make_options({{"blksize", "8"}, {"windowsize", "4"}}));

    packet pkt;
    ASSERT_TRUE (expect(op_oack, pkt));

    // Block 2 lost, block 3 arrives: ACK the last block in order, once
    send_data (1, slice(content, 0, 8));
    send_data (3, slice(content, 16, 8));
    ASSERT_TRUE (expect_ack(1));
    send_data (4, slice(content, 24, 8));
    EXPECT_TRUE (nothing_sent());

    // The sender resumes after block 1
    for (uint16_t block=2; block<=5; ++block)
        send_data (block, slice(content, (block-1)*8, 8));
    ASSERT_TRUE (expect_ack(5));

    send_data (6, slice(content, 40, 5));
    ASSERT_TRUE (expect_ack(6));

    auto r = result.get ();
    EXPECT_TRUE (r.ok());
    EXPECT_EQ (45u, r.bytes);
    EXPECT_EQ (content, sink.data);
    EXPECT_TRUE (sink.finished);
}


TEST_F (session_test, receiver_acks_duplicate_block_once)
{
    auto content = make_content (522);
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = serve_write (sess, sink);

    ASSERT_TRUE (expect_ack(0));
    send_data (1, slice(content, 0, 512));
    ASSERT_TRUE (expect_ack(1));

    // Our ACK was lost, the sender repeats block 1
    send_data (1, slice(content, 0, 512));
    ASSERT_TRUE (expect_ack(1));
    send_data (1, slice(content, 0, 512));
    EXPECT_TRUE (nothing_sent());

    send_data (2, slice(content, 512, 10));
    ASSERT_TRUE (expect_ack(2));

    auto r = result.get ();
    EXPECT_TRUE (r.ok());
    EXPECT_EQ (content, sink.data);
}


TEST_F (session_test, receiver_resends_ack_on_timeout)
{
    cfg.timeout = 100;
    auto content = make_content (600);
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = serve_write (sess, sink);

    ASSERT_TRUE (expect_ack(0));
    ASSERT_TRUE (expect_ack(0));

    send_data (1, slice(content, 0, 512));
    ASSERT_TRUE (expect_ack(1));
    ASSERT_TRUE (expect_ack(1));

    send_data (2, slice(content, 512, 88));
    ASSERT_TRUE (expect_ack(2));

    auto r = result.get ();
    EXPECT_TRUE (r.ok());
    EXPECT_EQ (content, sink.data);
}


TEST_F (session_test, receiver_answers_repeated_final_block)
{
    cfg = session_config_t ();
    cfg.timeout = 100;
    auto content = make_content (10);
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = serve_write (sess, sink);

    ASSERT_TRUE (expect_ack(0));
    send_data (1, content);
    ASSERT_TRUE (expect_ack(1));

    // The final ACK was lost, the sender repeats the final block
    send_data (1, content);
    ASSERT_TRUE (expect_ack(1));

    auto r = result.get ();
    EXPECT_TRUE (r.ok());
    EXPECT_EQ (content, sink.data);
}


TEST_F (session_test, receiver_without_linger_ends_at_final_ack)
{
    auto content = make_content (10);
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = serve_write (sess, sink);

    ASSERT_TRUE (expect_ack(0));
    send_data (1, content);
    ASSERT_TRUE (expect_ack(1));
    auto r = result.get ();
    EXPECT_TRUE (r.ok());

    send_data (1, content);
    EXPECT_TRUE (nothing_sent());
}


TEST_F (session_test, receiver_writes_blocks_as_they_arrive)
{
    cfg.clean_on_error = false;
    auto content = make_content (24);
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = serve_write (sess, sink, make_options({{"blksize", "8"}, {"windowsize", "65535"}}));

    packet pkt;
    ASSERT_TRUE (expect(op_oack, pkt));
    for (uint16_t block=1; block<=3; ++block)
        send_data (block, slice(content, (block-1)*8, 8));
    EXPECT_TRUE (nothing_sent());

    // Nothing is acknowledged yet, but the blocks are stored
    sess.cancel ();
    auto r = result.get ();
    EXPECT_EQ (error_kind_t::cancelled, r.error);
    EXPECT_EQ (24u, r.bytes);
    EXPECT_EQ (content, sink.data);
}


TEST_F (session_test, block_out_of_window_is_a_violation)
{
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = serve_write (sess, sink);

    ASSERT_TRUE (expect_ack(0));
    send_data (10, make_content(512));
    ASSERT_TRUE (expect_error(err_illegal_op));

    auto r = result.get ();
    EXPECT_EQ (error_kind_t::protocol_violation, r.error);
    EXPECT_TRUE (sink.discarded);
}


TEST_F (session_test, oversized_block_is_a_violation)
{
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = serve_write (sess, sink, make_options({{"blksize", "8"}}));

    packet pkt;
    ASSERT_TRUE (expect(op_oack, pkt));
    send_data (1, make_content(9));
    ASSERT_TRUE (expect_error(err_illegal_op));

    auto r = result.get ();
    EXPECT_EQ (error_kind_t::protocol_violation, r.error);
}


TEST_F (session_test, write_size_limit)
{
    cfg.max_write_size = 100;
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = serve_write (sess, sink);

    ASSERT_TRUE (expect_ack(0));
    send_data (1, make_content(512));
    ASSERT_TRUE (expect_error(err_disk_full));

    auto r = result.get ();
    EXPECT_EQ (error_kind_t::io_error, r.error);
    EXPECT_EQ (err_disk_full, r.tftp_code);
    EXPECT_TRUE (sink.discarded);
}


TEST_F (session_test, write_tsize_over_limit_is_refused)
{
    policy.max_write_size = 1000;
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = serve_write (sess, sink, make_options({{"tsize", "1001"}}));

    ASSERT_TRUE (expect_error(err_disk_full));
    auto r = result.get ();
    EXPECT_EQ (error_kind_t::io_error, r.error);
    EXPECT_TRUE (sink.discarded);
}


TEST_F (session_test, partial_data_kept_without_clean_on_error)
{
    cfg.clean_on_error = false;
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = serve_write (sess, sink);

    ASSERT_TRUE (expect_ack(0));
    send_data (1, make_content(512));
    ASSERT_TRUE (expect_ack(1));
    send (packet::error(err_undefined, "Aborted"));

    auto r = result.get ();
    EXPECT_EQ (error_kind_t::peer_error, r.error);
    EXPECT_FALSE (sink.discarded);
    EXPECT_EQ (512u, sink.data.size());
}


TEST_F (session_test, invalid_option_value_fails_negotiation)
{
    memory_source src (make_content(100));
    session sess (sess_tr, cfg);
    auto result = serve_read (sess, src, make_options({{"blksize", "abc"}}));

    ASSERT_TRUE (expect_error(err_option_negotiation));
    auto r = result.get ();
    EXPECT_EQ (error_kind_t::negotiation_failed, r.error);
    EXPECT_EQ (transfer_state_t::failed, r.state);
}


TEST_F (session_test, client_rejects_invalid_oack)
{
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = std::async (std::launch::async, [&]{
            return sess.request_read (request_addr(), "file.bin", "octet",
                                      make_options({{"blksize", "1024"}}), sink);
        });

    packet pkt;
    ASSERT_TRUE (expect(op_rrq, pkt));
    send (packet::oack(make_options({{"blksize", "2048"}})));
    ASSERT_TRUE (expect_error(err_option_negotiation));
    EXPECT_EQ (peer_addr, peer_tr.last_dest);

    auto r = result.get ();
    EXPECT_EQ (error_kind_t::negotiation_failed, r.error);
}


TEST_F (session_test, client_read_answers_duplicate_oack)
{
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = std::async (std::launch::async, [&]{
            return sess.request_read (request_addr(), "file.bin", "octet",
                                      make_options({{"blksize", "8"}}), sink);
        });

    packet pkt;
    ASSERT_TRUE (expect(op_rrq, pkt));
    send (packet::oack(make_options({{"blksize", "8"}})));
    ASSERT_TRUE (expect_ack(0));
    EXPECT_EQ (peer_addr, peer_tr.last_dest);

    // The OACK is repeated as if ACK #0 was lost
    send (packet::oack(make_options({{"blksize", "8"}})));
    ASSERT_TRUE (expect_ack(0));

    send (packet::data(1, "abc", 3));
    ASSERT_TRUE (expect_ack(1));

    auto r = result.get ();
    EXPECT_TRUE (r.ok());
    EXPECT_EQ (8u, sess.params().blksize);
    EXPECT_EQ (std::string("abc"), std::string(sink.data.begin(), sink.data.end()));
}


TEST_F (session_test, client_read_without_options_reply)
{
    auto content = make_content (512);
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = std::async (std::launch::async, [&]{
            return sess.request_read (request_addr(), "file.bin", "octet",
                                      make_options({{"blksize", "1024"}}), sink);
        });

    packet pkt;
    ASSERT_TRUE (expect(op_rrq, pkt));

    // The server ignores the options and sends block 1 right away
    send_data (1, content);
    ASSERT_TRUE (expect_ack(1));
    send_data (2, std::vector<char>());
    ASSERT_TRUE (expect_ack(2));

    auto r = result.get ();
    EXPECT_TRUE (r.ok());
    EXPECT_EQ (default_blksize, sess.params().blksize);
    EXPECT_EQ (content, sink.data);
}


TEST_F (session_test, client_write_falls_back_to_defaults)
{
    auto content = make_content (600);
    memory_source src (content);
    session sess (sess_tr, cfg);
    auto result = std::async (std::launch::async, [&]{
            return sess.request_write (request_addr(), "upload.bin", "octet",
                                       make_options({{"blksize", "1024"}, {"tsize", "600"}}), src);
        });

    packet pkt;
    ASSERT_TRUE (expect(op_wrq, pkt));
    EXPECT_EQ ("upload.bin", pkt.filename);
    send (packet::ack(0));

    ASSERT_TRUE (expect_data(1, pkt));
    EXPECT_EQ (512u, pkt.payload.size());
    send (packet::ack(1));
    ASSERT_TRUE (expect_data(2, pkt));
    EXPECT_EQ (88u, pkt.payload.size());
    send (packet::ack(2));

    auto r = result.get ();
    EXPECT_TRUE (r.ok());
    EXPECT_EQ (600u, r.bytes);
}


TEST_F (session_test, client_request_is_resent_on_timeout)
{
    cfg.timeout = 50;
    cfg.max_retries = 2;
    memory_sink sink;
    session sess (sess_tr, cfg);
    auto result = std::async (std::launch::async, [&]{
            return sess.request_read (request_addr(), "file.bin", "octet", option_list(), sink);
        });

    packet pkt;
    ASSERT_TRUE (expect(op_rrq, pkt));
    ASSERT_TRUE (expect(op_rrq, pkt));

    auto r = result.get ();
    EXPECT_EQ (error_kind_t::retries_exhausted, r.error);
    EXPECT_TRUE (nothing_sent(100));
}


TEST_F (session_test, cancel)
{
    memory_source src (make_content(2000));
    session sess (sess_tr, cfg);
    auto result = serve_read (sess, src);

    packet pkt;
    ASSERT_TRUE (expect_data(1, pkt));
    sess.cancel ();

    auto r = result.get ();
    EXPECT_EQ (error_kind_t::cancelled, r.error);
    EXPECT_TRUE (nothing_sent());
}


TEST_F (session_test, repeat_count_duplicates_packets)
{
    cfg.repeat_count = 1;
    memory_source src (make_content(10));
    session sess (sess_tr, cfg);
    auto result = serve_read (sess, src);

    packet pkt;
    ASSERT_TRUE (expect_data(1, pkt));
    ASSERT_TRUE (expect_data(1, pkt));
    send (packet::ack(1));

    auto r = result.get ();
    EXPECT_TRUE (r.ok());
}


TEST_F (session_test, observer_events)
{
    std::vector<session_event_t> events;
    cfg.observer = [&events](const session&, session_event_t event, const transfer_result_t&) {
        events.push_back (event);
    };
    memory_source src (make_content(10));
    session sess (sess_tr, cfg);
    auto result = serve_read (sess, src);

    packet pkt;
    ASSERT_TRUE (expect_data(1, pkt));
    send (packet::ack(1));
    ASSERT_TRUE (result.get().ok());

    ASSERT_EQ (2u, events.size());
    EXPECT_EQ (event_started, events[0]);
    EXPECT_EQ (event_completed, events[1]);
}


TEST_F (session_test, unexpected_opcode_is_a_violation)
{
    memory_source src (make_content(1000));
    session sess (sess_tr, cfg);
    auto result = serve_read (sess, src);

    packet pkt;
    ASSERT_TRUE (expect_data(1, pkt));
    send_data (1, make_content(10));
    ASSERT_TRUE (expect_error(err_illegal_op));

    auto r = result.get ();
    EXPECT_EQ (error_kind_t::protocol_violation, r.error);
}
