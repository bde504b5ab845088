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
#include <tftpio/session.hpp>
#include <tftpio/log.hpp>
#include <sstream>
#include <cstring>
#include <cerrno>


namespace tftpio {


    using steady_clock = std::chrono::steady_clock;

    // Receive buffer size, room for the largest DATA packet plus
    // one byte to detect packets larger than the block size.
    static constexpr size_t rx_buf_size = max_blksize + tftp_header_size + 1;


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const char* to_string (transfer_state_t state)
    {
        switch (state) {
        case transfer_state_t::negotiating:
            return "negotiating";
        case transfer_state_t::transferring:
            return "transferring";
        case transfer_state_t::completed:
            return "completed";
        case transfer_state_t::failed:
            return "failed";
        }
        return "n/a";
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const char* to_string (error_kind_t kind)
    {
        switch (kind) {
        case error_kind_t::none:
            return "none";
        case error_kind_t::malformed_packet:
            return "malformed packet";
        case error_kind_t::protocol_violation:
            return "protocol violation";
        case error_kind_t::negotiation_failed:
            return "option negotiation failed";
        case error_kind_t::timeout:
            return "timeout";
        case error_kind_t::retries_exhausted:
            return "retries exhausted";
        case error_kind_t::peer_error:
            return "peer error";
        case error_kind_t::io_error:
            return "I/O error";
        case error_kind_t::cancelled:
            return "cancelled";
        }
        return "n/a";
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static bool same_host (const ip_addr& lhs, const ip_addr& rhs)
    {
        return lhs.family() == rhs.family() &&
            lhs.to_string(false) == rhs.to_string(false);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t::transfer_result_t ()
        : state {transfer_state_t::negotiating},
          error {error_kind_t::none},
          tftp_code {0},
          bytes {0}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    session_config_t::session_config_t ()
        : max_retries    {default_max_retries},
          timeout        {default_timeout},
          rollover       {rollover_dont_care},
          repeat_count   {0},
          max_write_size {0},
          clean_on_error {true},
          linger         {linger_auto}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    session::session (transport& t, const session_config_t& config)
        : tr {t},
          cfg {config},
          st {transfer_state_t::negotiating},
          peer_fixed {false},
          read_request {true},
          is_client {false},
          rx_buf (rx_buf_size),
          num_bytes {0}
    {
        if (!cfg.timeout)
            cfg.timeout = default_timeout;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void session::cancel ()
    {
        tr.cancel ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void session::begin (const ip_addr& peer, bool peer_is_fixed, const std::string& filename, bool is_rrq)
    {
        peer_addr = peer;
        peer_fixed = peer_is_fixed;
        file_name = filename;
        read_request = is_rrq;
        num_bytes = 0;
        prm = transfer_params_t ();
        prm.timeout = cfg.timeout;
        st = transfer_state_t::negotiating;
        update_id ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void session::update_id ()
    {
        std::stringstream ss;
        ss << tr.addr().port() << ':' << peer_addr.to_string(true);
        sess_id = ss.str ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void session::set_state (transfer_state_t state)
    {
        if (st == state)
            return;
        log::debug ("%s: %s -> %s", sess_id.c_str(), to_string(st), to_string(state));
        st = state;
        if (st == transfer_state_t::transferring && cfg.observer) {
            transfer_result_t result;
            result.state = st;
            cfg.observer (*this, event_started, result);
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void session::use_local_timeout (const option_list& negotiated)
    {
        if (!negotiated.has(opt_timeout))
            prm.timeout = cfg.timeout;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    steady_clock::time_point session::next_deadline () const
    {
        return steady_clock::now() + std::chrono::milliseconds(prm.timeout);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int session::send_buf (const std::vector<char>& buf)
    {
        for (unsigned i=0; i<=cfg.repeat_count; ++i) {
            if (tr.send(buf.data(), buf.size(), peer_addr) < 0) {
                log::debug ("%s: Error sending packet: %s", sess_id.c_str(), strerror(errno));
                return -1;
            }
        }
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int session::send_packet (const packet& pkt)
    {
        if (log::priority() >= LOG_DEBUG)
            log::debug ("%s: Send %s", sess_id.c_str(), pkt.to_string().c_str());
        pkt.encode (tx_buf);
        return send_buf (tx_buf);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool session::send_window_blocks (const send_window& win, transfer_result_t& result)
    {
        for (auto& chunk : win.chunks()) {
            log::debug ("%s: Send DATA #%u, %u bytes",
                        sess_id.c_str(), (unsigned)chunk.block, (unsigned)chunk.size);
            if (win.encode(chunk, tx_buf)) {
                result = fail_io (errno, true);
                return false;
            }
            if (send_buf(tx_buf)) {
                result = fail (error_kind_t::io_error, 0, strerror(errno), false);
                return false;
            }
        }
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    session::wait_result_t session::receive_packet (packet& pkt, steady_clock::time_point deadline)
    {
        while (true) {
            auto now = steady_clock::now ();
            if (now >= deadline)
                return wait_timeout;
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            if (ms < 1)
                ms = 1;

            ip_addr from;
            auto result = tr.receive (rx_buf.data(), rx_buf.size(), from, (unsigned)ms);
            if (result < 0) {
                if (errno == ETIMEDOUT)
                    return wait_timeout;
                if (errno == ECANCELED)
                    return wait_cancelled;
                if (errno == EINTR)
                    continue;
                wait_error_msg = strerror (errno);
                return wait_error;
            }

            if (!peer_fixed) {
                // Waiting for the first reply to a request,
                // the server answers from a new port.
                if (!same_host(from, peer_addr)) {
                    log::debug ("%s: Ignore datagram from %s",
                                sess_id.c_str(), from.to_string().c_str());
                    continue;
                }
            }
            else if (from != peer_addr) {
                handle_unknown_tid (from, (size_t)result);
                continue;
            }

            if (!pkt.parse(rx_buf.data(), (size_t)result)) {
                log::debug ("%s: Drop malformed packet (%d bytes)", sess_id.c_str(), (int)result);
                continue;
            }

            if (!peer_fixed) {
                peer_addr = from;
                peer_fixed = true;
                update_id ();
            }

            if (log::priority() >= LOG_DEBUG)
                log::debug ("%s: Got %s", sess_id.c_str(), pkt.to_string().c_str());
            return wait_ok;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void session::handle_unknown_tid (const ip_addr& from, size_t size)
    {
        packet pkt;
        if (pkt.parse(rx_buf.data(), size) && pkt.opcode == op_error) {
            log::debug ("%s: Ignore ERROR from unknown peer %s",
                        sess_id.c_str(), from.to_string().c_str());
            return;
        }
        log::debug ("%s: Packet from unknown peer %s",
                    sess_id.c_str(), from.to_string().c_str());
        std::vector<char> buf;
        packet::error(err_unknown_tid, "").encode (buf);
        if (tr.send(buf.data(), buf.size(), from) < 0) {
            log::debug ("%s: Error sending packet to %s: %s",
                        sess_id.c_str(), from.to_string().c_str(), strerror(errno));
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::complete ()
    {
        set_state (transfer_state_t::completed);
        transfer_result_t result;
        result.state = st;
        result.bytes = num_bytes;
        if (cfg.observer)
            cfg.observer (*this, event_completed, result);
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::fail (error_kind_t kind,
                                     uint16_t code,
                                     const std::string& msg,
                                     bool send_error)
    {
        if (send_error)
            send_packet (packet::error(code, msg));

        set_state (transfer_state_t::failed);

        transfer_result_t result;
        result.state = st;
        result.error = kind;
        result.tftp_code = code;
        result.message = msg;
        result.bytes = num_bytes;
        log::debug ("%s: Failed, %s: %s", sess_id.c_str(), to_string(kind), msg.c_str());
        if (cfg.observer)
            cfg.observer (*this, event_failed, result);
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::fail_wait (wait_result_t wait_result)
    {
        switch (wait_result) {
        case wait_cancelled:
            return fail (error_kind_t::cancelled, 0, "Session cancelled", false);
        case wait_timeout:
            return fail (error_kind_t::retries_exhausted, 0, "Max retries reached", false);
        default:
            return fail (error_kind_t::io_error, 0, wait_error_msg, false);
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::fail_io (int errnum, bool reading)
    {
        if (errnum == ENOSPC || errnum == EDQUOT || errnum == EFBIG)
            return fail (error_kind_t::io_error, err_disk_full, tftp_error_to_string(err_disk_full), true);
        log::debug ("%s: File %s error: %s",
                    sess_id.c_str(), (reading ? "read" : "write"), strerror(errnum));
        return fail (error_kind_t::io_error,
                     err_access_violation,
                     reading ? "File read error" : "File write error",
                     true);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::fail_peer (const packet& pkt)
    {
        // Never answer an ERROR packet
        auto result = fail (error_kind_t::peer_error, pkt.error_code, pkt.message, false);
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::fail_unexpected (const packet& pkt)
    {
        std::string msg = std::string("Unexpected ") + opcode_to_string(pkt.opcode);
        return fail (error_kind_t::protocol_violation, err_illegal_op, msg, true);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::serve_read (const ip_addr& peer,
                                           const std::string& filename,
                                           data_source& src,
                                           const option_list& requested,
                                           const option_policy_t& policy)
    {
        begin (peer, true, filename, true);

        uint64_t file_size = 0;
        bool has_file_size = src.size (file_size);

        option_list reply;
        std::string error_msg;
        auto neg = negotiate_options (requested, true, has_file_size, file_size,
                                      policy, prm, reply, error_msg);
        use_local_timeout (reply);

        if (neg == neg_failed || neg == neg_too_large)
            return fail (error_kind_t::negotiation_failed, err_option_negotiation, error_msg, true);

        if (neg == neg_no_options)
            return send_file (src);

        // Send OACK and wait for ACK of block 0
        //
        std::vector<char> oack;
        auto oack_pkt = packet::oack (reply);
        oack_pkt.encode (oack);
        log::debug ("%s: Send %s", sess_id.c_str(), oack_pkt.to_string().c_str());
        if (send_buf(oack))
            return fail (error_kind_t::io_error, 0, strerror(errno), false);

        unsigned retry_count = 0;
        auto deadline = next_deadline ();
        packet pkt;
        while (true) {
            auto wait_result = receive_packet (pkt, deadline);
            if (wait_result == wait_timeout) {
                if (++retry_count >= cfg.max_retries)
                    return fail_wait (wait_result);
                log::debug ("%s: Timeout, resend OACK", sess_id.c_str());
                if (send_buf(oack))
                    return fail (error_kind_t::io_error, 0, strerror(errno), false);
                deadline = next_deadline ();
                continue;
            }
            else if (wait_result != wait_ok) {
                return fail_wait (wait_result);
            }

            switch (pkt.opcode) {
            case op_ack:
                if (pkt.block == 0)
                    return send_file (src);
                log::debug ("%s: Ignore ACK #%u while waiting for ACK #0",
                            sess_id.c_str(), (unsigned)pkt.block);
                break;

            case op_error:
                return fail_peer (pkt);

            default:
                return fail_unexpected (pkt);
            }
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::serve_write (const ip_addr& peer,
                                            const std::string& filename,
                                            data_sink& sink,
                                            const option_list& requested,
                                            const option_policy_t& policy)
    {
        begin (peer, true, filename, false);

        option_list reply;
        std::string error_msg;
        auto neg = negotiate_options (requested, false, false, 0,
                                      policy, prm, reply, error_msg);
        use_local_timeout (reply);

        transfer_result_t result;
        if (neg == neg_failed) {
            result = fail (error_kind_t::negotiation_failed, err_option_negotiation, error_msg, true);
        }
        else if (neg == neg_too_large) {
            result = fail (error_kind_t::io_error, err_disk_full, error_msg, true);
        }
        else {
            std::vector<char> initial_reply;
            if (neg == neg_accepted)
                packet::oack(reply).encode (initial_reply);
            else
                packet::ack(0).encode (initial_reply);

            log::debug ("%s: Send %s", sess_id.c_str(),
                        (neg == neg_accepted ? "OACK" : "ACK #0"));
            if (send_buf(initial_reply))
                result = fail (error_kind_t::io_error, 0, strerror(errno), false);
            else
                return receive_file (sink, initial_reply, nullptr);
        }

        if (cfg.clean_on_error)
            sink.discard ();
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::request_read (const ip_addr& server,
                                             const std::string& filename,
                                             const std::string& mode,
                                             const option_list& options,
                                             data_sink& sink)
    {
        begin (server, false, filename, true);
        is_client = true;

        std::vector<char> request;
        auto req = packet::rrq (filename, mode, options);
        req.encode (request);
        log::debug ("%s: Send %s", sess_id.c_str(), req.to_string().c_str());

        transfer_result_t result;
        unsigned retry_count = 0;
        packet pkt;

        if (send_buf(request)) {
            result = fail (error_kind_t::io_error, 0, strerror(errno), false);
        }
        else {
            auto deadline = next_deadline ();
            while (result.state == transfer_state_t::negotiating) {
                auto wait_result = receive_packet (pkt, deadline);
                if (wait_result == wait_timeout) {
                    if (++retry_count >= cfg.max_retries) {
                        result = fail_wait (wait_result);
                        break;
                    }
                    log::debug ("%s: Timeout, resend RRQ", sess_id.c_str());
                    if (send_buf(request)) {
                        result = fail (error_kind_t::io_error, 0, strerror(errno), false);
                        break;
                    }
                    deadline = next_deadline ();
                    continue;
                }
                else if (wait_result != wait_ok) {
                    result = fail_wait (wait_result);
                    break;
                }

                switch (pkt.opcode) {
                case op_oack:
                    {
                        std::string error_msg;
                        if (!apply_oack(options, pkt.options, prm, error_msg)) {
                            result = fail (error_kind_t::negotiation_failed,
                                           err_option_negotiation, error_msg, true);
                            break;
                        }
                        use_local_timeout (pkt.options);
                        std::vector<char> ack0;
                        packet::ack(0).encode (ack0);
                        log::debug ("%s: Send ACK #0", sess_id.c_str());
                        if (send_buf(ack0)) {
                            result = fail (error_kind_t::io_error, 0, strerror(errno), false);
                            break;
                        }
                        return receive_file (sink, ack0, nullptr);
                    }

                case op_data:
                    // No options accepted, use the defaults
                    prm = transfer_params_t ();
                    prm.timeout = cfg.timeout;
                    if (pkt.block != 1) {
                        result = fail (error_kind_t::protocol_violation,
                                       err_illegal_op, "Unexpected block number", true);
                        break;
                    }
                    return receive_file (sink, std::vector<char>(), &pkt);

                case op_error:
                    result = fail_peer (pkt);
                    break;

                default:
                    result = fail_unexpected (pkt);
                    break;
                }
            }
        }

        if (cfg.clean_on_error)
            sink.discard ();
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::request_write (const ip_addr& server,
                                              const std::string& filename,
                                              const std::string& mode,
                                              const option_list& options,
                                              data_source& src)
    {
        begin (server, false, filename, false);
        is_client = true;

        std::vector<char> request;
        auto req = packet::wrq (filename, mode, options);
        req.encode (request);
        log::debug ("%s: Send %s", sess_id.c_str(), req.to_string().c_str());
        if (send_buf(request))
            return fail (error_kind_t::io_error, 0, strerror(errno), false);

        unsigned retry_count = 0;
        auto deadline = next_deadline ();
        packet pkt;
        while (true) {
            auto wait_result = receive_packet (pkt, deadline);
            if (wait_result == wait_timeout) {
                if (++retry_count >= cfg.max_retries)
                    return fail_wait (wait_result);
                log::debug ("%s: Timeout, resend WRQ", sess_id.c_str());
                if (send_buf(request))
                    return fail (error_kind_t::io_error, 0, strerror(errno), false);
                deadline = next_deadline ();
                continue;
            }
            else if (wait_result != wait_ok) {
                return fail_wait (wait_result);
            }

            switch (pkt.opcode) {
            case op_oack:
                {
                    std::string error_msg;
                    if (!apply_oack(options, pkt.options, prm, error_msg))
                        return fail (error_kind_t::negotiation_failed,
                                     err_option_negotiation, error_msg, true);
                    use_local_timeout (pkt.options);
                    return send_file (src);
                }

            case op_ack:
                if (pkt.block != 0) {
                    log::debug ("%s: Ignore ACK #%u while waiting for ACK #0",
                                sess_id.c_str(), (unsigned)pkt.block);
                    break;
                }
                // No options accepted, use the defaults
                prm = transfer_params_t ();
                prm.timeout = cfg.timeout;
                return send_file (src);

            case op_error:
                return fail_peer (pkt);

            default:
                return fail_unexpected (pkt);
            }
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::send_file (data_source& src)
    {
        set_state (transfer_state_t::transferring);

        send_window win (src, prm.blksize, prm.windowsize, cfg.rollover);
        if (win.fill())
            return fail_io (errno, true);
        transfer_result_t result;
        if (!send_window_blocks(win, result))
            return result;

        unsigned retry_count = 0;
        auto deadline = next_deadline ();
        packet pkt;
        while (true) {
            auto wait_result = receive_packet (pkt, deadline);
            if (wait_result == wait_timeout) {
                if (++retry_count >= cfg.max_retries)
                    return fail_wait (wait_result);
                log::debug ("%s: Timeout, resend %u block(s) from #%u",
                            sess_id.c_str(),
                            (unsigned)win.chunks().size(),
                            (unsigned)win.chunks().front().block);
                if (!send_window_blocks(win, result))
                    return result;
                deadline = next_deadline ();
                continue;
            }
            else if (wait_result != wait_ok) {
                return fail_wait (wait_result);
            }

            switch (pkt.opcode) {
            case op_ack:
                if (win.retire(pkt.block) == 0) {
                    // Duplicate or out of window, don't resend anything
                    log::debug ("%s: Ignore ACK #%u", sess_id.c_str(), (unsigned)pkt.block);
                    break;
                }
                num_bytes = win.bytes_acked ();
                retry_count = 0;
                if (win.done())
                    return complete ();
                if (win.fill())
                    return fail_io (errno, true);
                if (!send_window_blocks(win, result))
                    return result;
                deadline = next_deadline ();
                break;

            case op_oack:
                if (is_client) {
                    // The server resent its OACK
                    log::debug ("%s: Ignore duplicate OACK", sess_id.c_str());
                    break;
                }
                return fail_unexpected (pkt);

            case op_error:
                return fail_peer (pkt);

            default:
                return fail_unexpected (pkt);
            }
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::receive_file (data_sink& sink,
                                             const std::vector<char>& initial_reply,
                                             const packet* first_block)
    {
        auto result = receive_blocks (sink, initial_reply, first_block);
        if (!result.ok() && cfg.clean_on_error)
            sink.discard ();
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t session::receive_blocks (data_sink& sink,
                                               const std::vector<char>& initial_reply,
                                               const packet* first_block)
    {
        set_state (transfer_state_t::transferring);

        receive_window win (sink, prm.windowsize, cfg.max_write_size);
        std::vector<char> last_reply = initial_reply;
        uint16_t last_block = 0;
        unsigned retry_count = 0;
        bool resynced = false;
        auto deadline = next_deadline ();
        packet pkt;
        bool have_pkt = false;

        if (first_block) {
            pkt = *first_block;
            have_pkt = true;
        }

        while (true) {
            if (!have_pkt) {
                auto wait_result = receive_packet (pkt, deadline);
                if (wait_result == wait_timeout) {
                    if (++retry_count >= cfg.max_retries)
                        return fail_wait (wait_result);
                    // Acknowledge what we have so the sender can continue from there
                    if (win.size() || last_reply.empty()) {
                        win.reset ();
                        packet::ack(last_block).encode (last_reply);
                    }
                    log::debug ("%s: Timeout, resend %s", sess_id.c_str(),
                                (last_block==0 && !initial_reply.empty() ? "initial reply" : "ACK"));
                    if (send_buf(last_reply))
                        return fail (error_kind_t::io_error, 0, strerror(errno), false);
                    resynced = false;
                    deadline = next_deadline ();
                    continue;
                }
                else if (wait_result != wait_ok) {
                    return fail_wait (wait_result);
                }
            }
            have_pkt = false;

            switch (pkt.opcode) {
            case op_data:
                if (pkt.payload.size() > prm.blksize) {
                    return fail (error_kind_t::protocol_violation, err_illegal_op,
                                 "Block size too large", true);
                }
                if (is_next_block(last_block, pkt.block, cfg.rollover)) {
                    if (win.add(pkt.payload))
                        return fail_io (errno, false);
                    num_bytes = win.bytes_written ();
                    last_block = pkt.block;
                    resynced = false;
                    retry_count = 0;

                    bool final_block = pkt.payload.size() < prm.blksize;
                    if (final_block || win.full()) {
                        win.reset ();
                        if (final_block && sink.finish())
                            return fail_io (errno, false);
                        packet::ack(last_block).encode (last_reply);
                        log::debug ("%s: Send ACK #%u", sess_id.c_str(), (unsigned)last_block);
                        if (send_buf(last_reply))
                            return fail (error_kind_t::io_error, 0, strerror(errno), false);
                        if (final_block) {
                            linger (last_reply);
                            return complete ();
                        }
                    }
                    deadline = next_deadline ();
                }
                else {
                    // With a receiver accepting both rollover
                    // variants the distance may be one off
                    auto distance = block_distance (last_block, pkt.block);
                    if (distance > (int)prm.windowsize + 1) {
                        log::debug ("%s: Block #%u out of window, expected #%u",
                                    sess_id.c_str(), (unsigned)pkt.block,
                                    (unsigned)next_block(last_block, cfg.rollover));
                        return fail (error_kind_t::protocol_violation, err_illegal_op,
                                     "Block number out of window", true);
                    }
                    if (resynced) {
                        log::debug ("%s: Drop DATA #%u", sess_id.c_str(), (unsigned)pkt.block);
                        break;
                    }
                    // A gap or a duplicate, acknowledge the last
                    // block received in order, once per burst.
                    win.reset ();
                    packet::ack(last_block).encode (last_reply);
                    log::debug ("%s: Got DATA #%u, expected #%u, send ACK #%u",
                                sess_id.c_str(), (unsigned)pkt.block,
                                (unsigned)next_block(last_block, cfg.rollover),
                                (unsigned)last_block);
                    if (send_buf(last_reply))
                        return fail (error_kind_t::io_error, 0, strerror(errno), false);
                    resynced = true;
                }
                break;

            case op_oack:
                if (is_client && last_block == 0) {
                    // The server resent its OACK, our ACK #0 was lost
                    if (!resynced) {
                        log::debug ("%s: Duplicate OACK, resend ACK #0", sess_id.c_str());
                        if (send_buf(last_reply))
                            return fail (error_kind_t::io_error, 0, strerror(errno), false);
                        resynced = true;
                    }
                    break;
                }
                return fail_unexpected (pkt);

            case op_error:
                return fail_peer (pkt);

            default:
                return fail_unexpected (pkt);
            }
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void session::linger (const std::vector<char>& final_ack)
    {
        if (!cfg.linger)
            return;

        // The peer resends the final block each time its timeout expires
        uint64_t duration = cfg.linger;
        if (cfg.linger == linger_auto)
            duration = 2 * (uint64_t)prm.timeout;
        auto deadline = steady_clock::now() + std::chrono::milliseconds(duration);
        packet pkt;
        while (receive_packet(pkt, deadline) == wait_ok) {
            if (pkt.opcode != op_data)
                continue;
            log::debug ("%s: Final ACK lost, resend", sess_id.c_str());
            if (send_buf(final_ack))
                break;
        }
    }


}
