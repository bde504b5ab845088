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
#include <tftpio/server.hpp>
#include <tftpio/log.hpp>
#include <vector>
#include <cstring>
#include <cerrno>


namespace tftpio {


    // Max time in milliseconds between checks for finished sessions
    static constexpr unsigned reap_interval = 500;

    static constexpr size_t listen_buf_size = max_blksize + tftp_header_size + 1;


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static uint16_t errno_to_tftp_error (int errnum)
    {
        switch (errnum) {
        case ENOENT:
        case ENOTDIR:
            return err_file_not_found;
        case EEXIST:
            return err_file_exists;
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return err_disk_full;
        default:
            return err_access_violation;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    server_config_t::server_config_t ()
        : bind_addr   {(uint32_t)INADDR_ANY, tftp_default_port},
          max_clients {0},
          allow_write {false},
          single_port {false}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    server::session_handle_t::session_handle_t ()
        : router {nullptr}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    server::server (const server_config_t& config, std::shared_ptr<file_provider> file_provider)
        : cfg {config},
          files {file_provider},
          running {false}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    server::~server ()
    {
        stop ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int server::start ()
    {
        if (running)
            return 0;

        if (sock.open(cfg.bind_addr.family()))
            return -1;
        if (sock.bind(cfg.bind_addr)) {
            auto errnum = errno;
            sock.close ();
            errno = errnum;
            return -1;
        }

        running = true;
        listener = std::thread ([this]{listen();});
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void server::stop ()
    {
        if (!running)
            return;
        running = false;

        // Stop the listener
        sock.cancel ();
        if (listener.joinable())
            listener.join ();

        // Cancel all sessions
        std::vector<handle_ptr> handles;
        {
            std::lock_guard<std::mutex> lock (session_mutex);
            for (auto& entry : sessions)
                handles.push_back (entry.second);
            for (auto& handle : finished)
                handles.push_back (handle);
        }
        for (auto& handle : handles) {
            if (handle->sess)
                handle->sess->cancel ();
        }
        for (auto& handle : handles) {
            if (handle->thread.joinable())
                handle->thread.join ();
        }
        {
            std::lock_guard<std::mutex> lock (session_mutex);
            sessions.clear ();
            finished.clear ();
        }

        sock.close ();
        log::debug ("Server stopped");
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    size_t server::num_sessions ()
    {
        std::lock_guard<std::mutex> lock (session_mutex);
        return sessions.size ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void server::listen ()
    {
        std::vector<char> buf (listen_buf_size);

        while (true) {
            ip_addr from;
            auto result = sock.recvfrom (buf.data(), buf.size(), from, reap_interval);
            reap_sessions ();

            if (result < 0) {
                if (errno == ECANCELED)
                    break; // Server closing down
                if (errno != ETIMEDOUT && errno != EINTR)
                    log::warning ("Error waiting for client request: %s", strerror(errno));
                continue;
            }

            // In single-port mode all datagrams from a peer
            // with a live session belong to that session
            if (cfg.single_port && route(buf.data(), (size_t)result, from))
                continue;

            packet pkt;
            if (!pkt.parse(buf.data(), (size_t)result)) {
                log::debug ("Ignoring malformed packet (%d bytes) from %s",
                            (int)result, from.to_string().c_str());
                continue;
            }
            handle_new_request (pkt, from);
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool server::route (const void* buf, size_t size, const ip_addr& from)
    {
        std::lock_guard<std::mutex> lock (session_mutex);
        auto entry = sessions.find (from);
        if (entry == sessions.end() || !entry->second->router)
            return false;
        entry->second->router->deliver (buf, size, from);
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void server::handle_new_request (const packet& pkt, const ip_addr& from)
    {
        switch (pkt.opcode) {
        case op_rrq:
        case op_wrq:
            handle_rq (pkt, from);
            break;

        case op_error:
            log::debug ("Ignoring ERROR from %s", from.to_string().c_str());
            break;

        default:
            {
                std::lock_guard<std::mutex> lock (session_mutex);
                if (sessions.find(from) != sessions.end()) {
                    log::debug ("Ignoring %s from %s on the request socket",
                                opcode_to_string(pkt.opcode), from.to_string().c_str());
                    break;
                }
            }
            log::info ("Invalid request (%s) from %s",
                       opcode_to_string(pkt.opcode), from.to_string().c_str());
            send_error (from, err_illegal_op, "");
            break;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void server::handle_rq (const packet& pkt, const ip_addr& from)
    {
        const char* rq = opcode_to_string (pkt.opcode);
        bool is_read = pkt.opcode == op_rrq;

        {
            std::lock_guard<std::mutex> lock (session_mutex);
            if (sessions.find(from) != sessions.end()) {
                log::debug ("%s from %s - Session in progress, ignoring request",
                            rq, from.to_string().c_str());
                return;
            }
            if (cfg.max_clients  &&  sessions.size() >= cfg.max_clients) {
                log::info ("%s from %s - Too many clients", rq, from.to_string().c_str());
                send_error (from, err_undefined, "Server busy");
                return;
            }
        }

        if (!iequals(pkt.mode, "octet") && !iequals(pkt.mode, "netascii")) {
            log::info ("%s from %s - Unsupported mode '%s'",
                       rq, from.to_string().c_str(), pkt.mode.c_str());
            send_error (from, err_illegal_op, "Unsupported transfer mode");
            return;
        }

        if (!is_read && !cfg.allow_write) {
            log::info ("%s from %s - Write requests not allowed", rq, from.to_string().c_str());
            send_error (from, err_access_violation, "Write requests not allowed");
            return;
        }

        auto handle = std::make_shared<session_handle_t> ();
        handle->peer = from;

        // Open the file
        //
        int result = is_read ?
            files->open_read (pkt.filename, handle->src) :
            files->open_write (pkt.filename, handle->sink);
        if (result) {
            auto errnum = errno;
            log::info ("%s from %s - Unable to open file '%s': %s",
                       rq, from.to_string().c_str(), pkt.filename.c_str(), strerror(errnum));
            send_error (from, errno_to_tftp_error(errnum), "");
            return;
        }

        // Open the session socket
        //
        if (create_transport(*handle)) {
            log::error ("%s from %s - Error opening session socket: %s",
                        rq, from.to_string().c_str(), strerror(errno));
            if (handle->sink)
                handle->sink->discard ();
            send_error (from, err_undefined, "");
            return;
        }

        session_config_t scfg = cfg.session;
        auto user_observer = cfg.session.observer;
        scfg.observer = [this, user_observer](const session& sess,
                                              session_event_t event,
                                              const transfer_result_t& result)
            {
                on_session_event (sess, event, result);
                if (user_observer)
                    user_observer (sess, event, result);
            };
        handle->sess.reset (new session(*handle->tr, scfg));

        {
            std::lock_guard<std::mutex> lock (session_mutex);
            sessions.emplace (from, handle);
        }
        handle->thread = std::thread ([this, handle, pkt]{run_session(handle, pkt);});
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int server::create_transport (session_handle_t& handle)
    {
        std::unique_ptr<transport> tr;

        if (cfg.single_port) {
            auto router = new routed_transport (sock);
            tr.reset (router);
            handle.router = router;
        }else{
            // Bind to the same local address as the request socket
            auto local_addr = sock.addr ();
            local_addr.port (0);
            auto udp = new udp_transport;
            tr.reset (udp);
            if (udp->open(local_addr))
                return -1;
        }

        if (cfg.drop_filter) {
            auto filter = cfg.drop_filter ();
            if (filter)
                tr.reset (new lossy_transport(std::move(tr), filter));
        }

        handle.tr = std::move (tr);
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void server::run_session (handle_ptr handle, packet request)
    {
        if (request.opcode == op_rrq) {
            handle->sess->serve_read (handle->peer,
                                      request.filename,
                                      *handle->src,
                                      request.options,
                                      cfg.policy);
        }else{
            handle->sess->serve_write (handle->peer,
                                       request.filename,
                                       *handle->sink,
                                       request.options,
                                       cfg.policy);
        }
        on_session_done (handle);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void server::on_session_done (handle_ptr handle)
    {
        // Close the file, the socket is closed when the thread is joined
        handle->src.reset ();
        handle->sink.reset ();

        std::lock_guard<std::mutex> lock (session_mutex);
        auto entry = sessions.find (handle->peer);
        if (entry != sessions.end() && entry->second == handle)
            sessions.erase (entry);
        finished.push_back (handle);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void server::on_session_event (const session& sess,
                                   session_event_t event,
                                   const transfer_result_t& result)
    {
        const char* rq = sess.is_read() ? "RRQ" : "WRQ";
        auto& params = sess.params ();

        switch (event) {
        case event_started:
            log::info ("%s session %s, file %s, block size %u, window size %u",
                       rq, sess.id().c_str(), sess.filename().c_str(),
                       (unsigned)params.blksize, params.windowsize);
            break;

        case event_completed:
            log::info ("%s session %s done, %llu bytes transferred",
                       rq, sess.id().c_str(), (unsigned long long)result.bytes);
            break;

        case event_failed:
            log::info ("%s session %s failed, %s%s%s",
                       rq, sess.id().c_str(), to_string(result.error),
                       (result.message.empty() ? "" : ": "),
                       result.message.c_str());
            break;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void server::reap_sessions ()
    {
        std::list<handle_ptr> done;
        {
            std::lock_guard<std::mutex> lock (session_mutex);
            done.swap (finished);
        }
        for (auto& handle : done) {
            if (handle->thread.joinable())
                handle->thread.join ();
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void server::send_error (const ip_addr& addr, uint16_t code, const std::string& msg)
    {
        std::vector<char> buf;
        packet::error(code, msg).encode (buf);
        if (sock.sendto(buf.data(), buf.size(), addr) < 0) {
            log::debug ("Error sending ERROR to %s: %s",
                        addr.to_string().c_str(), strerror(errno));
        }
    }


}
