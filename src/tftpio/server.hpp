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
#ifndef TFTPIO_SERVER_HPP
#define TFTPIO_SERVER_HPP

#include <tftpio/session.hpp>
#include <tftpio/file_provider.hpp>
#include <tftpio/transport.hpp>
#include <tftpio/udp_socket.hpp>
#include <tftpio/ip_addr.hpp>
#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <atomic>
#include <map>
#include <list>


namespace tftpio {


    /**
     * Server configuration.
     */
    struct server_config_t {
        server_config_t ();

        ip_addr bind_addr;        /**< Address of the request socket, default 0.0.0.0:69. */
        unsigned max_clients;     /**< Max number of concurrent sessions, 0 means no limit. */
        bool allow_write;         /**< Accept write requests. Default <code>false</code>. */
        bool single_port;         /**< Run all sessions on the request socket. */
        option_policy_t policy;   /**< Option negotiation policy. */
        session_config_t session; /**< Configuration of each session. */

        /**
         * If set, called to get a packet drop filter for each new session.
         */
        std::function<drop_filter_t ()> drop_filter;
    };


    /**
     * A TFTP server.
     *
     * Requests are received on one socket by a listener thread. Each
     * admitted request runs in a session with a thread of its own, on
     * a new socket bound to an ephemeral port. In single-port mode the
     * sessions share the request socket and the listener routes
     * datagrams to the session of the sending peer.
     */
    class server {
    public:
        server (const server_config_t& config, std::shared_ptr<file_provider> files);
        ~server ();

        /**
         * Bind the request socket and start serving.
         * @return 0 on success, -1 on error and <code>errno</code> is set.
         */
        int start ();

        /**
         * Stop serving.
         * All sessions are cancelled and all threads are joined.
         */
        void stop ();

        /**
         * The local address of the request socket.
         */
        const ip_addr& addr () const {
            return sock.addr ();
        }

        /**
         * Number of live sessions.
         */
        size_t num_sessions ();


    private:
        struct session_handle_t {
            session_handle_t ();

            ip_addr peer;
            std::unique_ptr<transport> tr;
            routed_transport* router;
            std::unique_ptr<session> sess;
            std::unique_ptr<data_source> src;
            std::unique_ptr<data_sink> sink;
            std::thread thread;
        };
        using handle_ptr = std::shared_ptr<session_handle_t>;

        server (const server&) = delete;
        server& operator= (const server&) = delete;

        void listen ();
        bool route (const void* buf, size_t size, const ip_addr& from);
        void handle_new_request (const packet& pkt, const ip_addr& from);
        void handle_rq (const packet& pkt, const ip_addr& from);
        int create_transport (session_handle_t& handle);
        void run_session (handle_ptr handle, packet request);
        void on_session_done (handle_ptr handle);
        void on_session_event (const session& sess,
                               session_event_t event,
                               const transfer_result_t& result);
        void reap_sessions ();
        void send_error (const ip_addr& addr, uint16_t code, const std::string& msg);

        server_config_t cfg;
        std::shared_ptr<file_provider> files;
        udp_socket sock;
        std::thread listener;
        std::atomic_bool running;

        std::mutex session_mutex;
        std::map<ip_addr, handle_ptr> sessions;
        std::list<handle_ptr> finished;
    };


}


#endif
