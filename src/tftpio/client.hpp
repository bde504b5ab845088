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
#ifndef TFTPIO_CLIENT_HPP
#define TFTPIO_CLIENT_HPP

#include <tftpio/session.hpp>
#include <tftpio/transport.hpp>
#include <tftpio/ip_addr.hpp>
#include <string>
#include <mutex>


namespace tftpio {


    /**
     * Client configuration.
     */
    struct client_config_t {
        client_config_t ();

        uint16_t port;            /**< Server request port, default 69. */
        std::string mode;         /**< Transfer mode, default "octet". */
        bool use_options;         /**< Send options in the request. Default <code>true</code>. */

        /**
         * Requested transfer parameters. Only values that differ from
         * the defaults are sent as options. The timeout is in milliseconds
         * and is sent rounded up to whole seconds.
         */
        transfer_params_t wanted;

        /**
         * Directory of downloaded files when no local file name is given.
         */
        std::string receive_dir;

        /**
         * Session configuration. <code>session.timeout</code> is the
         * time to wait for a reply before the request is resent.
         */
        session_config_t session;

        /**
         * If set, packets are dropped by this filter.
         */
        drop_filter_t drop_filter;
    };


    /**
     * Resolve a host name or numeric address.
     * @return 0 on success, -1 on error.
     */
    int resolve_host (const std::string& host, uint16_t port, ip_addr& addr);

    /**
     * Return the part of a path after the last '/'.
     */
    std::string base_name (const std::string& path);


    /**
     * A TFTP client.
     */
    class client {
    public:
        explicit client (const client_config_t& config=client_config_t());

        /**
         * Download a file.
         * @param server Host name or address of the server.
         * @param remote_file The file to read from the server.
         * @param local_file Where to store the file. A relative path is
         *                   relative to the receive directory. If empty,
         *                   the base name of the remote file in the
         *                   receive directory.
         */
        transfer_result_t download (const std::string& server,
                                    const std::string& remote_file,
                                    const std::string& local_file="");

        /**
         * Upload a file.
         * @param server Host name or address of the server.
         * @param local_file The file to send.
         * @param remote_file The name of the file on the server. If empty,
         *                    the base name of the local file.
         */
        transfer_result_t upload (const std::string& server,
                                  const std::string& local_file,
                                  const std::string& remote_file="");

        /**
         * Cancel a transfer in progress.
         * May be called from any thread. The client stays cancelled,
         * a transfer not yet started fails with error_kind_t::cancelled
         * without sending anything.
         */
        void cancel ();

        /**
         * Local path of a download.
         */
        std::string local_path (const std::string& remote_file,
                                const std::string& local_file) const;


    private:
        client (const client&) = delete;
        client& operator= (const client&) = delete;

        int open_transport (const ip_addr& server, std::unique_ptr<transport>& tr);
        transfer_result_t local_failure (const std::string& msg,
                                         error_kind_t kind=error_kind_t::io_error);
        bool start_transfer (session& sess);
        void end_transfer ();

        client_config_t cfg;
        std::mutex mutex;
        session* active;
        bool cancelled;
    };


}


#endif
