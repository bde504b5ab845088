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
#include <tftpio/client.hpp>
#include <tftpio/file_io.hpp>
#include <tftpio/log.hpp>
#include <cstring>
#include <cerrno>
#include <netdb.h>


namespace tftpio {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    client_config_t::client_config_t ()
        : port        {tftp_default_port},
          mode        {"octet"},
          use_options {true},
          receive_dir {"."}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int resolve_host (const std::string& host, uint16_t port, ip_addr& addr)
    {
        // Numeric address
        if (addr.parse(host, false)) {
            addr.port (port);
            return 0;
        }

        struct addrinfo hints;
        struct addrinfo* result = nullptr;
        memset (&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_DGRAM;

        auto err = getaddrinfo (host.c_str(), nullptr, &hints, &result);
        if (err) {
            log::debug ("Unable to resolve %s: %s", host.c_str(), gai_strerror(err));
            return -1;
        }

        int retval = -1;
        for (auto ai = result; ai; ai = ai->ai_next) {
            if (ai->ai_family == AF_INET) {
                addr = ip_addr (*(struct sockaddr_in*)ai->ai_addr);
                retval = 0;
                break;
            }
            else if (ai->ai_family == AF_INET6) {
                addr = ip_addr (*(struct sockaddr_in6*)ai->ai_addr);
                retval = 0;
                break;
            }
        }
        freeaddrinfo (result);

        if (retval == 0)
            addr.port (port);
        return retval;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string base_name (const std::string& path)
    {
        auto pos = path.find_last_of ('/');
        if (pos == std::string::npos)
            return path;
        return path.substr (pos + 1);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    client::client (const client_config_t& config)
        : cfg {config},
          active {nullptr},
          cancelled {false}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void client::cancel ()
    {
        std::lock_guard<std::mutex> lock (mutex);
        cancelled = true;
        if (active)
            active->cancel ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool client::start_transfer (session& sess)
    {
        std::lock_guard<std::mutex> lock (mutex);
        if (cancelled)
            return false;
        active = &sess;
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void client::end_transfer ()
    {
        std::lock_guard<std::mutex> lock (mutex);
        active = nullptr;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string client::local_path (const std::string& remote_file,
                                    const std::string& local_file) const
    {
        if (!local_file.empty() && local_file[0] == '/')
            return local_file;
        std::string path = cfg.receive_dir.empty() ? std::string(".") : cfg.receive_dir;
        if (path.back() != '/')
            path.push_back ('/');
        if (!local_file.empty())
            return path + local_file;
        return path + base_name (remote_file);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t client::local_failure (const std::string& msg, error_kind_t kind)
    {
        transfer_result_t result;
        result.state = transfer_state_t::failed;
        result.error = kind;
        result.message = msg;
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int client::open_transport (const ip_addr& server, std::unique_ptr<transport>& tr)
    {
        std::unique_ptr<udp_transport> udp (new udp_transport);
        if (udp->open(ip_addr::any(server.family())))
            return -1;
        if (cfg.drop_filter)
            tr.reset (new lossy_transport(std::move(udp), cfg.drop_filter));
        else
            tr = std::move (udp);
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t client::download (const std::string& server,
                                        const std::string& remote_file,
                                        const std::string& local_file)
    {
        ip_addr server_addr;
        if (resolve_host(server, cfg.port, server_addr))
            return local_failure ("Unable to resolve " + server);

        auto path = local_path (remote_file, local_file);
        posix_file_sink sink;
        if (sink.open(path, true))
            return local_failure (path + ": " + strerror(errno));

        std::unique_ptr<transport> tr;
        if (open_transport(server_addr, tr)) {
            auto result = local_failure (std::string("Unable to open socket: ") + strerror(errno));
            sink.discard ();
            return result;
        }

        option_list options;
        if (cfg.use_options)
            options = make_request_options (cfg.wanted);

        session sess (*tr, cfg.session);
        if (!start_transfer(sess)) {
            sink.discard ();
            return local_failure ("Transfer cancelled", error_kind_t::cancelled);
        }
        auto result = sess.request_read (server_addr, remote_file, cfg.mode, options, sink);
        end_transfer ();
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_result_t client::upload (const std::string& server,
                                      const std::string& local_file,
                                      const std::string& remote_file)
    {
        ip_addr server_addr;
        if (resolve_host(server, cfg.port, server_addr))
            return local_failure ("Unable to resolve " + server);

        posix_file_source src;
        if (src.open(local_file))
            return local_failure (local_file + ": " + strerror(errno));

        std::unique_ptr<transport> tr;
        if (open_transport(server_addr, tr))
            return local_failure (std::string("Unable to open socket: ") + strerror(errno));

        option_list options;
        if (cfg.use_options) {
            auto wanted = cfg.wanted;
            wanted.has_tsize = src.size (wanted.tsize);
            options = make_request_options (wanted);
        }

        auto remote_name = remote_file.empty() ? base_name(local_file) : remote_file;

        session sess (*tr, cfg.session);
        if (!start_transfer(sess))
            return local_failure ("Transfer cancelled", error_kind_t::cancelled);
        auto result = sess.request_write (server_addr, remote_name, cfg.mode, options, src);
        end_transfer ();
        return result;
    }


}
