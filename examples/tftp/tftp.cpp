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
#include <tftpio.hpp>
#include <iostream>
#include <memory>
#include <thread>
#include <cstring>
#include <csignal>
#include <unistd.h>
#include <syslog.h>
#include <pthread.h>

#include "tftp-options.hpp"


namespace tio = tftpio;


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static tio::client_config_t make_client_config (const appargs_t& opt)
{
    tio::client_config_t cfg;

    cfg.port        = opt.port;
    cfg.use_options = opt.use_options;
    cfg.receive_dir = opt.receive_dir;

    cfg.wanted.blksize    = opt.blksize;
    cfg.wanted.windowsize = opt.windowsize;
    if (opt.timeout_sec)
        cfg.wanted.timeout = opt.timeout_sec * 1000;

    cfg.session.max_retries    = opt.max_retries;
    cfg.session.timeout        = opt.request_timeout;
    cfg.session.rollover       = opt.rollover;
    cfg.session.linger         = opt.linger;
    cfg.session.clean_on_error = !opt.keep_on_error;

    cfg.session.observer = [](const tio::session& sess,
                              tio::session_event_t event,
                              const tio::transfer_result_t& result)
        {
            if (event != tio::event_started)
                return;
            auto& params = sess.params ();
            tio::log::debug ("Transfer started, block size %u, window size %u, timeout %u ms",
                             (unsigned)params.blksize, params.windowsize, params.timeout);
        };

#ifdef TFTPIO_DEBUG_DROP
    if (opt.drop_rate > 0.0)
        cfg.drop_filter = tio::drop_random (opt.drop_rate, (unsigned)getpid());
#endif

    return cfg;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
int main (int argc, char* argv[])
{
    // Parse arguments
    //
    appargs_t opt;
    auto parse_result = opt.parse_args (argc, argv);
    if (parse_result) {
        return parse_result<0 ? 1 : 0;
    }

    tio::log::set_callback (tio::stdout_log_callback);
    tio::log::priority (opt.verbose ? LOG_DEBUG : LOG_INFO);

    // Cancel the transfer on CTRL-C (SIGINT) and SIGTERM.
    // The signals are handled by a thread of their own,
    // SIGUSR1 stops the signal thread.
    //
    sigset_t sigset;
    sigemptyset (&sigset);
    sigaddset (&sigset, SIGINT);
    sigaddset (&sigset, SIGTERM);
    sigaddset (&sigset, SIGUSR1);
    pthread_sigmask (SIG_BLOCK, &sigset, nullptr);

    tio::client client (make_client_config(opt));

    std::thread signal_thread ([&client, sigset]{
            int sig = 0;
            while (sigwait(&sigset, &sig) != 0)
                ;
            if (sig == SIGINT || sig == SIGTERM) {
                tio::log::debug ("Got signal %d, cancel transfer", sig);
                client.cancel ();
            }
        });

    tio::transfer_result_t result;
    if (opt.upload) {
        tio::log::debug ("Upload %s to %s:%u",
                         opt.local_file.c_str(), opt.server.c_str(), (unsigned)opt.port);
        result = client.upload (opt.server, opt.local_file, opt.remote_file);
    }
    else if (opt.remote_file.empty()) {
        // One file name, it is the remote file
        tio::log::debug ("Download %s from %s:%u",
                         opt.local_file.c_str(), opt.server.c_str(), (unsigned)opt.port);
        result = client.download (opt.server, opt.local_file);
    }else{
        tio::log::debug ("Download %s from %s:%u to %s",
                         opt.remote_file.c_str(), opt.server.c_str(), (unsigned)opt.port,
                         client.local_path(opt.remote_file, opt.local_file).c_str());
        result = client.download (opt.server, opt.remote_file, opt.local_file);
    }

    pthread_kill (signal_thread.native_handle(), SIGUSR1);
    signal_thread.join ();

    if (result.ok()) {
        tio::log::info ("Transfer complete, %llu bytes",
                        (unsigned long long)result.bytes);
        return 0;
    }

    if (result.error == tio::error_kind_t::peer_error) {
        tio::log::error ("Transfer failed, error %u from server: %s",
                         (unsigned)result.tftp_code, result.message.c_str());
    }else{
        tio::log::error ("Transfer failed, %s%s%s",
                         tio::to_string(result.error),
                         (result.message.empty() ? "" : ": "),
                         result.message.c_str());
    }
    return 1;
}
