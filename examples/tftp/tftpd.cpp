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
#include <fstream>
#include <memory>
#include <atomic>
#include <system_error>
#include <stdexcept>
#include <cstring>
#include <cerrno>
#include <csignal>
#include <unistd.h>
#include <syslog.h>
#include <pthread.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <pwd.h>
#include <grp.h>

#include "tftpd-options.hpp"


namespace tio = tftpio;


struct appstate_t {
    appstate_t (const appargs_t& appargs)
        : opt (appargs)
    {
        uid = getuid ();
        gid = getgid ();
    }

    const appargs_t& opt;
    std::shared_ptr<tio::directory_provider> files;
    uid_t uid;
    gid_t gid;
};


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static int get_uid (const std::string& user, uid_t& uid)
{
    struct passwd* pwd = nullptr;
    errno = 0;
    try {
        pwd = getpwuid ((uid_t)std::stol(user));
    }
    catch (std::exception& e) {
        pwd = getpwnam (user.c_str());
    }
    if (!pwd)
        return -1;

    uid = pwd->pw_uid;
    return 0;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static int get_gid (const std::string& group, gid_t& gid)
{
    struct group* grp = nullptr;
    errno = 0;
    try {
        grp = getgrgid ((gid_t)std::stol(group));
    }
    catch (std::exception& e) {
        grp = getgrnam (group.c_str());
    }
    if (!grp)
        return -1;

    gid = grp->gr_gid;
    return 0;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static int set_tftproot (appstate_t& app)
{
    try {
        app.files = std::make_shared<tio::directory_provider> (app.opt.tftproot,
                                                               app.opt.send_dir,
                                                               app.opt.receive_dir,
                                                               app.opt.allow_overwrite);
    }
    catch (std::system_error& e) {
        tio::log::error ("Invalid tftp root %s: %s", app.opt.tftproot.c_str(), e.what());
        return -1;
    }
    return chdir (app.files->root().c_str());
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static int do_fork ()
{
    auto pid = fork ();
    if (pid < 0) {
        tio::log::error ("Unable to fork process: %s", strerror(errno));
        return -1;
    }
    else if (pid > 0) {
        // Exit parent process
        exit (0);
    }
    return 0;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static int daemonize (appstate_t& app)
{
    // Reset umask
    umask (0);

    if (!app.opt.foreground) {
        // fork
        if (do_fork())
            return -1;

        // Disassociate from the process group and the controlling terminal
        setsid ();

        // Do a second fork to make a process that is not a session leader
        // and that will not be able to create a controlling terminal
        if (do_fork())
            return -1;
    }

    // Close open file descriptors
    for (int i=0; i<1024; ++i) {
        if ((i==1||i==2) && app.opt.log_to_stdout)
            continue;
        close (i);
    }

    // (Re)open syslog
    if (!app.opt.log_to_stdout)
        openlog ("tftpd", LOG_PID, LOG_DAEMON);

    return 0;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static int set_privileges (appstate_t& app)
{
    // Get uid and gid from application arguments
    if (!app.opt.user.empty() && get_uid(app.opt.user, app.uid)) {
        tio::log::error ("Unable to set user id: %s",
                         (errno ? strerror(errno) : "No such user."));
        return -1;
    }
    if (!app.opt.group.empty() && get_gid(app.opt.group, app.gid)) {
        tio::log::error ("Unable to set group id: %s",
                         (errno ? strerror(errno) : "No such group."));
        return -1;
    }

    // Set group id
    if (app.gid != getgid()) {
        tio::log::debug ("Setting group id to %u", (unsigned(app.gid)));
        errno = 0;
        if (setgid(app.gid)) {
            tio::log::error ("Unable to set group id: %s", strerror(errno));
            return -1;
        }
    }

    // Set user id
    if (app.uid != getuid()) {
        errno = 0;
        tio::log::debug ("Setting user id to %u", (unsigned(app.uid)));
        if (setuid(app.uid)) {
            tio::log::error ("Unable to set user id: %s", strerror(errno));
            return -1;
        }
    }

    return 0;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static tio::server_config_t make_server_config (const appargs_t& opt)
{
    tio::server_config_t cfg;

    cfg.bind_addr   = opt.bind_addr;
    cfg.max_clients = opt.max_clients;
    cfg.allow_write = opt.allow_wrq;
    cfg.single_port = opt.single_port;

    cfg.policy.max_blksize    = opt.max_blksize;
    cfg.policy.max_windowsize = opt.max_windowsize;
    cfg.policy.max_write_size = opt.max_wrq_size;

    cfg.session.max_retries    = opt.max_retries;
    cfg.session.timeout        = opt.timeout;
    cfg.session.rollover       = opt.rollover;
    cfg.session.repeat_count   = opt.repeat_count;
    cfg.session.linger         = opt.linger;
    cfg.session.max_write_size = opt.max_wrq_size;
    cfg.session.clean_on_error = !opt.keep_on_error;

#ifdef TFTPIO_DEBUG_DROP
    if (opt.drop_rate > 0.0) {
        auto rate = opt.drop_rate;
        auto seed = std::make_shared<std::atomic_uint> ((unsigned)getpid());
        cfg.drop_filter = [rate, seed]() {
            return tio::drop_random (rate, (*seed)++);
        };
    }
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

    appstate_t app (opt);

    // Configure logging
    //
    if (opt.log_to_stdout) {
        tio::log::set_callback (tio::stdout_log_callback);
    }else{
        openlog ("tftpd", LOG_PID, LOG_DAEMON);
    }
    tio::log::priority (opt.verbose ? LOG_DEBUG : LOG_INFO);

    // Change working directory to the tftp root
    //
    if (set_tftproot(app)) {
        tio::log::error ("Unable to set working directory: %s", strerror(errno));
        exit (1);
    }

    // Daemonize
    //
    if (daemonize(app))
        exit (1);

    // Create PID file
    //
    if (!app.opt.pid_file.empty()) {
        std::ofstream pf (app.opt.pid_file);
        pf << getpid() << std::endl;
        if (!pf.good()) {
            tio::log::error ("Error creating pid file");
            exit (1);
        }
    }

    // Exit gracefully on CTRL-C (SIGINT) and SIGTERM.
    // Block the signals before any thread is created,
    // the main thread waits for them with sigwait().
    //
    sigset_t sigset;
    sigemptyset (&sigset);
    sigaddset (&sigset, SIGINT);
    sigaddset (&sigset, SIGTERM);
    pthread_sigmask (SIG_BLOCK, &sigset, nullptr);

    // Start the server
    //
    tio::server srv (make_server_config(app.opt), app.files);
    if (srv.start()) {
        tio::log::error ("Unable to open/bind socket %s: %s",
                         app.opt.bind_addr.to_string(true).c_str(),
                         strerror(errno));
        exit (1);
    }

    // Server ready to serve, but first drop privileges
    //
    if (set_privileges(app)) {
        srv.stop ();
        exit (1);
    }

    tio::log::info ("Serving files from %s, directory %s",
                    srv.addr().to_string(true).c_str(),
                    app.files->root().c_str());
    if (app.opt.allow_wrq) {
        if (app.opt.max_wrq_size)
            tio::log::debug ("Allow write requests with a size limit of %llu bytes",
                             (unsigned long long)app.opt.max_wrq_size);
        else
            tio::log::debug ("Allow write requests with no size limit");
    }

    // Wait for the TFTP server to terminate (SIGINT or SIGTERM)
    //
    int sig = 0;
    while (sigwait(&sigset, &sig) != 0)
        ;
    tio::log::debug ("Got signal %d", sig);

    // Stop pending sessions
    //
    srv.stop ();

    tio::log::info ("Stopped");
    return 0;
}
