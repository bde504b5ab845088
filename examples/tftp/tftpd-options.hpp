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
#ifndef EXAMPLES_TFTP_TFTPD_OPTIONS_HPP
#define EXAMPLES_TFTP_TFTPD_OPTIONS_HPP

#include <tftpio.hpp>
#include <string>
#include <ostream>
#include <cstdint>
#include <unistd.h>
#include <sys/types.h>



//------------------------------------------------------------------------------
//  T Y P E S
//------------------------------------------------------------------------------
struct appargs_t {
    appargs_t ();
    int parse_args (int argc, char* argv[]);
    void print_usage (std::ostream& out);

    tftpio::ip_addr bind_addr;
    std::string tftproot;
    std::string send_dir;
    std::string receive_dir;
    std::string pid_file;
    std::string user;
    std::string group;
    uint64_t max_wrq_size;
    size_t max_clients;
    unsigned max_retries;
    unsigned timeout;
    size_t max_blksize;
    unsigned max_windowsize;
    unsigned repeat_count;
    unsigned linger;
    tftpio::rollover_t rollover;
    bool single_port;
    bool keep_on_error;
    bool foreground;
    bool log_to_stdout;
    bool allow_wrq;
    bool allow_overwrite;
    bool verbose;
#ifdef TFTPIO_DEBUG_DROP
    double drop_rate;
#endif
};


#endif
