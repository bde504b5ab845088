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
#ifndef EXAMPLES_TFTP_TFTP_OPTIONS_HPP
#define EXAMPLES_TFTP_TFTP_OPTIONS_HPP

#include <tftpio.hpp>
#include <string>
#include <ostream>
#include <cstdint>



//------------------------------------------------------------------------------
//  T Y P E S
//------------------------------------------------------------------------------
struct appargs_t {
    appargs_t ();
    int parse_args (int argc, char* argv[]);
    void print_usage (std::ostream& out);

    std::string server;
    std::string local_file;
    std::string remote_file;
    std::string receive_dir;
    uint16_t port;
    size_t blksize;
    unsigned windowsize;
    unsigned timeout_sec;
    unsigned request_timeout;
    unsigned max_retries;
    unsigned linger;
    tftpio::rollover_t rollover;
    bool upload;
    bool use_options;
    bool keep_on_error;
    bool verbose;
#ifdef TFTPIO_DEBUG_DROP
    double drop_rate;
#endif
};


#endif
