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
#include "tftp-options.hpp"
#include "app-common.hpp"

#include <string>
#include <iostream>
#include <stdexcept>
#include <cstring>
#include <cerrno>
#include <getopt.h>


// Long options without a short option
enum {
    opt_rollover = 256,
    opt_no_options,
    opt_linger,
    opt_drop_rate
};

static constexpr const unsigned max_linger = 600000; // Milliseconds


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
void appargs_t::print_usage (std::ostream& out)
{
    out << "TFTP client." << std::endl;
    out << std::endl;
    out << "Usage: " << program_invocation_short_name << " [OPTIONS] <server> <local-file> [remote-file]" << std::endl;
    out << std::endl;
    out << "Download (default): Read 'remote-file' from the server and store it as 'local-file'." << std::endl;
    out << "                    If 'remote-file' is omitted, 'local-file' is the name of the remote" << std::endl;
    out << "                    file and it is stored in the receive directory." << std::endl;
    out << "Upload:             Send 'local-file' to the server and store it as 'remote-file'." << std::endl;
    out << "                    If 'remote-file' is omitted, the base name of 'local-file' is used." << std::endl;
    out << std::endl;
    out << "  -u, --upload                   Upload a file." << std::endl;
    out << "  -d, --download                 Download a file. This is the default." << std::endl;
    out << "  -p, --port=<port>              Server port number. Default is " << tftpio::tftp_default_port << '.' << std::endl;
    out << "  -b, --blksize=<size>           Request this block size (" << tftpio::min_blksize << '-' << tftpio::max_blksize << ")." << std::endl;
    out << "  -w, --windowsize=<num>         Request this window size (1-" << tftpio::max_windowsize << ")." << std::endl;
    out << "  -t, --timeout=<seconds>        Request this retransmission timeout (1-" << tftpio::max_timeout_sec << ")." << std::endl;
    out << "  -T, --request-timeout=<ms>     Time to wait for a reply before resending, if no timeout is negotiated." << std::endl;
    out << "                                 Default is " << tftpio::default_timeout << '.' << std::endl;
    out << "  -R, --max-retries=<num>        Maximum number of transmissions of a packet. Default is " << tftpio::default_max_retries << '.' << std::endl;
    out << "  -r, --receive-dir=<directory>  Store downloaded files in this directory. Default is the current directory." << std::endl;
    out << "      --rollover=<0|1|any>       Block number after 65535. Default is 'any', send 0 and accept 0 or 1." << std::endl;
    out << "  -k, --keep-on-error            Keep a partially downloaded file if the transfer fails." << std::endl;
    out << "      --linger=<milliseconds>    After the final ACK of a download, answer a repeated final block" << std::endl;
    out << "                                 for this long. 0 disables it. Default is twice the timeout." << std::endl;
    out << "      --no-options               Don't send any options in the request." << std::endl;
#ifdef TFTPIO_DEBUG_DROP
    out << "      --drop-rate=<percent>      Drop this percentage of all packets, for testing." << std::endl;
#endif
    out << "  -v, --verbose                  Verbose logging." << std::endl;
    out << "  -h, --help                     Print this help message." << std::endl;
    out << std::endl;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
appargs_t::appargs_t ()
    : receive_dir ("."),
      port (tftpio::tftp_default_port),
      blksize (tftpio::default_blksize),
      windowsize (tftpio::default_windowsize),
      timeout_sec (0),
      request_timeout (tftpio::default_timeout),
      max_retries (tftpio::default_max_retries),
      linger (tftpio::linger_auto),
      rollover (tftpio::rollover_dont_care),
      upload (false),
      use_options (true),
      keep_on_error (false),
      verbose (false)
#ifdef TFTPIO_DEBUG_DROP
      , drop_rate (0.0)
#endif
{
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
int appargs_t::parse_args (int argc, char* argv[])
{
    static struct option long_options[] = {
        { "upload",          no_argument,       0, 'u'},
        { "download",        no_argument,       0, 'd'},
        { "port",            required_argument, 0, 'p'},
        { "blksize",         required_argument, 0, 'b'},
        { "windowsize",      required_argument, 0, 'w'},
        { "timeout",         required_argument, 0, 't'},
        { "request-timeout", required_argument, 0, 'T'},
        { "max-retries",     required_argument, 0, 'R'},
        { "receive-dir",     required_argument, 0, 'r'},
        { "rollover",        required_argument, 0, opt_rollover},
        { "keep-on-error",   no_argument,       0, 'k'},
        { "no-options",      no_argument,       0, opt_no_options},
        { "linger",          required_argument, 0, opt_linger},
#ifdef TFTPIO_DEBUG_DROP
        { "drop-rate",       required_argument, 0, opt_drop_rate},
#endif
        { "verbose",         no_argument,       0, 'v'},
        { "help",            no_argument,       0, 'h'},
        { 0, 0, 0, 0}
    };
    static const char* arg_format = "udp:b:w:t:T:R:r:kvh";

    while (1) {
        int c = getopt_long (argc, argv, arg_format, long_options, NULL);
        if (c == -1)
            break;
        try {
            switch (c) {
            case 'u':
                upload = true;
                break;

            case 'd':
                upload = false;
                break;

            case 'p':
                port = (uint16_t) parse_uint (optarg, 1, 65535);
                break;

            case 'b':
                blksize = parse_uint (optarg, tftpio::min_blksize, tftpio::max_blksize);
                break;

            case 'w':
                windowsize = parse_uint (optarg, 1, tftpio::max_windowsize);
                break;

            case 't':
                timeout_sec = parse_uint (optarg, tftpio::min_timeout_sec, tftpio::max_timeout_sec);
                break;

            case 'T':
                request_timeout = parse_uint (optarg, 1, 255000);
                break;

            case 'R':
                max_retries = parse_uint (optarg, 1, 255);
                break;

            case 'r':
                receive_dir = optarg;
                break;

            case opt_rollover:
                if (!parse_rollover(optarg, rollover)) {
                    std::cerr << "Error: Invalid value to argument '--rollover'" << std::endl;
                    return -1;
                }
                break;

            case 'k':
                keep_on_error = true;
                break;

            case opt_linger:
                linger = parse_uint (optarg, 0, max_linger);
                break;

            case opt_no_options:
                use_options = false;
                break;

#ifdef TFTPIO_DEBUG_DROP
            case opt_drop_rate:
                drop_rate = parse_drop_rate (optarg);
                break;
#endif

            case 'v':
                verbose = true;
                break;

            case 'h':
                print_usage (std::cout);
                return 1;

            default:
                return -1;
            }
        }
        catch (std::exception& e) {
            std::cerr << "Error: Invalid argument value '" << optarg << "'" << std::endl;
            return -1;
        }
    }

    // Positional arguments
    //
    auto num_args = argc - optind;
    if (num_args < 2 || num_args > 3) {
        std::cerr << "Error: Missing or invalid arguments" << std::endl;
        print_usage (std::cerr);
        return -1;
    }
    server = argv[optind];
    local_file = argv[optind+1];
    if (num_args == 3)
        remote_file = argv[optind+2];

    return 0;
}
