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
#include "tftpd-options.hpp"
#include "app-common.hpp"

#include <string>
#include <iostream>
#include <stdexcept>
#include <cstring>
#include <cerrno>
#include <sys/types.h>
#include <getopt.h>


static constexpr const char* default_tftp_root = "/srv/tftp";
static constexpr const size_t default_max_clients = 0; // 0 == No limit
static constexpr const unsigned max_linger = 600000; // Milliseconds

// Long options without a short option
enum {
    opt_send_dir = 256,
    opt_receive_dir,
    opt_rollover,
    opt_linger,
    opt_drop_rate
};


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
void appargs_t::print_usage (std::ostream& out)
{
    out << "TFTP server." << std::endl;
    out << std::endl;
    out << "Usage: " << program_invocation_short_name << " [OPTIONS]" << std::endl;
    out << std::endl;
    out << "  -r, --tftproot=<directory>     Serve files from this directory. Default is: " << default_tftp_root << '.' << std::endl;
    out << "      --send-dir=<directory>     Serve read requests from this directory, relative to the tftp root." << std::endl;
    out << "      --receive-dir=<directory>  Store written files in this directory, relative to the tftp root." << std::endl;
    out << "  -b, --bind=<address>           Bind the tftp server to this address[:port]." << std::endl;
    out << "                                 Default address is 0.0.0.0:" << tftpio::tftp_default_port << " (any local IPv4 address)." << std::endl;
    out << "  -p, --port=<port>              Bind the tftp server to this port number." << std::endl;
    out << "                                 This overrides any port in option --bind." << std::endl;
    out << "  -m, --max-clients=<num>        Maximum number of concurrent clients." << std::endl;
    out << "                                 A value of 0 means no limit." << " Default is "<< default_max_clients << '.' << std::endl;
    out << "  -S, --single-port              Run all sessions on the server port instead of on ephemeral ports." << std::endl;
    out << "  -R, --max-retries=<num>        Maximum number of transmissions of a packet. Default is " << tftpio::default_max_retries << '.' << std::endl;
    out << "  -T, --timeout=<seconds>        Retransmission timeout if not negotiated. Default is " << (tftpio::default_timeout/1000) << '.' << std::endl;
    out << "  -B, --max-blksize=<size>       Maximum block size. Default is " << tftpio::max_blksize << '.' << std::endl;
    out << "  -W, --max-windowsize=<num>     Maximum window size. Default is " << tftpio::max_windowsize << '.' << std::endl;
    out << "      --rollover=<0|1|any>       Block number after 65535. Default is 'any', send 0 and accept 0 or 1." << std::endl;
    out << "  -d, --duplicate-packets=<num>  Send every packet this many extra times." << std::endl;
    out << "      --linger=<milliseconds>    After the final ACK of a WRQ, answer a repeated final block" << std::endl;
    out << "                                 for this long. 0 disables it. Default is twice the timeout." << std::endl;
    out << "  -u, --user=<user_id>           When the server is initialized, drop user privileges to this user." << std::endl;
    out << "  -g, --group=<group_id>         When the server is initialized, drop group privileges to this group." << std::endl;
    out << "  -i, --pid-file=<filename>      Create a pid file." << std::endl;
    out << "  -f, --foreground               Run the server in foreground." << std::endl;
    out << "  -s, --stdout                   Log to standard output instead of syslog." << std::endl;
    out << "                                 This option is only applicable if option --foreground is used." << std::endl;
    out << "  -w, --allow-wrq                Allow clients to write files (WRQ requests)." << std::endl;
    out << "                                 Default is to not allow WRQ requests." << std::endl;
    out << "  -o, --allow-overwrite          If WRQ is allowed, allow files to be overwritten." << std::endl;
    out << "  -l, --wrq-size-limit=<size>    Maximum size, in bytes, of files written with WRQ." << std::endl;
    out << "                                 A value of 0 means no limit. Default is no limit. " << std::endl;
    out << "                                 Use postfix 'K', 'M', 'G', for Kilobytes, Megabytes, and Gigabytes. " << std::endl;
    out << "  -k, --keep-on-error            Keep partially written files of failed WRQ requests." << std::endl;
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
    : bind_addr ((uint32_t)INADDR_ANY, tftpio::tftp_default_port),
      tftproot (default_tftp_root),
      max_wrq_size (0),
      max_clients (default_max_clients),
      max_retries (tftpio::default_max_retries),
      timeout (tftpio::default_timeout),
      max_blksize (tftpio::max_blksize),
      max_windowsize (tftpio::max_windowsize),
      repeat_count (0),
      linger (tftpio::linger_auto),
      rollover (tftpio::rollover_dont_care),
      single_port (false),
      keep_on_error (false),
      foreground (false),
      log_to_stdout (false),
      allow_wrq (false),
      allow_overwrite (false),
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
        { "tftproot",          required_argument, 0, 'r'},
        { "send-dir",          required_argument, 0, opt_send_dir},
        { "receive-dir",       required_argument, 0, opt_receive_dir},
        { "bind",              required_argument, 0, 'b'},
        { "port",              required_argument, 0, 'p'},
        { "max-clients",       required_argument, 0, 'm'},
        { "single-port",       no_argument,       0, 'S'},
        { "max-retries",       required_argument, 0, 'R'},
        { "timeout",           required_argument, 0, 'T'},
        { "max-blksize",       required_argument, 0, 'B'},
        { "max-windowsize",    required_argument, 0, 'W'},
        { "rollover",          required_argument, 0, opt_rollover},
        { "duplicate-packets", required_argument, 0, 'd'},
        { "linger",            required_argument, 0, opt_linger},
        { "user",              required_argument, 0, 'u'},
        { "group",             required_argument, 0, 'g'},
        { "pid-file",          required_argument, 0, 'i'},
        { "foreground",        no_argument,       0, 'f'},
        { "stdout",            no_argument,       0, 's'},
        { "allow-wrq",         no_argument,       0, 'w'},
        { "allow-overwrite",   no_argument,       0, 'o'},
        { "wrq-size-limit",    required_argument, 0, 'l'},
        { "keep-on-error",     no_argument,       0, 'k'},
#ifdef TFTPIO_DEBUG_DROP
        { "drop-rate",         required_argument, 0, opt_drop_rate},
#endif
        { "verbose",           no_argument,       0, 'v'},
        { "help",              no_argument,       0, 'h'},
        { 0, 0, 0, 0}
    };
    static const char* arg_format = "r:b:p:m:SR:T:B:W:d:u:g:i:fswol:kvh";
    int bind_port = -1;
    size_t len;

    while (1) {
        int c = getopt_long (argc, argv, arg_format, long_options, NULL);
        if (c == -1)
            break;
        try {
            switch (c) {
            case 'r':
                len = strlen (optarg);
                // Remove trailing / if not root dir.
                if (len>1 && optarg[len-1]=='/')
                    tftproot = std::string (optarg, len-1);
                else
                    tftproot = optarg;
                break;

            case opt_send_dir:
                send_dir = optarg;
                break;

            case opt_receive_dir:
                receive_dir = optarg;
                break;

            case 'b':
                if (!bind_addr.parse(optarg) || (bind_addr.family()!=AF_INET && bind_addr.family()!=AF_INET6)) {
                    std::cerr << "Error: Invalid IPv[4|6] address and/or port number to argument '--bind'" << std::endl;
                    return -1;
                }
                break;

            case 'p':
                bind_port = (int) parse_uint (optarg, 1, 65535);
                break;

            case 'm':
                max_clients = parse_uint (optarg, 0, 65535);
                break;

            case 'S':
                single_port = true;
                break;

            case 'R':
                max_retries = parse_uint (optarg, 1, 255);
                break;

            case 'T':
                timeout = parse_timeout (optarg);
                break;

            case 'B':
                max_blksize = parse_uint (optarg, tftpio::min_blksize, tftpio::max_blksize);
                break;

            case 'W':
                max_windowsize = parse_uint (optarg, 1, tftpio::max_windowsize);
                break;

            case opt_rollover:
                if (!parse_rollover(optarg, rollover)) {
                    std::cerr << "Error: Invalid value to argument '--rollover'" << std::endl;
                    return -1;
                }
                break;

            case 'd':
                repeat_count = parse_uint (optarg, 0, 16);
                break;

            case opt_linger:
                linger = parse_uint (optarg, 0, max_linger);
                break;

            case 'u':
                user = optarg;
                break;

            case 'g':
                group = optarg;
                break;

            case 'i':
                pid_file = optarg;
                break;

            case 'f':
                foreground = true;
                break;

            case 's':
                log_to_stdout = true;
                break;

            case 'w':
                allow_wrq = true;
                break;

            case 'o':
                allow_overwrite = true;
                break;

            case 'l':
                max_wrq_size = parse_file_size (optarg);
                break;

            case 'k':
                keep_on_error = true;
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
    if (optind < argc) {
        std::cerr << "Error: Invalid argument" << std::endl;
        print_usage (std::cerr);
        return -1;
    }

    // Set port number
    //
    if (bind_port != -1)
        bind_addr.port ((uint16_t)bind_port);
    else if (!bind_addr.port())
        bind_addr.port (tftpio::tftp_default_port);

    // Don't log to standard output if not running in foreground
    if (!foreground)
        log_to_stdout = false;

    return 0;
}
