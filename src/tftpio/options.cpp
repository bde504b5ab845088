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
#include <tftpio/options.hpp>
#include <tftpio/log.hpp>
#include <limits>


namespace tftpio {


    const char* const opt_blksize    = "blksize";
    const char* const opt_timeout    = "timeout";
    const char* const opt_tsize      = "tsize";
    const char* const opt_windowsize = "windowsize";


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    transfer_params_t::transfer_params_t ()
        : blksize    {default_blksize},
          timeout    {default_timeout},
          has_tsize  {false},
          tsize      {0},
          windowsize {default_windowsize}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    option_policy_t::option_policy_t ()
        : max_blksize    {tftpio::max_blksize},
          max_windowsize {tftpio::max_windowsize},
          max_write_size {0}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool parse_number (const std::string& str, uint64_t& value)
    {
        if (str.empty())
            return false;

        uint64_t result = 0;
        for (auto ch : str) {
            if (ch < '0' || ch > '9')
                return false;
            unsigned digit = ch - '0';
            if (result > (std::numeric_limits<uint64_t>::max() - digit) / 10)
                return false;
            result = result*10 + digit;
        }
        value = result;
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    negotiation_t negotiate_options (const option_list& requested,
                                     bool is_read,
                                     bool has_file_size,
                                     uint64_t file_size,
                                     const option_policy_t& policy,
                                     transfer_params_t& params,
                                     option_list& reply,
                                     std::string& error_msg)
    {
        params = transfer_params_t ();
        reply.clear ();

        size_t server_max_blksize = policy.max_blksize;
        if (server_max_blksize < min_blksize || server_max_blksize > max_blksize)
            server_max_blksize = max_blksize;
        unsigned server_max_windowsize = policy.max_windowsize;
        if (server_max_windowsize < 1 || server_max_windowsize > max_windowsize)
            server_max_windowsize = max_windowsize;

        for (auto& opt : requested) {
            uint64_t value = 0;
            const std::string& name = opt.first;

            if (iequals(name, opt_blksize)) {
                if (!parse_number(opt.second, value) || value < min_blksize) {
                    error_msg = "Invalid blksize value";
                    return neg_failed;
                }
                if (value > server_max_blksize)
                    value = server_max_blksize;
                params.blksize = (size_t) value;
                reply.set (opt_blksize, std::to_string(value));
            }
            else if (iequals(name, opt_timeout)) {
                if (!parse_number(opt.second, value)) {
                    error_msg = "Invalid timeout value";
                    return neg_failed;
                }
                if (value < min_timeout_sec || value > max_timeout_sec) {
                    log::debug ("Ignoring out of range timeout option %s", opt.second.c_str());
                    continue;
                }
                params.timeout = (unsigned) value * 1000;
                reply.set (opt_timeout, std::to_string(value));
            }
            else if (iequals(name, opt_tsize)) {
                if (!parse_number(opt.second, value)) {
                    error_msg = "Invalid tsize value";
                    return neg_failed;
                }
                if (is_read) {
                    if (!has_file_size)
                        continue;
                    value = file_size;
                }
                else if (policy.max_write_size && value > policy.max_write_size) {
                    error_msg = tftp_error_to_string (err_disk_full);
                    return neg_too_large;
                }
                params.has_tsize = true;
                params.tsize = value;
                reply.set (opt_tsize, std::to_string(value));
            }
            else if (iequals(name, opt_windowsize)) {
                if (!parse_number(opt.second, value) || value < 1) {
                    error_msg = "Invalid windowsize value";
                    return neg_failed;
                }
                if (value > server_max_windowsize)
                    value = server_max_windowsize;
                params.windowsize = (unsigned) value;
                reply.set (opt_windowsize, std::to_string(value));
            }
            else {
                log::debug ("Ignoring unknown option %s", name.c_str());
            }
        }

        return reply.empty() ? neg_no_options : neg_accepted;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool apply_oack (const option_list& requested,
                     const option_list& oack,
                     transfer_params_t& params,
                     std::string& error_msg)
    {
        params = transfer_params_t ();

        for (auto& opt : oack) {
            const std::string& name = opt.first;
            std::string req_value;
            uint64_t req_num = 0;
            uint64_t value = 0;

            if (!requested.get(name, req_value)) {
                error_msg = "Unrequested option " + name;
                return false;
            }
            if (!parse_number(opt.second, value)) {
                error_msg = "Invalid value of option " + name;
                return false;
            }
            if (!parse_number(req_value, req_num))
                req_num = std::numeric_limits<uint64_t>::max ();

            if (iequals(name, opt_blksize)) {
                if (value < min_blksize || value > max_blksize || value > req_num) {
                    error_msg = "Invalid blksize value";
                    return false;
                }
                params.blksize = (size_t) value;
            }
            else if (iequals(name, opt_timeout)) {
                if (value < min_timeout_sec || value > max_timeout_sec) {
                    error_msg = "Invalid timeout value";
                    return false;
                }
                params.timeout = (unsigned) value * 1000;
            }
            else if (iequals(name, opt_tsize)) {
                params.has_tsize = true;
                params.tsize = value;
            }
            else if (iequals(name, opt_windowsize)) {
                if (value < 1 || value > max_windowsize || value > req_num) {
                    error_msg = "Invalid windowsize value";
                    return false;
                }
                params.windowsize = (unsigned) value;
            }
            // Other requested options are accepted as is
        }
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    option_list make_request_options (const transfer_params_t& wanted)
    {
        option_list options;
        if (wanted.blksize != default_blksize)
            options.set (opt_blksize, std::to_string(wanted.blksize));
        if (wanted.timeout != default_timeout) {
            unsigned sec = (wanted.timeout + 999) / 1000;
            if (sec < min_timeout_sec)
                sec = min_timeout_sec;
            else if (sec > max_timeout_sec)
                sec = max_timeout_sec;
            options.set (opt_timeout, std::to_string(sec));
        }
        if (wanted.has_tsize)
            options.set (opt_tsize, std::to_string(wanted.tsize));
        if (wanted.windowsize != default_windowsize)
            options.set (opt_windowsize, std::to_string(wanted.windowsize));
        return options;
    }


}
