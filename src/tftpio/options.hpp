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
#ifndef TFTPIO_OPTIONS_HPP
#define TFTPIO_OPTIONS_HPP

#include <tftpio/packet.hpp>
#include <string>
#include <cstdint>
#include <cstddef>


namespace tftpio {


    static constexpr uint16_t tftp_default_port    = 69;

    static constexpr size_t   default_blksize      = 512;
    static constexpr size_t   min_blksize          = 8;
    static constexpr size_t   max_blksize          = 65464;

    static constexpr unsigned default_timeout      = 5000; // Milliseconds
    static constexpr unsigned min_timeout_sec      = 1;
    static constexpr unsigned max_timeout_sec      = 255;

    static constexpr unsigned default_windowsize   = 1;
    static constexpr unsigned max_windowsize       = 65535;

    static constexpr unsigned default_max_retries  = 6;

    extern const char* const opt_blksize;
    extern const char* const opt_timeout;
    extern const char* const opt_tsize;
    extern const char* const opt_windowsize;


    /**
     * Transfer parameters of a session.
     * Initialized with the RFC 1350 defaults and changed only
     * by option negotiation, before the first DATA block.
     */
    struct transfer_params_t {
        transfer_params_t ();

        size_t   blksize;    /**< Max payload size of a DATA packet. */
        unsigned timeout;    /**< Retransmission timeout in milliseconds. */
        bool     has_tsize;  /**< <code>true</code> if tsize is known. */
        uint64_t tsize;      /**< Transfer size in bytes, informational. */
        unsigned windowsize; /**< Number of DATA blocks per acknowledgement. */
    };


    /**
     * Server side option policy.
     */
    struct option_policy_t {
        option_policy_t ();

        size_t   max_blksize;    /**< Larger requested block sizes are clamped to this. */
        unsigned max_windowsize; /**< Larger requested window sizes are clamped to this. */
        uint64_t max_write_size; /**< Refuse WRQ with a larger tsize. 0 means no limit. */
    };


    /**
     * Result of server side option negotiation.
     */
    enum negotiation_t {
        neg_no_options, /**< No recognized option, use RFC 1350 defaults and no OACK. */
        neg_accepted,   /**< Options accepted, reply with OACK. */
        neg_failed,     /**< Reply with ERROR 8. */
        neg_too_large   /**< Declared tsize exceeds the write limit, reply with ERROR 3. */
    };


    /**
     * Parse an unsigned decimal number.
     * Only digits are accepted, no sign or white space.
     * @return <code>false</code> if the string is empty, not a
     *         number or larger than the range of uint64_t.
     */
    bool parse_number (const std::string& str, uint64_t& value);


    /**
     * Negotiate the options of a RRQ or WRQ.
     * @param requested The options in the request.
     * @param is_read <code>true</code> for RRQ.
     * @param has_file_size <code>true</code> if <code>file_size</code> is valid (RRQ).
     * @param file_size Size of the file to be read.
     * @param policy Server policy.
     * @param params Set to the negotiated parameters.
     * @param reply Set to the options to send in the OACK.
     * @param error_msg Set to a message for the ERROR packet on failure.
     */
    negotiation_t negotiate_options (const option_list& requested,
                                     bool is_read,
                                     bool has_file_size,
                                     uint64_t file_size,
                                     const option_policy_t& policy,
                                     transfer_params_t& params,
                                     option_list& reply,
                                     std::string& error_msg);


    /**
     * Adopt the options of an OACK received by a client.
     * The OACK may only contain options that was requested, and it may
     * not increase the block size or window size above the requested value.
     * @param requested The options sent in the request.
     * @param oack The options in the OACK.
     * @param params Updated with the accepted values, starting from defaults.
     * @param error_msg Set to a message for the ERROR packet on failure.
     * @return <code>true</code> if the OACK is acceptable.
     */
    bool apply_oack (const option_list& requested,
                     const option_list& oack,
                     transfer_params_t& params,
                     std::string& error_msg);


    /**
     * Build the option list of a client request.
     * Options equal to the RFC 1350 defaults are not included,
     * except tsize which is sent whenever <code>has_tsize</code> is set.
     */
    option_list make_request_options (const transfer_params_t& wanted);


}


#endif
