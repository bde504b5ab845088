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
#ifndef TFTPIO_PACKET_HPP
#define TFTPIO_PACKET_HPP

#include <string>
#include <vector>
#include <utility>
#include <cstdint>
#include <cstddef>


namespace tftpio {


    /**
     * TFTP opcodes (RFC 1350 and RFC 2347).
     */
    enum opcode_t : uint16_t {
        op_rrq   = 1,
        op_wrq   = 2,
        op_data  = 3,
        op_ack   = 4,
        op_error = 5,
        op_oack  = 6
    };

    /**
     * TFTP error codes.
     */
    enum tftp_error_t : uint16_t {
        err_undefined          = 0,
        err_file_not_found     = 1,
        err_access_violation   = 2,
        err_disk_full          = 3,
        err_illegal_op         = 4,
        err_unknown_tid        = 5,
        err_file_exists        = 6,
        err_no_such_user       = 7,
        err_option_negotiation = 8
    };

    /**
     * Size of the opcode and block number (or error code) fields.
     */
    static constexpr size_t tftp_header_size = sizeof(uint16_t) + sizeof(uint16_t);


    /**
     * Return a printable name of an opcode, "RRQ", "DATA", etc.
     */
    const char* opcode_to_string (uint16_t opcode);

    /**
     * Return the standard message for a TFTP error code.
     */
    const char* tftp_error_to_string (uint16_t error_code);


    /**
     * An ordered list of TFTP options.
     * Option names are compared case-insensitive, the
     * insertion order is kept when the list is encoded.
     * A name occurs at most once in the list.
     */
    class option_list {
    public:
        using value_type     = std::pair<std::string, std::string>;
        using const_iterator = std::vector<value_type>::const_iterator;

        /**
         * Set an option value.
         * An existing option with the same name (ignoring case)
         * is replaced in place, otherwise the option is appended.
         */
        void set (const std::string& name, const std::string& value);

        /**
         * Get an option value.
         * @return <code>true</code> if the option exists.
         */
        bool get (const std::string& name, std::string& value) const;

        bool has (const std::string& name) const;

        void erase (const std::string& name);

        void clear () {
            items.clear ();
        }

        bool empty () const {
            return items.empty ();
        }

        size_t size () const {
            return items.size ();
        }

        const_iterator begin () const {
            return items.begin ();
        }

        const_iterator end () const {
            return items.end ();
        }

        bool operator== (const option_list& rhs) const;
        bool operator!= (const option_list& rhs) const {
            return ! operator== (rhs);
        }

        /**
         * Format as "name=value, name=value" for logging.
         */
        std::string to_string () const;


    private:
        std::vector<value_type> items;
    };


    /**
     * A decoded TFTP packet.
     * Which fields are used depends on the opcode:
     * <dl>
     *   <dt>RRQ, WRQ</dt><dd>filename, mode, options</dd>
     *   <dt>DATA</dt><dd>block, payload</dd>
     *   <dt>ACK</dt><dd>block</dd>
     *   <dt>ERROR</dt><dd>error_code, message</dd>
     *   <dt>OACK</dt><dd>options</dd>
     * </dl>
     */
    class packet {
    public:
        packet ();

        static packet rrq (const std::string& filename,
                           const std::string& mode,
                           const option_list& options=option_list());
        static packet wrq (const std::string& filename,
                           const std::string& mode,
                           const option_list& options=option_list());
        static packet data (uint16_t block, const void* buf, size_t size);
        static packet ack (uint16_t block);
        static packet error (uint16_t error_code, const std::string& message="");
        static packet oack (const option_list& options);

        /**
         * Decode a packet from a received datagram.
         * Never reads outside <code>buf[0..size)</code>.
         * If an option name occurs more than once in the
         * datagram, the first occurrence is used.
         * @return <code>true</code> on success, <code>false</code>
         *         if the datagram is not a well formed TFTP packet.
         *         On failure the object is left in an unspecified state.
         */
        bool parse (const void* buf, size_t size);

        /**
         * Encode the packet into <code>buf</code>,
         * replacing its previous content.
         * Since option names are unique in an option_list,
         * parse() of the result gives back an equal packet.
         */
        void encode (std::vector<char>& buf) const;

        std::vector<char> encode () const;

        /**
         * A short human readable description for debug logging.
         */
        std::string to_string () const;

        bool operator== (const packet& rhs) const;
        bool operator!= (const packet& rhs) const {
            return ! operator== (rhs);
        }

        uint16_t opcode;
        std::string filename;
        std::string mode;
        option_list options;
        uint16_t block;
        std::vector<char> payload;
        uint16_t error_code;
        std::string message;
    };


    /**
     * Encode a DATA packet directly into <code>buf</code>
     * without building a packet object.
     */
    void encode_data (std::vector<char>& buf, uint16_t block, const void* payload, size_t size);

    /**
     * Case-insensitive string comparison.
     */
    bool iequals (const std::string& lhs, const std::string& rhs);


}


#endif
