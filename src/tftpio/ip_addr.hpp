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
#ifndef TFTPIO_IP_ADDR_HPP
#define TFTPIO_IP_ADDR_HPP

#include <string>
#include <cstdint>
#include <cstddef>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>


namespace tftpio {


    /**
     * An IPv4 or IPv6 socket address (address and port).
     * This is the transfer identifier of a TFTP peer.
     */
    class ip_addr {
    public:
        /**
         * Default constructor.
         * Constructs an IPv4 address with all values set to zero.
         */
        ip_addr ();

        /**
         * Create an ip_addr from a <code>struct sockaddr_in</code>.
         */
        explicit ip_addr (const struct sockaddr_in& saddr);

        /**
         * Create an ip_addr from a <code>struct sockaddr_in6</code>.
         */
        explicit ip_addr (const struct sockaddr_in6& saddr);

        /**
         * Create an IPv4 address.
         * @param ipv4_addr A 32 bit IPv4 address in host byte order.
         * @param port_num A port number in host byte order.
         */
        explicit ip_addr (uint32_t ipv4_addr, uint16_t port_num=0);

        /**
         * Parse a string and create an IP address[:port].
         * @param address A string containing an IPv[4|6] address
         *                and optionally a port number.
         * @throw std::invalid_argument on parse error.
         */
        explicit ip_addr (const std::string& address);

        /**
         * Parse an address from a string.
         * Accepted formats are <code>a.b.c.d</code>, <code>a.b.c.d:port</code>,
         * <code>ipv6</code>, <code>[ipv6]</code> and <code>[ipv6]:port</code>.
         * @param address The string to parse.
         * @param parse_port If <code>true</code>,
         *                   also check for a port number in the string.
         * @return <code>true</code> on success, <code>false</code> on failure.
         *         On failure the object is unchanged.
         */
        bool parse (const std::string& address, const bool parse_port=true);

        bool operator== (const ip_addr& rhs) const;
        bool operator!= (const ip_addr& rhs) const {
            return ! operator== (rhs);
        }

        /**
         * Strict weak ordering, family first, then address, then port.
         * Used as key ordering in the server session table.
         */
        bool operator< (const ip_addr& rhs) const;

        /**
         * Size of the socket address for the current address family.
         */
        socklen_t size () const;

        const struct sockaddr* data () const {
            return (const struct sockaddr*) &sa;
        }

        /**
         * Writable pointer to the socket address, used as output
         * argument for recvfrom() and getsockname().
         */
        struct sockaddr* data () {
            return (struct sockaddr*) &sa;
        }

        /**
         * Capacity of the underlying storage.
         */
        static constexpr socklen_t capacity () {
            return sizeof (struct sockaddr_storage);
        }

        sa_family_t family () const;

        /**
         * Return the port number in host byte order.
         */
        uint16_t port () const;

        /**
         * Set the port number in host byte order.
         */
        void port (const uint16_t port_num);

        /**
         * Return a 32 bit IPv4 address in host byte order.
         */
        uint32_t ipv4 () const;

        /**
         * Return a string representation of the address.
         * @param include_port If <code>true</code>, include the port number.
         */
        std::string to_string (bool include_port=true) const;

        /**
         * An unspecified address and port zero of the given family.
         */
        static ip_addr any (sa_family_t family);


    private:
        struct sockaddr_storage sa;
    };


}


#endif
