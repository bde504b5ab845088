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
#ifndef TFTPIO_UDP_SOCKET_HPP
#define TFTPIO_UDP_SOCKET_HPP

#include <tftpio/ip_addr.hpp>
#include <cstddef>
#include <sys/types.h>


namespace tftpio {


    /**
     * A non-blocking UDP socket with blocking, deadline bounded,
     * send and receive operations.
     *
     * A pending or future receive can be interrupted from another
     * thread with method cancel(). Cancellation is sticky, once
     * cancelled all following receive operations fail immediately
     * with <code>errno</code> set to <code>ECANCELED</code>.
     */
    class udp_socket {
    public:
        udp_socket ();
        udp_socket (udp_socket&& rhs);
        ~udp_socket ();

        udp_socket& operator= (udp_socket&& rhs);

        /**
         * Open the socket.
         * @param domain AF_INET or AF_INET6.
         * @return 0 on success, -1 on error and <code>errno</code> is set.
         */
        int open (int domain);

        /**
         * Close the socket.
         */
        void close ();

        bool is_open () const {
            return fd >= 0;
        }

        int handle () const {
            return fd;
        }

        /**
         * Bind the socket to a local address.
         * When bound to port 0 the kernel chooses an ephemeral
         * port, available in addr() after a successful bind.
         * @return 0 on success, -1 on error and <code>errno</code> is set.
         */
        int bind (const ip_addr& addr);

        /**
         * The local address of the socket.
         */
        const ip_addr& addr () const {
            return local_addr;
        }

        /**
         * Send a datagram.
         * @param timeout Max time in milliseconds to wait for
         *                the socket to become writable.
         * @return The number of bytes sent, or -1 on error
         *         and <code>errno</code> is set.
         */
        ssize_t sendto (const void* buf, size_t size, const ip_addr& peer, unsigned timeout=500);

        /**
         * Receive a datagram.
         * @param buf Receive buffer.
         * @param size Size of the receive buffer. Datagrams larger
         *             than this are truncated.
         * @param peer Set to the source address of the datagram.
         * @param timeout Timeout in milliseconds, -1 means no timeout.
         * @return The size of the received datagram, or -1 on error and
         *         <code>errno</code> is set. On timeout <code>errno</code>
         *         is <code>ETIMEDOUT</code>, on cancel <code>ECANCELED</code>.
         */
        ssize_t recvfrom (void* buf, size_t size, ip_addr& peer, unsigned timeout=-1);

        /**
         * Interrupt a pending recvfrom and make all future
         * receive operations fail with ECANCELED.
         * May be called from any thread.
         */
        void cancel ();


    private:
        udp_socket (const udp_socket&) = delete;
        udp_socket& operator= (const udp_socket&) = delete;

        int fd;
        int cancel_fd;
        ip_addr local_addr;
    };


}


#endif
