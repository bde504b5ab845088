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
#ifndef TFTPIO_TRANSPORT_HPP
#define TFTPIO_TRANSPORT_HPP

#include <tftpio/ip_addr.hpp>
#include <tftpio/udp_socket.hpp>
#include <functional>
#include <memory>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <cstdint>
#include <cstddef>
#include <sys/types.h>


namespace tftpio {


    /**
     * Datagram transport used by a transfer session.
     */
    class transport {
    public:
        virtual ~transport () = default;

        /**
         * Send a datagram.
         * @return The number of bytes sent, or -1 on error
         *         and <code>errno</code> is set.
         */
        virtual ssize_t send (const void* buf, size_t size, const ip_addr& peer) = 0;

        /**
         * Receive a datagram.
         * @param timeout Timeout in milliseconds.
         * @return The size of the datagram, or -1 on error and <code>errno</code>
         *         is set. On timeout <code>errno</code> is <code>ETIMEDOUT</code>,
         *         if cancelled <code>ECANCELED</code>.
         */
        virtual ssize_t receive (void* buf, size_t size, ip_addr& peer, unsigned timeout) = 0;

        /**
         * Make a pending and all following receive
         * operations fail with <code>ECANCELED</code>.
         * May be called from any thread.
         */
        virtual void cancel () = 0;

        /**
         * The local address of the transport.
         */
        virtual const ip_addr& addr () const = 0;
    };


    /**
     * Transport using a UDP socket of its own.
     */
    class udp_transport : public transport {
    public:
        udp_transport () = default;
        virtual ~udp_transport () = default;

        /**
         * Open the socket and bind it to a local address.
         * Use port 0 to bind to an ephemeral port.
         * @return 0 on success, -1 on error and <code>errno</code> is set.
         */
        int open (const ip_addr& local_addr);

        void close () {
            sock.close ();
        }

        udp_socket& socket () {
            return sock;
        }

        virtual ssize_t send (const void* buf, size_t size, const ip_addr& peer);
        virtual ssize_t receive (void* buf, size_t size, ip_addr& peer, unsigned timeout);
        virtual void cancel ();
        virtual const ip_addr& addr () const;


    private:
        udp_socket sock;
    };


    /**
     * Direction of a datagram passing a drop filter.
     */
    enum direction_t {
        dir_outgoing,
        dir_incoming
    };


    /**
     * A packet drop filter.
     * Return <code>true</code> to drop the datagram.
     */
    using drop_filter_t = std::function<bool (direction_t dir, const void* buf, size_t size)>;

    /**
     * Drop every <code>n</code>th datagram, in both directions.
     */
    drop_filter_t drop_every_nth (unsigned n);

    /**
     * Drop datagrams with probability <code>rate</code> (0.0 - 1.0),
     * using a pseudo random generator with a fixed seed.
     */
    drop_filter_t drop_random (double rate, unsigned seed);

    /**
     * Drop the first <code>times</code> DATA packets
     * with block number <code>block</code>.
     */
    drop_filter_t drop_data_block (uint16_t block, unsigned times, direction_t dir=dir_outgoing);


    /**
     * Transport decorator that drops datagrams chosen by a filter.
     * Used to test the retransmission logic of the protocol.
     */
    class lossy_transport : public transport {
    public:
        lossy_transport (std::unique_ptr<transport> inner, drop_filter_t filter);
        virtual ~lossy_transport () = default;

        virtual ssize_t send (const void* buf, size_t size, const ip_addr& peer);
        virtual ssize_t receive (void* buf, size_t size, ip_addr& peer, unsigned timeout);
        virtual void cancel ();
        virtual const ip_addr& addr () const;

        transport& inner () {
            return *slave;
        }

        /**
         * Number of dropped datagrams.
         */
        unsigned dropped () const {
            return num_dropped;
        }


    private:
        std::unique_ptr<transport> slave;
        drop_filter_t filter;
        unsigned num_dropped;
    };


    /**
     * Transport sharing a socket with other sessions.
     * Incoming datagrams are pushed to the transport by the
     * owner of the socket, outgoing datagrams are sent on the
     * shared socket. The shared socket must outlive the transport.
     */
    class routed_transport : public transport {
    public:
        explicit routed_transport (udp_socket& shared_sock);
        virtual ~routed_transport () = default;

        /**
         * Queue a received datagram. Called by the socket owner.
         */
        void deliver (const void* buf, size_t size, const ip_addr& from);

        virtual ssize_t send (const void* buf, size_t size, const ip_addr& peer);
        virtual ssize_t receive (void* buf, size_t size, ip_addr& peer, unsigned timeout);
        virtual void cancel ();
        virtual const ip_addr& addr () const;


    private:
        struct datagram_t {
            ip_addr from;
            std::vector<char> data;
        };

        udp_socket& sock;
        std::mutex mutex;
        std::condition_variable cond;
        std::deque<datagram_t> inbox;
        bool cancelled;
    };


}


#endif
