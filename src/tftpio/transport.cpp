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
#include <tftpio/transport.hpp>
#include <tftpio/packet.hpp>
#include <tftpio/log.hpp>
#include <chrono>
#include <random>
#include <cstring>
#include <cerrno>


namespace tftpio {


    using steady_clock = std::chrono::steady_clock;

    // Max number of datagrams queued for a routed session
    static constexpr size_t max_inbox_size = 256;


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int udp_transport::open (const ip_addr& local_addr)
    {
        if (sock.open(local_addr.family()))
            return -1;
        if (sock.bind(local_addr)) {
            auto errnum = errno;
            sock.close ();
            errno = errnum;
            return -1;
        }
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t udp_transport::send (const void* buf, size_t size, const ip_addr& peer)
    {
        return sock.sendto (buf, size, peer);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t udp_transport::receive (void* buf, size_t size, ip_addr& peer, unsigned timeout)
    {
        return sock.recvfrom (buf, size, peer, timeout);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void udp_transport::cancel ()
    {
        sock.cancel ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const ip_addr& udp_transport::addr () const
    {
        return sock.addr ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    drop_filter_t drop_every_nth (unsigned n)
    {
        unsigned count = 0;
        return [n, count] (direction_t, const void*, size_t) mutable -> bool {
            if (n == 0)
                return false;
            return (++count % n) == 0;
        };
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    drop_filter_t drop_random (double rate, unsigned seed)
    {
        auto rng = std::make_shared<std::mt19937> (seed);
        return [rate, rng] (direction_t, const void*, size_t) -> bool {
            std::uniform_real_distribution<double> dist (0.0, 1.0);
            return dist(*rng) < rate;
        };
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    drop_filter_t drop_data_block (uint16_t block, unsigned times, direction_t dir)
    {
        unsigned count = 0;
        return [block, times, dir, count] (direction_t d, const void* buf, size_t size) mutable -> bool {
            if (d != dir || count >= times || size < tftp_header_size)
                return false;
            auto p = (const uint8_t*) buf;
            uint16_t opcode = (uint16_t) ((p[0] << 8) | p[1]);
            uint16_t blk    = (uint16_t) ((p[2] << 8) | p[3]);
            if (opcode != op_data || blk != block)
                return false;
            ++count;
            return true;
        };
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    lossy_transport::lossy_transport (std::unique_ptr<transport> inner, drop_filter_t filter)
        : slave {std::move(inner)},
          filter {filter},
          num_dropped {0}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t lossy_transport::send (const void* buf, size_t size, const ip_addr& peer)
    {
        if (filter && filter(dir_outgoing, buf, size)) {
            ++num_dropped;
            log::debug ("Drop outgoing datagram to %s", peer.to_string().c_str());
            return (ssize_t) size;
        }
        return slave->send (buf, size, peer);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t lossy_transport::receive (void* buf, size_t size, ip_addr& peer, unsigned timeout)
    {
        auto deadline = steady_clock::now() + std::chrono::milliseconds(timeout);
        while (true) {
            auto result = slave->receive (buf, size, peer, timeout);
            if (result < 0 || !filter || !filter(dir_incoming, buf, (size_t)result))
                return result;

            ++num_dropped;
            log::debug ("Drop incoming datagram from %s", peer.to_string().c_str());

            auto now = steady_clock::now ();
            if (now >= deadline) {
                errno = ETIMEDOUT;
                return -1;
            }
            timeout = (unsigned) std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void lossy_transport::cancel ()
    {
        slave->cancel ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const ip_addr& lossy_transport::addr () const
    {
        return slave->addr ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    routed_transport::routed_transport (udp_socket& shared_sock)
        : sock {shared_sock},
          cancelled {false}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void routed_transport::deliver (const void* buf, size_t size, const ip_addr& from)
    {
        std::lock_guard<std::mutex> lock (mutex);
        if (cancelled)
            return;
        if (inbox.size() >= max_inbox_size) {
            log::debug ("Inbox full, drop datagram from %s", from.to_string().c_str());
            return;
        }
        datagram_t dgram;
        dgram.from = from;
        dgram.data.assign ((const char*)buf, (const char*)buf + size);
        inbox.push_back (std::move(dgram));
        cond.notify_one ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t routed_transport::send (const void* buf, size_t size, const ip_addr& peer)
    {
        return sock.sendto (buf, size, peer);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t routed_transport::receive (void* buf, size_t size, ip_addr& peer, unsigned timeout)
    {
        std::unique_lock<std::mutex> lock (mutex);
        auto ready = cond.wait_for (lock,
                                    std::chrono::milliseconds(timeout),
                                    [this]{return cancelled || !inbox.empty();});
        if (cancelled) {
            errno = ECANCELED;
            return -1;
        }
        if (!ready) {
            errno = ETIMEDOUT;
            return -1;
        }

        auto& dgram = inbox.front ();
        size_t len = dgram.data.size() < size ? dgram.data.size() : size;
        if (len)
            memcpy (buf, dgram.data.data(), len);
        peer = dgram.from;
        inbox.pop_front ();
        return (ssize_t) len;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void routed_transport::cancel ()
    {
        std::lock_guard<std::mutex> lock (mutex);
        cancelled = true;
        inbox.clear ();
        cond.notify_all ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const ip_addr& routed_transport::addr () const
    {
        return sock.addr ();
    }


}
