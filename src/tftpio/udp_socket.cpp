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
#include <tftpio/udp_socket.hpp>
#include <tftpio/log.hpp>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/eventfd.h>


//#define TRACE_DEBUG

#ifdef TRACE_DEBUG
#define TRACE(format, ...) log::debug("%s:%s:%d: " format, __FILE__, __FUNCTION__, __LINE__, ## __VA_ARGS__)
#else
#define TRACE(format, ...)
#endif


namespace tftpio {


    using steady_clock = std::chrono::steady_clock;


    //--------------------------------------------------------------------------
    // Milliseconds left until 'deadline', or -1 if no deadline.
    //--------------------------------------------------------------------------
    static int poll_timeout (bool has_deadline, steady_clock::time_point deadline)
    {
        if (!has_deadline)
            return -1;
        auto now = steady_clock::now ();
        if (now >= deadline)
            return 0;
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        // Round up so we never wake up just before the deadline
        return (int) (ms + 1);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    udp_socket::udp_socket ()
        : fd {-1},
          cancel_fd {-1}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    udp_socket::udp_socket (udp_socket&& rhs)
        : fd {rhs.fd},
          cancel_fd {rhs.cancel_fd},
          local_addr {rhs.local_addr}
    {
        rhs.fd = -1;
        rhs.cancel_fd = -1;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    udp_socket::~udp_socket ()
    {
        close ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    udp_socket& udp_socket::operator= (udp_socket&& rhs)
    {
        if (this != &rhs) {
            close ();
            fd = rhs.fd;
            cancel_fd = rhs.cancel_fd;
            local_addr = rhs.local_addr;
            rhs.fd = -1;
            rhs.cancel_fd = -1;
        }
        return *this;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int udp_socket::open (int domain)
    {
        errno = 0;
        if (fd >= 0)
            return 0;

        if (domain!=AF_INET && domain!=AF_INET6) {
            errno = EAFNOSUPPORT;
            return -1;
        }

        fd = socket (domain, SOCK_DGRAM|SOCK_NONBLOCK|SOCK_CLOEXEC, 0);
        if (fd < 0) {
            auto errnum = errno;
            TRACE ("socket() failed: %s", strerror(errnum));
            errno = errnum;
            return -1;
        }

        cancel_fd = eventfd (0, EFD_NONBLOCK|EFD_CLOEXEC);
        if (cancel_fd < 0) {
            auto errnum = errno;
            ::close (fd);
            fd = -1;
            errno = errnum;
            return -1;
        }

        local_addr = ip_addr::any (domain);
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void udp_socket::close ()
    {
        if (fd >= 0) {
            TRACE ("Closing socket %d", fd);
            ::close (fd);
            fd = -1;
        }
        if (cancel_fd >= 0) {
            ::close (cancel_fd);
            cancel_fd = -1;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int udp_socket::bind (const ip_addr& addr)
    {
        errno = 0;
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }
        if (addr.family() != local_addr.family()) {
            errno = EINVAL;
            return -1;
        }

        if (::bind(fd, addr.data(), addr.size())) {
            auto errnum = errno;
            TRACE ("bind() failed: %s", strerror(errnum));
            errno = errnum;
            return -1;
        }

        // Get the actual address, the port may have been chosen by the kernel
        socklen_t slen = ip_addr::capacity ();
        if (getsockname(fd, local_addr.data(), &slen))
            local_addr = addr;

        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t udp_socket::sendto (const void* buf, size_t size, const ip_addr& peer, unsigned timeout)
    {
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }

        bool has_deadline = timeout != (unsigned)-1;
        auto deadline = steady_clock::now() + std::chrono::milliseconds(has_deadline ? timeout : 0);

        while (true) {
            auto result = ::sendto (fd, buf, size, 0, peer.data(), peer.size());
            if (result >= 0)
                return result;
            if (errno == EINTR)
                continue;
            if (errno!=EAGAIN && errno!=EWOULDBLOCK)
                return -1;

            // Socket buffer full, wait until writable
            struct pollfd pfd = {fd, POLLOUT, 0};
            auto n = poll (&pfd, 1, poll_timeout(has_deadline, deadline));
            if (n == 0) {
                errno = ETIMEDOUT;
                return -1;
            }
            else if (n<0 && errno!=EINTR) {
                return -1;
            }
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t udp_socket::recvfrom (void* buf, size_t size, ip_addr& peer, unsigned timeout)
    {
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }

        bool has_deadline = timeout != (unsigned)-1;
        auto deadline = steady_clock::now() + std::chrono::milliseconds(has_deadline ? timeout : 0);

        while (true) {
            struct pollfd pfd[2] = {
                {fd,        POLLIN, 0},
                {cancel_fd, POLLIN, 0}
            };
            auto n = poll (pfd, 2, poll_timeout(has_deadline, deadline));
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                return -1;
            }
            if (pfd[1].revents) {
                errno = ECANCELED;
                return -1;
            }
            if (n == 0) {
                errno = ETIMEDOUT;
                return -1;
            }

            socklen_t slen = ip_addr::capacity ();
            auto result = ::recvfrom (fd, buf, size, MSG_TRUNC, peer.data(), &slen);
            if (result >= 0)
                return result > (ssize_t)size ? (ssize_t)size : result;
            if (errno!=EAGAIN && errno!=EWOULDBLOCK && errno!=EINTR)
                return -1;
            // Spurious wakeup, poll again
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void udp_socket::cancel ()
    {
        if (cancel_fd >= 0) {
            uint64_t one = 1;
            if (::write(cancel_fd, &one, sizeof(one)) != sizeof(one))
                log::debug ("Unable to signal cancel on socket %d: %s", fd, strerror(errno));
        }
    }


}
