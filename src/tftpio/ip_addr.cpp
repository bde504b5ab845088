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
#include <tftpio/ip_addr.hpp>
#include <sstream>
#include <stdexcept>
#include <cstring>
#include <cstdlib>
#include <regex>
#include <arpa/inet.h>


namespace tftpio {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr ()
    {
        memset (&sa, 0, sizeof(sa));
        ((struct sockaddr_in&)sa).sin_family = AF_INET;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr (const struct sockaddr_in& saddr)
    {
        memset (&sa, 0, sizeof(sa));
        memcpy (&sa, &saddr, sizeof(struct sockaddr_in));
        ((struct sockaddr_in&)sa).sin_family = AF_INET;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr (const struct sockaddr_in6& saddr)
    {
        memset (&sa, 0, sizeof(sa));
        memcpy (&sa, &saddr, sizeof(struct sockaddr_in6));
        ((struct sockaddr_in6&)sa).sin6_family = AF_INET6;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr (uint32_t ipv4_addr, uint16_t port_num)
    {
        memset (&sa, 0, sizeof(sa));
        auto& in = (struct sockaddr_in&) sa;
        in.sin_family = AF_INET;
        in.sin_addr.s_addr = htonl (ipv4_addr);
        in.sin_port = htons (port_num);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr (const std::string& address)
        : ip_addr ()
    {
        if (!parse(address, true))
            throw std::invalid_argument ("Invalid IP address");
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static bool parse_port (const char* str, int& port)
    {
        // Regular expression to validate a port number
        static const std::regex regex_port_num ("0*(?:"
                                                "[0-9]|"
                                                "[1-9][0-9]{1,3}|"
                                                "[1-5][0-9]{4}|"
                                                "6[0-4][0-9]{3}|"
                                                "65[0-4][0-9]{2}|"
                                                "655[0-2][0-9]|"
                                                "6553[0-5]"
                                                ")");
        std::cmatch m;
        if (!std::regex_match(str, m, regex_port_num))
            return false;

        port = atoi (str);
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool ip_addr::parse (const std::string& address, const bool also_parse_port)
    {
        std::string ip_str;
        bool try_ipv4 = true;
        bool try_ipv6 = true;
        int port_num = -1;

        if (address.empty())
            return false;

        if (address[0] == '[') {
            // This must be an IPv6 address
            try_ipv4 = false;
            auto pos = address.find ("]:");
            if (pos != std::string::npos) {
                ip_str = address.substr (1, pos-1);
                if (!also_parse_port || !parse_port(address.c_str()+pos+2, port_num))
                    return false;
            }
            else if (address[address.size()-1] == ']') {
                ip_str = address.substr (1, address.size()-2);
            }else{
                return false;
            }
        }
        else if (address.find('.') != std::string::npos) {
            // This must be an IPv4 address
            try_ipv6 = false;
            auto pos = address.find (':');
            if (pos != std::string::npos) {
                ip_str = address.substr (0, pos);
                if (!also_parse_port || !parse_port(address.c_str()+pos+1, port_num))
                    return false;
            }
        }

        const std::string& addr = ip_str.empty() ? address : ip_str;
        struct in_addr  ipv4addr;
        struct in6_addr ipv6addr;

        if (try_ipv4 && inet_pton(AF_INET, addr.c_str(), &ipv4addr) == 1) {
            memset (&sa, 0, sizeof(sa));
            ((struct sockaddr_in&)sa).sin_family = AF_INET;
            ((struct sockaddr_in&)sa).sin_addr = ipv4addr;
        }
        else if (try_ipv6 && inet_pton(AF_INET6, addr.c_str(), &ipv6addr) == 1) {
            memset (&sa, 0, sizeof(sa));
            ((struct sockaddr_in6&)sa).sin6_family = AF_INET6;
            ((struct sockaddr_in6&)sa).sin6_addr = ipv6addr;
        }else{
            return false;
        }

        if (port_num != -1)
            port ((uint16_t)port_num);

        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool ip_addr::operator== (const ip_addr& rhs) const
    {
        if (this == &rhs)
            return true;
        if (family() != rhs.family() || port() != rhs.port())
            return false;

        switch (family()) {
        case AF_INET:
            return ((const struct sockaddr_in&)sa).sin_addr.s_addr ==
                ((const struct sockaddr_in&)rhs.sa).sin_addr.s_addr;
        case AF_INET6:
            return memcmp (&((const struct sockaddr_in6&)sa).sin6_addr,
                           &((const struct sockaddr_in6&)rhs.sa).sin6_addr,
                           sizeof(struct in6_addr)) == 0;
        default:
            return false;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool ip_addr::operator< (const ip_addr& rhs) const
    {
        if (family() != rhs.family())
            return family() < rhs.family();

        int cmp = 0;
        switch (family()) {
        case AF_INET:
            {
                auto lhs_addr = ipv4 ();
                auto rhs_addr = rhs.ipv4 ();
                cmp = lhs_addr < rhs_addr ? -1 : (lhs_addr > rhs_addr ? 1 : 0);
            }
            break;
        case AF_INET6:
            cmp = memcmp (&((const struct sockaddr_in6&)sa).sin6_addr,
                          &((const struct sockaddr_in6&)rhs.sa).sin6_addr,
                          sizeof(struct in6_addr));
            break;
        default:
            break;
        }
        if (cmp != 0)
            return cmp < 0;
        return port() < rhs.port();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    socklen_t ip_addr::size () const
    {
        switch (family()) {
        case AF_INET:
            return sizeof (struct sockaddr_in);
        case AF_INET6:
            return sizeof (struct sockaddr_in6);
        default:
            return 0;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    sa_family_t ip_addr::family () const
    {
        return ((const struct sockaddr&)sa).sa_family;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    uint16_t ip_addr::port () const
    {
        switch (family()) {
        case AF_INET:
            return ntohs (((const struct sockaddr_in&)sa).sin_port);
        case AF_INET6:
            return ntohs (((const struct sockaddr_in6&)sa).sin6_port);
        default:
            return 0;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void ip_addr::port (const uint16_t port_num)
    {
        switch (family()) {
        case AF_INET:
            ((struct sockaddr_in&)sa).sin_port = htons (port_num);
            break;
        case AF_INET6:
            ((struct sockaddr_in6&)sa).sin6_port = htons (port_num);
            break;
        default:
            break;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    uint32_t ip_addr::ipv4 () const
    {
        return ntohl (((const struct sockaddr_in&)sa).sin_addr.s_addr);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string ip_addr::to_string (bool include_port) const
    {
        std::stringstream ss;

        if (family() == AF_INET) {
            char tmp[INET_ADDRSTRLEN];
            inet_ntop (AF_INET, &(((const struct sockaddr_in&)sa).sin_addr),
                       tmp, sizeof(tmp));
            ss << tmp;
            if (include_port)
                ss << ':' << port();
        }
        else if (family() == AF_INET6) {
            char tmp[INET6_ADDRSTRLEN];
            inet_ntop (AF_INET6, &(((const struct sockaddr_in6&)sa).sin6_addr),
                       tmp, sizeof(tmp));
            if (include_port)
                ss << '[';
            ss << tmp;
            if (include_port)
                ss << "]:" << port();
        }
        else {
            ss << "[n/a]";
        }
        return ss.str ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr ip_addr::any (sa_family_t family)
    {
        if (family == AF_INET6) {
            struct sockaddr_in6 in6;
            memset (&in6, 0, sizeof(in6));
            in6.sin6_family = AF_INET6;
            in6.sin6_addr = in6addr_any;
            return ip_addr (in6);
        }
        return ip_addr ((uint32_t)INADDR_ANY, 0);
    }


}
