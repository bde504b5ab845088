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
#ifndef TFTPIO_HPP
#define TFTPIO_HPP

#include <tftpio/log.hpp>
#include <tftpio/ip_addr.hpp>
#include <tftpio/udp_socket.hpp>
#include <tftpio/packet.hpp>
#include <tftpio/options.hpp>
#include <tftpio/window.hpp>
#include <tftpio/file_io.hpp>
#include <tftpio/file_provider.hpp>
#include <tftpio/transport.hpp>
#include <tftpio/session.hpp>
#include <tftpio/server.hpp>
#include <tftpio/client.hpp>


#endif
