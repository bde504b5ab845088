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
#ifndef EXAMPLES_TFTP_APP_COMMON_HPP
#define EXAMPLES_TFTP_APP_COMMON_HPP

#include <tftpio.hpp>
#include <string>
#include <cstdint>
#include <cstddef>


/**
 * Parse a size with an optional 'K', 'M' or 'G' suffix.
 * @throw std::invalid_argument or std::out_of_range on error.
 */
uint64_t parse_file_size (const char* arg);

/**
 * Parse a timeout in seconds, decimals allowed, to milliseconds.
 * @throw std::invalid_argument or std::out_of_range on error.
 */
unsigned parse_timeout (const char* arg);

/**
 * Parse an unsigned integer in the range [min_value, max_value].
 * @throw std::invalid_argument or std::out_of_range on error.
 */
unsigned parse_uint (const char* arg, unsigned min_value, unsigned max_value);

/**
 * Parse a rollover policy, "0", "1" or "any".
 * @return <code>false</code> on error.
 */
bool parse_rollover (const std::string& arg, tftpio::rollover_t& rollover);

#ifdef TFTPIO_DEBUG_DROP
/**
 * Parse a drop rate in percent, 0 - 100.
 * @throw std::invalid_argument or std::out_of_range on error.
 */
double parse_drop_rate (const char* arg);
#endif


#endif
