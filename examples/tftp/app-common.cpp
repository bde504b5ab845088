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
#include "app-common.hpp"
#include <stdexcept>
#include <cstring>


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
uint64_t parse_file_size (const char* arg)
{
    size_t pos;
    uint64_t retval = 0;

    if (*arg == '-')
        throw std::invalid_argument ("EINVAL");
    retval = std::stoull (arg, &pos, 10);

    auto arg_len = strlen (arg);
    if (pos != arg_len) {
        if (pos != arg_len-1)
            throw std::invalid_argument ("EINVAL");
        switch (arg[pos]) {
        case 'K':
            retval *= 1024;
            break;

        case 'M':
            retval *= 1024 * 1024;
            break;

        case 'G':
            retval *= 1024 * 1024 * 1024;
            break;

        default:
            throw std::invalid_argument ("EINVAL");
        }
    }

    return retval;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
unsigned parse_timeout (const char* arg)
{
    size_t pos;
    double sec = std::stod (arg, &pos);
    if (pos != strlen(arg) || !(sec > 0.0 && sec <= tftpio::max_timeout_sec))
        throw std::out_of_range ("ERANGE");
    unsigned ms = (unsigned) (sec * 1000.0);
    return ms ? ms : 1;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
unsigned parse_uint (const char* arg, unsigned min_value, unsigned max_value)
{
    size_t pos;
    if (*arg == '-')
        throw std::invalid_argument ("EINVAL");
    auto value = std::stoul (arg, &pos, 10);
    if (pos != strlen(arg))
        throw std::invalid_argument ("EINVAL");
    if (value < min_value || value > max_value)
        throw std::out_of_range ("ERANGE");
    return (unsigned) value;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
bool parse_rollover (const std::string& arg, tftpio::rollover_t& rollover)
{
    if (arg == "0")
        rollover = tftpio::rollover_enforce0;
    else if (arg == "1")
        rollover = tftpio::rollover_enforce1;
    else if (arg == "any")
        rollover = tftpio::rollover_dont_care;
    else
        return false;
    return true;
}


#ifdef TFTPIO_DEBUG_DROP
//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
double parse_drop_rate (const char* arg)
{
    size_t pos;
    double rate = std::stod (arg, &pos);
    if (pos != strlen(arg) || !(rate >= 0.0 && rate <= 100.0))
        throw std::out_of_range ("ERANGE");
    return rate / 100.0;
}
#endif
