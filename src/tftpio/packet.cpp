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
#include <tftpio/packet.hpp>
#include <sstream>
#include <cstring>
#include <strings.h>


namespace tftpio {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const char* opcode_to_string (uint16_t opcode)
    {
        switch (opcode) {
        case op_rrq:
            return "RRQ";
        case op_wrq:
            return "WRQ";
        case op_data:
            return "DATA";
        case op_ack:
            return "ACK";
        case op_error:
            return "ERROR";
        case op_oack:
            return "OACK";
        default:
            return "n/a";
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const char* tftp_error_to_string (uint16_t error_code)
    {
        switch (error_code) {
        case err_file_not_found:
            return "File not found";
        case err_access_violation:
            return "Access violation";
        case err_disk_full:
            return "Disk full or allocation exceeded";
        case err_illegal_op:
            return "Illegal TFTP operation";
        case err_unknown_tid:
            return "Unknown transfer ID";
        case err_file_exists:
            return "File already exists";
        case err_no_such_user:
            return "No such user";
        case err_option_negotiation:
            return "Option negotiation failed";
        default:
            return "Undefined error";
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool iequals (const std::string& lhs, const std::string& rhs)
    {
        return lhs.size() == rhs.size() && strcasecmp(lhs.c_str(), rhs.c_str()) == 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void option_list::set (const std::string& name, const std::string& value)
    {
        for (auto& item : items) {
            if (iequals(item.first, name)) {
                item.second = value;
                return;
            }
        }
        items.emplace_back (name, value);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool option_list::get (const std::string& name, std::string& value) const
    {
        for (auto& item : items) {
            if (iequals(item.first, name)) {
                value = item.second;
                return true;
            }
        }
        return false;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool option_list::has (const std::string& name) const
    {
        for (auto& item : items) {
            if (iequals(item.first, name))
                return true;
        }
        return false;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void option_list::erase (const std::string& name)
    {
        for (auto i=items.begin(); i!=items.end(); ++i) {
            if (iequals(i->first, name)) {
                items.erase (i);
                return;
            }
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool option_list::operator== (const option_list& rhs) const
    {
        if (items.size() != rhs.items.size())
            return false;
        for (size_t i=0; i<items.size(); ++i) {
            if (!iequals(items[i].first, rhs.items[i].first) ||
                items[i].second != rhs.items[i].second)
            {
                return false;
            }
        }
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string option_list::to_string () const
    {
        std::stringstream ss;
        bool first = true;
        for (auto& item : items) {
            if (!first)
                ss << ", ";
            ss << item.first << '=' << item.second;
            first = false;
        }
        return ss.str ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    packet::packet ()
        : opcode {0},
          block {0},
          error_code {0}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    packet packet::rrq (const std::string& filename,
                        const std::string& mode,
                        const option_list& options)
    {
        packet pkt;
        pkt.opcode = op_rrq;
        pkt.filename = filename;
        pkt.mode = mode;
        pkt.options = options;
        return pkt;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    packet packet::wrq (const std::string& filename,
                        const std::string& mode,
                        const option_list& options)
    {
        packet pkt = rrq (filename, mode, options);
        pkt.opcode = op_wrq;
        return pkt;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    packet packet::data (uint16_t block, const void* buf, size_t size)
    {
        packet pkt;
        pkt.opcode = op_data;
        pkt.block = block;
        if (size)
            pkt.payload.assign ((const char*)buf, (const char*)buf + size);
        return pkt;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    packet packet::ack (uint16_t block)
    {
        packet pkt;
        pkt.opcode = op_ack;
        pkt.block = block;
        return pkt;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    packet packet::error (uint16_t error_code, const std::string& message)
    {
        packet pkt;
        pkt.opcode = op_error;
        pkt.error_code = error_code;
        pkt.message = message.empty() ? tftp_error_to_string(error_code) : message;
        return pkt;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    packet packet::oack (const option_list& options)
    {
        packet pkt;
        pkt.opcode = op_oack;
        pkt.options = options;
        return pkt;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static uint16_t get_u16 (const uint8_t* p)
    {
        return (uint16_t) ((p[0] << 8) | p[1]);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static void put_u16 (std::vector<char>& buf, uint16_t value)
    {
        buf.push_back ((char)(value >> 8));
        buf.push_back ((char)(value & 0xff));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static void put_string (std::vector<char>& buf, const std::string& str)
    {
        buf.insert (buf.end(), str.begin(), str.end());
        buf.push_back ('\0');
    }


    //--------------------------------------------------------------------------
    // Read a null terminated string starting at 'pos'.
    // On success 'pos' is moved past the terminator.
    //--------------------------------------------------------------------------
    static bool get_string (const uint8_t* buf, size_t size, size_t& pos, std::string& str)
    {
        if (pos >= size)
            return false;
        const void* nul = memchr (buf+pos, '\0', size-pos);
        if (!nul)
            return false;
        size_t len = (const uint8_t*)nul - (buf+pos);
        str.assign ((const char*)buf+pos, len);
        pos += len + 1;
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static bool get_options (const uint8_t* buf, size_t size, size_t pos, option_list& options)
    {
        options.clear ();
        while (pos < size) {
            std::string name;
            std::string value;
            if (!get_string(buf, size, pos, name) ||
                !get_string(buf, size, pos, value) ||
                name.empty())
            {
                return false;
            }
            // First occurrence of an option wins
            if (!options.has(name))
                options.set (name, value);
        }
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool packet::parse (const void* data, size_t size)
    {
        const uint8_t* buf = (const uint8_t*) data;

        if (!buf || size < sizeof(uint16_t))
            return false;

        opcode = get_u16 (buf);
        filename.clear ();
        mode.clear ();
        options.clear ();
        payload.clear ();
        message.clear ();
        block = 0;
        error_code = 0;

        size_t pos = sizeof (uint16_t);

        switch (opcode) {
        case op_rrq:
        case op_wrq:
            if (!get_string(buf, size, pos, filename) || filename.empty())
                return false;
            if (!get_string(buf, size, pos, mode) || mode.empty())
                return false;
            return get_options (buf, size, pos, options);

        case op_data:
            if (size < tftp_header_size)
                return false;
            block = get_u16 (buf + pos);
            payload.assign ((const char*)buf + tftp_header_size, (const char*)buf + size);
            return true;

        case op_ack:
            if (size < tftp_header_size)
                return false;
            block = get_u16 (buf + pos);
            return true;

        case op_error:
            if (size < tftp_header_size)
                return false;
            error_code = get_u16 (buf + pos);
            pos = tftp_header_size;
            if (!get_string(buf, size, pos, message)) {
                // Accept a message without terminator
                message.assign ((const char*)buf + tftp_header_size, size - tftp_header_size);
            }
            return true;

        case op_oack:
            return get_options (buf, size, pos, options);

        default:
            return false;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void packet::encode (std::vector<char>& buf) const
    {
        buf.clear ();
        put_u16 (buf, opcode);

        switch (opcode) {
        case op_rrq:
        case op_wrq:
            put_string (buf, filename);
            put_string (buf, mode);
            for (auto& opt : options) {
                put_string (buf, opt.first);
                put_string (buf, opt.second);
            }
            break;

        case op_data:
            put_u16 (buf, block);
            buf.insert (buf.end(), payload.begin(), payload.end());
            break;

        case op_ack:
            put_u16 (buf, block);
            break;

        case op_error:
            put_u16 (buf, error_code);
            put_string (buf, message);
            break;

        case op_oack:
            for (auto& opt : options) {
                put_string (buf, opt.first);
                put_string (buf, opt.second);
            }
            break;

        default:
            break;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::vector<char> packet::encode () const
    {
        std::vector<char> buf;
        encode (buf);
        return buf;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void encode_data (std::vector<char>& buf, uint16_t block, const void* payload, size_t size)
    {
        buf.clear ();
        buf.reserve (tftp_header_size + size);
        put_u16 (buf, op_data);
        put_u16 (buf, block);
        if (size)
            buf.insert (buf.end(), (const char*)payload, (const char*)payload + size);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string packet::to_string () const
    {
        std::stringstream ss;
        ss << opcode_to_string(opcode);
        switch (opcode) {
        case op_rrq:
        case op_wrq:
            ss << " '" << filename << "' " << mode;
            if (!options.empty())
                ss << " [" << options.to_string() << ']';
            break;
        case op_data:
            ss << " #" << block << ", " << payload.size() << " bytes";
            break;
        case op_ack:
            ss << " #" << block;
            break;
        case op_error:
            ss << ' ' << error_code << " (" << message << ')';
            break;
        case op_oack:
            ss << " [" << options.to_string() << ']';
            break;
        default:
            ss << " (" << opcode << ')';
            break;
        }
        return ss.str ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool packet::operator== (const packet& rhs) const
    {
        if (opcode != rhs.opcode)
            return false;

        switch (opcode) {
        case op_rrq:
        case op_wrq:
            return filename == rhs.filename &&
                mode == rhs.mode &&
                options == rhs.options;
        case op_data:
            return block == rhs.block && payload == rhs.payload;
        case op_ack:
            return block == rhs.block;
        case op_error:
            return error_code == rhs.error_code && message == rhs.message;
        case op_oack:
            return options == rhs.options;
        default:
            return true;
        }
    }


}
