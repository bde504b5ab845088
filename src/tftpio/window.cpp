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
#include <tftpio/window.hpp>
#include <tftpio/packet.hpp>
#include <cerrno>


namespace tftpio {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    uint16_t next_block (uint16_t block, rollover_t rollover)
    {
        if (block == 0xffff)
            return rollover == rollover_enforce1 ? 1 : 0;
        return block + 1;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool is_next_block (uint16_t prev, uint16_t block, rollover_t rollover)
    {
        if (prev == 0xffff && rollover == rollover_dont_care)
            return block == 0 || block == 1;
        return block == next_block (prev, rollover);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int block_distance (uint16_t from, uint16_t to)
    {
        return (int) (int16_t) (uint16_t) (to - from);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    send_window::send_window (data_source& src,
                              size_t blksize,
                              unsigned windowsize,
                              rollover_t rollover)
        : source {src},
          blksize {blksize},
          windowsize {windowsize ? windowsize : 1},
          rollover {rollover==rollover_dont_care ? rollover_enforce0 : rollover},
          read_buf (blksize),
          last_queued {0},
          offset {0},
          acked {0},
          final_queued {false}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int send_window::fill ()
    {
        while (!final_queued && window.size() < windowsize) {
            auto result = source.read_chunk (offset, read_buf.data(), blksize);
            if (result < 0)
                return -1;

            chunk_t chunk;
            chunk.block = next_block (last_queued, rollover);
            chunk.offset = offset;
            chunk.size = (size_t) result;

            offset += result;
            last_queued = chunk.block;
            // A block shorter than blksize, possibly empty, ends the transfer
            if ((size_t)result < blksize)
                final_queued = true;

            window.push_back (chunk);
        }
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    unsigned send_window::retire (uint16_t block)
    {
        // Find the block in the window, searched by block number
        // since block numbers may roll over inside the window
        size_t pos = 0;
        for (; pos < window.size(); ++pos) {
            if (window[pos].block == block)
                break;
        }
        if (pos == window.size())
            return 0;

        unsigned num = 0;
        for (size_t i=0; i<=pos; ++i) {
            acked += window.front().size;
            window.pop_front ();
            ++num;
        }
        return num;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int send_window::encode (const chunk_t& chunk, std::vector<char>& pkt) const
    {
        auto result = source.read_chunk (chunk.offset, read_buf.data(), chunk.size);
        if (result < 0)
            return -1;
        if ((size_t)result != chunk.size) {
            errno = EIO;
            return -1;
        }
        encode_data (pkt, chunk.block, read_buf.data(), chunk.size);
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    receive_window::receive_window (data_sink& sink, unsigned windowsize, uint64_t max_size)
        : sink {sink},
          windowsize {windowsize ? windowsize : 1},
          max_size {max_size},
          written {0},
          num_blocks {0}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int receive_window::add (const std::vector<char>& payload)
    {
        if (max_size && written + payload.size() > max_size) {
            errno = EFBIG;
            return -1;
        }
        if (!payload.empty()) {
            auto result = sink.write_chunk (written, payload.data(), payload.size());
            if (result < 0)
                return -1;
            written += result;
        }
        ++num_blocks;
        return 0;
    }


}
