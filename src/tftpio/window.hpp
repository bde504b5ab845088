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
#ifndef TFTPIO_WINDOW_HPP
#define TFTPIO_WINDOW_HPP

#include <tftpio/file_io.hpp>
#include <vector>
#include <deque>
#include <cstdint>
#include <cstddef>


namespace tftpio {


    /**
     * Block number that follows 65535.
     */
    enum rollover_t {
        rollover_enforce0,  /**< Block 0 follows 65535. */
        rollover_enforce1,  /**< Block 1 follows 65535. */
        rollover_dont_care  /**< Send block 0, accept both 0 and 1. */
    };


    /**
     * Return the block number following <code>block</code>.
     * With rollover_dont_care, block 0 follows 65535.
     */
    uint16_t next_block (uint16_t block, rollover_t rollover);

    /**
     * Return <code>true</code> if <code>block</code> directly
     * follows <code>prev</code> according to the rollover policy.
     * With rollover_dont_care, both 0 and 1 follow 65535.
     */
    bool is_next_block (uint16_t prev, uint16_t block, rollover_t rollover);

    /**
     * Signed modular distance from <code>from</code> to <code>to</code>,
     * in the range [-32768, 32767]. A positive value means that
     * <code>to</code> is newer than <code>from</code>.
     */
    int block_distance (uint16_t from, uint16_t to);


    /**
     * The sending side of a windowed transfer.
     * Keeps track of the blocks sent but not yet acknowledged.
     * Only the position of each block is kept, the payload is
     * read from the data source each time the block is encoded.
     */
    class send_window {
    public:
        /**
         * A block in the window.
         */
        struct chunk_t {
            uint16_t block;
            uint64_t offset;
            size_t size;   /**< Payload size. */
        };

        send_window (data_source& src,
                     size_t blksize,
                     unsigned windowsize,
                     rollover_t rollover);

        /**
         * Read blocks from the data source until the window
         * is full or the final block is queued.
         * @return 0 on success, -1 on read error and <code>errno</code> is set.
         */
        int fill ();

        /**
         * Retire all blocks up to and including <code>block</code>.
         * @return The number of retired blocks, 0 if
         *         <code>block</code> is not inside the window.
         */
        unsigned retire (uint16_t block);

        /**
         * Encode a DATA packet of a block in the window.
         * @return 0 on success, -1 on read error and <code>errno</code> is set.
         *         <code>errno</code> is <code>EIO</code> if the data source
         *         no longer holds the same amount of data for the block.
         */
        int encode (const chunk_t& chunk, std::vector<char>& pkt) const;

        const std::deque<chunk_t>& chunks () const {
            return window;
        }

        bool empty () const {
            return window.empty ();
        }

        /**
         * <code>true</code> when the final block is queued and acknowledged.
         */
        bool done () const {
            return final_queued && window.empty();
        }

        /**
         * Number of bytes acknowledged by the peer.
         */
        uint64_t bytes_acked () const {
            return acked;
        }


    private:
        data_source& source;
        size_t blksize;
        unsigned windowsize;
        rollover_t rollover;

        std::deque<chunk_t> window;
        mutable std::vector<char> read_buf;
        uint16_t last_queued;
        uint64_t offset;
        uint64_t acked;
        bool final_queued;
    };


    /**
     * The receiving side of a windowed transfer.
     * Blocks are written to the data sink as they arrive in order,
     * only the number of blocks not yet acknowledged is kept.
     */
    class receive_window {
    public:
        /**
         * @param max_size Max number of bytes to receive, 0 means no limit.
         */
        receive_window (data_sink& sink, unsigned windowsize, uint64_t max_size);

        /**
         * Write the payload of the next block to the data sink.
         * @return 0 on success, -1 on error and <code>errno</code> is set.
         *         <code>errno</code> is <code>EFBIG</code> if the
         *         size limit is exceeded.
         */
        int add (const std::vector<char>& payload);

        /**
         * Start a new window, called when the received blocks are acknowledged.
         */
        void reset () {
            num_blocks = 0;
        }

        bool full () const {
            return num_blocks >= windowsize;
        }

        /**
         * Number of blocks received since the last reset.
         */
        unsigned size () const {
            return num_blocks;
        }

        /**
         * Number of bytes written to the data sink.
         */
        uint64_t bytes_written () const {
            return written;
        }


    private:
        data_sink& sink;
        unsigned windowsize;
        uint64_t max_size;
        uint64_t written;
        unsigned num_blocks;
    };


}


#endif
