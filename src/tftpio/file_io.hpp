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
#ifndef TFTPIO_FILE_IO_HPP
#define TFTPIO_FILE_IO_HPP

#include <string>
#include <cstdint>
#include <cstddef>
#include <sys/types.h>


namespace tftpio {


    /**
     * Source of file data for a read transfer.
     */
    class data_source {
    public:
        virtual ~data_source () = default;

        /**
         * Read up to <code>size</code> bytes starting at <code>offset</code>.
         * A return value less than <code>size</code> means end of file.
         * @return The number of bytes read, or -1 on error
         *         and <code>errno</code> is set.
         */
        virtual ssize_t read_chunk (uint64_t offset, void* buf, size_t size) = 0;

        /**
         * Get the size of the data, if known.
         * @return <code>true</code> if the size is known.
         */
        virtual bool size (uint64_t& file_size) const = 0;
    };


    /**
     * Sink of file data for a write transfer.
     */
    class data_sink {
    public:
        virtual ~data_sink () = default;

        /**
         * Write <code>size</code> bytes at <code>offset</code>.
         * @return The number of bytes written, or -1 on error
         *         and <code>errno</code> is set.
         */
        virtual ssize_t write_chunk (uint64_t offset, const void* buf, size_t size) = 0;

        /**
         * Called when the last block is received, before it is acknowledged.
         * @return 0 on success, -1 on error and <code>errno</code> is set.
         */
        virtual int finish () {
            return 0;
        }

        /**
         * Called when a transfer fails and partial data should be removed.
         */
        virtual void discard () = 0;
    };


    /**
     * A regular file opened for reading.
     */
    class posix_file_source : public data_source {
    public:
        posix_file_source ();
        virtual ~posix_file_source ();

        /**
         * Open a regular file for reading.
         * @return 0 on success, -1 on error and <code>errno</code> is set.
         *         <code>errno</code> is <code>EISDIR</code> or <code>EINVAL</code>
         *         if the path is a directory or not a regular file.
         */
        int open (const std::string& path);

        void close ();

        virtual ssize_t read_chunk (uint64_t offset, void* buf, size_t size);
        virtual bool size (uint64_t& file_size) const;


    private:
        posix_file_source (const posix_file_source&) = delete;
        posix_file_source& operator= (const posix_file_source&) = delete;

        int fd;
        uint64_t file_size;
    };


    /**
     * A regular file opened for writing.
     */
    class posix_file_sink : public data_sink {
    public:
        posix_file_sink ();
        virtual ~posix_file_sink ();

        /**
         * Create a file for writing.
         * @param path The file to create.
         * @param overwrite If <code>false</code>, fail with
         *                  <code>EEXIST</code> if the file exists.
         * @return 0 on success, -1 on error and <code>errno</code> is set.
         */
        int open (const std::string& path, bool overwrite);

        void close ();

        virtual ssize_t write_chunk (uint64_t offset, const void* buf, size_t size);
        virtual int finish ();
        virtual void discard ();


    private:
        posix_file_sink (const posix_file_sink&) = delete;
        posix_file_sink& operator= (const posix_file_sink&) = delete;

        int fd;
        std::string filename;
    };


}


#endif
