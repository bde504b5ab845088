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
#ifndef TFTPIO_FILE_PROVIDER_HPP
#define TFTPIO_FILE_PROVIDER_HPP

#include <tftpio/file_io.hpp>
#include <memory>
#include <string>


namespace tftpio {


    /**
     * Resolves requested file names to data sources and sinks.
     */
    class file_provider {
    public:
        virtual ~file_provider () = default;

        /**
         * Open a file for a read request.
         * @return 0 on success, -1 on error and <code>errno</code> is set.
         */
        virtual int open_read (const std::string& filename,
                               std::unique_ptr<data_source>& src) = 0;

        /**
         * Open a file for a write request.
         * @return 0 on success, -1 on error and <code>errno</code> is set.
         */
        virtual int open_write (const std::string& filename,
                                std::unique_ptr<data_sink>& sink) = 0;
    };


    /**
     * Check a requested file name.
     * Empty names, absolute paths and paths with a ".."
     * component are not allowed.
     */
    bool is_valid_filename (const std::string& filename);


    /**
     * Serve files from a directory.
     */
    class directory_provider : public file_provider {
    public:
        /**
         * @param root_dir The root directory.
         * @param send_dir Directory of files to read, relative to the root.
         * @param receive_dir Directory of written files, relative to the root.
         * @param allow_overwrite Allow write requests to replace existing files.
         * @throw std::system_error if the root directory can't be resolved.
         */
        directory_provider (const std::string& root_dir,
                            const std::string& send_dir="",
                            const std::string& receive_dir="",
                            bool allow_overwrite=false);
        virtual ~directory_provider () = default;

        virtual int open_read (const std::string& filename,
                               std::unique_ptr<data_source>& src);
        virtual int open_write (const std::string& filename,
                                std::unique_ptr<data_sink>& sink);

        /**
         * The canonical root directory, ending with '/'.
         */
        const std::string& root () const {
            return root_path;
        }


    private:
        std::string root_path;
        std::string send_path;
        std::string receive_path;
        bool allow_overwrite;
    };


}


#endif
