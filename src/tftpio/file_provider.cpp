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
#include <tftpio/file_provider.hpp>
#include <tftpio/log.hpp>
#include <system_error>
#include <cstdlib>
#include <cerrno>
#include <climits>


namespace tftpio {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool is_valid_filename (const std::string& filename)
    {
        if (filename.empty() ||     // Emtpy filename not allowed
            filename[0] == '/')     // Absolute path not allowed
        {
            return false;
        }

        // Relative path to a parent directory not allowed
        size_t pos = 0;
        while (pos <= filename.size()) {
            auto end = filename.find ('/', pos);
            if (end == std::string::npos)
                end = filename.size ();
            if (filename.compare(pos, end-pos, "..") == 0)
                return false;
            pos = end + 1;
        }
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static std::string sub_directory (const std::string& root, const std::string& dir)
    {
        if (dir.empty())
            return root;
        std::string path = root + dir;
        if (path.back() != '/')
            path.push_back ('/');
        return path;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    directory_provider::directory_provider (const std::string& root_dir,
                                            const std::string& send_dir,
                                            const std::string& receive_dir,
                                            bool allow_overwrite)
        : allow_overwrite {allow_overwrite}
    {
        // Get the canonical server root path
        auto* path = realpath (root_dir.c_str(), nullptr);
        if (!path)
            throw std::system_error (errno, std::generic_category(), root_dir);
        root_path = path;
        free (path);
        if (root_path.back() != '/')
            root_path.append ("/");

        if ((!send_dir.empty() && !is_valid_filename(send_dir)) ||
            (!receive_dir.empty() && !is_valid_filename(receive_dir)))
        {
            throw std::system_error (EINVAL, std::generic_category(), "Invalid sub directory");
        }
        send_path = sub_directory (root_path, send_dir);
        receive_path = sub_directory (root_path, receive_dir);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int directory_provider::open_read (const std::string& filename,
                                       std::unique_ptr<data_source>& src)
    {
        if (!is_valid_filename(filename)) {
            log::debug ("Illegal file name '%s'", filename.c_str());
            errno = EACCES;
            return -1;
        }

        std::unique_ptr<posix_file_source> file (new posix_file_source);
        if (file->open(send_path + filename))
            return -1;
        src = std::move (file);
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int directory_provider::open_write (const std::string& filename,
                                        std::unique_ptr<data_sink>& sink)
    {
        if (!is_valid_filename(filename)) {
            log::debug ("Illegal file name '%s'", filename.c_str());
            errno = EACCES;
            return -1;
        }

        std::unique_ptr<posix_file_sink> file (new posix_file_sink);
        if (file->open(receive_path + filename, allow_overwrite))
            return -1;
        sink = std::move (file);
        return 0;
    }


}
