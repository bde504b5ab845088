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
#include <tftpio/file_io.hpp>
#include <tftpio/log.hpp>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>


namespace tftpio {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    posix_file_source::posix_file_source ()
        : fd {-1},
          file_size {0}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    posix_file_source::~posix_file_source ()
    {
        close ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int posix_file_source::open (const std::string& path)
    {
        close ();

        fd = ::open (path.c_str(), O_RDONLY|O_CLOEXEC);
        if (fd < 0)
            return -1;

        // We only allow regular files to be read
        struct stat sb;
        if (fstat(fd, &sb)) {
            auto errnum = errno;
            close ();
            errno = errnum;
            return -1;
        }
        if (!S_ISREG(sb.st_mode)) {
            close ();
            errno = S_ISDIR(sb.st_mode) ? EISDIR : EINVAL;
            return -1;
        }
        file_size = (uint64_t) sb.st_size;
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void posix_file_source::close ()
    {
        if (fd >= 0) {
            ::close (fd);
            fd = -1;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t posix_file_source::read_chunk (uint64_t offset, void* buf, size_t size)
    {
        size_t total = 0;
        while (total < size) {
            auto result = pread (fd, (char*)buf + total, size - total, (off_t)(offset + total));
            if (result < 0) {
                if (errno == EINTR)
                    continue;
                return -1;
            }
            if (result == 0)
                break; // End of file
            total += result;
        }
        return (ssize_t) total;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool posix_file_source::size (uint64_t& size) const
    {
        if (fd < 0)
            return false;
        size = file_size;
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    posix_file_sink::posix_file_sink ()
        : fd {-1}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    posix_file_sink::~posix_file_sink ()
    {
        close ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int posix_file_sink::open (const std::string& path, bool overwrite)
    {
        close ();

        // Don't follow into anything but regular files
        struct stat sb;
        if (stat(path.c_str(), &sb) == 0) {
            if (!S_ISREG(sb.st_mode)) {
                errno = S_ISDIR(sb.st_mode) ? EISDIR : EINVAL;
                return -1;
            }
            if (!overwrite) {
                errno = EEXIST;
                return -1;
            }
        }

        int flags = O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
        if (!overwrite)
            flags |= O_EXCL;
        fd = ::open (path.c_str(), flags, S_IRUSR|S_IWUSR|S_IRGRP|S_IWGRP|S_IROTH);
        if (fd < 0)
            return -1;

        filename = path;
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void posix_file_sink::close ()
    {
        if (fd >= 0) {
            ::close (fd);
            fd = -1;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t posix_file_sink::write_chunk (uint64_t offset, const void* buf, size_t size)
    {
        size_t total = 0;
        while (total < size) {
            auto result = pwrite (fd, (const char*)buf + total, size - total, (off_t)(offset + total));
            if (result < 0) {
                if (errno == EINTR)
                    continue;
                return -1;
            }
            total += result;
        }
        return (ssize_t) total;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int posix_file_sink::finish ()
    {
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }
        int result = ::close (fd);
        fd = -1;
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void posix_file_sink::discard ()
    {
        close ();
        if (!filename.empty()) {
            if (unlink(filename.c_str()) && errno != ENOENT)
                log::warning ("Unable to remove %s: %s", filename.c_str(), strerror(errno));
            filename.clear ();
        }
    }


}
