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
#include <gtest/gtest.h>
#include <tftpio/file_provider.hpp>
#include "test_util.hpp"
#include <system_error>
#include <cerrno>
#include <sys/stat.h>


using namespace tftpio;
using tftpio::test::temp_dir;
using tftpio::test::make_content;
using tftpio::test::write_file;
using tftpio::test::read_file;
using tftpio::test::file_exists;


TEST (file_provider, valid_filenames)
{
    EXPECT_TRUE (is_valid_filename("file.bin"));
    EXPECT_TRUE (is_valid_filename("dir/file.bin"));
    EXPECT_TRUE (is_valid_filename("..file"));
    EXPECT_TRUE (is_valid_filename("a/..b/c"));

    EXPECT_FALSE (is_valid_filename(""));
    EXPECT_FALSE (is_valid_filename("/etc/passwd"));
    EXPECT_FALSE (is_valid_filename(".."));
    EXPECT_FALSE (is_valid_filename("../secret"));
    EXPECT_FALSE (is_valid_filename("dir/../../secret"));
    EXPECT_FALSE (is_valid_filename("dir/.."));
}


TEST (posix_file, source_reads_chunks)
{
    temp_dir dir;
    auto content = make_content (1000);
    ASSERT_TRUE (write_file(dir.file("src.bin"), content));

    posix_file_source src;
    ASSERT_EQ (0, src.open(dir.file("src.bin")));
    uint64_t size = 0;
    ASSERT_TRUE (src.size(size));
    EXPECT_EQ (1000u, size);

    char buf[600];
    ASSERT_EQ (600, src.read_chunk(0, buf, sizeof(buf)));
    EXPECT_EQ (0, memcmp(buf, content.data(), 600));
    ASSERT_EQ (400, src.read_chunk(600, buf, sizeof(buf)));
    EXPECT_EQ (0, memcmp(buf, content.data()+600, 400));
    EXPECT_EQ (0, src.read_chunk(1000, buf, sizeof(buf)));
}


TEST (posix_file, source_rejects_directory)
{
    temp_dir dir;
    posix_file_source src;
    errno = 0;
    EXPECT_EQ (-1, src.open(dir.path()));
    EXPECT_EQ (EISDIR, errno);
    EXPECT_EQ (-1, src.open(dir.file("missing")));
    EXPECT_EQ (ENOENT, errno);
}


TEST (posix_file, sink_overwrite_and_discard)
{
    temp_dir dir;
    auto path = dir.file ("out.bin");
    ASSERT_TRUE (write_file(path, make_content(10)));

    posix_file_sink sink;
    errno = 0;
    EXPECT_EQ (-1, sink.open(path, false));
    EXPECT_EQ (EEXIST, errno);

    ASSERT_EQ (0, sink.open(path, true));
    ASSERT_EQ (3, sink.write_chunk(0, "abc", 3));
    ASSERT_EQ (2, sink.write_chunk(3, "de", 2));
    ASSERT_EQ (0, sink.finish());

    std::vector<char> content;
    ASSERT_TRUE (read_file(path, content));
    EXPECT_EQ (std::string("abcde"), std::string(content.begin(), content.end()));

    posix_file_sink partial;
    ASSERT_EQ (0, partial.open(dir.file("partial.bin"), false));
    ASSERT_EQ (1, partial.write_chunk(0, "x", 1));
    partial.discard ();
    EXPECT_FALSE (file_exists(dir.file("partial.bin")));
}


TEST (directory_provider, open_read_and_write)
{
    temp_dir dir;
    ASSERT_EQ (0, mkdir(dir.file("out").c_str(), 0755));
    ASSERT_EQ (0, mkdir(dir.file("in").c_str(), 0755));
    ASSERT_TRUE (write_file(dir.file("out/boot.img"), make_content(64)));

    directory_provider files (dir.path(), "out", "in");
    EXPECT_EQ ('/', files.root().back());

    std::unique_ptr<data_source> src;
    ASSERT_EQ (0, files.open_read("boot.img", src));
    uint64_t size = 0;
    ASSERT_TRUE (src->size(size));
    EXPECT_EQ (64u, size);

    errno = 0;
    EXPECT_EQ (-1, files.open_read("missing.img", src));
    EXPECT_EQ (ENOENT, errno);

    std::unique_ptr<data_sink> sink;
    ASSERT_EQ (0, files.open_write("upload.bin", sink));
    EXPECT_TRUE (file_exists(dir.file("in/upload.bin")));
    sink.reset ();

    // No overwriting by default
    errno = 0;
    EXPECT_EQ (-1, files.open_write("upload.bin", sink));
    EXPECT_EQ (EEXIST, errno);

    directory_provider overwriting (dir.path(), "out", "in", true);
    EXPECT_EQ (0, overwriting.open_write("upload.bin", sink));
}


TEST (directory_provider, illegal_filenames)
{
    temp_dir dir;
    directory_provider files (dir.path());
    std::unique_ptr<data_source> src;
    std::unique_ptr<data_sink> sink;

    errno = 0;
    EXPECT_EQ (-1, files.open_read("../etc/passwd", src));
    EXPECT_EQ (EACCES, errno);
    errno = 0;
    EXPECT_EQ (-1, files.open_read("/etc/passwd", src));
    EXPECT_EQ (EACCES, errno);
    errno = 0;
    EXPECT_EQ (-1, files.open_write("a/../../x", sink));
    EXPECT_EQ (EACCES, errno);
}


TEST (directory_provider, missing_root)
{
    EXPECT_THROW (directory_provider("/nonexistent/tftpio/root"), std::system_error);

    temp_dir dir;
    EXPECT_THROW (directory_provider(dir.path(), "../up"), std::system_error);
}
