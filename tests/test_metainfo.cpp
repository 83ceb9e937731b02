#include "seedwise/metainfo.hpp"

#include <gtest/gtest.h>

using namespace seedwise;

namespace {

file_manifest decode(const std::string& encoded, error_code& error)
{
    return decode_manifest(encoded, error);
}

error_code decode_error(const std::string& encoded)
{
    error_code error;
    const auto manifest = decode_manifest(encoded, error);
    EXPECT_FALSE(manifest.is_known());
    return error;
}

} // namespace

TEST(metainfo, single_file_torrent)
{
    error_code error;
    const auto m = decode("d8:announce14:http://t/x/ann4:infod6:lengthi1024e"
        "4:name8:file.iso12:piece lengthi16384eee", error);
    ASSERT_FALSE(error) << error.message();
    ASSERT_EQ(m.num_files(), 1);
    EXPECT_EQ(m.files()[0].path, "file.iso");
    EXPECT_EQ(m.files()[0].length, 1024);
}

TEST(metainfo, multi_file_torrent_paths_are_rooted_at_name)
{
    error_code error;
    const auto m = decode("d4:infod5:filesld6:lengthi10e4:pathl3:dir5:a.mkvee"
        "d6:lengthi20e4:pathl5:b.nfoeee4:name4:Showee", error);
    ASSERT_FALSE(error) << error.message();
    ASSERT_EQ(m.num_files(), 2);
    EXPECT_EQ(m.files()[0].path, "Show/dir/a.mkv");
    EXPECT_EQ(m.files()[0].length, 10);
    EXPECT_EQ(m.files()[1].path, "Show/b.nfo");
    EXPECT_EQ(m.total_length(), 30);
}

TEST(metainfo, binary_strings_are_skipped)
{
    std::string pieces(20, '\xff');
    pieces[3] = 'e';
    pieces[7] = ':';
    error_code error;
    const auto m = decode("d4:infod6:lengthi7e4:name1:x6:pieces20:" + pieces + "ee", error);
    ASSERT_FALSE(error) << error.message();
    EXPECT_EQ(m.total_length(), 7);
}

TEST(metainfo, zero_length_files_are_kept)
{
    error_code error;
    const auto m = decode("d4:infod6:lengthi0e4:name5:emptyee", error);
    ASSERT_FALSE(error);
    EXPECT_TRUE(m.is_known());
    EXPECT_EQ(m.total_length(), 0);
}

TEST(metainfo, malformed_bencoding)
{
    EXPECT_EQ(decode_error(""), metainfo_errc::invalid_bencoding);
    EXPECT_EQ(decode_error("not bencode"), metainfo_errc::invalid_bencoding);
    // unterminated
    EXPECT_EQ(decode_error("d4:infod"), metainfo_errc::invalid_bencoding);
    // the root must be a map
    EXPECT_EQ(decode_error("i42e"), metainfo_errc::invalid_bencoding);
    EXPECT_EQ(decode_error("l4:infoe"), metainfo_errc::invalid_bencoding);
    // trailing garbage
    EXPECT_EQ(decode_error("d4:infod6:lengthi1e4:name1:xeex"),
        metainfo_errc::invalid_bencoding);
    // string longer than the input
    EXPECT_EQ(decode_error("d4:infod4:name99:xee"), metainfo_errc::invalid_bencoding);
    // non-string map key
    EXPECT_EQ(decode_error("di1e1:xe"), metainfo_errc::invalid_bencoding);
}

TEST(metainfo, malformed_numbers)
{
    EXPECT_EQ(decode_error("d4:infod6:lengthi01e4:name1:xee"),
        metainfo_errc::invalid_bencoding);
    EXPECT_EQ(decode_error("d4:infod6:lengthi-0e4:name1:xee"),
        metainfo_errc::invalid_bencoding);
    EXPECT_EQ(decode_error("d4:infod6:lengthie4:name1:xee"),
        metainfo_errc::invalid_bencoding);
    EXPECT_EQ(decode_error("d4:infod6:lengthi1234567890123456789e4:name1:xee"),
        metainfo_errc::invalid_bencoding);
    EXPECT_EQ(decode_error("d4:infod6:lengthi12x4:name1:xee"),
        metainfo_errc::invalid_bencoding);
}

TEST(metainfo, nesting_is_bounded)
{
    const std::string deep = "d1:a" + std::string(100, 'l') + std::string(100, 'e') + 'e';
    EXPECT_EQ(decode_error(deep), metainfo_errc::invalid_bencoding);
}

TEST(metainfo, missing_fields)
{
    EXPECT_EQ(decode_error("d3:fooi1ee"), metainfo_errc::missing_info);
    // info must be a map
    EXPECT_EQ(decode_error("d4:info4:infoe"), metainfo_errc::missing_info);
    EXPECT_EQ(decode_error("d4:infod6:lengthi1eee"), metainfo_errc::missing_name);
    EXPECT_EQ(decode_error("d4:infod6:lengthi1e4:name0:ee"), metainfo_errc::missing_name);
}

TEST(metainfo, invalid_file_entries)
{
    // no length
    EXPECT_EQ(decode_error("d4:infod4:name1:xee"), metainfo_errc::invalid_file_entry);
    // negative length
    EXPECT_EQ(decode_error("d4:infod6:lengthi-1e4:name1:xee"),
        metainfo_errc::invalid_file_entry);
    // empty path element
    EXPECT_EQ(decode_error("d4:infod5:filesld6:lengthi1e4:pathl0:eee4:name1:xee"),
        metainfo_errc::invalid_file_entry);
    // no path
    EXPECT_EQ(decode_error("d4:infod5:filesld6:lengthi1eee4:name1:xee"),
        metainfo_errc::invalid_file_entry);
    // empty file list
    EXPECT_EQ(decode_error("d4:infod5:filesle4:name1:xee"),
        metainfo_errc::invalid_file_entry);
}

TEST(metainfo, error_category)
{
    const error_code e = metainfo_errc::invalid_bencoding;
    EXPECT_STREQ(e.category().name(), "metainfo");
    EXPECT_TRUE(e == std::errc::illegal_byte_sequence);
    EXPECT_FALSE(error_code(metainfo_errc::missing_info) == std::errc::illegal_byte_sequence);
}
