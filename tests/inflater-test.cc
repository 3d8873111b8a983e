// Copyright 2019-2020 Fanael Linithien
//
// This file is part of uzhash.
//
// uzhash is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// uzhash is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with uzhash.  If not, see <https://www.gnu.org/licenses/>.
#include <cstddef>
#include <string>
#include <gtest/gtest.h>
#include "inflater.hh"
#include "span.hh"
#include "test-utils.hh"

namespace uzhash {
namespace {

using test::bytes_of;

std::string inflate_all(inflater& decompressor, std::string_view compressed)
{
    decompressor.start(bytes_of(compressed));
    std::string result;
    for(;;) {
        const auto block = decompressor.next();
        if(block.empty()) {
            break;
        }
        result.append(reinterpret_cast<const char*>(block.data()), block.size());
    }
    return result;
}

TEST(inflater, raw_stream)
{
    const auto text = test::sample_text(5000);
    inflater decompressor;
    EXPECT_EQ(inflate_all(decompressor, test::deflate_raw(text)), text);
    EXPECT_TRUE(decompressor.finished());
    EXPECT_EQ(decompressor.total_out(), text.size());
}

TEST(inflater, zlib_wrapped_stream)
{
    const auto text = test::sample_text(5000, 7);
    inflater decompressor;
    EXPECT_EQ(inflate_all(decompressor, test::deflate_zlib(text)), text);
}

TEST(inflater, detects_zlib_header)
{
    const auto text = test::sample_text(1000);
    EXPECT_TRUE(inflater::has_zlib_header(bytes_of(test::deflate_zlib(text))));
    EXPECT_FALSE(inflater::has_zlib_header(bytes_of(test::deflate_raw(text))));
    EXPECT_FALSE(inflater::has_zlib_header(bytes_of("x")));
}

TEST(inflater, output_larger_than_buffer)
{
    const auto text = test::sample_text(200000, 3);
    inflater decompressor;
    EXPECT_EQ(inflate_all(decompressor, test::deflate_raw(text)), text);
    EXPECT_EQ(decompressor.total_out(), text.size());
}

TEST(inflater, reusable)
{
    inflater decompressor;
    const auto first = test::sample_text(3000, 1);
    const auto second = test::sample_text(4000, 2);
    EXPECT_EQ(inflate_all(decompressor, test::deflate_raw(first)), first);
    EXPECT_EQ(inflate_all(decompressor, test::deflate_zlib(second)), second);
    EXPECT_EQ(decompressor.total_out(), second.size());
}

TEST(inflater, corrupt_data)
{
    inflater decompressor;
    // Block type 3 is reserved.
    EXPECT_THROW(inflate_all(decompressor, "\xff\xff\xff\xff"), inflate_error);
}

TEST(inflater, truncated_stream)
{
    const auto compressed = test::deflate_raw(test::sample_text(50000));
    inflater decompressor;
    EXPECT_THROW(inflate_all(decompressor, std::string_view(compressed).substr(0,
        compressed.size() / 2)), inflate_error);
}

} // unnamed namespace
} // namespace uzhash
