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
#include <limits>
#include <new>
#include <string>
#include "inflater.hh"
#include "span.hh"

namespace uzhash {
namespace {

constexpr int raw_window_bits = -MAX_WBITS;
constexpr int zlib_window_bits = MAX_WBITS;

[[noreturn]] void throw_inflate_error(const z_stream& stream, const char* fallback)
{
    throw inflate_error(stream.msg != nullptr ? stream.msg : fallback);
}

} // unnamed namespace

inflater::inflater()
    : stream(),
      buffer(new std::byte[buffer_size]),
      produced(0),
      stream_ended(true)
{
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    stream.next_in = Z_NULL;
    stream.avail_in = 0;
    const auto status = inflateInit2(&stream, raw_window_bits);
    if(status == Z_MEM_ERROR) {
        throw std::bad_alloc();
    }
    if(status != Z_OK) {
        throw_inflate_error(stream, "cannot initialize inflate stream");
    }
}

inflater::~inflater() noexcept
{
    inflateEnd(&stream);
}

void inflater::start(span<const std::byte> payload)
{
    // zlib takes the input length as uInt.
    if(payload.size() > std::numeric_limits<uInt>::max()) {
        throw inflate_error("compressed payload too large");
    }
    const auto window_bits = has_zlib_header(payload) ? zlib_window_bits : raw_window_bits;
    if(inflateReset2(&stream, window_bits) != Z_OK) {
        throw_inflate_error(stream, "cannot reset inflate stream");
    }
    // zlib never writes through next_in.
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(payload.data()));
    stream.avail_in = static_cast<uInt>(payload.size());
    produced = 0;
    stream_ended = false;
}

span<const std::byte> inflater::next()
{
    while(!stream_ended) {
        stream.next_out = reinterpret_cast<Bytef*>(buffer.get());
        stream.avail_out = static_cast<uInt>(buffer_size);
        const auto status = inflate(&stream, Z_NO_FLUSH);
        const auto block_size = buffer_size - stream.avail_out;
        switch(status) {
        case Z_STREAM_END:
            stream_ended = true;
            break;
        case Z_OK:
            break;
        case Z_BUF_ERROR:
            // No progress possible: the output buffer was empty on entry,
            // so the input must have run out.
            throw inflate_error("compressed data ends before the end of the deflate stream");
        case Z_MEM_ERROR:
            throw std::bad_alloc();
        case Z_NEED_DICT:
            throw inflate_error("deflate stream requires a preset dictionary");
        default:
            throw_inflate_error(stream, "corrupt deflate stream");
        }
        if(block_size > 0) {
            produced += block_size;
            return span<const std::byte>(buffer.get(), block_size);
        }
        if(!stream_ended && stream.avail_in == 0) {
            throw inflate_error("compressed data ends before the end of the deflate stream");
        }
    }
    return span<const std::byte>();
}

std::uint64_t inflater::total_out() const noexcept
{
    return produced;
}

bool inflater::finished() const noexcept
{
    return stream_ended;
}

bool inflater::has_zlib_header(span<const std::byte> payload) noexcept
{
    if(payload.size() < 2) {
        return false;
    }
    const auto cmf = static_cast<unsigned>(payload[0]);
    const auto flg = static_cast<unsigned>(payload[1]);
    const bool deflate_method = (cmf & 0x0F) == Z_DEFLATED;
    const bool valid_window = (cmf >> 4) <= 7;
    const bool valid_check = ((cmf << 8) | flg) % 31 == 0;
    const bool no_dictionary = (flg & 0x20) == 0;
    return deflate_method && valid_window && valid_check && no_dictionary;
}

} // namespace uzhash
