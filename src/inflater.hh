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
#ifndef INCLUDED_EEA2083C90C14CC4A94F1EDCCDAA9B70
#define INCLUDED_EEA2083C90C14CC4A94F1EDCCDAA9B70
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <zlib.h>

namespace uzhash {

template <typename T>
class span;

class inflate_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Pull-style decompressor for a single deflate payload held in memory.
//
// Payloads are raw deflate streams. A payload that starts with a valid
// zlib stream header is decoded as a zlib-wrapped stream instead; raw
// streams produced by a conforming compressor cannot start with such
// a header.
class inflater {
public:
    inflater();
    inflater(const inflater&) = delete;
    inflater& operator=(const inflater&) = delete;
    ~inflater() noexcept;

    void start(span<const std::byte> payload);
    // Returns the next block of decompressed data, or an empty span once
    // the stream has ended. The block is valid until the next call.
    [[nodiscard]] span<const std::byte> next();
    std::uint64_t total_out() const noexcept;
    bool finished() const noexcept;

    static bool has_zlib_header(span<const std::byte> payload) noexcept;
private:
    static constexpr std::size_t buffer_size = 32768;

    z_stream stream;
    std::unique_ptr<std::byte[]> buffer;
    std::uint64_t produced;
    bool stream_ended;
};

} // namespace uzhash
#endif
