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
#ifndef INCLUDED_2DDFD56E0FAC407490947E8F121B9E5F
#define INCLUDED_2DDFD56E0FAC407490947E8F121B9E5F
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "span.hh"

namespace uzhash::test {

// A fresh directory under TMPDIR, removed with everything in it on
// destruction.
class temporary_directory {
public:
    temporary_directory();
    ~temporary_directory() noexcept;
    temporary_directory(const temporary_directory&) = delete;
    temporary_directory& operator=(const temporary_directory&) = delete;

    const std::string& path() const noexcept;
    std::string file_path(std::string_view name) const;
    std::string write_file(std::string_view name, std::string_view contents) const;
    std::string make_subdirectory(std::string_view name) const;
private:
    std::string directory_path;
};

span<const std::byte> bytes_of(std::string_view data) noexcept;
std::string md5_of(std::string_view data);

std::string deflate_raw(std::string_view data);
std::string deflate_zlib(std::string_view data);

// Compressible, but not trivially so.
std::string sample_text(std::size_t size, unsigned seed = 1);

// Header followed by the payload, as stored in a container.
std::string make_chunk(std::string_view payload, std::uint32_t uncompressed_size);
// Compresses each piece into its own chunk.
std::string make_container(const std::vector<std::string>& pieces);

} // namespace uzhash::test
#endif
