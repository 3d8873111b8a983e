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
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <stdlib.h>
#include <sys/stat.h>
#include <zlib.h>
#include "digest.hh"
#include "test-utils.hh"

namespace uzhash::test {

temporary_directory::temporary_directory()
{
    const char* const tmpdir = getenv("TMPDIR");
    std::string pattern = (tmpdir != nullptr && *tmpdir != '\0') ? tmpdir : "/tmp";
    pattern.append("/uzhash-test-XXXXXX");
    if(mkdtemp(pattern.data()) == nullptr) {
        throw std::system_error(errno, std::generic_category(), "mkdtemp");
    }
    directory_path = std::move(pattern);
}

temporary_directory::~temporary_directory() noexcept
{
    std::error_code ignored;
    std::filesystem::remove_all(directory_path, ignored);
}

const std::string& temporary_directory::path() const noexcept
{
    return directory_path;
}

std::string temporary_directory::file_path(std::string_view name) const
{
    return directory_path + '/' + std::string(name);
}

std::string temporary_directory::write_file(std::string_view name,
    std::string_view contents) const
{
    auto path = file_path(name);
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    stream.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    stream.close();
    if(!stream) {
        throw std::runtime_error("cannot write test file " + path);
    }
    return path;
}

std::string temporary_directory::make_subdirectory(std::string_view name) const
{
    auto path = file_path(name);
    if(mkdir(path.c_str(), 0700) != 0) {
        throw std::system_error(errno, std::generic_category(), "mkdir");
    }
    return path;
}


span<const std::byte> bytes_of(std::string_view data) noexcept
{
    return as_bytes(span<const char>(data.data(), data.size()));
}

std::string md5_of(std::string_view data)
{
    hash_accumulator hash;
    hash.update(bytes_of(data));
    return hash.finalize();
}

std::string deflate_raw(std::string_view data)
{
    z_stream stream{};
    if(deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
            Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::string result(deflateBound(&stream, static_cast<uLong>(data.size())), '\0');
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(result.data());
    stream.avail_out = static_cast<uInt>(result.size());
    const auto status = deflate(&stream, Z_FINISH);
    const auto produced = stream.total_out;
    deflateEnd(&stream);
    if(status != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    result.resize(produced);
    return result;
}

std::string deflate_zlib(std::string_view data)
{
    auto length = compressBound(static_cast<uLong>(data.size()));
    std::string result(length, '\0');
    if(compress2(reinterpret_cast<Bytef*>(result.data()), &length,
            reinterpret_cast<const Bytef*>(data.data()), static_cast<uLong>(data.size()),
            Z_BEST_COMPRESSION) != Z_OK) {
        throw std::runtime_error("compress2 failed");
    }
    result.resize(length);
    return result;
}

std::string sample_text(std::size_t size, unsigned seed)
{
    static constexpr std::string_view words[] = {
        "Unreal", "Engine", "Package", "Texture", "Sound", "Map", "Class", "Mesh", "\n",
    };
    std::string result;
    result.reserve(size + 16);
    unsigned state = seed;
    while(result.size() < size) {
        // Linear congruential step, only needs to be deterministic.
        state = state * 1103515245u + 12345u;
        result.append(words[(state >> 16) % std::size(words)]);
        result.push_back(static_cast<char>('0' + (state >> 8) % 10));
    }
    result.resize(size);
    return result;
}

std::string make_chunk(std::string_view payload, std::uint32_t uncompressed_size)
{
    std::string result;
    const auto append_le32 = [&](std::uint32_t value) {
        for(int i = 0; i < 4; ++i) {
            result.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
        }
    };
    append_le32(static_cast<std::uint32_t>(payload.size()));
    append_le32(uncompressed_size);
    result.append(payload);
    return result;
}

std::string make_container(const std::vector<std::string>& pieces)
{
    std::string result;
    for(const auto& piece: pieces) {
        result.append(make_chunk(deflate_raw(piece), static_cast<std::uint32_t>(piece.size())));
    }
    return result;
}

} // namespace uzhash::test
