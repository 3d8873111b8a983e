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
#ifndef INCLUDED_36EC1A3EC59B470DA2137378B1FC3CA4
#define INCLUDED_36EC1A3EC59B470DA2137378B1FC3CA4
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <vector>
#include "inflater.hh"

namespace uzhash {

template <typename T>
class span;

class file_descriptor;
class hash_accumulator;
class logger;

// The game's own chunk buffers are this big; larger declared sizes are
// suspicious, but not fatal.
constexpr std::uint32_t max_compressed_chunk_size = 33096;
constexpr std::uint32_t max_uncompressed_chunk_size = 32768;
constexpr std::size_t chunk_header_size = 8;

enum class decode_failure {
    truncation,
    malformed_chunk,
    inflate_failure,
};

std::string_view describe(decode_failure failure) noexcept;

class decode_error : public std::exception {
public:
    explicit decode_error(decode_failure kind, std::uint64_t chunk_index, std::string message);

    const char* what() const noexcept override;
    decode_failure kind() const noexcept;
    std::uint64_t chunk_index() const noexcept;
private:
    decode_failure failure_kind;
    std::uint64_t failed_chunk;
    std::string message;
};

struct container_stats {
    std::uint64_t logical_size;
    std::uint64_t chunk_count;
};

// Decodes the chunked compression container, feeding the decompressed
// bytes to a hash accumulator.
//
// A container is a sequence of chunks filling the file exactly, each one
// an 8-byte header of two little-endian 32-bit integers (compressed size,
// uncompressed size) followed by the compressed payload. The end of the
// container is implied by its total length.
class container_decoder {
public:
    explicit container_decoder(logger& log);

    // Throws decode_error if the container is damaged, and file_error if
    // reading fails. The accumulator must not be used further after
    // a failure.
    container_stats decode(const file_descriptor& file, std::int64_t total_length,
        hash_accumulator& hash, std::string_view file_name);
private:
    void check_chunk_sizes(std::uint32_t compressed_size, std::uint32_t uncompressed_size,
        std::uint64_t chunk_index, std::string_view file_name);
    void inflate_chunk(span<const std::byte> compressed, std::uint32_t uncompressed_size,
        std::uint64_t chunk_index, hash_accumulator& hash);

    inflater decompressor;
    std::vector<std::byte> payload;
    logger* log;
};

} // namespace uzhash
#endif
