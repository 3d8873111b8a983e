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
#include <array>
#include <cstring>
#include <utility>
#include <boost/endian/conversion.hpp>
#include "compiler.hh"
#include "container-decoder.hh"
#include "digest.hh"
#include "file-descriptor.hh"
#include "log.hh"
#include "span.hh"

namespace uzhash {
namespace {

struct chunk_header {
    std::uint32_t compressed_size;
    std::uint32_t uncompressed_size;
};

chunk_header parse_chunk_header(span<const std::byte> bytes) noexcept
{
    std::uint32_t sizes[2];
    static_assert(sizeof(sizes) == chunk_header_size);
    std::memcpy(sizes, bytes.data(), sizeof(sizes));
    return {boost::endian::little_to_native(sizes[0]),
        boost::endian::little_to_native(sizes[1])};
}

} // unnamed namespace

std::string_view describe(decode_failure failure) noexcept
{
    switch(failure) {
    case decode_failure::truncation: return "truncated";
    case decode_failure::malformed_chunk: return "malformed chunk";
    case decode_failure::inflate_failure: return "inflate failure";
    }
    UZHASH_UNREACHABLE();
}

decode_error::decode_error(decode_failure kind, std::uint64_t chunk_index, std::string message)
    : failure_kind(kind), failed_chunk(chunk_index), message(std::move(message))
{
}

const char* decode_error::what() const noexcept
{
    return message.c_str();
}

decode_failure decode_error::kind() const noexcept
{
    return failure_kind;
}

std::uint64_t decode_error::chunk_index() const noexcept
{
    return failed_chunk;
}


container_decoder::container_decoder(logger& log)
    : log(&log)
{
}

container_stats container_decoder::decode(const file_descriptor& file,
    std::int64_t total_length, hash_accumulator& hash, std::string_view file_name)
{
    container_stats stats{0, 0};
    auto remaining = total_length;
    while(remaining > 0) {
        std::array<std::byte, chunk_header_size> header_bytes;
        if(file.read_full(header_bytes).size() < header_bytes.size()) {
            log->debug("Expected end of file in \"", file_name, "\" at chunk index ",
                stats.chunk_count);
            break;
        }
        const auto header = parse_chunk_header(header_bytes);
        check_chunk_sizes(header.compressed_size, header.uncompressed_size, stats.chunk_count,
            file_name);

        // A payload reaching past the declared end of the container cannot
        // be complete, so don't bother allocating space for it.
        const auto space_left = remaining - static_cast<std::int64_t>(chunk_header_size);
        if(static_cast<std::int64_t>(header.compressed_size) > space_left) {
            throw decode_error(decode_failure::truncation, stats.chunk_count,
                "chunk payload extends past the end of the container");
        }
        payload.resize(header.compressed_size);
        const auto read_payload = file.read_full(payload);
        if(read_payload.size() != payload.size()) {
            throw decode_error(decode_failure::truncation, stats.chunk_count,
                "unexpected end of file inside a chunk payload");
        }
        remaining -= static_cast<std::int64_t>(chunk_header_size + header.compressed_size);

        inflate_chunk(read_payload, header.uncompressed_size, stats.chunk_count, hash);
        stats.logical_size += header.uncompressed_size;
        ++stats.chunk_count;
    }
    return stats;
}

void container_decoder::check_chunk_sizes(std::uint32_t compressed_size,
    std::uint32_t uncompressed_size, std::uint64_t chunk_index, std::string_view file_name)
{
    if(compressed_size == 0) {
        throw decode_error(decode_failure::malformed_chunk, chunk_index,
            "chunk reports zero compressed size");
    }
    if(uncompressed_size == 0) {
        throw decode_error(decode_failure::malformed_chunk, chunk_index,
            "chunk reports zero uncompressed size");
    }
    if(compressed_size > max_compressed_chunk_size) {
        log->warning('"', file_name, "\" chunk ", chunk_index,
            " reports oversize compressed size ", compressed_size);
    }
    if(uncompressed_size > max_uncompressed_chunk_size) {
        log->warning('"', file_name, "\" chunk ", chunk_index,
            " reports oversize uncompressed size ", uncompressed_size);
    }
}

void container_decoder::inflate_chunk(span<const std::byte> compressed,
    std::uint32_t uncompressed_size, std::uint64_t chunk_index, hash_accumulator& hash)
{
    try {
        decompressor.start(compressed);
        for(;;) {
            const auto block = decompressor.next();
            if(block.empty()) {
                break;
            }
            if(decompressor.total_out() > uncompressed_size) {
                throw decode_error(decode_failure::inflate_failure, chunk_index,
                    "chunk decompresses to more than its declared size");
            }
            hash.update(block);
        }
    } catch(const inflate_error& e) {
        throw decode_error(decode_failure::inflate_failure, chunk_index, e.what());
    }
    if(decompressor.total_out() != uncompressed_size) {
        throw decode_error(decode_failure::inflate_failure, chunk_index,
            "chunk decompresses to less than its declared size");
    }
}

} // namespace uzhash
