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
#ifndef INCLUDED_0821E04724284C3696F264CC76408F00
#define INCLUDED_0821E04724284C3696F264CC76408F00
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include "container-decoder.hh"

namespace uzhash {

class file_descriptor;
class logger;

// Files this big are never hashed, whatever their type.
constexpr std::int64_t max_file_size = 2147483647;
constexpr std::size_t plain_block_size = 32768;
constexpr std::string_view container_suffix = ".uz2";

enum class file_kind {
    container,
    plain_asset,
    cache_asset,
    unknown,
};

enum class unknown_type_policy {
    skip,
    hash,
};

enum class handling {
    decode_container,
    hash_raw,
    skip_oversize,
    skip_unrecognized,
};

enum class skip_reason {
    oversize,
    truncated,
    malformed_chunk,
    inflate_failure,
    unrecognized_type,
    unreadable,
    not_regular_file,
};

std::string_view describe(skip_reason reason) noexcept;
// Whether the reason denotes a damaged or inaccessible file rather than one
// that is simply not meant to be indexed.
bool is_failure(skip_reason reason) noexcept;

struct hash_result {
    std::string name;
    std::int64_t size;
    std::string digest;
};

struct skipped_file {
    std::string name;
    skip_reason reason;
    std::string detail;
};

using hash_outcome = std::variant<hash_result, skipped_file>;

std::string_view base_name(std::string_view path) noexcept;
file_kind classify_extension(std::string_view path);
// The name a file is indexed under: its base name, minus the container
// suffix for containers.
std::string indexed_name(std::string_view path);
handling decide_handling(std::string_view path, std::int64_t size, unknown_type_policy policy);

class file_classifier {
public:
    explicit file_classifier(logger& log);

    // Never throws for problems with the file itself; those are reported
    // as a skipped_file.
    hash_outcome hash_file(const std::string& path, unknown_type_policy policy);
private:
    hash_outcome hash_open_file(const std::string& path, const file_descriptor& file,
        std::int64_t size, unknown_type_policy policy);
    hash_result hash_container(const std::string& path, const file_descriptor& file,
        std::int64_t size);
    hash_result hash_plain(const std::string& path, const file_descriptor& file,
        std::int64_t size);

    container_decoder decoder;
    std::unique_ptr<std::byte[]> buffer;
    logger* log;
};

} // namespace uzhash
#endif
