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
#include <algorithm>
#include <iterator>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include "classifier.hh"
#include "compiler.hh"
#include "digest.hh"
#include "file-descriptor.hh"
#include "log.hh"
#include "span.hh"

namespace uzhash {
namespace {

constexpr std::string_view plain_asset_extensions[] = {
    "u", "ucl", "ukx", "ka", "ut2", "ogg", "uax", "usx", "utx",
};

constexpr std::string_view cache_extension = "uxx";

std::string_view extension_of(std::string_view name) noexcept
{
    const auto dot = name.rfind('.');
    return (dot != std::string_view::npos) ? name.substr(dot + 1) : std::string_view();
}

skip_reason to_skip_reason(decode_failure failure) noexcept
{
    switch(failure) {
    case decode_failure::truncation: return skip_reason::truncated;
    case decode_failure::malformed_chunk: return skip_reason::malformed_chunk;
    case decode_failure::inflate_failure: return skip_reason::inflate_failure;
    }
    UZHASH_UNREACHABLE();
}

} // unnamed namespace

std::string_view describe(skip_reason reason) noexcept
{
    switch(reason) {
    case skip_reason::oversize: return "oversize";
    case skip_reason::truncated: return "truncated";
    case skip_reason::malformed_chunk: return "malformed chunk";
    case skip_reason::inflate_failure: return "corrupt compressed data";
    case skip_reason::unrecognized_type: return "unrecognized type";
    case skip_reason::unreadable: return "unreadable";
    case skip_reason::not_regular_file: return "not a regular file";
    }
    UZHASH_UNREACHABLE();
}

bool is_failure(skip_reason reason) noexcept
{
    switch(reason) {
    case skip_reason::unrecognized_type:
    case skip_reason::not_regular_file:
        return false;
    case skip_reason::oversize:
    case skip_reason::truncated:
    case skip_reason::malformed_chunk:
    case skip_reason::inflate_failure:
    case skip_reason::unreadable:
        return true;
    }
    UZHASH_UNREACHABLE();
}

std::string_view base_name(std::string_view path) noexcept
{
    const auto slash = path.rfind('/');
    return (slash != std::string_view::npos) ? path.substr(slash + 1) : path;
}

file_kind classify_extension(std::string_view path)
{
    const auto name = base_name(path);
    if(boost::algorithm::iends_with(name, container_suffix)) {
        return file_kind::container;
    }
    const auto extension = boost::algorithm::to_lower_copy(std::string(extension_of(name)));
    if(extension == cache_extension) {
        return file_kind::cache_asset;
    }
    const auto known = std::find(std::begin(plain_asset_extensions),
        std::end(plain_asset_extensions), extension);
    return (known != std::end(plain_asset_extensions)) ? file_kind::plain_asset : file_kind::unknown;
}

std::string indexed_name(std::string_view path)
{
    const auto name = base_name(path);
    if(boost::algorithm::iends_with(name, container_suffix)) {
        return std::string(name.substr(0, name.size() - container_suffix.size()));
    }
    return std::string(name);
}

handling decide_handling(std::string_view path, std::int64_t size, unknown_type_policy policy)
{
    if(size > max_file_size) {
        return handling::skip_oversize;
    }
    switch(classify_extension(path)) {
    case file_kind::container:
        return handling::decode_container;
    case file_kind::plain_asset:
    case file_kind::cache_asset:
        return handling::hash_raw;
    case file_kind::unknown:
        return (policy == unknown_type_policy::hash) ? handling::hash_raw
            : handling::skip_unrecognized;
    }
    UZHASH_UNREACHABLE();
}


file_classifier::file_classifier(logger& log)
    : decoder(log),
      buffer(new std::byte[plain_block_size]),
      log(&log)
{
}

hash_outcome file_classifier::hash_file(const std::string& path, unknown_type_policy policy)
{
    try {
        auto file = file_descriptor::open_read_only(path.c_str());
        const auto info = file.stat();
        if(!S_ISREG(info.st_mode)) {
            return skipped_file{indexed_name(path), skip_reason::not_regular_file, {}};
        }
        // O_NONBLOCK was only needed for open itself.
        file.drop_o_nonblock();
        file.fadvise(POSIX_FADV_SEQUENTIAL);
        return hash_open_file(path, file, static_cast<std::int64_t>(info.st_size), policy);
    } catch(const file_error& e) {
        return skipped_file{indexed_name(path), skip_reason::unreadable, e.reason()};
    }
}

hash_outcome file_classifier::hash_open_file(const std::string& path,
    const file_descriptor& file, std::int64_t size, unknown_type_policy policy)
{
    switch(decide_handling(path, size, policy)) {
    case handling::skip_oversize:
        return skipped_file{indexed_name(path), skip_reason::oversize,
            std::to_string(size) + " bytes"};
    case handling::skip_unrecognized:
        log->debug("Filetype (", extension_of(base_name(path)), ") of file \"", path,
            "\" is not recognized");
        return skipped_file{indexed_name(path), skip_reason::unrecognized_type, {}};
    case handling::decode_container:
        try {
            return hash_container(path, file, size);
        } catch(const decode_error& e) {
            return skipped_file{indexed_name(path), to_skip_reason(e.kind()),
                "chunk " + std::to_string(e.chunk_index()) + ": " + e.what()};
        }
    case handling::hash_raw:
        return hash_plain(path, file, size);
    }
    UZHASH_UNREACHABLE();
}

hash_result file_classifier::hash_container(const std::string& path,
    const file_descriptor& file, std::int64_t size)
{
    log->debug('"', path, "\" appears to be a compressed file");
    hash_accumulator hash;
    const auto stats = decoder.decode(file, size, hash, path);
    log->debug('"', path, "\" decoded from ", stats.chunk_count, " chunk(s)");
    return {indexed_name(path), static_cast<std::int64_t>(stats.logical_size), hash.finalize()};
}

hash_result file_classifier::hash_plain(const std::string& path, const file_descriptor& file,
    std::int64_t size)
{
    if(classify_extension(path) == file_kind::cache_asset) {
        log->warning('"', path, "\" is a cache file");
    }
    hash_accumulator hash;
    for(;;) {
        const auto read_data = file.read({buffer.get(), plain_block_size});
        if(read_data.empty()) {
            break;
        }
        hash.update(read_data);
    }
    return {indexed_name(path), size, hash.finalize()};
}

} // namespace uzhash
