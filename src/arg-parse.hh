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
#ifndef INCLUDED_E95D8250806B4887B9909FCA50E109AC
#define INCLUDED_E95D8250806B4887B9909FCA50E109AC
#include <cstddef>
#include <exception>
#include <iosfwd>
#include <string_view>
#include <variant>
#include "log.hh"
#include "span.hh"

namespace uzhash {

namespace args {

class command_cookie {
public:
    constexpr command_cookie() noexcept;
    constexpr explicit command_cookie(std::size_t id) noexcept;
    constexpr std::size_t get() const noexcept;
    constexpr bool valid() const noexcept;
private:
    std::size_t id;
};

class parse_error : public std::exception {
public:
    const char* what() const noexcept override;
    virtual command_cookie command() const noexcept = 0;
private:
    virtual void print(std::ostream& stream) const = 0;

    friend std::ostream& operator<<(std::ostream& stream, const parse_error& error);
};

struct usage {
public:
    constexpr explicit usage(command_cookie cookie, std::string_view program_name) noexcept;
private:
    command_cookie cookie;
    std::string_view program_name;

    friend std::ostream& operator<<(std::ostream& stream, const usage& u);
};

struct count_command {};

struct dedupe_command {};

struct digest_dupes_command {};

struct dump_command {};

struct dupes_command {};

struct find_digest_command {
    std::string_view digest;
};

struct find_name_command {
    std::string_view file_name;
};

struct hash_command {
    std::string_view file_path;
};

struct help_command {
    command_cookie cookie;
};

struct init_command {};

struct scan_command {};

struct scan_dir_command {
    std::string_view directory_path;
};

struct scan_game_command {
    std::string_view game_path;
};

struct wipe_command {};

using command = std::variant<
    count_command,
    dedupe_command,
    digest_dupes_command,
    dump_command,
    dupes_command,
    find_digest_command,
    find_name_command,
    hash_command,
    help_command,
    init_command,
    scan_command,
    scan_dir_command,
    scan_game_command,
    wipe_command>;

struct common_args {
    std::string_view database_path;
    verbosity log_level = verbosity::info;
    bool casefold = true;
    bool force_unknown = false;
    bool wipe = false;
};

struct args {
    common_args common;
    command cmd;
};

args parse_args(span<const std::string_view> args);


constexpr usage::usage(command_cookie cookie, std::string_view program_name) noexcept
    : cookie(cookie), program_name(program_name)
{
}

} // namespace uzhash::args
} // namespace uzhash
#endif
