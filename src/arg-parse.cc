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
#include <cstdint>
#include <iterator>
#include <ostream>
#include <string_view>
#include <utility>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include "arg-parse.hh"
#include "hash-index.hh"
#include "log.hh"
#include "main.hh"
#include "span.hh"

namespace uzhash::args {

namespace {

using command_parser = command (*)(command_cookie, span<const std::string_view>);

struct command_spec {
    std::string_view name;
    command_parser parser;
    std::string_view readable_arg_spec;
    std::string_view short_description;
    std::string_view long_description;
};

constexpr const command_spec& cookie_to_command(command_cookie cookie) noexcept;
constexpr command_cookie command_to_cookie(const command_spec& command) noexcept;


class commandless_parse_error : public parse_error {
private:
    command_cookie command() const noexcept override;
};

command_cookie commandless_parse_error::command() const noexcept
{
    return command_cookie();
}

class commandful_parse_error : public parse_error {
public:
    explicit commandful_parse_error(command_cookie cookie) noexcept;
private:
    command_cookie command() const noexcept override;

    command_cookie cookie;
};

commandful_parse_error::commandful_parse_error(command_cookie cookie) noexcept
    : cookie(cookie)
{
}

command_cookie commandful_parse_error::command() const noexcept
{
    return cookie;
}

class unknown_long_option final : public commandless_parse_error {
public:
    explicit unknown_long_option(std::string_view option) noexcept;
private:
    void print(std::ostream& stream) const override;

    std::string_view option;
};

unknown_long_option::unknown_long_option(std::string_view option) noexcept
    : option(option)
{
}

void unknown_long_option::print(std::ostream& stream) const
{
    stream << "Error: unknown option \"--" << option << '"';
}

class invalid_verbosity final : public commandless_parse_error {
public:
    explicit invalid_verbosity(std::string_view str) noexcept;
private:
    void print(std::ostream& stream) const override;

    std::string_view string;
};

invalid_verbosity::invalid_verbosity(std::string_view str) noexcept
    : string(str)
{
}

void invalid_verbosity::print(std::ostream& stream) const
{
    stream << "Error: \"" << string << "\" is not a valid verbosity level, expected 0 to "
        << static_cast<int>(verbosity::debug);
}

class missing_required_value final : public commandless_parse_error {
public:
    explicit missing_required_value(std::string_view name) noexcept;
private:
    void print(std::ostream& stream) const override;

    std::string_view option_name;
};

missing_required_value::missing_required_value(std::string_view name) noexcept
    : option_name(name)
{
}

void missing_required_value::print(std::ostream& stream) const
{
    stream << "Error: option \"" << option_name << "\" requires a value, but none is present";
}

class unexpected_value final : public commandless_parse_error {
public:
    explicit unexpected_value(std::string_view name) noexcept;
private:
    void print(std::ostream& stream) const override;

    std::string_view option_name;
};

unexpected_value::unexpected_value(std::string_view name) noexcept
    : option_name(name)
{
}

void unexpected_value::print(std::ostream& stream) const
{
    stream << "Error: option \"" << option_name << "\" doesn't take a value";
}

class no_command_passed final : public commandless_parse_error {
private:
    void print(std::ostream& stream) const override;
};

void no_command_passed::print(std::ostream& stream) const
{
    stream << "Error: no command name passed";
}

class unknown_command_name final : public commandless_parse_error {
public:
    explicit unknown_command_name(std::string_view name) noexcept;
private:
    void print(std::ostream& stream) const override;

    std::string_view command_name;
};

unknown_command_name::unknown_command_name(std::string_view name) noexcept
    : command_name(name)
{
}

void unknown_command_name::print(std::ostream& stream) const
{
    stream << "Error: unknown command name \"" << command_name << '"';
}

class missing_argument final : public commandful_parse_error {
public:
    using commandful_parse_error::commandful_parse_error;
private:
    void print(std::ostream& stream) const override;
};

void missing_argument::print(std::ostream& stream) const
{
    stream << "Error: missing value for a required argument";
}

class superfluous_arguments final : public commandful_parse_error {
public:
    explicit superfluous_arguments(command_cookie cookie, std::size_t argument_count) noexcept;
private:
    void print(std::ostream& stream) const noexcept override;

    std::size_t argument_count;
};

superfluous_arguments::superfluous_arguments(command_cookie cookie,
    std::size_t argument_count) noexcept
    : commandful_parse_error(cookie), argument_count(argument_count)
{
}

void superfluous_arguments::print(std::ostream& stream) const noexcept
{
    stream << "Error: " << argument_count << " superfluous argument(s) found";
}

class help_error final : public commandless_parse_error {
private:
    void print(std::ostream& stream) const override;
};

void help_error::print(std::ostream& stream) const
{
    stream << "General usage:";
}


using option_parser = void (*)(common_args&, std::string_view);

[[noreturn]] void show_help_message(common_args&, std::string_view)
{
    throw help_error();
}

void set_database_path(common_args& destination, std::string_view arg)
{
    destination.database_path = arg;
}

void set_verbosity(common_args& destination, std::string_view arg)
{
    try {
        const auto level = verbosity_from_int(
            boost::lexical_cast<long long>(arg.data(), arg.size()));
        if(!level) {
            throw invalid_verbosity(arg);
        }
        destination.log_level = *level;
    } catch(const boost::bad_lexical_cast&) {
        throw invalid_verbosity(arg);
    }
}

void unset_casefold(common_args& destination, std::string_view)
{
    destination.casefold = false;
}

void set_force_unknown(common_args& destination, std::string_view)
{
    destination.force_unknown = true;
}

void set_wipe(common_args& destination, std::string_view)
{
    destination.wipe = true;
}


struct option_spec {
    std::string_view name;
    bool wants_arg;
    option_parser parser;
    std::string_view description;
};

constexpr const option_spec option_specs[] = {
    {"database", true, set_database_path, "Path of the hash database, default \"hashes.sqb\""},
    {"force-unknown", false, set_force_unknown,
        "Hash files of unrecognized types when scanning instead of skipping them"},
    {"help", false, show_help_message, "Show this message"},
    {"no-casefold", false, unset_casefold, "Store file names exactly as found, not lowercased"},
    {"verbosity", true, set_verbosity,
        "Message verbosity: 0 fatal, 1 error, 2 warning, 3 info (default), 4 debug"},
    {"wipe", false, set_wipe, "Clear the database before scanning"},
};

std::pair<common_args, span<const std::string_view>> parse_common(span<const std::string_view> args)
{
    common_args result;
    result.database_path = db::default_database_path;
    std::size_t i = 1;
    const auto arg_count = args.size();
    for(; i < arg_count; ++i) {
        const auto arg = args[i];
        if(!boost::starts_with(arg, "--")) {
            // It's not an option, so pass it through as positional.
            break;
        }
        if(arg == "--") {
            // Ignore this argument and treat everything beyond it as
            // positional.
            ++i;
            break;
        }
        // We know it's an option at this point.
        const auto option_name_value = arg.substr(2);
        const auto equals_position = option_name_value.find('=');
        const auto option_name = (equals_position != std::string_view::npos)
            ? option_name_value.substr(0, equals_position)
            : option_name_value;
        const auto option_spec = std::find_if(std::begin(option_specs), std::end(option_specs),
            [&](const auto& spec) {return spec.name == option_name;});
        if(option_spec == std::end(option_specs)) {
            throw unknown_long_option(option_name);
        }
        if(!option_spec->wants_arg) {
            if(equals_position != std::string_view::npos) {
                throw unexpected_value(option_spec->name);
            }
            option_spec->parser(result, std::string_view());
        } else {
            const auto option_value = [&]{
                if(equals_position != std::string_view::npos) {
                    // We have the value already, just use it.
                    return option_name_value.substr(equals_position + 1);
                }
                // We need to use the next argument as the value.
                if(i + 1 >= arg_count) {
                    throw missing_required_value(option_spec->name);
                }
                ++i;
                return args[i];
            }();
            option_spec->parser(result, option_value);
        }
    }
    return {result, args.drop_first(i)};
}


const command_spec* find_command(std::string_view name);

template <typename T, typename... Fields>
struct command_parser_impl {
    static command parse(command_cookie cookie, span<const std::string_view> args);
};

template <typename T, typename... Fields>
command command_parser_impl<T, Fields...>::parse(command_cookie cookie,
    span<const std::string_view> args)
{
    T result;
    (..., (args = Fields::parse(cookie, result, args)));
    if(!args.empty()) {
        throw superfluous_arguments(cookie, args.size());
    }
    return result;
}

template <auto Field>
struct string_arg {
    template <typename T>
    static span<const std::string_view> parse(command_cookie cookie,
        T& result, span<const std::string_view> args);
};

template <auto Field>
template <typename T>
span<const std::string_view> string_arg<Field>::parse(command_cookie cookie,
    T& result, span<const std::string_view> args)
{
    if(args.empty()) {
        throw missing_argument(cookie);
    }
    (result.*Field) = args.front();
    return args.drop_first(1);
}

template <auto Field>
struct command_name_opt_arg {
    template <typename T>
    static span<const std::string_view> parse(command_cookie, T& result,
        span<const std::string_view> args);
};

template <auto Field>
template <typename T>
span<const std::string_view> command_name_opt_arg<Field>::parse(command_cookie, T& result,
    span<const std::string_view> args)
{
    if(args.empty()) {
        (result.*Field) = command_cookie();
        return args;
    }
    const auto command_name = args.front();
    const auto command = find_command(command_name);
    if(command == nullptr) {
        throw unknown_command_name(command_name);
    }
    (result.*Field) = command_to_cookie(*command);
    return args.drop_first(1);
}

constexpr command_spec command_specs[] = {
    {
        "count",
        command_parser_impl<count_command>::parse,
        "",
        "Count the indexed files",
        R"eof(Print the number of rows in the database as a "rows" line followed
by a line with the count.

A database without the hash table is reported as having 0 rows. The database
file must exist.)eof"
    },
    {
        "dedupe",
        command_parser_impl<dedupe_command>::parse,
        "",
        "Remove duplicate rows",
        R"eof(Remove rows that repeat both the file name and the hash of another row.

Of every group of such rows, only the most recently inserted one is kept. The
number of removed rows is printed.

If there was nothing to remove, the command fails, but that condition can be
distinguished from other errors by the exit code, see '--help'.)eof"
    },
    {
        "digest-dupes",
        command_parser_impl<digest_dupes_command>::parse,
        "",
        "List hashes shared by several rows",
        R"eof(List every hash that appears in more than one row, whatever the file names.

Each line holds one of the file names with that hash, the hash, and the number
of rows sharing it, separated by tabs.)eof"
    },
    {
        "dump",
        command_parser_impl<dump_command>::parse,
        "",
        "Print every row",
        R"eof(Print every row in the database, ordered by file name.

The output is a header line followed by one tab-separated line per row,
holding the file name, the size and the hash.)eof"
    },
    {
        "dupes",
        command_parser_impl<dupes_command>::parse,
        "",
        "List duplicate rows",
        R"eof(List every file name and hash pair that appears in more than one row.

Each line holds the file name, the hash, and the number of rows, separated by
tabs. Use 'dedupe' to remove the duplicates.)eof"
    },
    {
        "find",
        command_parser_impl<find_digest_command,
            string_arg<&find_digest_command::digest>>::parse,
        "<HASH>",
        "Look up files by hash",
        R"eof(Print every row whose hash is the given one.

The hash must be 32 hexadecimal digits, in either case. Matching rows are
printed ordered by file name, ignoring case.

If nothing matches, the command fails, but that condition can be
distinguished from other errors by the exit code, see '--help'.)eof"
    },
    {
        "hash",
        command_parser_impl<hash_command,
            string_arg<&hash_command::file_path>>::parse,
        "<FILE>",
        "Hash a single file",
        R"eof(Compute and print the hash of a single file, without touching any database.

Compressed .uz2 files are decompressed and the hash is computed over their
contents. Files of unrecognized types are hashed as they are.)eof"
    },
    {
        "help",
        command_parser_impl<help_command,
            command_name_opt_arg<&help_command::cookie>>::parse,
        "[<COMMAND>]",
        "Show detailed usage information",
        R"eof(If a command name is passed, bring up detailed information about
the specified command.

If no command name is passed, print general usage information, just like
'--help'.)eof"
    },
    {
        "init",
        command_parser_impl<init_command>::parse,
        "",
        "Initialize a database",
        R"eof(Create the hash table in the database, creating the file if needed.

An existing table is left untouched.)eof"
    },
    {
        "name",
        command_parser_impl<find_name_command,
            string_arg<&find_name_command::file_name>>::parse,
        "<FILE-NAME>",
        "Look up files by name",
        R"eof(Print every row whose file name is exactly the given one.

Compressed files are indexed under their name without the .uz2 suffix. The
name may not contain semicolons, colons or spaces.

If nothing matches, the command fails, but that condition can be
distinguished from other errors by the exit code, see '--help'.)eof"
    },
    {
        "scan",
        command_parser_impl<scan_command>::parse,
        "",
        "Index files listed on the standard input",
        R"eof(Hash the files whose paths are specified on the standard input and add
them to the database. The file paths shall be separated by null characters
(U+0000 NULL), as produced by 'find -print0'.

Compressed .uz2 files are decompressed and indexed under their name without
the suffix. Files of unrecognized types are skipped, unless '--force-unknown'
is given. Directories, symlinks, device nodes, etc. are skipped.

If processing of any file fails, the error will be logged and the process
will continue. This situation is treated as a harmless error for the purpose
of determining the exit code.

If the '--wipe' option is present, the database is cleared first.)eof"
    },
    {
        "scan-dir",
        command_parser_impl<scan_dir_command,
            string_arg<&scan_dir_command::directory_path>>::parse,
        "<DIRECTORY>",
        "Index the files in a directory",
        R"eof(Like 'scan', but index the files directly inside the given directory.

Subdirectories are not descended into.)eof"
    },
    {
        "scan-game",
        command_parser_impl<scan_game_command,
            string_arg<&scan_game_command::game_path>>::parse,
        "<GAME-DIRECTORY>",
        "Index a game installation",
        R"eof(Like 'scan', but index the content directories of a game installation:
Animations, KarmaData, Maps, Music, Sounds, System and Textures.

Missing directories are reported and skipped.)eof"
    },
    {
        "wipe",
        command_parser_impl<wipe_command>::parse,
        "",
        "Remove all rows",
        R"eof(Drop the hash table and recreate it empty.)eof"
    },
};

constexpr const command_spec& cookie_to_command(command_cookie cookie) noexcept
{
    return command_specs[cookie.get()];
}

constexpr command_cookie command_to_cookie(const command_spec& command) noexcept
{
    return command_cookie(static_cast<std::size_t>(&command - command_specs));
}

const command_spec* find_command(std::string_view name)
{
    const auto command_spec = std::find_if(std::begin(command_specs), std::end(command_specs),
        [&](const auto& spec) {return spec.name == name;});
    return (command_spec != std::end(command_specs)) ? command_spec : nullptr;
}

command parse_command(span<const std::string_view> args)
{
    if(args.empty()) {
        throw no_command_passed();
    }
    const auto command_name = args.front();
    const auto command = find_command(command_name);
    if(command == nullptr) {
        throw unknown_command_name(command_name);
    }
    return command->parser(command_to_cookie(*command), args.drop_first(1));
}

} // unnamed namespace

const char* parse_error::what() const noexcept
{
    return "argument parse error";
}

std::ostream& operator<<(std::ostream& stream, const parse_error& error)
{
    error.print(stream);
    return stream;
}


// Define them here so they're not usable outside of this file.
constexpr command_cookie::command_cookie() noexcept
    : id(SIZE_MAX)
{
}

constexpr command_cookie::command_cookie(std::size_t id) noexcept
    : id(id)
{
}

constexpr std::size_t command_cookie::get() const noexcept
{
    return id;
}

constexpr bool command_cookie::valid() const noexcept
{
    return id < std::size(command_specs);
}


struct exit_code_metadata {
    int value;
    std::string_view description;
};

constexpr exit_code_metadata exit_codes[] = {
#define DEFINE_EXIT_CODE_METADATA(_name, value, description) {(value), (description)},
    UZHASH_FOR_EACH_EXIT_CODE(DEFINE_EXIT_CODE_METADATA)
#undef DEFINE_EXIT_CODE_METADATA
};


std::ostream& operator<<(std::ostream& stream, const usage& u)
{
    if(u.cookie.valid()) {
        const auto& command = cookie_to_command(u.cookie);
        stream << u.program_name << ' ' << command.name;
        if(!command.readable_arg_spec.empty()) {
            stream << ' ' << command.readable_arg_spec;
        }
        stream << "\n   " << command.short_description << "\n\n" << command.long_description;
    } else {
        stream << "usage: " << u.program_name
            << " [options...] [--] command [command args...]\n\nAllowed options:\n";
        for(const auto& option: option_specs) {
            stream << " --" << option.name << (option.wants_arg ? "=VALUE" : "")
                << "\n     " << option.description << '\n';
        }
        stream << "\nCommands:\n";
        for(const auto& command: command_specs) {
            stream << ' ' << command.name << "\n   " << command.short_description << '\n';
        }
        stream << "\nTo get more information about a command, use " << u.program_name
            << " help <COMMAND>\n\n";
        stream << "Program exit codes and their meanings:\n";
        for(const auto& exit_code: exit_codes) {
            stream << ' ' << exit_code.value << ": " << exit_code.description << '\n';
        }
    }
    return stream;
}


args parse_args(span<const std::string_view> args)
{
    auto [common, rest] = parse_common(args);
    auto command = parse_command(rest);
    return {std::move(common), std::move(command)};
}

} // namespace uzhash::args
