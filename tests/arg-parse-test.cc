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
#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include "arg-parse.hh"
#include "log.hh"

namespace uzhash {
namespace {

args::args parse(std::initializer_list<std::string_view> arguments)
{
    const std::vector<std::string_view> storage(arguments);
    return args::parse_args(storage);
}

// Renders the error followed by the usage text main would print.
std::string parse_failure(std::initializer_list<std::string_view> arguments)
{
    try {
        static_cast<void>(parse(arguments));
    } catch(const args::parse_error& e) {
        std::ostringstream stream;
        stream << e << '\n' << args::usage(e.command(), "uzhash");
        return stream.str();
    }
    ADD_FAILURE() << "parsing did not fail";
    return {};
}

bool contains(const std::string& haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string::npos;
}

TEST(arg_parse, defaults)
{
    const auto parsed = parse({"uzhash", "count"});
    EXPECT_TRUE(std::holds_alternative<args::count_command>(parsed.cmd));
    EXPECT_EQ(parsed.common.database_path, "hashes.sqb");
    EXPECT_EQ(parsed.common.log_level, verbosity::info);
    EXPECT_TRUE(parsed.common.casefold);
    EXPECT_FALSE(parsed.common.force_unknown);
    EXPECT_FALSE(parsed.common.wipe);
}

TEST(arg_parse, options)
{
    const auto parsed = parse({"uzhash", "--database=maps.sqb", "--verbosity=4",
        "--no-casefold", "--force-unknown", "--wipe", "scan"});
    EXPECT_TRUE(std::holds_alternative<args::scan_command>(parsed.cmd));
    EXPECT_EQ(parsed.common.database_path, "maps.sqb");
    EXPECT_EQ(parsed.common.log_level, verbosity::debug);
    EXPECT_FALSE(parsed.common.casefold);
    EXPECT_TRUE(parsed.common.force_unknown);
    EXPECT_TRUE(parsed.common.wipe);
}

TEST(arg_parse, option_value_in_next_argument)
{
    const auto parsed = parse({"uzhash", "--database", "other.sqb", "--verbosity", "0", "dump"});
    EXPECT_TRUE(std::holds_alternative<args::dump_command>(parsed.cmd));
    EXPECT_EQ(parsed.common.database_path, "other.sqb");
    EXPECT_EQ(parsed.common.log_level, verbosity::fatal);
}

TEST(arg_parse, command_arguments)
{
    const auto find = parse({"uzhash", "find", "0123456789ABCDEF0123456789abcdef"});
    ASSERT_TRUE(std::holds_alternative<args::find_digest_command>(find.cmd));
    EXPECT_EQ(std::get<args::find_digest_command>(find.cmd).digest,
        "0123456789ABCDEF0123456789abcdef");

    const auto name = parse({"uzhash", "name", "DM-Deck.ut2"});
    ASSERT_TRUE(std::holds_alternative<args::find_name_command>(name.cmd));
    EXPECT_EQ(std::get<args::find_name_command>(name.cmd).file_name, "DM-Deck.ut2");

    const auto scan_dir = parse({"uzhash", "--", "scan-dir", "--odd-name"});
    ASSERT_TRUE(std::holds_alternative<args::scan_dir_command>(scan_dir.cmd));
    EXPECT_EQ(std::get<args::scan_dir_command>(scan_dir.cmd).directory_path, "--odd-name");

    const auto game = parse({"uzhash", "scan-game", "/games/ut2004"});
    ASSERT_TRUE(std::holds_alternative<args::scan_game_command>(game.cmd));
    EXPECT_EQ(std::get<args::scan_game_command>(game.cmd).game_path, "/games/ut2004");

    const auto hash = parse({"uzhash", "hash", "Core.u"});
    ASSERT_TRUE(std::holds_alternative<args::hash_command>(hash.cmd));
    EXPECT_EQ(std::get<args::hash_command>(hash.cmd).file_path, "Core.u");
}

TEST(arg_parse, every_command_name_is_known)
{
    for(const auto name: {"count", "dedupe", "digest-dupes", "dump", "dupes", "init", "scan",
            "wipe", "help"}) {
        EXPECT_NO_THROW(parse({"uzhash", name})) << name;
    }
}

TEST(arg_parse, help_for_command)
{
    const auto parsed = parse({"uzhash", "help", "find"});
    ASSERT_TRUE(std::holds_alternative<args::help_command>(parsed.cmd));
    std::ostringstream stream;
    stream << args::usage(std::get<args::help_command>(parsed.cmd).cookie, "uzhash");
    EXPECT_TRUE(contains(stream.str(), "uzhash find <HASH>"));
}

TEST(arg_parse, general_usage)
{
    const auto parsed = parse({"uzhash", "help"});
    std::ostringstream stream;
    stream << args::usage(std::get<args::help_command>(parsed.cmd).cookie, "uzhash");
    const auto text = stream.str();
    EXPECT_TRUE(contains(text, "usage: uzhash"));
    EXPECT_TRUE(contains(text, "--verbosity=VALUE"));
    EXPECT_TRUE(contains(text, " scan-game\n"));
    EXPECT_TRUE(contains(text, " 64: "));
}

TEST(arg_parse, errors)
{
    EXPECT_TRUE(contains(parse_failure({"uzhash"}), "no command name passed"));
    EXPECT_TRUE(contains(parse_failure({"uzhash", "frobnicate"}),
        "unknown command name \"frobnicate\""));
    EXPECT_TRUE(contains(parse_failure({"uzhash", "--bogus", "count"}),
        "unknown option \"--bogus\""));
    EXPECT_TRUE(contains(parse_failure({"uzhash", "--database"}), "requires a value"));
    EXPECT_TRUE(contains(parse_failure({"uzhash", "--wipe=yes", "scan"}),
        "doesn't take a value"));
    EXPECT_TRUE(contains(parse_failure({"uzhash", "--help"}), "General usage:"));
    EXPECT_TRUE(contains(parse_failure({"uzhash", "help", "frobnicate"}),
        "unknown command name"));
}

TEST(arg_parse, invalid_verbosity)
{
    EXPECT_TRUE(contains(parse_failure({"uzhash", "--verbosity=5", "count"}),
        "not a valid verbosity level"));
    EXPECT_TRUE(contains(parse_failure({"uzhash", "--verbosity=loud", "count"}),
        "not a valid verbosity level"));
    EXPECT_TRUE(contains(parse_failure({"uzhash", "--verbosity=-1", "count"}),
        "not a valid verbosity level"));
}

TEST(arg_parse, command_argument_count)
{
    const auto missing = parse_failure({"uzhash", "find"});
    EXPECT_TRUE(contains(missing, "missing value for a required argument"));
    // The usage shown is the command's own.
    EXPECT_TRUE(contains(missing, "uzhash find <HASH>"));

    const auto superfluous = parse_failure({"uzhash", "count", "extra", "args"});
    EXPECT_TRUE(contains(superfluous, "2 superfluous argument(s) found"));
    EXPECT_TRUE(contains(superfluous, "Count the indexed files"));
}

} // unnamed namespace
} // namespace uzhash
