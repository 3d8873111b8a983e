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
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include "arg-parse.hh"
#include "classifier.hh"
#include "directory.hh"
#include "hash-index.hh"
#include "log.hh"
#include "main.hh"
#include "path-source.hh"
#include "report.hh"
#include "scanner.hh"
#include "span.hh"
#include "sqlite.hh"
#include "syscall-error.hh"

namespace uzhash {
namespace {

exit_status report_rows(const std::vector<db::file_row>& rows, std::string_view query,
    logger& log)
{
    if(rows.empty()) {
        log.warning("No rows match \"", query, '"');
        return exit_status::harmless_error;
    }
    print_rows(std::cout, rows);
    return exit_status::success;
}

exit_status report_groups(const std::vector<db::duplicate_group>& groups, logger& log)
{
    if(groups.empty()) {
        log.warning("No duplicates found");
        return exit_status::success;
    }
    print_groups(std::cout, groups);
    return exit_status::success;
}

db::index_options get_index_options(const args::common_args& common_args) noexcept
{
    db::index_options options;
    options.casefold = common_args.casefold;
    return options;
}

unknown_type_policy get_scan_policy(const args::common_args& common_args) noexcept
{
    return common_args.force_unknown ? unknown_type_policy::hash : unknown_type_policy::skip;
}

// Query commands never create a database.
db::hash_index open_for_reading(const args::common_args& common_args)
{
    return db::hash_index(common_args.database_path, get_index_options(common_args),
        sqlite::open_mode::open_existing);
}

exit_status run_scan(path_source& paths, const args::common_args& common_args, logger& log)
{
    db::hash_index index(common_args.database_path, get_index_options(common_args));
    if(common_args.wipe) {
        log.info("Clearing \"", common_args.database_path, '"');
    }
    index.initialize(common_args.wipe);
    file_classifier classifier(log);
    const auto stats = scan_files(paths, classifier, index, get_scan_policy(common_args), log);
    if(stats.failed > 0) {
        log.warning(stats.failed, " file(s) failed to process");
        return exit_status::harmless_error;
    }
    return exit_status::success;
}


exit_status run_command(const args::count_command&, const args::common_args& common_args,
    logger&)
{
    auto index = open_for_reading(common_args);
    print_count(std::cout, index.count());
    return exit_status::success;
}

exit_status run_command(const args::dedupe_command&, const args::common_args& common_args,
    logger& log)
{
    db::hash_index index(common_args.database_path, get_index_options(common_args),
        sqlite::open_mode::open_existing);
    const auto removed = index.remove_duplicates();
    print_removed(std::cout, removed);
    if(removed == 0) {
        log.warning("No duplicate rows to remove");
        return exit_status::harmless_error;
    }
    return exit_status::success;
}

exit_status run_command(const args::digest_dupes_command&,
    const args::common_args& common_args, logger& log)
{
    auto index = open_for_reading(common_args);
    return report_groups(index.list_duplicate_digests(), log);
}

exit_status run_command(const args::dump_command&, const args::common_args& common_args,
    logger&)
{
    auto index = open_for_reading(common_args);
    print_row_header(std::cout);
    for(auto cursor = index.dump(); auto row = cursor.next(); ) {
        print_row(std::cout, *row);
    }
    std::cout << std::flush;
    return exit_status::success;
}

exit_status run_command(const args::dupes_command&, const args::common_args& common_args,
    logger& log)
{
    auto index = open_for_reading(common_args);
    return report_groups(index.list_duplicate_groups(), log);
}

exit_status run_command(const args::find_digest_command& args,
    const args::common_args& common_args, logger& log)
{
    const auto digest = db::normalize_digest_query(args.digest);
    auto index = open_for_reading(common_args);
    return report_rows(index.find_by_digest(digest), digest, log);
}

exit_status run_command(const args::find_name_command& args,
    const args::common_args& common_args, logger& log)
{
    db::validate_name_query(args.file_name);
    auto index = open_for_reading(common_args);
    return report_rows(index.find_by_name(args.file_name), args.file_name, log);
}

exit_status run_command(const args::hash_command& args, const args::common_args&, logger& log)
{
    file_classifier classifier(log);
    const auto outcome = classifier.hash_file(std::string(args.file_path),
        unknown_type_policy::hash);
    if(const auto result = std::get_if<hash_result>(&outcome)) {
        print_rows(std::cout, {db::file_row{result->name, result->size, result->digest}});
        return exit_status::success;
    }
    const auto& skipped = std::get<skipped_file>(outcome);
    log.error("Cannot hash \"", args.file_path, "\": ", describe(skipped.reason),
        skipped.detail.empty() ? "" : ": ", skipped.detail);
    return is_failure(skipped.reason) ? exit_status::error : exit_status::harmless_error;
}

exit_status run_command(const args::help_command& args, const args::common_args&, logger&)
{
    std::cout << args::usage(args.cookie, "uzhash") << '\n';
    return exit_status::success;
}

exit_status run_command(const args::init_command&, const args::common_args& common_args,
    logger& log)
{
    db::hash_index index(common_args.database_path, get_index_options(common_args));
    index.initialize(false);
    log.info("Database \"", common_args.database_path, "\" holds ", index.count(), " row(s)");
    return exit_status::success;
}

exit_status run_command(const args::scan_command&, const args::common_args& common_args,
    logger& log)
{
    istream_path_source paths(std::cin);
    return run_scan(paths, common_args, log);
}

exit_status run_command(const args::scan_dir_command& args,
    const args::common_args& common_args, logger& log)
{
    list_path_source paths(list_directory(args.directory_path));
    return run_scan(paths, common_args, log);
}

exit_status run_command(const args::scan_game_command& args,
    const args::common_args& common_args, logger& log)
{
    list_path_source paths(enumerate_game_layout(args.game_path, log));
    return run_scan(paths, common_args, log);
}

exit_status run_command(const args::wipe_command&, const args::common_args& common_args,
    logger& log)
{
    db::hash_index index(common_args.database_path, get_index_options(common_args));
    index.initialize(true);
    log.info("Cleared \"", common_args.database_path, '"');
    return exit_status::success;
}

[[nodiscard]] exit_status main(span<const std::string_view> args)
{
    try {
        auto parsed_args = args::parse_args(args);
        logger log(parsed_args.common.log_level, std::cout, std::clog);
        log.debug("Verbosity level: ", verbosity_name(log.level()));
        return std::visit([&](const auto& cmd) {
            return run_command(cmd, parsed_args.common, log);
        }, parsed_args.cmd);
    } catch(const args::parse_error& e) {
        std::clog << e << "\n\n" << args::usage(e.command(), args.front()) << '\n';
        return exit_status::usage;
    } catch(const db::validation_error& e) {
        std::clog << "Error: " << e.what() << '\n';
        return exit_status::usage;
    } catch(const syscall_error& e) {
        std::clog << "System error: " << e.what() << ": " << e.reason() << '\n';
        return exit_status::error;
    } catch(const db::error& e) {
        std::clog << "Database error: " << e.what() << '\n';
        return exit_status::error;
    } catch(const sqlite::error& e) {
        std::clog << "SQLite error: " << e.what() << '\n';
        return exit_status::error;
    } catch(const std::exception& e) {
        std::clog << "Internal error: " << e.what() << '\n';
        return exit_status::error;
    }
}

} // unnamed namespace
} // namespace uzhash

int main(int argc, char** argv)
{
    std::ios_base::sync_with_stdio(false);
    // We use std::cin as the file name source, so it doesn't make sense for it
    // to be tied to std::cout.
    std::cin.tie(nullptr);
    std::clog.tie(&std::cout);

    std::vector<std::string_view> args(argv, argv + argc);
    return static_cast<int>(uzhash::main(args));
}
