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
#include <utility>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include "digest.hh"
#include "hash-index.hh"
#include "sqlite.hh"

namespace uzhash::db {
namespace {

sqlite::connection open_database(std::string_view path, sqlite::open_mode mode)
{
    // Wait 5 seconds for the database to be unlocked.
    constexpr int default_busy_timeout = 5000;

    // Ensure the user cannot pass magic SQLite names like ":memory:".
    const auto safe_path = (boost::starts_with(path, ":") || boost::starts_with(path, "file:"))
        ? std::string("./").append(path)
        : std::string(path);

    sqlite::connection connection(safe_path.c_str(), mode);
    connection.set_busy_timeout(default_busy_timeout);
    return connection;
}

void apply_common_pragmas(sqlite::connection& connection)
{
    connection.execute("PRAGMA cache_size = -16384;");
    connection.execute("PRAGMA secure_delete = OFF;");
    connection.execute("PRAGMA synchronous = FULL;");
}

bool is_hex_digit(char c) noexcept
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

constexpr std::string_view create_table_sql =
    "CREATE TABLE IF NOT EXISTS hashes("
    "id INTEGER PRIMARY KEY, filename TEXT, size INTEGER, md5 TEXT);";

} // unnamed namespace

std::string normalize_digest_query(std::string_view digest)
{
    auto normalized = boost::algorithm::to_lower_copy(std::string(digest));
    if(normalized.size() != digest_hex_length
        || !std::all_of(normalized.begin(), normalized.end(), is_hex_digit)) {
        throw validation_error("search digest must be exactly 32 hexadecimal digits: \""
            + std::string(digest) + '"');
    }
    return normalized;
}

void validate_name_query(std::string_view name)
{
    if(name.empty() || name.find_first_of(";: ") != std::string_view::npos) {
        throw validation_error("search file name is invalid: \"" + std::string(name) + '"');
    }
}


hash_index::hash_index(std::string_view path, index_options options, sqlite::open_mode mode)
    : connection(open_database(path, mode)),
      current_transaction(sqlite::invalid_transaction_tag),
      options(options),
      next_row_id(1),
      inserts_since_flush(0)
{
    apply_common_pragmas(connection);
}

void hash_index::initialize(bool clear)
{
    // The statement would keep the old table alive.
    insert_statement.reset();
    start_transaction_if_needed();
    if(clear) {
        connection.execute("DROP TABLE IF EXISTS hashes;");
    }
    connection.execute(create_table_sql);
    commit();
    insert_statement = connection.prepare("INSERT INTO hashes VALUES (?, ?, ?, ?);");
    load_next_id();
}

void hash_index::insert(std::string_view name, std::int64_t size, std::string_view digest)
{
    if(digest.size() != digest_hex_length) {
        throw validation_error("digest must be exactly 32 characters long, got "
            + std::to_string(digest.size()));
    }
    if(size < 0) {
        throw validation_error("file size cannot be negative");
    }
    if(!insert_statement) {
        throw error("hash index used before being initialized");
    }
    const auto stored_name = options.casefold
        ? boost::algorithm::to_lower_copy(std::string(name))
        : std::string(name);

    start_transaction_if_needed();
    insert_statement->reset();
    insert_statement->bind(next_row_id, std::string_view(stored_name), size, digest);
    insert_statement->step();
    ++next_row_id;
    ++inserts_since_flush;
    if(inserts_since_flush >= options.flush_interval) {
        commit();
    }
}

void hash_index::commit()
{
    if(current_transaction.valid()) {
        current_transaction.commit();
    }
    inserts_since_flush = 0;
}

void hash_index::revert()
{
    current_transaction.rollback();
    inserts_since_flush = 0;
    if(insert_statement) {
        load_next_id();
    }
}

std::vector<file_row> hash_index::find_by_digest(std::string_view digest)
{
    return find_rows("SELECT filename, size, md5 FROM hashes WHERE md5 = ? "
        "ORDER BY filename COLLATE NOCASE;", digest);
}

std::vector<file_row> hash_index::find_by_name(std::string_view name)
{
    // Names are stored folded, so the key has to be folded the same way.
    const auto key = options.casefold
        ? boost::algorithm::to_lower_copy(std::string(name))
        : std::string(name);
    return find_rows("SELECT filename, size, md5 FROM hashes WHERE filename = ? "
        "ORDER BY filename COLLATE NOCASE;", key);
}

file_row_cursor hash_index::dump()
{
    if(!table_exists()) {
        // Same columns, no rows.
        return file_row_cursor(connection.prepare("SELECT '', 0, '' WHERE 0;"));
    }
    return file_row_cursor(connection.prepare(
        "SELECT filename, size, md5 FROM hashes ORDER BY filename;"));
}

std::int64_t hash_index::count()
{
    if(!table_exists()) {
        return 0;
    }
    auto stmt = connection.prepare("SELECT COUNT(*) FROM hashes;");
    return sqlite::single_column_cursor<sqlite::int_column_tag>(stmt).next_always();
}

std::vector<duplicate_group> hash_index::list_duplicate_groups()
{
    return find_groups(
        "SELECT filename, md5, COUNT(*) FROM hashes "
        "GROUP BY filename, md5 HAVING COUNT(*) > 1 "
        "ORDER BY filename, md5;");
}

std::vector<duplicate_group> hash_index::list_duplicate_digests()
{
    return find_groups(
        "SELECT MIN(filename), md5, COUNT(*) FROM hashes "
        "GROUP BY md5 HAVING COUNT(*) > 1 "
        "ORDER BY MIN(filename), md5;");
}

std::int64_t hash_index::remove_duplicates()
{
    if(!table_exists()) {
        return 0;
    }
    start_transaction_if_needed();
    // Keep the newest row of every (filename, md5) group.
    connection.execute("DELETE FROM hashes WHERE id NOT IN ("
        "SELECT MAX(id) FROM hashes GROUP BY filename, md5);");
    const std::int64_t removed = connection.change_count();
    commit();
    return removed;
}

std::int64_t hash_index::next_id() const noexcept
{
    return next_row_id;
}

void hash_index::start_transaction_if_needed()
{
    if(!current_transaction.valid()) {
        current_transaction = connection.begin_transaction();
    }
}

bool hash_index::table_exists()
{
    auto stmt = connection.prepare(
        "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'hashes';");
    return sqlite::single_column_cursor<sqlite::int_column_tag>(stmt).next_always() > 0;
}

void hash_index::load_next_id()
{
    auto stmt = connection.prepare("SELECT MAX(id) FROM hashes;");
    const auto max_id =
        sqlite::single_column_cursor<sqlite::nullable_int_column_tag>(stmt).next_always();
    next_row_id = max_id.value_or(0) + 1;
}

std::vector<file_row> hash_index::find_rows(std::string_view sql, std::string_view key)
{
    std::vector<file_row> result;
    if(!table_exists()) {
        return result;
    }
    file_row_cursor cursor(connection.prepare(sql));
    cursor.bind(key);
    while(auto row = cursor.next()) {
        result.push_back(*std::move(row));
    }
    return result;
}

std::vector<duplicate_group> hash_index::find_groups(std::string_view sql)
{
    std::vector<duplicate_group> result;
    if(!table_exists()) {
        return result;
    }
    sqlite::owning_cursor<duplicate_group,
        sqlite::owned_string_column_tag,
        sqlite::owned_string_column_tag,
        sqlite::int_column_tag> cursor(connection.prepare(sql));
    while(auto row = cursor.next()) {
        result.push_back(*std::move(row));
    }
    return result;
}

} // namespace uzhash::db
