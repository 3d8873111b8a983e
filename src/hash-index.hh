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
#ifndef INCLUDED_277EAB83A95C4A7BB9B1886A3FC4C045
#define INCLUDED_277EAB83A95C4A7BB9B1886A3FC4C045
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <string>
#include <vector>
#include "sqlite.hh"

namespace uzhash::db {

class error final : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A malformed argument was passed to a query or an insert.
class validation_error final : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

constexpr std::size_t default_flush_interval = 100;
constexpr std::string_view default_database_path = "hashes.sqb";

struct file_row {
    std::string name;
    std::int64_t size;
    std::string digest;
};

struct duplicate_group {
    std::string name;
    std::string digest;
    std::int64_t count;
};

using file_row_cursor = sqlite::owning_cursor<file_row,
    sqlite::owned_string_column_tag,
    sqlite::int_column_tag,
    sqlite::owned_string_column_tag>;

struct index_options {
    // Store names lowercased.
    bool casefold = true;
    // Commit automatically after this many inserts.
    std::size_t flush_interval = default_flush_interval;
};

// Lowercases a digest given as a search key and checks that it's 32 hex
// digits.
std::string normalize_digest_query(std::string_view digest);
void validate_name_query(std::string_view name);

// Flat table of (id, filename, size, md5) rows, compatible with stores
// written by earlier versions of the tool.
//
// Inserts are buffered in a transaction that is committed every
// flush_interval inserts, and on explicit commit. Uncommitted changes
// are rolled back when the index is destroyed.
class hash_index {
public:
    explicit hash_index(std::string_view path, index_options options = {},
        sqlite::open_mode mode = sqlite::open_mode::create_if_missing);
    // Disable moves, prepared statements keep a pointer to the connection.
    hash_index(hash_index&&) = delete;
    hash_index& operator=(hash_index&&) = delete;

    // Must be called before insert.
    void initialize(bool clear);
    void insert(std::string_view name, std::int64_t size, std::string_view digest);
    void commit();
    void revert();

    std::vector<file_row> find_by_digest(std::string_view digest);
    // With case folding on, names differing only in case match.
    std::vector<file_row> find_by_name(std::string_view name);
    file_row_cursor dump();
    std::int64_t count();
    std::vector<duplicate_group> list_duplicate_groups();
    std::vector<duplicate_group> list_duplicate_digests();
    // Returns the number of rows removed.
    std::int64_t remove_duplicates();

    std::int64_t next_id() const noexcept;
private:
    void start_transaction_if_needed();
    bool table_exists();
    void load_next_id();
    std::vector<file_row> find_rows(std::string_view sql, std::string_view key);
    std::vector<duplicate_group> find_groups(std::string_view sql);

    sqlite::connection connection;
    sqlite::transaction current_transaction;
    std::optional<sqlite::statement> insert_statement;
    index_options options;
    std::int64_t next_row_id;
    std::size_t inserts_since_flush;
};

} // namespace uzhash::db
#endif
