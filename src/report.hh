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
#ifndef INCLUDED_C3021E51B9CD43798B83FE0ABEE394C0
#define INCLUDED_C3021E51B9CD43798B83FE0ABEE394C0
#include <cstdint>
#include <ostream>
#include <vector>
#include "hash-index.hh"

namespace uzhash {

void print_row_header(std::ostream& stream);
void print_row(std::ostream& stream, const db::file_row& row);
// Query results are written as tab-separated lines, one per row, after a
// header line naming the columns. Nothing is written for an empty result.
void print_rows(std::ostream& stream, const std::vector<db::file_row>& rows);
// One "filename, digest, count" line per group.
void print_groups(std::ostream& stream, const std::vector<db::duplicate_group>& groups);
// A "rows" line followed by a line with the number.
void print_count(std::ostream& stream, std::int64_t count);
void print_removed(std::ostream& stream, std::int64_t removed);

} // namespace uzhash
#endif
