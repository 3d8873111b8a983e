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
#include "report.hh"

namespace uzhash {

void print_row_header(std::ostream& stream)
{
    stream << "filename\tsize\tmd5\n";
}

void print_row(std::ostream& stream, const db::file_row& row)
{
    stream << row.name << '\t' << row.size << '\t' << row.digest << '\n';
}

void print_rows(std::ostream& stream, const std::vector<db::file_row>& rows)
{
    if(rows.empty()) {
        return;
    }
    print_row_header(stream);
    for(const auto& row: rows) {
        print_row(stream, row);
    }
    stream << std::flush;
}

void print_groups(std::ostream& stream, const std::vector<db::duplicate_group>& groups)
{
    for(const auto& group: groups) {
        stream << group.name << '\t' << group.digest << '\t' << group.count << '\n';
    }
    stream << std::flush;
}

void print_count(std::ostream& stream, std::int64_t count)
{
    stream << "rows\n" << count << '\n' << std::flush;
}

void print_removed(std::ostream& stream, std::int64_t removed)
{
    stream << "removed\t" << removed << '\n' << std::flush;
}

} // namespace uzhash
