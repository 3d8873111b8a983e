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
#ifndef INCLUDED_98EED48643CA41208737F52C0DA76D66
#define INCLUDED_98EED48643CA41208737F52C0DA76D66
#include <cstdint>
#include "classifier.hh"

namespace uzhash {

class logger;
class path_source;

namespace db {
class hash_index;
}

struct scan_stats {
    std::uint_least64_t indexed = 0;
    // Files deliberately not indexed, e.g. of unrecognized type.
    std::uint_least64_t skipped = 0;
    // Files that couldn't be hashed because of an error.
    std::uint_least64_t failed = 0;
};

// Hashes every file produced by the path source and inserts the results
// into the index, committing at the end. Problems with individual files
// are logged and counted; errors from the index propagate.
scan_stats scan_files(path_source& paths, file_classifier& classifier, db::hash_index& index,
    unknown_type_policy policy, logger& log);

} // namespace uzhash
#endif
