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
#include <string>
#include <variant>
#include "classifier.hh"
#include "hash-index.hh"
#include "log.hh"
#include "path-source.hh"
#include "scanner.hh"

namespace uzhash {

scan_stats scan_files(path_source& paths, file_classifier& classifier, db::hash_index& index,
    unknown_type_policy policy, logger& log)
{
    scan_stats stats;
    std::string path;
    while(paths.next(path)) {
        log.debug("Processing \"", path, '"');
        const auto outcome = classifier.hash_file(path, policy);
        if(const auto result = std::get_if<hash_result>(&outcome)) {
            index.insert(result->name, result->size, result->digest);
            ++stats.indexed;
            log.debug("Indexed ", result->name, '\t', result->size, '\t', result->digest);
            continue;
        }

        const auto& skipped = std::get<skipped_file>(outcome);
        if(is_failure(skipped.reason)) {
            ++stats.failed;
            log.error("Skipping \"", path, "\": ", describe(skipped.reason),
                skipped.detail.empty() ? "" : ": ", skipped.detail);
        } else {
            ++stats.skipped;
            log.debug("Skipping \"", path, "\": ", describe(skipped.reason));
        }
    }
    index.commit();
    log.info("Indexed ", stats.indexed, " file(s), skipped ", stats.skipped, ", failed ",
        stats.failed);
    return stats;
}

} // namespace uzhash
