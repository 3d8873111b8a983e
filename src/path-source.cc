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
#include <iterator>
#include <utility>
#include <errno.h>
#include "directory.hh"
#include "log.hh"
#include "path-source.hh"

namespace uzhash {

istream_path_source::istream_path_source(std::istream& input) noexcept
    : input(&input)
{
}

bool istream_path_source::next(std::string& destination)
{
    destination.clear();
    std::getline(*input, destination, '\0');
    // An empty name ends the list, whether or not the input has ended.
    return !destination.empty();
}


list_path_source::list_path_source(std::vector<std::string> paths) noexcept
    : paths(std::move(paths)),
      position(0)
{
}

bool list_path_source::next(std::string& destination)
{
    if(position >= paths.size()) {
        return false;
    }
    destination = paths[position];
    ++position;
    return true;
}


std::vector<std::string> enumerate_game_layout(std::string_view root, logger& log)
{
    std::vector<std::string> result;
    for(const auto subdirectory: game_content_directories) {
        std::string path(root);
        if(path.empty() || path.back() != '/') {
            path.push_back('/');
        }
        path.append(subdirectory);
        try {
            auto files = list_directory(path);
            log.debug("Found ", files.size(), " entries in \"", path, '"');
            result.insert(result.end(), std::make_move_iterator(files.begin()),
                std::make_move_iterator(files.end()));
        } catch(const directory_error& e) {
            if(e.code() != ENOENT && e.code() != ENOTDIR) {
                throw;
            }
            log.warning("Directory \"", path, "\" not present, skipping");
        }
    }
    return result;
}

} // namespace uzhash
