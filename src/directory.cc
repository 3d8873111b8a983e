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
#include <string_view>
#include <errno.h>
#include "directory.hh"
#include "syscall-utils.hh"

namespace uzhash {

const char* directory_error::what() const noexcept
{
    return "directory error";
}

directory directory::open(const char* path)
{
    DIR* const dir = opendir(path);
    if(dir == nullptr) {
        throw_errno<directory_error>();
    }
    return directory(dir);
}

bool directory::next_entry_name(std::string& destination)
{
    for(;;) {
        // readdir only sets errno on failure, so it's the only way to tell
        // errors from the end of the stream.
        errno = 0;
        const struct dirent* const entry = readdir(handle.get());
        if(entry == nullptr) {
            if(errno != 0) {
                throw_errno<directory_error>();
            }
            return false;
        }
        const std::string_view name(entry->d_name);
        if(name == "." || name == "..") {
            continue;
        }
        destination.assign(name);
        return true;
    }
}

void directory::deleter::operator()(DIR* dir) const noexcept
{
    closedir(dir);
}

directory::directory(DIR* dir) noexcept
    : handle(dir)
{
}


std::vector<std::string> list_directory(std::string_view path)
{
    const std::string path_string(path);
    auto dir = directory::open(path_string.c_str());
    std::vector<std::string> result;
    std::string name;
    while(dir.next_entry_name(name)) {
        auto& full_path = result.emplace_back(path_string);
        if(full_path.empty() || full_path.back() != '/') {
            full_path.push_back('/');
        }
        full_path.append(name);
    }
    return result;
}

} // namespace uzhash
