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
#ifndef INCLUDED_A9DC987BCB5D40A481E62EE66FBCFC27
#define INCLUDED_A9DC987BCB5D40A481E62EE66FBCFC27
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <dirent.h>
#include "syscall-error.hh"

namespace uzhash {

class directory_error final : public syscall_error {
public:
    using syscall_error::syscall_error;
    const char* what() const noexcept override;
};

// An open directory stream. Entries are produced in the order the file
// system returns them.
class directory {
public:
    static directory open(const char* path);

    // Returns false at the end of the stream. "." and ".." are skipped.
    bool next_entry_name(std::string& destination);
private:
    struct deleter {
        void operator()(DIR* dir) const noexcept;
    };

    explicit directory(DIR* dir) noexcept;

    std::unique_ptr<DIR, deleter> handle;
};

// Full paths of all entries directly inside the directory, not descending
// into subdirectories.
std::vector<std::string> list_directory(std::string_view path);

} // namespace uzhash
#endif
