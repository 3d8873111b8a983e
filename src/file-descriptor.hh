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
#ifndef INCLUDED_70886C16FC6F4356BCDDE03F513D44CA
#define INCLUDED_70886C16FC6F4356BCDDE03F513D44CA
#include <cstddef>
#include <sys/types.h>
#include "syscall-error.hh"

struct stat;

namespace uzhash {

template <typename T>
class span;

class file_error : public syscall_error {
public:
    using syscall_error::syscall_error;
    const char* what() const noexcept override;
};

class file_descriptor {
public:
    explicit file_descriptor(int fd) noexcept;
    ~file_descriptor() noexcept;
    file_descriptor(file_descriptor&& other) noexcept;
    file_descriptor& operator=(file_descriptor other) noexcept;
    file_descriptor(const file_descriptor&) = delete;

    static file_descriptor open_read_only(const char* path);

    struct ::stat stat() const;
    [[nodiscard]] span<std::byte> read(span<std::byte> buffer) const;
    // Like read, but keeps reading until the buffer is full or the end of
    // file is reached. A result shorter than the buffer means end of file.
    [[nodiscard]] span<std::byte> read_full(span<std::byte> buffer) const;
    void drop_o_nonblock() const;
    void fadvise(int mode, off_t offset = 0, off_t len = 0) const;
private:
    int descriptor;
};

} // namespace uzhash
#endif
