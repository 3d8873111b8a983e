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
#include <string.h>
#include "syscall-error.hh"

namespace uzhash {

syscall_error::syscall_error(int code) noexcept
    : error_code(code)
{
}

const char* syscall_error::what() const noexcept
{
    return "syscall error";
}

int syscall_error::code() const noexcept
{
    return error_code;
}

const char* syscall_error::reason() const noexcept
{
    return strerror(error_code);
}

} // namespace uzhash
