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
#ifndef INCLUDED_B1C20DCC45FE404EBB4EC290C15874C3
#define INCLUDED_B1C20DCC45FE404EBB4EC290C15874C3
#include <exception>

namespace uzhash {

class syscall_error : public std::exception {
public:
    explicit syscall_error(int code) noexcept;
    const char* what() const noexcept override;
    int code() const noexcept;
    // Human readable text for code(), as given by strerror.
    const char* reason() const noexcept;
private:
    int error_code;
};

} // namespace uzhash
#endif
