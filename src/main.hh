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
#ifndef INCLUDED_07FD00920FE049758AC2DC9082033BA3
#define INCLUDED_07FD00920FE049758AC2DC9082033BA3
namespace uzhash {

#define UZHASH_FOR_EACH_EXIT_CODE(macro)\
    macro(success, 0, "Operation completed successfully")\
    macro(harmless_error, 1, "Operation failed, but the error was harmless")\
    macro(error, 3, "An error occurred")\
    macro(usage, 64, "Command line argument parsing failed")

enum class exit_status : int {
#define UZHASH_DEFINE_EXIT_STATUS_ENUM(name, value, _description) name = (value),
    UZHASH_FOR_EACH_EXIT_CODE(UZHASH_DEFINE_EXIT_STATUS_ENUM)
#undef UZHASH_DEFINE_EXIT_STATUS_ENUM
};

} // namespace uzhash
#endif
