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
#ifndef INCLUDED_68782917DB124143AA7FF692EBF35848
#define INCLUDED_68782917DB124143AA7FF692EBF35848

#if defined(__has_builtin)
# define UZHASH_HAS_BUILTIN __has_builtin
#else
# define UZHASH_HAS_BUILTIN(...) 0
#endif

#if UZHASH_HAS_BUILTIN(__builtin_unreachable) || defined(__GNUC__)
# define UZHASH_UNREACHABLE() __builtin_unreachable()
#else
# define UZHASH_UNREACHABLE_USE_FALLBACK
# define UZHASH_UNREACHABLE() ::uzhash::unreachable_fallback()
#endif

#if defined(UZHASH_UNREACHABLE_USE_FALLBACK)
namespace uzhash {
[[noreturn]] void unreachable_fallback();
} // namespace uzhash
#endif

#endif
