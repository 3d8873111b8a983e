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
#include "compiler.hh"
#include "log.hh"

namespace uzhash {

std::optional<verbosity> verbosity_from_int(long long value) noexcept
{
    if(value < static_cast<int>(verbosity::fatal) || value > static_cast<int>(verbosity::debug)) {
        return std::nullopt;
    }
    return static_cast<verbosity>(value);
}

std::string_view verbosity_name(verbosity level) noexcept
{
    switch(level) {
    case verbosity::fatal: return "fatal";
    case verbosity::error: return "error";
    case verbosity::warning: return "warning";
    case verbosity::info: return "informational";
    case verbosity::debug: return "debug";
    }
    UZHASH_UNREACHABLE();
}

logger::logger(verbosity level, std::ostream& output, std::ostream& error_output) noexcept
    : max_level(level), output(&output), error_output(&error_output)
{
}

verbosity logger::level() const noexcept
{
    return max_level;
}

bool logger::enabled(verbosity message_level) const noexcept
{
    return static_cast<int>(message_level) <= static_cast<int>(max_level);
}

std::ostream& logger::stream_for(verbosity message_level) const noexcept
{
    return (message_level <= verbosity::warning) ? *error_output : *output;
}

std::string_view logger::prefix(verbosity message_level) noexcept
{
    switch(message_level) {
    case verbosity::fatal: return "FATAL:";
    case verbosity::error: return "ERROR:";
    case verbosity::warning: return "WARN :";
    case verbosity::info: return "INFO :";
    case verbosity::debug: return "DEBUG:";
    }
    UZHASH_UNREACHABLE();
}

} // namespace uzhash
