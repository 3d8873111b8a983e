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
#ifndef INCLUDED_A6F42CB23EEE462A843E6125B748AC3F
#define INCLUDED_A6F42CB23EEE462A843E6125B748AC3F
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>

namespace uzhash {

enum class verbosity : int {
    fatal = 0,
    error = 1,
    warning = 2,
    info = 3,
    debug = 4,
};

std::optional<verbosity> verbosity_from_int(long long value) noexcept;
std::string_view verbosity_name(verbosity level) noexcept;

// Writes level-prefixed diagnostic lines. Fatal, error and warning messages
// go to the error stream, informational and debug ones to the regular
// output stream.
class logger {
public:
    explicit logger(verbosity level, std::ostream& output, std::ostream& error_output) noexcept;

    verbosity level() const noexcept;
    bool enabled(verbosity message_level) const noexcept;

    template <typename... Args>
    void write(verbosity message_level, Args&&... args);
    template <typename... Args>
    void fatal(Args&&... args);
    template <typename... Args>
    void error(Args&&... args);
    template <typename... Args>
    void warning(Args&&... args);
    template <typename... Args>
    void info(Args&&... args);
    template <typename... Args>
    void debug(Args&&... args);
private:
    std::ostream& stream_for(verbosity message_level) const noexcept;
    static std::string_view prefix(verbosity message_level) noexcept;

    verbosity max_level;
    std::ostream* output;
    std::ostream* error_output;
};


template <typename... Args>
void logger::write(verbosity message_level, Args&&... args)
{
    if(!enabled(message_level)) {
        return;
    }
    auto& stream = stream_for(message_level);
    stream << prefix(message_level) << ' ';
    (stream << ... << std::forward<Args>(args));
    stream << '\n' << std::flush;
}

template <typename... Args>
void logger::fatal(Args&&... args)
{
    write(verbosity::fatal, std::forward<Args>(args)...);
}

template <typename... Args>
void logger::error(Args&&... args)
{
    write(verbosity::error, std::forward<Args>(args)...);
}

template <typename... Args>
void logger::warning(Args&&... args)
{
    write(verbosity::warning, std::forward<Args>(args)...);
}

template <typename... Args>
void logger::info(Args&&... args)
{
    write(verbosity::info, std::forward<Args>(args)...);
}

template <typename... Args>
void logger::debug(Args&&... args)
{
    write(verbosity::debug, std::forward<Args>(args)...);
}

} // namespace uzhash
#endif
