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
#ifndef INCLUDED_54A9363C682E42B09545A5483BD7F9CE
#define INCLUDED_54A9363C682E42B09545A5483BD7F9CE
#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace uzhash {

class logger;

// Produces the paths of files to be hashed, one at a time.
class path_source {
public:
    virtual ~path_source() = default;

    // Returns false when there are no more paths.
    virtual bool next(std::string& destination) = 0;
};

// Reads NUL-separated paths, as produced by find -print0, up to the end
// of input or the first empty name.
class istream_path_source final : public path_source {
public:
    explicit istream_path_source(std::istream& input) noexcept;

    bool next(std::string& destination) override;
private:
    std::istream* input;
};

class list_path_source final : public path_source {
public:
    explicit list_path_source(std::vector<std::string> paths) noexcept;

    bool next(std::string& destination) override;
private:
    std::vector<std::string> paths;
    std::size_t position;
};

// Directories of a game installation that hold hashable content.
inline constexpr std::string_view game_content_directories[] = {
    "Animations", "KarmaData", "Maps", "Music", "Sounds", "System", "Textures",
};

// Lists the files directly inside each content directory of a game
// installation. Missing directories are reported and skipped.
std::vector<std::string> enumerate_game_layout(std::string_view root, logger& log);

} // namespace uzhash
#endif
