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
#include <sstream>
#include <gtest/gtest.h>
#include "log.hh"

namespace uzhash {
namespace {

TEST(logger, messages_above_verbosity_are_dropped)
{
    std::ostringstream output;
    std::ostringstream error_output;
    logger log(verbosity::warning, output, error_output);
    log.info("not shown");
    log.debug("not shown either");
    log.warning("careful");
    EXPECT_EQ(error_output.str(), "WARN : careful\n");
    EXPECT_TRUE(output.str().empty());
}

TEST(logger, diagnostics_go_to_error_stream)
{
    std::ostringstream output;
    std::ostringstream error_output;
    logger log(verbosity::debug, output, error_output);
    log.error("bad file \"", "x.uz2", "\" at chunk ", 3);
    log.fatal("giving up");
    log.warning("oversize chunk");
    log.info("progress");
    log.debug("details");
    EXPECT_EQ(error_output.str(), "ERROR: bad file \"x.uz2\" at chunk 3\nFATAL: giving up\n"
        "WARN : oversize chunk\n");
    EXPECT_EQ(output.str(), "INFO : progress\nDEBUG: details\n");
}

TEST(logger, fatal_only)
{
    std::ostringstream output;
    std::ostringstream error_output;
    logger log(verbosity::fatal, output, error_output);
    log.error("dropped");
    log.fatal("kept");
    EXPECT_FALSE(log.enabled(verbosity::error));
    EXPECT_TRUE(log.enabled(verbosity::fatal));
    EXPECT_EQ(error_output.str(), "FATAL: kept\n");
}

TEST(logger, verbosity_from_int)
{
    EXPECT_EQ(verbosity_from_int(0), verbosity::fatal);
    EXPECT_EQ(verbosity_from_int(3), verbosity::info);
    EXPECT_EQ(verbosity_from_int(4), verbosity::debug);
    EXPECT_FALSE(verbosity_from_int(-1).has_value());
    EXPECT_FALSE(verbosity_from_int(5).has_value());
    EXPECT_EQ(verbosity_name(verbosity::warning), "warning");
}

} // unnamed namespace
} // namespace uzhash
