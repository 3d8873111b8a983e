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
#include <string>
#include <variant>
#include <gtest/gtest.h>
#include "classifier.hh"
#include "log.hh"
#include "test-utils.hh"

namespace uzhash {
namespace {

TEST(classifier, oversize_wins_over_extension)
{
    constexpr std::int64_t too_big = 2147483648;
    EXPECT_EQ(decide_handling("DM-Deck.ut2.uz2", too_big, unknown_type_policy::skip),
        handling::skip_oversize);
    EXPECT_EQ(decide_handling("Core.u", too_big, unknown_type_policy::hash),
        handling::skip_oversize);
    EXPECT_EQ(decide_handling("notes.txt", too_big, unknown_type_policy::hash),
        handling::skip_oversize);
    EXPECT_EQ(decide_handling("Core.u", max_file_size, unknown_type_policy::skip),
        handling::hash_raw);
}

TEST(classifier, handling_by_extension)
{
    EXPECT_EQ(decide_handling("Maps/DM-Deck.ut2.UZ2", 10, unknown_type_policy::skip),
        handling::decode_container);
    EXPECT_EQ(decide_handling("Textures/Foo.utx", 10, unknown_type_policy::skip),
        handling::hash_raw);
    EXPECT_EQ(decide_handling("System/Cache.uxx", 10, unknown_type_policy::skip),
        handling::hash_raw);
    EXPECT_EQ(decide_handling("readme.txt", 10, unknown_type_policy::skip),
        handling::skip_unrecognized);
    EXPECT_EQ(decide_handling("readme.txt", 10, unknown_type_policy::hash),
        handling::hash_raw);
}

TEST(classifier, classify_extension)
{
    EXPECT_EQ(classify_extension("Core.u"), file_kind::plain_asset);
    EXPECT_EQ(classify_extension("Music/Title.OGG"), file_kind::plain_asset);
    EXPECT_EQ(classify_extension("Sounds/Weapons.uax"), file_kind::plain_asset);
    EXPECT_EQ(classify_extension("KarmaData/Ragdoll.ka"), file_kind::plain_asset);
    EXPECT_EQ(classify_extension("x.uz2"), file_kind::container);
    EXPECT_EQ(classify_extension("Cache.uxx"), file_kind::cache_asset);
    EXPECT_EQ(classify_extension("notes.txt"), file_kind::unknown);
    EXPECT_EQ(classify_extension("menu"), file_kind::unknown);
    // Only the part after the last dot counts.
    EXPECT_EQ(classify_extension("file.mu"), file_kind::unknown);
    EXPECT_EQ(classify_extension("file.tutx"), file_kind::unknown);
    EXPECT_EQ(classify_extension("dir.u/file"), file_kind::unknown);
}

TEST(classifier, indexed_name)
{
    EXPECT_EQ(indexed_name("/srv/redirect/DM-Deck.ut2.uz2"), "DM-Deck.ut2");
    EXPECT_EQ(indexed_name("Core.u.UZ2"), "Core.u");
    EXPECT_EQ(indexed_name("System/Engine.u"), "Engine.u");
    EXPECT_EQ(base_name("a/b/c"), "c");
    EXPECT_EQ(base_name("c"), "c");
}

TEST(classifier, skip_reasons)
{
    EXPECT_TRUE(is_failure(skip_reason::oversize));
    EXPECT_TRUE(is_failure(skip_reason::truncated));
    EXPECT_TRUE(is_failure(skip_reason::unreadable));
    EXPECT_FALSE(is_failure(skip_reason::unrecognized_type));
    EXPECT_FALSE(is_failure(skip_reason::not_regular_file));
    EXPECT_EQ(describe(skip_reason::malformed_chunk), "malformed chunk");
}


class file_classifier_test : public ::testing::Test {
protected:
    file_classifier_test()
        : log(verbosity::debug, output, error_output),
          classifier(log)
    {
    }

    const hash_result& expect_result(const hash_outcome& outcome)
    {
        EXPECT_TRUE(std::holds_alternative<hash_result>(outcome));
        static const hash_result none{};
        const auto result = std::get_if<hash_result>(&outcome);
        return (result != nullptr) ? *result : none;
    }

    skip_reason expect_skip(const hash_outcome& outcome)
    {
        const auto skipped = std::get_if<skipped_file>(&outcome);
        if(skipped == nullptr) {
            ADD_FAILURE() << "file was not skipped";
            return skip_reason::unrecognized_type;
        }
        return skipped->reason;
    }

    test::temporary_directory directory;
    std::ostringstream output;
    std::ostringstream error_output;
    logger log;
    file_classifier classifier;
};

TEST_F(file_classifier_test, container_is_hashed_decompressed)
{
    const auto text = test::sample_text(70000);
    const auto path = directory.write_file("DM-Deck.ut2.uz2",
        test::make_container({text.substr(0, 32768), text.substr(32768, 32768),
            text.substr(65536)}));
    const auto outcome = classifier.hash_file(path, unknown_type_policy::skip);
    const auto& result = expect_result(outcome);
    EXPECT_EQ(result.name, "DM-Deck.ut2");
    EXPECT_EQ(result.size, 70000);
    EXPECT_EQ(result.digest, test::md5_of(text));
}

TEST_F(file_classifier_test, plain_asset_is_hashed_raw)
{
    const auto text = test::sample_text(100000);
    const auto path = directory.write_file("Engine.u", text);
    const auto outcome = classifier.hash_file(path, unknown_type_policy::skip);
    const auto& result = expect_result(outcome);
    EXPECT_EQ(result.name, "Engine.u");
    EXPECT_EQ(result.size, 100000);
    EXPECT_EQ(result.digest, test::md5_of(text));
}

TEST_F(file_classifier_test, empty_plain_asset)
{
    const auto path = directory.write_file("Empty.utx", "");
    const auto outcome = classifier.hash_file(path, unknown_type_policy::skip);
    const auto& result = expect_result(outcome);
    EXPECT_EQ(result.size, 0);
    EXPECT_EQ(result.digest, "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(file_classifier_test, cache_file_warns)
{
    const auto path = directory.write_file("0123.uxx", "cached");
    const auto outcome = classifier.hash_file(path, unknown_type_policy::skip);
    EXPECT_EQ(expect_result(outcome).digest, test::md5_of("cached"));
    EXPECT_NE(error_output.str().find("is a cache file"), std::string::npos);
    EXPECT_EQ(output.str().find("is a cache file"), std::string::npos);
}

TEST_F(file_classifier_test, unknown_type_follows_policy)
{
    const auto path = directory.write_file("notes.txt", "hello");
    EXPECT_EQ(expect_skip(classifier.hash_file(path, unknown_type_policy::skip)),
        skip_reason::unrecognized_type);
    const auto outcome = classifier.hash_file(path, unknown_type_policy::hash);
    EXPECT_EQ(expect_result(outcome).digest, test::md5_of("hello"));
}

TEST_F(file_classifier_test, damaged_container_is_skipped)
{
    const auto contents = test::make_container({test::sample_text(1000)});
    const auto path = directory.write_file("Broken.u.uz2",
        std::string_view(contents).substr(0, contents.size() - 1));
    const auto outcome = classifier.hash_file(path, unknown_type_policy::skip);
    EXPECT_EQ(expect_skip(outcome), skip_reason::truncated);
    const auto skipped = std::get_if<skipped_file>(&outcome);
    ASSERT_NE(skipped, nullptr);
    EXPECT_EQ(skipped->name, "Broken.u");
    EXPECT_EQ(skipped->detail.rfind("chunk 0: ", 0), 0u);
}

TEST_F(file_classifier_test, corrupt_container_is_skipped)
{
    const auto path = directory.write_file("Corrupt.uz2", test::make_chunk("\xff\xff\xff", 3));
    EXPECT_EQ(expect_skip(classifier.hash_file(path, unknown_type_policy::skip)),
        skip_reason::inflate_failure);
}

TEST_F(file_classifier_test, missing_file_is_unreadable)
{
    const auto outcome = classifier.hash_file(directory.file_path("Missing.u"),
        unknown_type_policy::skip);
    EXPECT_EQ(expect_skip(outcome), skip_reason::unreadable);
}

TEST_F(file_classifier_test, directory_is_not_a_regular_file)
{
    const auto path = directory.make_subdirectory("Maps.u");
    EXPECT_EQ(expect_skip(classifier.hash_file(path, unknown_type_policy::hash)),
        skip_reason::not_regular_file);
}

} // unnamed namespace
} // namespace uzhash
