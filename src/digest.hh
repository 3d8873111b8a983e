// Copyright 2019-2020 Fanael Linithien
//
// This file is part of uzhash.
//
// uzhash is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// In addition, for the avoidance of any doubt, permission is granted to
// link uzhash with OpenSSL or any other library package and to
// (re)distribute the binaries produced as the result of such linking.
//
// uzhash is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with uzhash.  If not, see <https://www.gnu.org/licenses/>.
#ifndef INCLUDED_BD4DC27ECDE842399662FBB772851214
#define INCLUDED_BD4DC27ECDE842399662FBB772851214
#include <array>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <openssl/evp.h>

namespace uzhash {

template <typename T>
class span;

class digest_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class md5 {
public:
    using result_type = std::array<std::byte, 16>;

    md5();
    void reset();
    void update(span<const std::byte> bytes);
    result_type finalize();
private:
    struct deleter {
        void operator()(EVP_MD_CTX* context) const noexcept;
    };
    std::unique_ptr<EVP_MD_CTX, deleter> context;
};

// Length of a digest rendered by to_hex.
constexpr std::size_t digest_hex_length = 2 * std::tuple_size_v<md5::result_type>;

std::string to_hex(span<const std::byte> bytes);

// Single-use digest of one logically contiguous byte stream.
class hash_accumulator {
public:
    void update(span<const std::byte> bytes);
    // Returns the lowercase hex digest. May only be called once.
    [[nodiscard]] std::string finalize();
private:
    md5 hash;
    bool finalized = false;
};

} // namespace uzhash
#endif
