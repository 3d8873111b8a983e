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
#include <climits>
#include <stdexcept>
#include "digest.hh"
#include "span.hh"

namespace uzhash {

md5::md5()
    : context(EVP_MD_CTX_new())
{
    if(context == nullptr) {
        throw digest_error("cannot allocate a digest context");
    }
    reset();
}

void md5::reset()
{
    if(EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr) != 1) {
        throw digest_error("cannot initialize MD5 digest");
    }
}

void md5::update(span<const std::byte> bytes)
{
    if(EVP_DigestUpdate(context.get(), bytes.data(), bytes.size_bytes()) != 1) {
        throw digest_error("MD5 update failed");
    }
}

auto md5::finalize() -> result_type
{
    result_type result;
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(context.get(), reinterpret_cast<unsigned char*>(result.data()),
            &length) != 1 || length != result.size()) {
        throw digest_error("MD5 finalization failed");
    }
    return result;
}

void md5::deleter::operator()(EVP_MD_CTX* context) const noexcept
{
    EVP_MD_CTX_free(context);
}


std::string to_hex(span<const std::byte> bytes)
{
    static constexpr char hex_digits[16] = {
        '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
    };

    static_assert(CHAR_BIT == 8);
    std::string result;
    result.reserve(2 * bytes.size());
    for(const std::byte byte: bytes) {
        result.push_back(hex_digits[static_cast<unsigned>(byte >> 4)]);
        result.push_back(hex_digits[static_cast<unsigned>(byte & std::byte{0x0F})]);
    }
    return result;
}


void hash_accumulator::update(span<const std::byte> bytes)
{
    if(finalized) {
        throw std::logic_error("hash_accumulator updated after finalize");
    }
    hash.update(bytes);
}

std::string hash_accumulator::finalize()
{
    if(finalized) {
        throw std::logic_error("hash_accumulator finalized twice");
    }
    finalized = true;
    const auto digest = hash.finalize();
    return to_hex(digest);
}

} // namespace uzhash
