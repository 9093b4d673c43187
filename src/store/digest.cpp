#include "store/digest.hpp"
#include <fmt/format.h>
#include <boost/uuid/detail/sha1.hpp>
#include <cstdint>
#include <type_traits>

namespace grader::store {
using namespace std;

using digest_type = boost::uuids::detail::sha1::digest_type;
using digest_element = remove_extent_t<digest_type>;
static_assert(sizeof(digest_type) == 20, "SHA-1 digest should be 20 bytes");

string compute_digest(const string &content) {
    boost::uuids::detail::sha1 sha1;
    sha1.process_bytes(content.data(), content.size());
    digest_type digest;
    sha1.get_digest(digest);

    // Boost 1.86 起摘要由 5 个 32 位整数改为 20 个字节
    string result;
    result.reserve(40);
    if constexpr (sizeof(digest_element) == 1) {
        for (auto byte : digest)
            result += fmt::format("{:02x}", (unsigned int)(unsigned char)byte);
    } else {
        for (auto word : digest)
            result += fmt::format("{:08x}", (uint32_t)word);
    }
    return result;
}

bool is_valid_digest(const string &digest) {
    if (digest.size() != 40) return false;
    for (char c : digest)
        if (!(('0' <= c && c <= '9') || ('a' <= c && c <= 'f')))
            return false;
    return true;
}

}  // namespace grader::store
