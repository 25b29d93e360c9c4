#ifndef DIGEST_HPP
#define DIGEST_HPP
#include <uuid/uuid-errors.hpp>
#include <array>
#include <cstddef>

// Name based uuids are built from message digests computed by OpenSSL libcrypto.
namespace UUID{
namespace digest{
    using Md5 = std::array<unsigned char, 16>;
    using Sha1 = std::array<unsigned char, 20>;

    // Set ec to errc::digest_unavailable if libcrypto fails; the digest is then all zeros.
    Md5 md5(const unsigned char* data, std::size_t len, std::error_code& ec);
    Sha1 sha1(const unsigned char* data, std::size_t len, std::error_code& ec);
}// digest namespace
}// UUID namespace
#endif
