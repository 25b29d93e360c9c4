#include "digest.hpp"
#include <memory>
#include <openssl/evp.h>

namespace UUID{
namespace digest{
    template<std::size_t N>
    static std::array<unsigned char, N> compute(const EVP_MD* md, const unsigned char* data, std::size_t len, std::error_code& ec){
        std::array<unsigned char, N> out = {};
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
        if(!ctx || md == nullptr){
            ec = errc::digest_unavailable;
            return out;
        }
        unsigned int out_len = 0;
        if(EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1
            || EVP_DigestUpdate(ctx.get(), data, len) != 1
            || EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1
            || out_len != N
        ){
            out.fill(0);
            ec = errc::digest_unavailable;
            return out;
        }
        ec.clear();
        return out;
    }

    Md5 md5(const unsigned char* data, std::size_t len, std::error_code& ec){
        return compute<16>(EVP_md5(), data, len, ec);
    }

    Sha1 sha1(const unsigned char* data, std::size_t len, std::error_code& ec){
        return compute<20>(EVP_sha1(), data, len, ec);
    }
}// digest namespace
}// UUID namespace
