#ifndef UUID_ERRORS_HPP
#define UUID_ERRORS_HPP
#include <system_error>

namespace UUID{
    // Failures reported by the uuid library.
    // Values start at 1 so that a default constructed std::error_code is never one of ours.
    enum class errc
    {
        invalid_length = 1,     // binary input is not exactly 16 bytes.
        invalid_format,         // text input is not xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
        entropy_unavailable,    // the random source could not fill the buffer.
        node_id_unavailable,    // no 48-bit node identifier could be obtained.
        digest_unavailable      // the md5/sha1 digest could not be computed.
    };

    const std::error_category& error_category() noexcept;
    std::error_code make_error_code(errc e) noexcept;
}// UUID namespace

namespace std{
    template<>
    struct is_error_code_enum<UUID::errc> : public true_type {};
}
#endif
