#ifndef UUID_STRING_HPP
#define UUID_STRING_HPP
#include "uuid.hpp"
#include <string>
#include <string_view>

namespace UUID{
    // Canonical text form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    constexpr static std::size_t string_length = 36;
    constexpr static std::string_view urn_prefix = "urn:uuid:";

    enum class Case
    {
        lower,
        upper
    };

    // Always 36 characters. Lowercase unless asked otherwise.
    std::string to_string(const Uuid& uuid, Case letter_case = Case::lower);
    std::string to_urn(const Uuid& uuid);

    // Accepts exactly the 36 character hyphenated form, hex digits in either case.
    // Anything else sets ec to errc::invalid_format and yields the nil uuid.
    Uuid from_string(std::string_view str, std::error_code& ec);
    // urn:uuid: (any case) followed by the canonical form.
    Uuid from_urn(std::string_view str, std::error_code& ec);

    // Canonical form, honouring std::uppercase.
    std::ostream& operator<<(std::ostream& os, const Uuid& uuid);
    // Reads exactly 36 characters. Sets failbit if they are not a canonical uuid.
    std::istream& operator>>(std::istream& is, Uuid& uuid);
}// UUID namespace
#endif
