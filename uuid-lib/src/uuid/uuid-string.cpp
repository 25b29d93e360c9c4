#include "uuid-string.hpp"
#include <iomanip>
#include <sstream>
#include <charconv>
#include <cctype>

namespace UUID{
    static bool is_hyphen_position(std::size_t pos){
        return (pos == 8 || pos == 13 || pos == 18 || pos == 23);
    }

    std::string to_string(const Uuid& uuid, Case letter_case){
        std::stringstream ss;
        if(letter_case == Case::upper){
            ss << std::uppercase;
        }
        ss << uuid;
        return ss.str();
    }

    std::string to_urn(const Uuid& uuid){
        std::string urn(urn_prefix);
        urn.append(to_string(uuid));
        return urn;
    }

    Uuid from_string(std::string_view str, std::error_code& ec){
        if(str.size() != string_length){
            ec = errc::invalid_format;
            return Uuid();
        }
        Uuid::bytes_type bytes = {};
        std::size_t idx = 0;
        std::size_t pos = 0;
        while(pos < string_length){
            if(is_hyphen_position(pos)){
                if(str[pos] != '-'){
                    ec = errc::invalid_format;
                    return Uuid();
                }
                ++pos;
                continue;
            }
            const char* first = str.data() + pos;
            std::from_chars_result res = std::from_chars(first, first+2, bytes[idx], 16);
            if(res.ec != std::errc{} || res.ptr != first+2){
                ec = errc::invalid_format;
                return Uuid();
            }
            ++idx;
            pos += 2;
        }
        ec.clear();
        return Uuid(bytes);
    }

    Uuid from_urn(std::string_view str, std::error_code& ec){
        if(str.size() != urn_prefix.size() + string_length){
            ec = errc::invalid_format;
            return Uuid();
        }
        for(std::size_t i=0; i < urn_prefix.size(); ++i){
            if(std::tolower(static_cast<unsigned char>(str[i])) != urn_prefix[i]){
                ec = errc::invalid_format;
                return Uuid();
            }
        }
        return from_string(str.substr(urn_prefix.size()), ec);
    }

    std::ostream& operator<<(std::ostream& os, const Uuid& uuid){
        std::ios::fmtflags os_flags(os.flags());
        char fill = os.fill();
        // Only the caller's case is honoured, every other flag would break the canonical form.
        os.flags((os_flags & std::ios::uppercase) | std::ios::hex | std::ios::right);
        os.fill('0');
        const Uuid::bytes_type& bytes = uuid.bytes();
        for(std::size_t i=0; i < Uuid::size; ++i){
            if(i == 4 || i == 6 || i == 8 || i == 10){
                os << '-';
            }
            os << std::setw(2) << static_cast<std::uint16_t>(bytes[i]);
        }
        os.fill(fill);
        os.flags(os_flags);
        return os;
    }

    std::istream& operator>>(std::istream& is, Uuid& uuid){
        char str[string_length] = {};
        is.read(str, string_length);
        if(static_cast<std::size_t>(is.gcount()) != string_length){
            is.setstate(std::ios::failbit);
            return is;
        }
        std::error_code ec;
        Uuid tmp = from_string(std::string_view(str, string_length), ec);
        if(ec){
            is.setstate(std::ios::failbit);
            return is;
        }
        uuid = tmp;
        return is;
    }
}// UUID namespace
