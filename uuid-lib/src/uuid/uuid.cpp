#include "uuid.hpp"
#include <cstring>
#include <iomanip>
#include <charconv>

namespace UUID{
    /*UUID.Node POD*/
    std::ostream& operator<<(std::ostream& os, const Node& node) {
        std::ios::fmtflags os_flags(os.flags());
        char fill = os.fill();
        // Only the caller's case is honoured, every other flag would break the canonical form.
        os.flags((os_flags & std::ios::uppercase) | std::ios::hex | std::ios::right);
        os.fill('0');
        for(std::size_t i=0; i < Node::length; ++i){
            if(i > 0){
                os << '-';
            }
            os << std::setw(2) << static_cast<std::uint16_t>(node.bytes[i]);
        }
        os.fill(fill);
        os.flags(os_flags);
        return os;
    }

    std::istream& operator>>(std::istream& is, Node& node){
        constexpr std::size_t num_chars = 3*Node::length - 1;
        char str[num_chars] = {};
        is.read(str, num_chars);
        if(static_cast<std::size_t>(is.gcount()) != num_chars){
            is.setstate(std::ios::failbit);
            return is;
        }
        const char separator = str[2];
        if(separator != ':' && separator != '-'){
            is.setstate(std::ios::failbit);
            return is;
        }
        Node tmp = {};
        for(std::size_t i=0; i < Node::length; ++i){
            const char* first = &str[3*i];
            if(i > 0 && *(first-1) != separator){
                is.setstate(std::ios::failbit);
                return is;
            }
            std::from_chars_result res = std::from_chars(first, first+2, tmp.bytes[i], 16);
            if(res.ec != std::errc{} || res.ptr != first+2){
                is.setstate(std::ios::failbit);
                return is;
            }
        }
        node = tmp;
        return is;
    }

    bool operator==(const Node& lhs, const Node& rhs){
        return std::memcmp(lhs.bytes, rhs.bytes, Node::length) == 0;
    }

    bool operator!=(const Node& lhs, const Node& rhs){
        return !(lhs == rhs);
    }

    /*UUID*/
    bool Uuid::is_nil() const {
        for(unsigned char b: bytes_){
            if(b != 0){
                return false;
            }
        }
        return true;
    }

    Version Uuid::version() const {
        return static_cast<Version>(bytes_[6] >> 4);
    }

    Variant Uuid::variant() const {
        const unsigned char b = bytes_[8];
        if((b & 0x80) == 0){
            return Variant::ncs;
        } else if ((b & 0xc0) == 0x80){
            return Variant::rfc4122;
        } else if ((b & 0xe0) == 0xc0){
            return Variant::microsoft;
        }
        return Variant::future;
    }

    std::uint32_t Uuid::time_low() const {
        return (static_cast<std::uint32_t>(bytes_[0]) << 24)
            | (static_cast<std::uint32_t>(bytes_[1]) << 16)
            | (static_cast<std::uint32_t>(bytes_[2]) << 8)
            | static_cast<std::uint32_t>(bytes_[3]);
    }
    std::uint16_t Uuid::time_mid() const {
        return static_cast<std::uint16_t>((bytes_[4] << 8) | bytes_[5]);
    }
    std::uint16_t Uuid::time_hi_and_version() const {
        return static_cast<std::uint16_t>((bytes_[6] << 8) | bytes_[7]);
    }
    unsigned char Uuid::clock_seq_hi_and_reserved() const {
        return bytes_[8];
    }
    unsigned char Uuid::clock_seq_low() const {
        return bytes_[9];
    }
    std::uint16_t Uuid::clock_seq() const {
        // The variant bits are not part of the sequence.
        return static_cast<std::uint16_t>(((bytes_[8] & 0x3f) << 8) | bytes_[9]);
    }
    Node Uuid::node() const {
        Node tmp = {};
        std::memcpy(tmp.bytes, &bytes_[10], Node::length);
        return tmp;
    }

    std::uint64_t Uuid::timestamp() const {
        return (static_cast<std::uint64_t>(time_hi_and_version() & 0x0fff) << 48)
            | (static_cast<std::uint64_t>(time_mid()) << 32)
            | static_cast<std::uint64_t>(time_low());
    }

    bool operator==(const Uuid& lhs, const Uuid& rhs){
        return lhs.bytes() == rhs.bytes();
    }

    bool operator!=(const Uuid&lhs, const Uuid& rhs){
        return !(lhs == rhs);
    }

    Uuid from_bytes(const unsigned char* data, std::size_t length, std::error_code& ec){
        if(data == nullptr || length != Uuid::size){
            ec = errc::invalid_length;
            return Uuid();
        }
        Uuid::bytes_type bytes;
        std::memcpy(bytes.data(), data, Uuid::size);
        ec.clear();
        return Uuid(bytes);
    }

    Uuid from_bytes(const std::vector<unsigned char>& data, std::error_code& ec){
        return from_bytes(data.data(), data.size(), ec);
    }

    std::vector<unsigned char> to_bytes(const Uuid& uuid){
        return std::vector<unsigned char>(uuid.bytes().begin(), uuid.bytes().end());
    }

    namespace ns{
        const Uuid dns({0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});
        const Uuid url({0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});
        const Uuid oid({0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});
        const Uuid x500({0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});
    }// ns namespace
}// UUID namespace
