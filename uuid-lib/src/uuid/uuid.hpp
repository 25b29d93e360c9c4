#ifndef UUID_HPP
#define UUID_HPP
#include "uuid-errors.hpp"
#include <array>
#include <cstdint>
#include <iostream>
#include <vector>

namespace UUID{
    // IEEE 802 node identifier, 48 bits, most significant octet first.
    struct Node {
        constexpr static std::size_t length = 6;
        unsigned char bytes[length];

        // Least significant bit of the first octet. Always set on random node ids.
        bool is_multicast() const { return (bytes[0] & 0x01) != 0; }
    };
    // Writes xx-xx-xx-xx-xx-xx.
    std::ostream& operator<<(std::ostream& os, const Node& node);
    // Reads 17 characters, xx:xx:xx:xx:xx:xx or xx-xx-xx-xx-xx-xx. Sets failbit on bad input.
    std::istream& operator>>(std::istream& is, Node& node);
    bool operator==(const Node& lhs, const Node& rhs);
    bool operator!=(const Node& lhs, const Node& rhs);

    // Top nibble of octet 6.
    enum class Version : unsigned char
    {
        none = 0,
        time = 1,
        dce = 2,
        md5 = 3,
        random = 4,
        sha1 = 5
    };

    // Top bits of octet 8.
    enum class Variant
    {
        ncs,        // 0xx
        rfc4122,    // 10x
        microsoft,  // 110
        future      // 111
    };

    // UUID binary fields as defined in IETF RFC 4122:
    // https://datatracker.ietf.org/doc/html/rfc4122#section-4.1.2
    // This is 16 octets of data, every multi-octet field in network byte order.
    // A default constructed Uuid is the nil UUID (all zeros), which stands for "no uuid".
    // Values are immutable once built; generators and codecs are the only way to
    // obtain a non-nil one.
    class Uuid
    {
    public:
        constexpr static std::size_t size = 16; // UUID is always a 16 byte array.
        using bytes_type = std::array<unsigned char, size>;

        Uuid(): bytes_{} {} // nil uuid.
        explicit Uuid(const bytes_type& bytes): bytes_(bytes) {}

        const bytes_type& bytes() const { return bytes_; }
        bool is_nil() const;

        Version version() const;
        Variant variant() const;

        std::uint32_t time_low() const;
        std::uint16_t time_mid() const;
        std::uint16_t time_hi_and_version() const;
        unsigned char clock_seq_hi_and_reserved() const;
        unsigned char clock_seq_low() const;
        std::uint16_t clock_seq() const;
        Node node() const;

        // 60 bit count of 100ns intervals since 1582-10-15.
        // Only meaningful when version() == Version::time.
        std::uint64_t timestamp() const;

    private:
        bytes_type bytes_;
    };
    bool operator==(const Uuid& lhs, const Uuid& rhs);
    bool operator!=(const Uuid& lhs, const Uuid& rhs);

    // Binary codec. No version or variant checks are made so that foreign
    // and legacy uuids survive a round trip.
    Uuid from_bytes(const unsigned char* data, std::size_t length, std::error_code& ec);
    Uuid from_bytes(const std::vector<unsigned char>& data, std::error_code& ec);
    std::vector<unsigned char> to_bytes(const Uuid& uuid);

    // Name space ids from RFC 4122 appendix C.
    namespace ns{
        extern const Uuid dns;
        extern const Uuid url;
        extern const Uuid oid;
        extern const Uuid x500;
    }// ns namespace
}// UUID namespace
#endif
