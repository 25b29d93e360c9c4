#include "generators.hpp"
#include <digest/digest.hpp>
#include <cstring>
#include <vector>

namespace UUID{
    static void set_version_and_variant(Uuid::bytes_type& bytes, Version version){
        // time_hi_and_version is bytes 6 and 7, the version lives in the high nibble.
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | (static_cast<unsigned char>(version) << 4));
        // clock_seq_hi_and_reserved is byte 8. Set the hi bit, clear the one below it.
        // Must come last so that no payload write can clobber it.
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);
        return;
    }

    static std::vector<unsigned char> name_data(const Uuid& name_space, const unsigned char* name, std::size_t len){
        std::vector<unsigned char> data(name_space.bytes().begin(), name_space.bytes().end());
        if(len > 0){
            data.insert(data.end(), name, name + len);
        }
        return data;
    }

    Uuid make_v4(RandomSource& rng, std::error_code& ec){
        Uuid::bytes_type bytes = {};
        rng.fill(bytes.data(), bytes.size(), ec);
        if(ec){
            return Uuid();
        }
        set_version_and_variant(bytes, Version::random);
        return Uuid(bytes);
    }

    Uuid make_v3(const Uuid& name_space, const unsigned char* name, std::size_t len, std::error_code& ec){
        std::vector<unsigned char> data = name_data(name_space, name, len);
        digest::Md5 hash = digest::md5(data.data(), data.size(), ec);
        if(ec){
            return Uuid();
        }
        Uuid::bytes_type bytes;
        std::memcpy(bytes.data(), hash.data(), Uuid::size);
        set_version_and_variant(bytes, Version::md5);
        return Uuid(bytes);
    }

    Uuid make_v3(const Uuid& name_space, std::string_view name, std::error_code& ec){
        return make_v3(name_space, (const unsigned char*)(name.data()), name.size(), ec);
    }

    Uuid make_v5(const Uuid& name_space, const unsigned char* name, std::size_t len, std::error_code& ec){
        std::vector<unsigned char> data = name_data(name_space, name, len);
        digest::Sha1 hash = digest::sha1(data.data(), data.size(), ec);
        if(ec){
            return Uuid();
        }
        // sha1 is 20 bytes, only the first 16 are used.
        Uuid::bytes_type bytes;
        std::memcpy(bytes.data(), hash.data(), Uuid::size);
        set_version_and_variant(bytes, Version::sha1);
        return Uuid(bytes);
    }

    Uuid make_v5(const Uuid& name_space, std::string_view name, std::error_code& ec){
        return make_v5(name_space, (const unsigned char*)(name.data()), name.size(), ec);
    }

    TimeGenerator::TimeGenerator(Clock& clock, NodeSource& nodes, RandomSource& rng)
      : clock_(clock),
        nodes_(nodes),
        rng_(rng),
        seeded_{false},
        clock_seq_{0},
        last_clock_{0},
        last_timestamp_{0}
    {}

    Uuid TimeGenerator::generate(std::error_code& ec){
        // The node source is caller code, it runs outside of the lock.
        Node node = nodes_.get_node_id(ec);
        if(ec){
            return Uuid();
        }
        std::unique_lock<std::mutex> lk(mtx_);
        std::uint64_t now = clock_.now() & timestamp_mask;
        std::uint64_t timestamp = now;
        if(!seeded_){
            unsigned char seq[2] = {};
            rng_.fill(seq, sizeof(seq), ec);
            if(ec){
                return Uuid();
            }
            clock_seq_ = static_cast<std::uint16_t>(((seq[0] << 8) | seq[1]) & 0x3fff);
            seeded_ = true;
        } else if(now < last_clock_){
            clock_seq_ = static_cast<std::uint16_t>((clock_seq_ + 1) & 0x3fff);
        } else if(timestamp <= last_timestamp_){
            timestamp = (last_timestamp_ + 1) & timestamp_mask;
        }
        last_clock_ = now;
        last_timestamp_ = timestamp;
        const std::uint16_t clock_seq = clock_seq_;
        lk.unlock();

        Uuid::bytes_type bytes = {};
        const std::uint32_t time_low = static_cast<std::uint32_t>(timestamp & 0xffffffff);
        const std::uint16_t time_mid = static_cast<std::uint16_t>((timestamp >> 32) & 0xffff);
        const std::uint16_t time_hi = static_cast<std::uint16_t>((timestamp >> 48) & 0x0fff);
        bytes[0] = static_cast<unsigned char>(time_low >> 24);
        bytes[1] = static_cast<unsigned char>(time_low >> 16);
        bytes[2] = static_cast<unsigned char>(time_low >> 8);
        bytes[3] = static_cast<unsigned char>(time_low);
        bytes[4] = static_cast<unsigned char>(time_mid >> 8);
        bytes[5] = static_cast<unsigned char>(time_mid);
        bytes[6] = static_cast<unsigned char>(time_hi >> 8);
        bytes[7] = static_cast<unsigned char>(time_hi);
        bytes[8] = static_cast<unsigned char>(clock_seq >> 8);
        bytes[9] = static_cast<unsigned char>(clock_seq);
        std::memcpy(&bytes[10], node.bytes, Node::length);
        set_version_and_variant(bytes, Version::time);
        return Uuid(bytes);
    }
}// UUID namespace
