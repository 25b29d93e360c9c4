#ifndef GENERATORS_HPP
#define GENERATORS_HPP
#include <uuid/uuid.hpp>
#include <sources/clock.hpp>
#include <sources/node-source.hpp>
#include <sources/random-source.hpp>
#include <mutex>
#include <string_view>

namespace UUID{
    // Every generator fills the payload first, then writes the version nibble
    // and finally the RFC 4122 variant bits. On failure ec is set and the nil
    // uuid is returned.

    // Version 4: 122 random bits.
    Uuid make_v4(RandomSource& rng, std::error_code& ec);

    // Version 3: md5(namespace bytes || name bytes).
    Uuid make_v3(const Uuid& name_space, const unsigned char* name, std::size_t len, std::error_code& ec);
    Uuid make_v3(const Uuid& name_space, std::string_view name, std::error_code& ec);

    // Version 5: first 16 bytes of sha1(namespace bytes || name bytes).
    Uuid make_v5(const Uuid& name_space, const unsigned char* name, std::size_t len, std::error_code& ec);
    Uuid make_v5(const Uuid& name_space, std::string_view name, std::error_code& ec);

    // Version 1: 60 bit timestamp, 14 bit clock sequence and a 48 bit node id.
    // The generator owns the clock sequence and the last timestamp it handed
    // out, so independent instances never share state. Calls are serialized
    // with a mutex: no two calls on one instance emit the same
    // (timestamp, clock sequence) pair.
    //
    // The clock sequence starts at a random value drawn on first use. While the
    // clock moves forward timestamps strictly increase, calls within the same
    // tick take the next free tick. If the clock goes backwards the clock
    // sequence is incremented.
    class TimeGenerator
    {
    public:
        TimeGenerator(Clock& clock, NodeSource& nodes, RandomSource& rng);
        TimeGenerator(const TimeGenerator&) = delete;
        TimeGenerator& operator=(const TimeGenerator&) = delete;

        Uuid generate(std::error_code& ec);

    private:
        Clock& clock_;
        NodeSource& nodes_;
        RandomSource& rng_;

        std::mutex mtx_;
        bool seeded_;
        std::uint16_t clock_seq_;
        std::uint64_t last_clock_;
        std::uint64_t last_timestamp_;
    };
}// UUID namespace
#endif
