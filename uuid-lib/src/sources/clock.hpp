#ifndef CLOCK_HPP
#define CLOCK_HPP
#include <cstdint>

namespace UUID{
    // Number of 100ns intervals between 1582-10-15 (the gregorian reform,
    // where uuid time starts) and 1970-01-01.
    constexpr static std::uint64_t gregorian_offset = 0x01B21DD213814000ULL;
    // v1 timestamps are 60 bits wide.
    constexpr static std::uint64_t timestamp_mask = 0x0FFFFFFFFFFFFFFFULL;

    // Time source for version 1 uuids.
    class Clock
    {
    public:
        // 100ns ticks since 1582-10-15.
        virtual std::uint64_t now() = 0;
        virtual ~Clock() = default;
    };

    class SystemClock: public Clock
    {
    public:
        std::uint64_t now() override;
    };

    // 100ns ticks since 1582-10-15 -> 100ns ticks since 1970-01-01.
    // Timestamps from before the unix epoch clamp to 0.
    std::uint64_t to_unix_time(std::uint64_t timestamp);
}// UUID namespace
#endif
