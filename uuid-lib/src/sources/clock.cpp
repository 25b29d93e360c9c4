#include "clock.hpp"
#include <chrono>

namespace UUID{
    std::uint64_t SystemClock::now(){
        using ticks = std::chrono::duration<std::uint64_t, std::ratio<1, 10000000> >;
        std::uint64_t since_unix = std::chrono::duration_cast<ticks>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
        return (since_unix + gregorian_offset) & timestamp_mask;
    }

    std::uint64_t to_unix_time(std::uint64_t timestamp){
        if(timestamp < gregorian_offset){
            return 0;
        }
        return timestamp - gregorian_offset;
    }
}// UUID namespace
