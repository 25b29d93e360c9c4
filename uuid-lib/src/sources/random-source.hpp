#ifndef RANDOM_SOURCE_HPP
#define RANDOM_SOURCE_HPP
#include <uuid/uuid-errors.hpp>
#include <cstddef>

namespace UUID{
    // Entropy for version 4 uuids, v1 clock sequences and random node ids.
    class RandomSource
    {
    public:
        // Fill the whole buffer or set ec. Partial fills are failures.
        virtual void fill(unsigned char* buf, std::size_t len, std::error_code& ec) = 0;
        virtual ~RandomSource() = default;
    };

    // getrandom(2) from the kernel urandom pool.
    class SystemRandomSource: public RandomSource
    {
    public:
        void fill(unsigned char* buf, std::size_t len, std::error_code& ec) override;
    };
}// UUID namespace
#endif
