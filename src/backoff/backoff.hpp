#ifndef BACKOFF_HPP
#define BACKOFF_HPP

#include <cstdint>

namespace backoff
{
    struct Policy
    {
        int64_t base_ms = 2000;
        int64_t cap_ms = 5 * 60 * 1000;
    };

    // base * 2^attempt, capped. attempt < 0 is treated as 0.
    int64_t exponentialDelay(int attempt, const Policy &policy);
} // namespace backoff

#endif // BACKOFF_HPP
