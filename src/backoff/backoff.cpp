#include "backoff.hpp"

#include <algorithm>

namespace backoff
{
    int64_t exponentialDelay(int attempt, const Policy &policy)
    {
        if (attempt < 0)
            attempt = 0;
        int64_t delay = policy.base_ms;
        // Doubling stops once the cap is hit, so large attempts cannot overflow.
        for (int i = 0; i < attempt && delay < policy.cap_ms; ++i)
            delay *= 2;
        return std::min(delay, policy.cap_ms);
    }
} // namespace backoff
