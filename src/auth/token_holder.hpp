#pragma once

#include <mutex>
#include <string>

namespace auth
{
    // Bearer token shared between the orchestrator and the HTTP clients.
    // The token is supplied from outside; nothing here logs in.
    class TokenHolder
    {
    public:
        void set(const std::string &token)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            token_ = token;
        }

        std::string get() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return token_;
        }

        bool empty() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return token_.empty();
        }

    private:
        mutable std::mutex mutex_;
        std::string token_;
    };
} // namespace auth
