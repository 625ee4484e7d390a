#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "dshare/client/logger.hpp"
#include "dshare/error_codes.hpp"

namespace dshare::client
{

    struct RetryOptions
    {
        int attempts{4};
        std::chrono::milliseconds base_delay{400};
    };

    // Bounded retry with exponential backoff (no jitter). TransferError is final and is never retried.
    class RetryPolicy
    {
    public:
        RetryPolicy(RetryOptions options, Logger logger)
            : options_(options), logger_(std::move(logger)) {}

        template <typename Action>
        auto run(std::string_view what, Action &&action) -> decltype(action())
        {
            const int attempts = options_.attempts < 1 ? 1 : options_.attempts;
            auto delay = options_.base_delay;
            for (int attempt = 1;; ++attempt)
            {
                try
                {
                    return action();
                }
                catch (const TransferError &)
                {
                    throw;
                }
                catch (const std::exception &ex)
                {
                    if (attempt >= attempts)
                    {
                        logger_.log("retry", what, " gave up after ", attempt, " attempts: ", ex.what());
                        throw;
                    }
                    logger_.log("retry", what, " attempt ", attempt, " failed: ", ex.what(), "; next try in ",
                                delay.count(), "ms");
                }
                std::this_thread::sleep_for(delay);
                delay *= 2;
            }
        }

        const RetryOptions &options() const noexcept { return options_; }

    private:
        RetryOptions options_;
        Logger logger_;
    };

} // namespace dshare::client
