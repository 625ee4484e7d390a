#pragma once

#include <cstdint>
#include <functional>
#include <mutex>

namespace dshare::client
{

    using ProgressCallback = std::function<void(double)>;

    // Forwards upload progress as a fraction in [0, 1] that never moves backwards, whatever order the
    // workers finish their chunks in. The callback runs outside the lock guarding last(), so it may query it.
    class ProgressReporter
    {
    public:
        explicit ProgressReporter(ProgressCallback callback);

        void publish(std::uint64_t uploaded_bytes, std::uint64_t total_bytes);
        double last() const;

    private:
        ProgressCallback callback_;
        mutable std::mutex mutex_;
        double last_{0.0};
        bool published_{false};

        std::mutex delivery_mutex_;
        double delivered_{0.0};
        bool any_delivered_{false};
    };

} // namespace dshare::client
