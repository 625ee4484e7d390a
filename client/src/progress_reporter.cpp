#include "dshare/client/progress_reporter.hpp"

#include <algorithm>
#include <utility>

namespace dshare::client
{

    ProgressReporter::ProgressReporter(ProgressCallback callback) : callback_(std::move(callback)) {}

    void ProgressReporter::publish(std::uint64_t uploaded_bytes, std::uint64_t total_bytes)
    {
        if (total_bytes == 0)
        {
            return;
        }
        const double fraction =
            std::clamp(static_cast<double>(uploaded_bytes) / static_cast<double>(total_bytes), 0.0, 1.0);

        {
            std::lock_guard lock(mutex_);
            if (published_ && fraction <= last_)
            {
                return;
            }
            last_ = fraction;
            published_ = true;
        }
        if (!callback_)
        {
            return;
        }

        // Another worker may have delivered a larger fraction since the state lock was released.
        std::lock_guard delivery(delivery_mutex_);
        if (any_delivered_ && fraction <= delivered_)
        {
            return;
        }
        delivered_ = fraction;
        any_delivered_ = true;
        callback_(fraction);
    }

    double ProgressReporter::last() const
    {
        std::lock_guard lock(mutex_);
        return last_;
    }

} // namespace dshare::client
