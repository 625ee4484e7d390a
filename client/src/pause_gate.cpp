#include "dshare/client/pause_gate.hpp"

namespace dshare::client
{

    void PauseGate::pause()
    {
        std::lock_guard lock(mutex_);
        paused_ = true;
    }

    void PauseGate::resume()
    {
        {
            std::lock_guard lock(mutex_);
            paused_ = false;
        }
        cv_.notify_all();
    }

    bool PauseGate::paused() const
    {
        std::lock_guard lock(mutex_);
        return paused_;
    }

    bool PauseGate::wait_while_paused()
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]
                 { return !paused_ || released_; });
        return !released_;
    }

    void PauseGate::release()
    {
        {
            std::lock_guard lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    bool PauseGate::released() const
    {
        std::lock_guard lock(mutex_);
        return released_;
    }

} // namespace dshare::client
