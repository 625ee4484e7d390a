#pragma once

#include <condition_variable>
#include <mutex>

namespace dshare::client
{

    // Cooperative suspension point consulted before every chunk operation. A paused gate holds callers of
    // wait_while_paused() until resume() or release(); calls already in flight are never interrupted.
    class PauseGate
    {
    public:
        void pause();
        void resume();
        bool paused() const;

        // Blocks while paused. Returns false once the gate has been released.
        bool wait_while_paused();

        // Tears the gate down: wakes every waiter and makes all later waits return false.
        void release();
        bool released() const;

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        bool paused_{false};
        bool released_{false};
    };

} // namespace dshare::client
