#pragma once

#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>

#include "context.hpp"

namespace cluster_cpp {

    /**
     * @brief Call `tick` every `interval` until `stop` is requested.
     *
     * The first tick happens one interval after the call. A stop request
     * wakes the wait immediately, and the Context handed to `tick` is
     * canceled by it too, so in-flight I/O is aborted.
     */
    inline void run_periodically(std::stop_token stop,
                                 std::chrono::milliseconds interval,
                                 const std::function<void(const Context&)>& tick) {
        const Context ctx(std::move(stop));
        while (ctx.sleep_for(interval)) {
            tick(ctx);
        }
    }

    /**
     * @brief A background driver owning one std::jthread.
     *
     * The body receives the thread's stop token. stop() requests stop and
     * joins; it is also called by the destructor.
     */
    class PeriodicTask {
       public:
        using Body = std::function<void(std::stop_token)>;

        explicit PeriodicTask(Body body) : m_thread(std::move(body)) {}

        PeriodicTask(const PeriodicTask&) = delete;
        PeriodicTask& operator=(const PeriodicTask&) = delete;

        ~PeriodicTask() { stop(); }

        void stop() {
            if (!m_thread.joinable()) return;
            m_thread.request_stop();
            m_thread.join();
        }

       private:
        std::jthread m_thread;
    };

}  // namespace cluster_cpp
