#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>

namespace cluster_cpp {

    /**
     * @brief Delay to wait before retrying a request on another node.
     *
     * Implementations are stateless and shared across threads.
     */
    class Backoff {
       public:
        virtual ~Backoff() = default;

        /// @param retry 1 for the first retry, 2 for the second, ...
        virtual std::chrono::milliseconds next(std::size_t retry) const = 0;
    };

    /// @brief Retry immediately.
    class NoBackoff : public Backoff {
       public:
        std::chrono::milliseconds next(std::size_t /*retry*/) const override {
            return std::chrono::milliseconds{0};
        }
    };

    class ConstantBackoff : public Backoff {
       public:
        explicit ConstantBackoff(std::chrono::milliseconds delay)
            : m_delay(delay) {}

        std::chrono::milliseconds next(std::size_t /*retry*/) const override {
            return m_delay;
        }

       private:
        std::chrono::milliseconds m_delay;
    };

    /**
     * @brief initial, 2*initial, 4*initial, ... capped at `max`.
     */
    class ExponentialBackoff : public Backoff {
       public:
        ExponentialBackoff(std::chrono::milliseconds initial,
                           std::chrono::milliseconds max)
            : m_initial(initial), m_max(std::max(initial, max)) {}

        std::chrono::milliseconds next(std::size_t retry) const override {
            auto delay = m_initial;
            for (std::size_t i = 1; i < retry && delay < m_max; ++i) {
                delay *= 2;
            }
            return std::min(delay, m_max);
        }

       private:
        std::chrono::milliseconds m_initial;
        std::chrono::milliseconds m_max;
    };

    using BackoffPtr = std::shared_ptr<const Backoff>;

}  // namespace cluster_cpp
