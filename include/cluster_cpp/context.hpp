#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>

#include "error.hpp"

namespace cluster_cpp {

    /**
     * @brief Cancellation signal plus optional deadline for a blocking call.
     *
     * Every operation that touches the network takes a Context. A Context is
     * done once its stop token has been signalled (Canceled) or its deadline
     * has passed (DeadlineExceeded). Contexts are cheap to copy; copies share
     * the same cancellation state.
     *
     * Derived contexts (with_cancel, with_timeout, with_deadline) are done
     * whenever their parent is, and may add their own cancel() or an earlier
     * deadline.
     */
    class Context {
       public:
        using clock = std::chrono::steady_clock;

        /// @brief A context that is never canceled and has no deadline.
        Context() = default;

        /// @brief A context canceled through an external stop token, e.g.
        /// the one handed to a std::jthread body.
        explicit Context(std::stop_token token);

        static Context background() { return Context{}; }

        /// @brief Derived context with its own cancel().
        [[nodiscard]] Context with_cancel() const;

        /// @brief Derived context whose deadline is at most now + timeout.
        [[nodiscard]] Context with_timeout(clock::duration timeout) const;

        /// @brief Derived context whose deadline is at most `deadline`.
        [[nodiscard]] Context with_deadline(clock::time_point deadline) const;

        /// @brief Cancel this context and everything derived from it.
        /// @note No-op unless this context was returned by with_cancel();
        /// contexts derived from it keep the link alive but do not own it.
        void cancel() const noexcept;

        [[nodiscard]] std::stop_token stop_token() const noexcept {
            return m_token;
        }

        [[nodiscard]] std::optional<clock::time_point> deadline()
            const noexcept {
            return m_deadline;
        }

        [[nodiscard]] bool canceled() const noexcept {
            return m_token.stop_requested();
        }

        [[nodiscard]] bool done() const noexcept;

        /// @brief Why the context is done; nullopt while it is still live.
        [[nodiscard]] std::optional<Error> err() const;

        /// @brief Time left until the deadline, or `fallback` when there is
        /// none. Never negative.
        [[nodiscard]] clock::duration remaining_or(
            clock::duration fallback) const;

        /// @brief Block for `d` or until the context is done.
        /// @return true if the full duration elapsed, false if the context
        /// finished first.
        bool sleep_for(clock::duration d) const;

       private:
        // Keeps a derived stop_source linked to its parent token.
        struct Link {
            std::stop_source source;
            std::optional<std::stop_callback<std::function<void()>>> forward;
            std::shared_ptr<Link> parent;
        };

        std::stop_token m_token{};
        std::optional<clock::time_point> m_deadline{};
        std::shared_ptr<Link> m_link{};
        bool m_owns_link{false};
    };

    inline Error canceled_error() {
        return Error{Error::Code::Canceled, "context canceled"};
    }

    inline Error deadline_exceeded_error() {
        return Error{Error::Code::DeadlineExceeded,
                     "context deadline exceeded"};
    }

}  // namespace cluster_cpp
