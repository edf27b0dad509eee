#include "cluster_cpp/context.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace cluster_cpp {

    Context::Context(std::stop_token token) : m_token(std::move(token)) {}

    Context Context::with_cancel() const {
        auto link = std::make_shared<Link>();
        link->parent = m_link;
        if (m_token.stop_possible()) {
            link->forward.emplace(
                m_token, std::function<void()>(
                             [src = link->source]() mutable {
                                 src.request_stop();
                             }));
        }

        Context child;
        child.m_token = link->source.get_token();
        child.m_deadline = m_deadline;
        child.m_link = std::move(link);
        child.m_owns_link = true;
        return child;
    }

    Context Context::with_timeout(clock::duration timeout) const {
        return with_deadline(clock::now() + timeout);
    }

    Context Context::with_deadline(clock::time_point deadline) const {
        Context child;
        child.m_token = m_token;
        child.m_link = m_link;
        child.m_deadline =
            m_deadline ? std::min(*m_deadline, deadline) : deadline;
        return child;
    }

    void Context::cancel() const noexcept {
        if (m_owns_link && m_link) m_link->source.request_stop();
    }

    bool Context::done() const noexcept {
        if (m_token.stop_requested()) return true;
        return m_deadline && clock::now() >= *m_deadline;
    }

    std::optional<Error> Context::err() const {
        if (m_token.stop_requested()) return canceled_error();
        if (m_deadline && clock::now() >= *m_deadline) {
            return deadline_exceeded_error();
        }
        return std::nullopt;
    }

    Context::clock::duration Context::remaining_or(
        clock::duration fallback) const {
        if (!m_deadline) return fallback;
        auto left = *m_deadline - clock::now();
        return std::max(left, clock::duration::zero());
    }

    bool Context::sleep_for(clock::duration d) const {
        auto until = clock::now() + d;
        bool deadline_first = false;
        if (m_deadline && *m_deadline < until) {
            until = *m_deadline;
            deadline_first = true;
        }

        std::mutex mu;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lk(mu);
        // Nothing ever notifies cv; only a stop request or `until` ends the
        // wait.
        (void)cv.wait_until(lk, m_token, until, [] { return false; });
        if (m_token.stop_requested()) return false;
        return !deadline_first;
    }

}  // namespace cluster_cpp
