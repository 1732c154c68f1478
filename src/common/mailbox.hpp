// SPDX-License-Identifier: Apache-2.0
// mailbox.hpp - Multi-producer / single-consumer message channel.
// The only object shared between the dispatcher and a worker. Producers push whole serialized
// messages; the owning loop drains everything queued so far in one swap.
#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace bulletsim {

template <typename T>
class Mailbox
{
public:
    void push(T msg)
    {
        std::scoped_lock lk{m_mutex};
        m_queue.push_back(std::move(msg));
    }

    std::vector<T> drain()
    {
        std::deque<T> local;
        {
            std::scoped_lock lk{m_mutex};
            local.swap(m_queue);
        }
        std::vector<T> out;
        out.reserve(local.size());
        for (auto &m : local)
            out.push_back(std::move(m));
        return out;
    }

    size_t size() const
    {
        std::scoped_lock lk{m_mutex};
        return m_queue.size();
    }

    void clear()
    {
        std::scoped_lock lk{m_mutex};
        m_queue.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::deque<T> m_queue;
};

} // namespace bulletsim
