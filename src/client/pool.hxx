/*
 *     Copyright 2022 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>

#include <boost/optional.hpp>
#include <ledger/support.hxx>

#include "logging.hxx"

namespace ledger
{

enum class pool_event { create, reuse, add, discard, destroy };

template<typename T>
struct pool_event_counter {
    std::atomic<uint32_t> create;
    std::atomic<uint32_t> reuse;
    std::atomic<uint32_t> add;
    std::atomic<uint32_t> discard;
    std::atomic<uint32_t> destroy;

    pool_event_counter()
      : create(0)
      , reuse(0)
      , add(0)
      , discard(0)
      , destroy(0)
    {
    }

    void handler(pool_event e, const T&)
    {
        switch (e) {
            case pool_event::create:
                ++create;
                break;
            case pool_event::reuse:
                ++reuse;
                break;
            case pool_event::add:
                ++add;
                break;
            case pool_event::discard:
                ++discard;
                break;
            case pool_event::destroy:
                ++destroy;
                break;
        }
    }
};

/**
 * A bounded pool with admission control.
 *
 * Capacity is expressed as permits: every object handed out by try_get holds one permit until it
 * is released, so at most max_size objects are ever checked out at once.  Released objects that
 * are still usable wait in an idle queue for the next caller.  Objects are created lazily, only
 * when a permit was obtained and nothing idle could be reused.
 */
template<typename T>
class pool
{
    typedef std::function<void(pool_event, const T&)> event_handler;

  public:
    pool(size_t max_size, std::function<T(void)> create_fn, std::function<void(T&)> destroy_fn)
      : available_(max_size)
      , max_size_(max_size)
      , closed_(false)
      , create_fn_(create_fn)
      , destroy_fn_(destroy_fn)
    {
        event_fn_ = [](pool_event, const T&) {};
    }

    ~pool()
    {
        close();
    }

    void set_event_handler(event_handler fn)
    {
        event_fn_ = fn;
    }

    /**
     * Wait up to timeout for a permit, then return an idle object, or a new one.
     *
     * When force_new is set, idle objects are left alone and a new one is always created.
     * Returns nothing if no permit became available in time.  If creating the object throws, the
     * permit is given back before the exception propagates.
     */
    template<typename Rep, typename Period>
    LEDGER_NODISCARD boost::optional<T> try_get(std::chrono::duration<Rep, Period> timeout, bool force_new = false)
    {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!wait_for_permit(lock, timeout)) {
                client_log->debug("no permit available after {}ms, max {}",
                                  std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count(),
                                  max_size_);
                return {};
            }
            --available_;
            if (!force_new && !idle_.empty()) {
                T t = std::move(idle_.front());
                idle_.pop_front();
                event_fn_(pool_event::reuse, t);
                return t;
            }
        }
        // creation may be a remote call, so it happens outside the lock
        try {
            T t = create_fn_();
            event_fn_(pool_event::create, t);
            return t;
        } catch (...) {
            return_permit();
            throw;
        }
    }

    /**
     * Give back the permit held by t.  If reusable, t goes to the idle queue, otherwise it is
     * dropped.  Once the pool is closed, reusable objects are destroyed instead of kept.
     */
    void release(T t, bool reusable)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (reusable && !closed_) {
            idle_.push_back(std::move(t));
            event_fn_(pool_event::add, idle_.back());
            ++available_;
            cv_.notify_one();
            return;
        }
        ++available_;
        cv_.notify_one();
        lock.unlock();
        if (reusable) {
            destroy(t);
        } else {
            client_log->trace("discarding unusable object, {} of {} permits available", available_.load(), max_size_);
            event_fn_(pool_event::discard, t);
        }
    }

    /**
     * Destroy every idle object.  Objects still checked out are destroyed when released.
     */
    void close()
    {
        std::list<T> drained;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            drained.swap(idle_);
        }
        for (T& t : drained) {
            destroy(t);
        }
    }

    LEDGER_NODISCARD size_t available() const
    {
        return available_.load();
    }

    LEDGER_NODISCARD size_t size() const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_.size();
    }

    LEDGER_NODISCARD size_t max_size() const
    {
        return max_size_;
    }

    LEDGER_NODISCARD bool is_closed() const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return closed_;
    }

  private:
    // mutable, so we can use it in const functions
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<size_t> available_;
    size_t max_size_;
    bool closed_;
    std::list<T> idle_;
    std::function<T(void)> create_fn_;
    std::function<void(T&)> destroy_fn_;
    event_handler event_fn_;

    template<typename Rep, typename Period>
    bool wait_for_permit(std::unique_lock<std::mutex>& lock, std::chrono::duration<Rep, Period> timeout)
    {
        auto ready = [this] { return available_.load() > 0; };
        auto now = std::chrono::steady_clock::now();
        auto headroom = std::chrono::steady_clock::time_point::max() - now;
        // a deadline past the end of the clock would overflow, so such a timeout means no deadline
        if (timeout >= std::chrono::duration_cast<std::chrono::duration<Rep, Period>>(headroom)) {
            cv_.wait(lock, ready);
            return true;
        }
        return cv_.wait_until(lock, now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout), ready);
    }

    void return_permit()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        ++available_;
        cv_.notify_one();
    }

    void destroy(T& t)
    {
        event_fn_(pool_event::destroy, t);
        try {
            destroy_fn_(t);
        } catch (const std::exception& e) {
            client_log->warn("ignoring error destroying pooled object: {}", e.what());
        }
    }
};
} // namespace ledger
