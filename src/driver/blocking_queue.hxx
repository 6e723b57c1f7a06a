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

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace ledger
{
namespace driver
{
    /**
     * Bounded FIFO handing items from one producer thread to one consumer thread.
     */
    template<typename T>
    class blocking_queue
    {
      public:
        explicit blocking_queue(size_t capacity)
          : capacity_(capacity)
          , high_water_mark_(0)
        {
        }

        /**
         * Appends item, waiting up to timeout for room.  Returns false, leaving item untouched,
         * if the queue stayed full.
         */
        template<typename R, typename P>
        bool push_for(T& item, std::chrono::duration<R, P> timeout)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!not_full_.wait_for(lock, timeout, [this]() { return items_.size() < capacity_; })) {
                return false;
            }
            append(std::move(item));
            return true;
        }

        void push(T item)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this]() { return items_.size() < capacity_; });
            append(std::move(item));
        }

        T pop()
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this]() { return !items_.empty(); });
            T item = std::move(items_.front());
            items_.pop_front();
            not_full_.notify_one();
            return item;
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.clear();
            not_full_.notify_all();
        }

        size_t size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return items_.size();
        }

        bool empty() const
        {
            return size() == 0;
        }

        // largest number of items ever held at once
        size_t high_water_mark() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return high_water_mark_;
        }

      private:
        void append(T&& item)
        {
            items_.push_back(std::move(item));
            if (items_.size() > high_water_mark_) {
                high_water_mark_ = items_.size();
            }
            not_empty_.notify_one();
        }

        size_t capacity_;
        size_t high_water_mark_;
        std::deque<T> items_;
        mutable std::mutex mutex_;
        std::condition_variable not_full_;
        std::condition_variable not_empty_;
    };
} // namespace driver
} // namespace ledger
