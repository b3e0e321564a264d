/*
*  This file is part of flexplayer project.
*  Copyright (C) 2025 flexplayer contributors
*
*  flexplayer is free software: you can redistribute it and/or modify
*  it under the terms of the GNU General Public License as published by
*  the Free Software Foundation; either version 3 of the License, or
*  (at your option) any later version.

*  flexplayer is distributed in the hope that it will be useful,
*  but WITHOUT ANY WARRANTY; without even the implied warranty of
*  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
*  GNU General Public License for more details.
*
*  You should have received a copy of the GNU General Public License
*  along with flexplayer. If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <vector>

namespace flex
{
    namespace player
    {
        namespace analysis
        {

            /**
             * @brief Lock-free single-producer single-consumer (SPSC) queue of sample chunks
             *
             * The producer is the real-time output callback, the consumer is the analyzer
             * thread. Every slot is allocated up front with room for chunkCapacity samples,
             * so push() never allocates. Chunks longer than a slot are truncated.
             *
             * @tparam Capacity Number of slots, must be a power of 2
             */
            template <size_t Capacity>
            class AnalysisQueue
            {
                static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");
                static_assert(Capacity > 0, "Capacity must be greater than 0");

            public:
                explicit AnalysisQueue(size_t chunkCapacity)
                    : head_(0), tail_(0), dropped_(0), chunkCapacity_(chunkCapacity)
                {
                    for (auto &slot : slots_)
                    {
                        slot.samples.assign(chunkCapacity_, 0.0f);
                        slot.count = 0;
                    }
                }

                /**
                 * @brief Copy a chunk into the next free slot (producer side)
                 * @return false if the queue is full and the chunk was dropped
                 */
                bool push(const float *data, size_t count)
                {
                    if (!data || count == 0)
                        return false;

                    const size_t head = head_.load(std::memory_order_relaxed);
                    const size_t tail = tail_.load(std::memory_order_acquire);

                    if (head - tail >= Capacity)
                    {
                        dropped_.fetch_add(1, std::memory_order_relaxed);
                        return false;
                    }

                    Slot &slot = slots_[head & mask_];
                    const size_t toCopy = std::min(count, chunkCapacity_);
                    std::copy_n(data, toCopy, slot.samples.begin());
                    slot.count = toCopy;

                    // Publish the slot with release semantics so the consumer sees the samples
                    head_.store(head + 1, std::memory_order_release);
                    return true;
                }

                /**
                 * @brief Take the oldest chunk if one is ready (consumer side)
                 */
                bool tryPop(std::vector<float> &chunk)
                {
                    const size_t tail = tail_.load(std::memory_order_relaxed);
                    const size_t head = head_.load(std::memory_order_acquire);

                    if (head == tail)
                        return false;

                    const Slot &slot = slots_[tail & mask_];
                    chunk.assign(slot.samples.begin(), slot.samples.begin() + slot.count);

                    tail_.store(tail + 1, std::memory_order_release);
                    return true;
                }

                /**
                 * @brief Wait up to timeout for a chunk (consumer side)
                 *
                 * The producer never signals, so the consumer polls in short sleeps.
                 */
                bool pop(std::vector<float> &chunk, std::chrono::milliseconds timeout)
                {
                    const auto deadline = std::chrono::steady_clock::now() + timeout;

                    while (!tryPop(chunk))
                    {
                        if (std::chrono::steady_clock::now() >= deadline)
                            return false;
                        std::this_thread::sleep_for(cPollInterval);
                    }
                    return true;
                }

                size_t size() const
                {
                    const size_t head = head_.load(std::memory_order_acquire);
                    const size_t tail = tail_.load(std::memory_order_acquire);
                    return head - tail;
                }

                /**
                 * @brief Number of chunks dropped because the queue was full
                 */
                size_t dropped() const
                {
                    return dropped_.load(std::memory_order_relaxed);
                }

                size_t chunkCapacity() const
                {
                    return chunkCapacity_;
                }

                /**
                 * @brief Discard queued chunks (consumer side)
                 */
                void clear()
                {
                    tail_.store(head_.load(std::memory_order_acquire), std::memory_order_release);
                }

                static constexpr size_t capacity() { return Capacity; }

            private:
                struct Slot
                {
                    std::vector<float> samples;
                    size_t count;
                };

                static constexpr size_t mask_ = Capacity - 1;
                static constexpr std::chrono::milliseconds cPollInterval{2};

                alignas(64) std::atomic<size_t> head_; // Written by producer
                alignas(64) std::atomic<size_t> tail_; // Written by consumer
                std::atomic<size_t> dropped_;
                size_t chunkCapacity_;
                std::array<Slot, Capacity> slots_;
            };

            using ChunkQueue = AnalysisQueue<8>;

        } // namespace analysis
    } // namespace player
} // namespace flex
