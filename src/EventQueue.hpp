/**
 * MIT License
 *
 * @brief Fixed-capacity FIFO (no heap) for hotplug notifications.
 *
 * @file EventQueue.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstddef>

namespace ppm
{
    /**
     * @brief Ring buffer holding up to N - 1 items.
     *
     * Not synchronized on its own; the owner serializes push/pop.
     *
     * @tparam T Trivially copyable item.
     * @tparam N Slot count (one slot stays free to tell full from empty).
     */
    template <typename T, std::size_t N>
    class EventQueue
    {
        static_assert(N >= 2, "EventQueue: N must be >= 2.");

    public:
        /**
         * @brief Append an item.
         * @return false if the queue is full (item dropped).
         */
        bool push(const T &item)
        {
            const std::size_t nxt = advance(w_);
            if (nxt == r_)
                return false;
            buf_[w_] = item;
            w_ = nxt;
            return true;
        }

        /**
         * @brief Remove the oldest item.
         * @return false if the queue is empty.
         */
        bool pop(T &out)
        {
            if (r_ == w_)
                return false;
            out = buf_[r_];
            r_ = advance(r_);
            return true;
        }

        bool empty() const noexcept { return r_ == w_; }

        std::size_t size() const noexcept { return (w_ >= r_) ? (w_ - r_) : (N - r_ + w_); }

        static constexpr std::size_t capacity() { return N - 1; }

    private:
        static std::size_t advance(std::size_t i) { return (i + 1 < N) ? i + 1 : 0; }

        T buf_[N]{};       ///< Storage.
        std::size_t r_{0}; ///< Read index.
        std::size_t w_{0}; ///< Write index.
    };

} ///< namespace ppm.
