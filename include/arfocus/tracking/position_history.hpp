#pragma once
/**
 * @file   position_history.hpp
 * @brief  Bounded FIFO of recent hit positions and their mean.
 */

#include <arfocus/core/math.hpp>
#include <arfocus/core/numeric.hpp>

#include <boost/circular_buffer.hpp>

#include <cstddef>
#include <stdexcept>

namespace arfocus::tracking
{
    using core::Vec3;

    /**
     * @brief Fixed-capacity history of world positions.
     *
     * Pushing into a full history evicts the oldest sample. The smoothed
     * position is the arithmetic mean of the samples currently held.
     */
    class PositionHistory final
    {
      public:
        /**
         * @param capacity Maximum number of retained samples.
         * @throws std::invalid_argument if @p capacity is zero.
         */
        explicit PositionHistory (std::size_t capacity = core::POSITION_HISTORY_CAPACITY) : samples_ (capacity)
        {
            if (capacity == 0)
                throw std::invalid_argument ("PositionHistory: capacity must be >= 1");
        }

        /**
         * @brief Append a sample and return the new mean.
         * @param p World position [m].
         */
        Vec3 push (const Vec3 &p)
        {
            samples_.push_back (p);
            return mean ();
        }

        /// @brief Mean of the retained samples (origin when empty).
        [[nodiscard]] Vec3 mean () const noexcept { return core::mean (samples_); }

        void clear () noexcept { samples_.clear (); }

        [[nodiscard]] std::size_t size () const noexcept { return samples_.size (); }
        [[nodiscard]] std::size_t capacity () const noexcept { return samples_.capacity (); }
        [[nodiscard]] bool empty () const noexcept { return samples_.empty (); }

        /// @brief Oldest-first view of the samples.
        [[nodiscard]] const boost::circular_buffer<Vec3> &samples () const noexcept { return samples_; }

      private:
        boost::circular_buffer<Vec3> samples_;
    };

} // namespace arfocus::tracking
