#pragma once
/**
 * @file   geometry_cache.hpp
 * @brief  Explicitly owned cache of geometry shared between skin instances.
 */

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace arfocus::skin
{
    /**
     * @brief Keyed cache of immutable geometry.
     *
     * Owned by whoever creates the skins and handed to them; its lifetime
     * bounds the sharing. Entries stay alive while any skin still holds one,
     * even after @ref clear. Thread-safe.
     *
     * @tparam Geometry Host geometry type.
     */
    template <class Geometry> class GeometryCache final
    {
      public:
        using Ptr = std::shared_ptr<const Geometry>;
        using Factory = std::function<Ptr ()>;

        /**
         * @brief Cached geometry for @p key, built by @p make on first request.
         * @param key  Geometry identifier, e.g. "arc:0.17".
         * @param make Factory, run without the lock held so it may itself query
         *             the cache. Under contention it can run more than once
         *             for a key; the first result stored wins.
         */
        [[nodiscard]] Ptr getOrCreate (const std::string &key, const Factory &make)
        {
            {
                std::lock_guard lock (mtx_);
                if (auto it = entries_.find (key); it != entries_.end ())
                    return it->second;
            }

            Ptr geometry = make ();

            std::lock_guard lock (mtx_);
            return entries_.try_emplace (key, std::move (geometry)).first->second;
        }

        /// @brief Drop every entry; geometry already handed out stays valid.
        void clear ()
        {
            std::lock_guard lock (mtx_);
            entries_.clear ();
        }

        [[nodiscard]] std::size_t size () const
        {
            std::lock_guard lock (mtx_);
            return entries_.size ();
        }

      private:
        mutable std::mutex mtx_;
        std::map<std::string, Ptr> entries_;
    };

} // namespace arfocus::skin
