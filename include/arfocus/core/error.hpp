#pragma once
/**
 * @file   error.hpp
 * @brief  Lifecycle error codes reported through std::expected.
 */

#include <string_view>

namespace arfocus::core
{
    /**
     * @brief Errors returned by controller lifecycle operations.
     *
     * Per-frame conditions (no hit, degraded tracking, missing camera) are
     * states, never errors.
     */
    enum class FocusError
    {
        AlreadyInitialized ///< initialize() was already requested
    };

    /// @brief Human-readable name of a @ref FocusError.
    [[nodiscard]] constexpr std::string_view toString (FocusError e) noexcept
    {
        switch (e)
        {
        case FocusError::AlreadyInitialized:
            return "already initialized";
        }
        return "unknown";
    }

} // namespace arfocus::core
