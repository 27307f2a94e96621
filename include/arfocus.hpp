#pragma once
/**
 * @file   arfocus.hpp
 * @brief  Umbrella header – include the full ArFocus public interface.
 *
 * Include this single header in a translation unit to access the entire API:
 *  - Core primitives (math, numeric constants, configuration, errors)
 *  - Host collaborator interfaces (view, scene node, camera and hit types)
 *  - Tracking (position history, pose smoother, detection state machine)
 *  - Display (display state machine, observer) and skin interfaces
 *  - The focus controller façade
 */

/*──────────────────────────── Core ────────────────────────────*/
#include <arfocus/core/config.hpp>
#include <arfocus/core/error.hpp>
#include <arfocus/core/math.hpp>
#include <arfocus/core/numeric.hpp>

/*──────────────────────────── Host ────────────────────────────*/
#include <arfocus/host/scene_node.hpp>
#include <arfocus/host/scene_view.hpp>
#include <arfocus/host/types.hpp>

/*────────────────────────── Tracking ──────────────────────────*/
#include <arfocus/tracking/detection_state.hpp>
#include <arfocus/tracking/detection_state_machine.hpp>
#include <arfocus/tracking/pose_smoother.hpp>
#include <arfocus/tracking/position_history.hpp>

/*─────────────────────── Display & skins ──────────────────────*/
#include <arfocus/display/display_state.hpp>
#include <arfocus/display/display_state_machine.hpp>
#include <arfocus/display/focus_observer.hpp>
#include <arfocus/skin/geometry_cache.hpp>
#include <arfocus/skin/indicator_skin.hpp>

/*───────────────────────── Controller ─────────────────────────*/
#include <arfocus/controller/focus_controller.hpp> // Per-frame façade
