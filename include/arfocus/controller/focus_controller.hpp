#pragma once
/**
 * @file   focus_controller.hpp
 * @brief  Façade driving the focus indicator once per rendered frame.
 *
 * Per tick:
 *  - pick the screen point (explicit, else the view center read on the UI thread);
 *  - raycast from it when world tracking is normal;
 *  - feed the detection state machine, the pose smoother and the display
 *    state machine on the serial work queue;
 *  - re-parent the node between the scene root and the camera;
 *  - notify the skin, and the observer on the UI thread, of display-state changes.
 *
 * All mutable tracking state is touched only from the work queue. Public
 * entry points are fire-and-forget and may be called from any thread.
 */

#include <arfocus/core/config.hpp>
#include <arfocus/core/error.hpp>
#include <arfocus/core/math.hpp>
#include <arfocus/display/display_state.hpp>
#include <arfocus/display/display_state_machine.hpp>
#include <arfocus/display/focus_observer.hpp>
#include <arfocus/host/scene_node.hpp>
#include <arfocus/host/scene_view.hpp>
#include <arfocus/skin/indicator_skin.hpp>
#include <arfocus/tracking/detection_state_machine.hpp>
#include <arfocus/tracking/pose_smoother.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/system_executor.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <utility>
#include <variant>

namespace arfocus::controller
{
    namespace asio = boost::asio;

    /**
     * @brief Focus indicator controller.
     *
     * Two-phase lifecycle: @ref create is cheap and synchronous, @ref initialize
     * sets the skin up and shows the billboard on the work queue. Ticks before
     * initialization has completed are ignored.
     *
     * The controller is always shared-owned; queued work holds a weak
     * reference and is dropped once the controller is gone.
     */
    class FocusController final : public std::enable_shared_from_this<FocusController>
    {
        struct Passkey
        {
            explicit Passkey () = default;
        };

        /// Wrap @p fn so it runs only while the controller is alive.
        template <class F> auto guarded (F fn)
        {
            return [weak = weak_from_this (), fn = std::move (fn)] () mutable {
                if (auto self = weak.lock ())
                    fn (*self);
            };
        }

        /// Host completion that hands @p fn back to the work queue.
        template <class F> host::Completion onQueue (F fn)
        {
            return [queue = queue_, task = guarded (std::move (fn))] () mutable { asio::post (queue, task); };
        }

      public:
        /// Executor of the UI thread's event loop.
        using UiExecutor = asio::io_context::executor_type;
        /// Serial queue all state mutation runs on.
        using WorkQueue = asio::strand<asio::any_io_executor>;

        /**
         * @brief Create a controller whose work queue runs on @p updateExecutor.
         * @param view           Host AR view; must outlive the controller.
         * @param node           Node carrying the indicator; must outlive the controller.
         * @param indicator      Visual skin; may be null and set later.
         * @param ui             UI thread executor (view geometry, observer callbacks).
         * @param updateExecutor Executor serialized into the work queue; pass the
         *                       UI executor to do all work on the UI thread.
         * @param config         Tuning parameters.
         * @throws std::invalid_argument if @p config is invalid.
         */
        [[nodiscard]] static std::shared_ptr<FocusController> create (host::SceneView &view, host::SceneNode &node, std::shared_ptr<skin::IndicatorSkin> indicator,
                                                                      UiExecutor ui, asio::any_io_executor updateExecutor, core::FocusConfig config = {})
        {
            return std::make_shared<FocusController> (Passkey{}, view, node, std::move (indicator), std::move (ui), std::move (updateExecutor), std::move (config));
        }

        /// @brief Create a controller whose work queue runs in the background (system thread pool).
        [[nodiscard]] static std::shared_ptr<FocusController> create (host::SceneView &view, host::SceneNode &node, std::shared_ptr<skin::IndicatorSkin> indicator,
                                                                      UiExecutor ui, core::FocusConfig config = {})
        {
            return create (view, node, std::move (indicator), std::move (ui), asio::system_executor{}, std::move (config));
        }

        FocusController (Passkey, host::SceneView &view, host::SceneNode &node, std::shared_ptr<skin::IndicatorSkin> indicator, UiExecutor ui,
                         asio::any_io_executor updateExecutor, core::FocusConfig config)
            : config_ ((config.validate (), std::move (config))), log_ (config_.logger ? config_.logger : spdlog::default_logger ()), view_ (view), node_ (node),
              skin_ (std::move (indicator)), ui_ (std::move (ui)), queue_ (asio::make_strand (std::move (updateExecutor))), smoother_ (config_)
        {
        }

        FocusController (const FocusController &) = delete;
        FocusController &operator= (const FocusController &) = delete;

        /**
         * @brief Set the skin up, attach it and show the billboard (asynchronously).
         * @return @c FocusError::AlreadyInitialized on a second call.
         */
        std::expected<void, core::FocusError> initialize ()
        {
            bool requested = false;
            if (!initRequested_.compare_exchange_strong (requested, true))
            {
                log_->warn ("focus controller: initialize() ignored, {}", core::toString (core::FocusError::AlreadyInitialized));
                return std::unexpected (core::FocusError::AlreadyInitialized);
            }
            asio::post (queue_, guarded ([] (FocusController &self) { self.completeInitialization (); }));
            return {};
        }

        /**
         * @brief Update the indicator for the current frame.
         * @param screenPoint Point to raycast from; the view center if empty.
         *
         * Without an explicit point and off the UI thread, the call first hops
         * to the UI thread to read the view geometry.
         */
        void tick (std::optional<host::ScreenPoint> screenPoint = std::nullopt)
        {
            if (!initialized_.load ())
                return;

            if (!screenPoint && !ui_.running_in_this_thread ())
            {
                asio::post (ui_, guarded ([] (FocusController &self) { self.tick (); }));
                return;
            }

            const host::ScreenPoint point = screenPoint ? *screenPoint : view_.screenCenter ();
            asio::post (queue_, guarded ([point] (FocusController &self) { self.update (point); }));
        }

        /**
         * @brief Show or hide the indicator.
         * @param visible  Requested visibility.
         * @param animated Cross-fade over @c visibilityFadeDuration, else switch at once.
         *
         * Requests arriving while a transition is in flight are dropped.
         */
        void setVisible (bool visible, bool animated)
        {
            asio::post (queue_, guarded ([hide = !visible, animated] (FocusController &self) { self.changeVisibility (hide, animated); }));
        }

        /// @brief Same as setVisible(!hidden, false).
        void setHidden (bool hidden) { setVisible (!hidden, false); }

        /**
         * @brief Replace the indicator skin.
         *
         * After initialization the old skin is detached and the new one is set
         * up, attached and shown in the current state.
         */
        void setIndicator (std::shared_ptr<skin::IndicatorSkin> indicator)
        {
            asio::post (queue_, guarded ([indicator = std::move (indicator)] (FocusController &self) mutable { self.replaceIndicator (std::move (indicator)); }));
        }

        /// @brief Register the (non-owned) observer; null unregisters.
        void setObserver (display::FocusObserver *observer) noexcept { observer_.store (observer); }

        /*──────────────────────── Queries (any thread) ────────────────────────*/

        [[nodiscard]] display::DisplayState displayState () const noexcept { return displayState_.load (); }
        [[nodiscard]] bool isHidden () const noexcept { return hidden_.load (); }
        [[nodiscard]] bool isInitialized () const noexcept { return initialized_.load (); }
        [[nodiscard]] double displayScale () const noexcept { return displayScale_.load (); }
        [[nodiscard]] std::size_t visitedPlaneCount () const noexcept { return visitedPlanes_.load (); }
        [[nodiscard]] const core::FocusConfig &config () const noexcept { return config_; }
        [[nodiscard]] asio::any_io_executor workQueue () const { return queue_; }

      private:
        /*──────────────────────── Work queue only ────────────────────────*/

        void completeInitialization ()
        {
            if (skin_)
                attachContent (*skin_);
            initialized_ = true;
            displayAsBillboard ();
            node_.setRenderOnTop (true);
            log_->info ("focus controller initialized");
        }

        void update (host::ScreenPoint point)
        {
            std::optional<host::CameraPose> camera = view_.currentCamera ();
            std::optional<host::RaycastHit> hit;
            if (camera && camera->tracking == host::TrackingQuality::Normal)
            {
                auto hits = view_.raycast (point);
                if (!hits.empty ())
                    hit = std::move (hits.front ());
            }

            if (hit)
            {
                apply (detection_.observe (std::move (hit), std::move (camera)));
                attachTo (host::NodeParent::SceneRoot);
            }
            else
            {
                apply (detection_.observe (std::nullopt, std::nullopt));
                attachTo (host::NodeParent::Camera);
            }
        }

        void apply (const tracking::Observation &observation)
        {
            const auto *detecting = std::get_if<tracking::Detecting> (&observation.state);
            if (!detecting)
            {
                if (observation.changed)
                    displayAsBillboard ();
                return;
            }

            if (config_.updatePolicy == core::DetectionUpdatePolicy::OnChange && !observation.kindChanged)
                return;
            displayOnSurface (*detecting);
        }

        /// Parallel to the camera plane, in front of it.
        void displayAsBillboard ()
        {
            node_.setTransform (core::Transform::Identity ());
            node_.setContentPitch (0.0);
            setDisplayScale (1.0);
            node_.setPosition (core::Vec3 (0.0, 0.0, -config_.billboardDistance));
            smoother_.reset ();
            commit (display_.advance (detection_.current ()));
        }

        void displayOnSurface (const tracking::Detecting &detecting)
        {
            node_.setContentPitch (-core::PI_OVER_TWO); // lie flat on the surface
            applyPose (smoother_.update (detecting.hit.worldTransform, detecting.camera));
            commit (display_.advance (detection_.current ()));
            visitedPlanes_ = display_.visitedCount ();
        }

        void applyPose (const tracking::SmoothedPose &pose)
        {
            node_.setPosition (pose.position);
            setDisplayScale (pose.scale);
            if (!pose.orientation)
                return;

            const tracking::OrientationUpdate &o = *pose.orientation;
            host::Completion done;
            if (o.yawOnly)
                done = onQueue ([] (FocusController &self) { self.smoother_.completeReorientation (); });
            node_.setOrientation (o.orientation, o.duration, std::move (done));
        }

        void setDisplayScale (double scale)
        {
            displayScale_ = scale;
            node_.setScale (core::Vec3::Constant (scale));
        }

        void commit (std::optional<display::DisplayState> next)
        {
            if (!next)
                return;

            const display::DisplayState previous = displayState_.exchange (*next);
            log_->debug ("focus display state: {} -> {}", display::toString (previous), display::toString (*next));

            if (skin_)
                skin_->setDisplayState (*next);
            asio::post (ui_, guarded ([state = *next] (FocusController &self) {
                            if (auto *observer = self.observer_.load ())
                                observer->onDisplayStateChanged (self, state);
                        }));
            node_.setRenderOnTop (true);
        }

        void attachTo (host::NodeParent parent)
        {
            if (node_.parent () == parent)
                return;
            node_.reparent (parent);
            log_->debug ("focus node attached to {}", parent == host::NodeParent::SceneRoot ? "scene root" : "camera");
        }

        void attachContent (skin::IndicatorSkin &content)
        {
            content.setupGeometry (asio::any_io_executor (queue_));
            node_.setContentScale (content.size ());
            node_.addContent (content);
        }

        void replaceIndicator (std::shared_ptr<skin::IndicatorSkin> indicator)
        {
            if (indicator == skin_)
                return;
            if (!initialized_)
            {
                skin_ = std::move (indicator); // set up by completeInitialization()
                return;
            }

            if (skin_)
                node_.removeContent (*skin_);
            skin_ = std::move (indicator);
            if (!skin_)
                return;

            attachContent (*skin_);
            skin_->setDisplayState (display_.current ());
            node_.setRenderOnTop (!hidden_);
            log_->debug ("focus indicator skin replaced");
        }

        void changeVisibility (bool hide, bool animated)
        {
            if (changingVisibility_)
            {
                log_->trace ("focus visibility change to {} dropped, transition in flight", hide ? "hidden" : "visible");
                return;
            }
            if (hide == hidden_)
                return;

            changingVisibility_ = true;
            const double duration = animated ? config_.visibilityFadeDuration : 0.0;
            if (hide)
            {
                node_.fade (0.0, duration, onQueue ([] (FocusController &self) {
                                self.node_.setRenderOnTop (false);
                                self.node_.setHidden (true);
                                self.hidden_ = true;
                                self.changingVisibility_ = false;
                            }));
                return;
            }

            node_.setOpacity (0.0);
            node_.setHidden (false);
            hidden_ = false;
            node_.setRenderOnTop (true);
            node_.fade (1.0, duration, onQueue ([] (FocusController &self) { self.changingVisibility_ = false; }));
        }

        core::FocusConfig config_;
        std::shared_ptr<spdlog::logger> log_;

        host::SceneView &view_;
        host::SceneNode &node_;
        std::shared_ptr<skin::IndicatorSkin> skin_;

        UiExecutor ui_;
        WorkQueue queue_;

        /* Work-queue state. */
        tracking::DetectionStateMachine detection_;
        tracking::PoseSmoother smoother_;
        display::DisplayStateMachine display_;
        bool changingVisibility_ = false;

        /* Published for queries from any thread. */
        std::atomic<display::DisplayState> displayState_{display::DisplayState::Initializing};
        std::atomic<double> displayScale_{1.0};
        std::atomic<bool> hidden_{false};
        std::atomic<bool> initialized_{false};
        std::atomic<bool> initRequested_{false};
        std::atomic<std::size_t> visitedPlanes_{0};
        std::atomic<display::FocusObserver *> observer_{nullptr};
    };

} // namespace arfocus::controller
