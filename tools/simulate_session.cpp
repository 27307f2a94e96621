/**
 * @file simulate_session.cpp
 * @brief Standalone tool replaying a scripted AR session through the focus controller
 *        and logging every display-state change and node update.
 *
 * Usage: simulate_session [--verbose]
 */

#include <arfocus.hpp>

#include <boost/asio/io_context.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace arfocus;
using arfocus::controller::FocusController;
using arfocus::display::DisplayState;

// Session
constexpr double CAMERA_HEIGHT = 1.4;
constexpr double SHALLOW_PITCH = -0.4;
constexpr double STEEP_PITCH = -1.35;

/**
 * @brief View replaying one scripted frame at a time.
 */
class ScriptedView final : public host::SceneView
{
  public:
    struct Frame
    {
        std::string label;
        host::TrackingQuality tracking = host::TrackingQuality::Normal;
        double pitch = SHALLOW_PITCH;
        std::optional<core::Vec3> hit{};
        std::optional<host::PlaneId> plane{};
    };

    void load (const Frame &frame) { frame_ = frame; }

    [[nodiscard]] host::ScreenPoint screenCenter () const override { return {195.0, 422.0}; }

    [[nodiscard]] std::optional<host::CameraPose> currentCamera () const override
    {
        host::CameraPose camera;
        camera.transform = core::makeTranslation (core::Vec3 (0.0, CAMERA_HEIGHT, 0.0));
        camera.eulerAngles = core::Vec3 (frame_.pitch, 0.0, 0.0);
        camera.tracking = frame_.tracking;
        return camera;
    }

    [[nodiscard]] std::vector<host::RaycastHit> raycast (host::ScreenPoint) const override
    {
        if (!frame_.hit)
            return {};
        return {host::RaycastHit{core::makeTranslation (*frame_.hit), frame_.plane}};
    }

  private:
    Frame frame_{};
};

/**
 * @brief Node printing its updates; animations finish immediately.
 */
class ConsoleNode final : public host::SceneNode
{
  public:
    [[nodiscard]] host::NodeParent parent () const override { return parent_; }

    void reparent (host::NodeParent p) override
    {
        parent_ = p;
        spdlog::info ("  node   attached to {}", p == host::NodeParent::Camera ? "camera" : "scene root");
    }

    void setTransform (const core::Transform &) override {}

    void setPosition (const core::Vec3 &p) override { spdlog::debug ("  node   position ({:.3f}, {:.3f}, {:.3f})", p.x (), p.y (), p.z ()); }

    void setScale (const core::Vec3 &s) override { spdlog::debug ("  node   scale {:.3f}", s.x ()); }

    void setOrientation (const core::Quat &q, double duration, host::Completion onComplete) override
    {
        spdlog::info ("  node   orient to ({:.3f}, {:.3f}, {:.3f}, {:.3f}) over {:.2f}s", q.x (), q.y (), q.z (), q.w (), duration);
        if (onComplete)
            onComplete ();
    }

    void addContent (skin::IndicatorSkin &) override {}
    void removeContent (skin::IndicatorSkin &) override {}
    void setContentPitch (double) override {}
    void setContentScale (double) override {}

    void fade (double opacity, double duration, host::Completion onComplete) override
    {
        spdlog::info ("  node   fade to {:.1f} over {:.2f}s", opacity, duration);
        if (onComplete)
            onComplete ();
    }

    void setOpacity (double) override {}
    void setHidden (bool hidden) override { spdlog::info ("  node   {}", hidden ? "hidden" : "shown"); }
    void setRenderOnTop (bool) override {}

  private:
    host::NodeParent parent_ = host::NodeParent::Detached;
};

struct Corners
{
    std::vector<core::Vec3> segments;
};

using CornerCache = skin::GeometryCache<Corners>;

/**
 * @brief Square-bracket skin: geometry is a set of corner segments shared
 *        through a cache owned by the session.
 */
class BracketSkin final : public skin::IndicatorSkin
{
  public:
    explicit BracketSkin (CornerCache &cache) : cache_ (cache) {}

    void setupGeometry (const boost::asio::any_io_executor &) override
    {
        corners_ = cache_.getOrCreate ("bracket", [] {
            auto c = std::make_shared<Corners> ();
            const double h = 0.5;
            for (double sx : {-h, h})
                for (double sz : {-h, h})
                    c->segments.emplace_back (sx, 0.0, sz);
            return c;
        });
    }

    void setDisplayState (DisplayState s) override
    {
        state_ = s;
        spdlog::info ("  skin   {} ({} corners, {})", display::toString (s), corners_ ? corners_->segments.size () : std::size_t{0},
                      display::isOnPlane (s) ? "closed" : "open");
    }

    [[nodiscard]] DisplayState displayState () const noexcept override { return state_; }
    [[nodiscard]] double size () const noexcept override { return 0.17; }

  private:
    CornerCache &cache_;
    CornerCache::Ptr corners_;
    DisplayState state_ = DisplayState::Initializing;
};

class LoggingObserver final : public display::FocusObserver
{
  public:
    void onDisplayStateChanged (FocusController &c, DisplayState s) override
    {
        spdlog::info ("  notify {} (visited planes: {})", display::toString (s), c.visitedPlaneCount ());
    }
};

int main (int argc, char **argv)
{
    if (argc > 1 && std::string_view (argv[1]) == "--verbose")
        spdlog::set_level (spdlog::level::debug);

    const std::vector<ScriptedView::Frame> script = {
        {"no surface yet", host::TrackingQuality::Normal, SHALLOW_PITCH, std::nullopt, std::nullopt},
        {"tracking limited", host::TrackingQuality::Limited, SHALLOW_PITCH, core::Vec3 (0.0, 0.0, -1.2), std::nullopt},
        {"estimated floor", host::TrackingQuality::Normal, SHALLOW_PITCH, core::Vec3 (0.00, 0.0, -1.2), std::nullopt},
        {"estimated floor", host::TrackingQuality::Normal, SHALLOW_PITCH, core::Vec3 (0.02, 0.0, -1.2), std::nullopt},
        {"floor plane", host::TrackingQuality::Normal, SHALLOW_PITCH, core::Vec3 (0.03, 0.0, -1.2), "floor"},
        {"floor plane", host::TrackingQuality::Normal, SHALLOW_PITCH, core::Vec3 (0.04, 0.0, -1.2), "floor"},
        {"surface lost", host::TrackingQuality::Normal, SHALLOW_PITCH, std::nullopt, std::nullopt},
        {"floor again", host::TrackingQuality::Normal, SHALLOW_PITCH, core::Vec3 (0.05, 0.0, -1.1), "floor"},
        {"looking down", host::TrackingQuality::Normal, STEEP_PITCH, core::Vec3 (0.05, 0.0, -0.3), "floor"},
        {"looking down", host::TrackingQuality::Normal, STEEP_PITCH, core::Vec3 (0.05, 0.0, -0.3), "floor"},
        {"table plane", host::TrackingQuality::Normal, SHALLOW_PITCH, core::Vec3 (0.6, 0.75, -1.0), "table"},
    };

    boost::asio::io_context ui;
    CornerCache corners;
    ScriptedView view;
    ConsoleNode node;
    LoggingObserver observer;

    core::FocusConfig config;
    config.logger = spdlog::default_logger ();

    std::shared_ptr<FocusController> focus;
    try
    {
        focus = FocusController::create (view, node, std::make_shared<BracketSkin> (corners), ui.get_executor (), ui.get_executor (), config);
    }
    catch (const std::invalid_argument &e)
    {
        spdlog::error ("invalid configuration: {}", e.what ());
        return EXIT_FAILURE;
    }
    focus->setObserver (&observer);

    const auto runFrame = [&ui] {
        ui.poll ();
        ui.restart ();
    };

    if (auto started = focus->initialize (); !started)
    {
        spdlog::error ("initialize failed: {}", core::toString (started.error ()));
        return EXIT_FAILURE;
    }
    runFrame ();

    int index = 0;
    for (const auto &frame : script)
    {
        spdlog::info ("frame {:2d}: {}", index++, frame.label);
        view.load (frame);
        focus->tick ();
        runFrame ();
    }

    spdlog::info ("hiding indicator");
    focus->setVisible (false, true);
    runFrame ();
    spdlog::info ("showing indicator");
    focus->setVisible (true, false);
    runFrame ();

    spdlog::info ("final state: {}, scale {:.3f}, {} planes visited", display::toString (focus->displayState ()), focus->displayScale (),
                  focus->visitedPlaneCount ());
    return EXIT_SUCCESS;
}
