/**
 * @file detection_state_machine_tests.cpp
 * @brief Classification of raycast outcomes and change reporting.
 */

#include <arfocus/tracking/detection_state_machine.hpp>
#include <gtest/gtest.h>
#include <optional>
#include <variant>

using namespace arfocus::core;
using namespace arfocus::tracking;
using arfocus::host::CameraPose;
using arfocus::host::RaycastHit;

namespace
{
    RaycastHit hitAt (double z, std::optional<std::string> plane = std::nullopt) { return RaycastHit{makeTranslation (Vec3 (0.0, 0.0, z)), std::move (plane)}; }
} // namespace

TEST (DetectionStateMachineTests, StartsInitializing)
{
    DetectionStateMachine m;
    EXPECT_TRUE (std::holds_alternative<Initializing> (m.current ()));
}

TEST (DetectionStateMachineTests, NoHitIsInitializingEvenWithCamera)
{
    DetectionStateMachine m;
    const auto obs = m.observe (std::nullopt, CameraPose{});
    EXPECT_TRUE (std::holds_alternative<Initializing> (obs.state));
    EXPECT_FALSE (obs.changed);
    EXPECT_FALSE (obs.kindChanged);
}

TEST (DetectionStateMachineTests, ClassifiesSurfaceKinds)
{
    DetectionStateMachine m;

    const auto estimated = m.observe (hitAt (-1.0), std::nullopt);
    const auto *d = std::get_if<Detecting> (&estimated.state);
    ASSERT_NE (d, nullptr);
    EXPECT_TRUE (std::holds_alternative<EstimatedSurface> (d->surface));
    EXPECT_FALSE (d->camera.has_value ());

    const auto onPlane = m.observe (hitAt (-1.0, "P1"), CameraPose{});
    d = std::get_if<Detecting> (&onPlane.state);
    ASSERT_NE (d, nullptr);
    const auto *plane = std::get_if<KnownPlane> (&d->surface);
    ASSERT_NE (plane, nullptr);
    EXPECT_EQ (plane->id, "P1");
    EXPECT_TRUE (d->camera.has_value ());
}

TEST (DetectionStateMachineTests, ReportsValueAndKindChanges)
{
    DetectionStateMachine m;

    auto obs = m.observe (hitAt (-1.0), std::nullopt);
    EXPECT_TRUE (obs.changed);
    EXPECT_TRUE (obs.kindChanged);

    // Same hit again: nothing changed.
    obs = m.observe (hitAt (-1.0), std::nullopt);
    EXPECT_FALSE (obs.changed);
    EXPECT_FALSE (obs.kindChanged);

    // Moved hit on the same kind of surface.
    obs = m.observe (hitAt (-1.2), std::nullopt);
    EXPECT_TRUE (obs.changed);
    EXPECT_FALSE (obs.kindChanged);

    // Different plane ids are different kinds.
    obs = m.observe (hitAt (-1.2, "A"), std::nullopt);
    EXPECT_TRUE (obs.kindChanged);
    obs = m.observe (hitAt (-1.2, "B"), std::nullopt);
    EXPECT_TRUE (obs.kindChanged);

    obs = m.observe (std::nullopt, std::nullopt);
    EXPECT_TRUE (obs.changed);
    EXPECT_TRUE (obs.kindChanged);
}

TEST (DetectionStateMachineTests, SameKindHelper)
{
    const DetectionState init = Initializing{};
    const DetectionState est1 = Detecting{hitAt (0.0), EstimatedSurface{}, std::nullopt};
    const DetectionState est2 = Detecting{hitAt (3.0), EstimatedSurface{}, CameraPose{}};
    const DetectionState planeA = Detecting{hitAt (0.0, "A"), KnownPlane{"A"}, std::nullopt};

    EXPECT_TRUE (sameKind (init, Initializing{}));
    EXPECT_TRUE (sameKind (est1, est2));
    EXPECT_FALSE (sameKind (est1, planeA));
    EXPECT_FALSE (sameKind (init, est1));
    EXPECT_TRUE (isDetecting (planeA));
    EXPECT_FALSE (isDetecting (init));
}

TEST (DetectionStateMachineTests, ResetReturnsToInitializing)
{
    DetectionStateMachine m;
    m.observe (hitAt (-1.0, "P"), std::nullopt);
    m.reset ();
    EXPECT_TRUE (std::holds_alternative<Initializing> (m.current ()));
}

TEST (DetectionStateMachineTests, ObservationIsSnapshotOfItsFrame)
{
    DetectionStateMachine m;
    const auto onPlane = m.observe (hitAt (-1.0, "A"), std::nullopt);
    const auto lost = m.observe (std::nullopt, std::nullopt);

    const auto *d = std::get_if<Detecting> (&onPlane.state);
    ASSERT_NE (d, nullptr);
    EXPECT_EQ (std::get<KnownPlane> (d->surface).id, "A");
    EXPECT_TRUE (std::holds_alternative<Initializing> (lost.state));

    Observation copy = onPlane;
    copy = lost;
    EXPECT_TRUE (copy.changed);
    EXPECT_TRUE (std::holds_alternative<Initializing> (copy.state));
}
