/**
 * @file test_overlay_manager.cpp
 * @brief Unit tests for the overlay lifecycle state machine
 */

#include <catch2/catch_test_macros.hpp>
#include <flowmap/overlay_manager.h>

#include "support/fake_host_map.h"

#include <string>
#include <vector>

using namespace flowmap;
using flowmap::testing::FakeHostMap;

namespace {

std::vector<AnimatedLayerSpec> oneLayer() {
    AnimatedLayerSpec spec;
    spec.id = "pulse";
    spec.kind = LayerKind::PulseCircle;
    return {spec};
}

} // namespace

TEST_CASE("OverlayManager attach on a ready map", "[unit][overlay]") {
    FakeHostMap map;
    RunLoop loop;
    OverlayManager manager(map, loop);
    manager.setLayerSource(oneLayer);

    int attached = 0;
    int detached = 0;
    manager.onAttached([&](OverlayHandle) { ++attached; });
    manager.onDetached([&](OverlayHandle) { ++detached; });

    SECTION("creates the overlay immediately") {
        REQUIRE(manager.state() == OverlayState::Idle);
        manager.attach();

        REQUIRE(manager.state() == OverlayState::Attached);
        REQUIRE(manager.isAttached());
        REQUIRE(map.addCalls == 1);
        REQUIRE(map.layersOf(manager.handle()).size() == 1);
        REQUIRE(attached == 1);
    }

    SECTION("initial camera is pushed on creation") {
        manager.attach();
        REQUIRE(map.viewOf(manager.handle()) == map.camera);
    }

    SECTION("attach twice creates one overlay") {
        manager.attach();
        manager.attach();
        REQUIRE(map.addCalls == 1);
        REQUIRE(manager.creationCount() == 1);
    }

    SECTION("update replaces layers and requests a repaint") {
        manager.attach();
        manager.update({});
        REQUIRE(map.setLayersCalls == 1);
        REQUIRE(map.layersOf(manager.handle()).empty());
        REQUIRE(map.repaints == 1);
    }

    SECTION("update while detached is ignored") {
        manager.update(oneLayer());
        REQUIRE(map.setLayersCalls == 0);
    }

    SECTION("detach removes the overlay") {
        manager.attach();
        manager.detach();
        REQUIRE(manager.state() == OverlayState::Idle);
        REQUIRE_FALSE(manager.handle().valid());
        REQUIRE(map.overlayCount() == 0);
        REQUIRE(detached == 1);
    }

    SECTION("nothing visible means no attach") {
        manager.setVisibilityQuery([] { return false; });
        manager.attach();
        REQUIRE(manager.state() == OverlayState::Idle);
        REQUIRE(map.addCalls == 0);
    }
}

TEST_CASE("OverlayManager readiness wait", "[unit][overlay]") {
    FakeHostMap map;
    map.styleLoaded = false;
    RunLoop loop;
    OverlayManager manager(map, loop);
    manager.setLayerSource(oneLayer);

    SECTION("waits for the load event") {
        manager.attach();
        REQUIRE(manager.state() == OverlayState::WaitingForReady);
        REQUIRE(map.addCalls == 0);

        loop.advance(500.0);
        map.styleLoaded = true;
        map.fire(MapEvent::Load);

        REQUIRE(manager.state() == OverlayState::Attached);
        REQUIRE(map.addCalls == 1);
        REQUIRE_FALSE(manager.degradedStart());
        REQUIRE(map.subscriptionCount() == 0);
        REQUIRE(loop.pendingTimers() == 0);
    }

    SECTION("style load also ends the wait, once") {
        manager.attach();
        map.fire(MapEvent::StyleLoad);
        map.fire(MapEvent::Load);
        REQUIRE(map.addCalls == 1);
    }

    SECTION("attach while waiting does not subscribe twice") {
        manager.attach();
        manager.attach();
        REQUIRE(map.subscriptionCount() == 2);
        REQUIRE(loop.pendingTimers() == 1);
    }

    SECTION("timeout proceeds with a degraded start") {
        manager.attach();
        loop.advance(1999.0);
        REQUIRE(manager.state() == OverlayState::WaitingForReady);
        loop.advance(1.0);

        REQUIRE(manager.state() == OverlayState::Attached);
        REQUIRE(manager.degradedStart());
        REQUIRE(map.subscriptionCount() == 0);
    }

    SECTION("timeout fails closed when configured") {
        OverlaySettings settings;
        settings.failOnReadinessTimeout = true;
        manager.configure(settings);

        std::vector<CleanupDetail> cleanups;
        manager.onCleanup([&](const CleanupDetail& d) { cleanups.push_back(d); });

        manager.attach();
        loop.advance(2000.0);
        REQUIRE(manager.state() == OverlayState::Failed);
        REQUIRE(map.addCalls == 0);
        REQUIRE(cleanups.size() == 1);
        REQUIRE(cleanups[0].reason == "readiness_timeout");
    }

    SECTION("pending attach aborts when visibility drops") {
        bool visible = true;
        manager.setVisibilityQuery([&] { return visible; });
        manager.attach();

        visible = false;
        map.fire(MapEvent::Load);
        REQUIRE(manager.state() == OverlayState::Idle);
        REQUIRE(map.addCalls == 0);
    }

    SECTION("detach cancels the wait") {
        manager.attach();
        manager.detach();
        REQUIRE(manager.state() == OverlayState::Idle);
        REQUIRE(map.subscriptionCount() == 0);
        REQUIRE(loop.pendingTimers() == 0);

        map.fire(MapEvent::Load);
        loop.advance(5000.0);
        REQUIRE(map.addCalls == 0);
    }
}

TEST_CASE("OverlayManager failures", "[unit][overlay]") {
    FakeHostMap map;
    RunLoop loop;
    OverlayManager manager(map, loop);
    manager.setLayerSource(oneLayer);

    std::vector<CleanupDetail> cleanups;
    manager.onCleanup([&](const CleanupDetail& d) { cleanups.push_back(d); });

    SECTION("add failure notifies once and clears the handle") {
        map.failNextAdds = 1;
        manager.attach();

        REQUIRE(manager.state() == OverlayState::Failed);
        REQUIRE_FALSE(manager.handle().valid());
        REQUIRE(manager.hasError());
        REQUIRE(cleanups.size() == 1);
        REQUIRE(cleanups[0].status == CleanupStatus::Failed);
        REQUIRE(cleanups[0].reason == "overlay_add_failed");
        REQUIRE(cleanups[0].message == map.failMessage);
    }

    SECTION("retry after failure succeeds without a second notification") {
        map.failNextAdds = 1;
        manager.attach();
        manager.attach();

        REQUIRE(manager.state() == OverlayState::Attached);
        REQUIRE_FALSE(manager.hasError());
        REQUIRE(map.addCalls == 2);
        REQUIRE(cleanups.size() == 1);

        manager.shutdown();
        REQUIRE(cleanups.size() == 1);
    }

    SECTION("invalid handle counts as a failure") {
        map.returnInvalidHandle = true;
        manager.attach();
        REQUIRE(manager.state() == OverlayState::Failed);
        REQUIRE(cleanups.size() == 1);
    }

    SECTION("stale handle is discarded and recreated") {
        int detached = 0;
        manager.onDetached([&](OverlayHandle) { ++detached; });
        manager.attach();
        OverlayHandle first = manager.handle();

        map.dropOverlay(first);
        REQUIRE_FALSE(manager.verify());
        REQUIRE(manager.state() == OverlayState::Idle);
        REQUIRE(detached == 1);

        manager.attach();
        REQUIRE(manager.isAttached());
        REQUIRE(manager.handle() != first);
        REQUIRE(map.addCalls == 2);
        REQUIRE(cleanups.empty());
    }

    SECTION("attach verifies the handle before skipping") {
        manager.attach();
        map.dropOverlay(manager.handle());
        manager.attach();
        REQUIRE(map.addCalls == 2);
        REQUIRE(map.overlayCount() == 1);
    }

    SECTION("shutdown notifies Stopped once") {
        manager.attach();
        manager.shutdown();
        manager.shutdown();

        REQUIRE(cleanups.size() == 1);
        REQUIRE(cleanups[0].status == CleanupStatus::Stopped);
        REQUIRE(map.overlayCount() == 0);
        REQUIRE(manager.cleanupNotified());
    }

    SECTION("destruction removes the overlay without notifying") {
        {
            OverlayManager scoped(map, loop);
            scoped.onCleanup([&](const CleanupDetail& d) { cleanups.push_back(d); });
            scoped.attach();
            REQUIRE(map.overlayCount() == 1);
        }
        REQUIRE(map.overlayCount() == 0);
        REQUIRE(cleanups.empty());
    }
}

TEST_CASE("OverlayManager state names", "[unit][overlay]") {
    REQUIRE(std::string(overlayStateName(OverlayState::WaitingForReady)) == "waiting-for-ready");
    REQUIRE(std::string(overlayStateName(OverlayState::Attached)) == "attached");
    REQUIRE(std::string(cleanupStatusName(CleanupStatus::Failed)) == "failed");
}
