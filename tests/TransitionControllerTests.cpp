#include "sh/core/Error.hpp"
#include "sh/core/Stage.hpp"
#include "sh/core/TransitionEvents.hpp"

#include "TestContentHelpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using sh::content::AlreadyBuilt;
using sh::content::ContentNode;
using sh::content::ContentNodePtr;
using sh::transition::TransitionPhase;

namespace {

using Log = std::vector<std::string>;

// Records every transition-related event into a shared log.
struct EventRecorder {
    EventRecorder(sh::core::EventBus& events, Log& log) {
        for (const char* name : {sh::TransitionEvents::TeardownDone, sh::TransitionEvents::SetupDone,
                                 sh::TransitionEvents::StartDone, sh::TransitionEvents::TransitionFailed,
                                 sh::TransitionEvents::SimulationPaused, sh::TransitionEvents::SimulationResumed}) {
            const std::string label = std::string("event:") + name;
            subscriptions.emplace_back(events.Subscribe(name, [&log, label]() { log.push_back(label); }));
        }
    }

    std::vector<sh::core::EventBus::ScopedSubscription> subscriptions;
};

ContentNodePtr MakeLoggingNode(const std::string& name, Log& log) {
    auto node = std::make_shared<ContentNode>(name);
    node->SetTeardownHook([&log, name]() {
        log.push_back(name + ".teardown");
        return sh::core::Task<void>::Resolved();
    });
    node->SetSetupHook([&log, name](const sh::content::ParamList&) {
        log.push_back(name + ".setup");
        return sh::core::Task<void>::Resolved();
    });
    node->SetStartHook([&log, name]() {
        log.push_back(name + ".start");
        return sh::core::Task<void>::Resolved();
    });
    node->SetDestroyCallback([&log](ContentNode& self) { log.push_back(self.GetName() + ".destroyed"); });
    return node;
}

// Ticks until the controller is idle and returns the number of ticks it took.
int TicksUntilDone(sh::core::Stage& stage, float deltaTime, int limit = 1000) {
    int ticks = 0;
    while (stage.Controller().IsBusy() && ticks < limit) {
        stage.Tick(deltaTime);
        ++ticks;
    }
    return ticks;
}

} // namespace

TEST_CASE("First transition starts at target resolution", "[transition][controller]") {
    TestContentDir dir;
    sh::core::Stage stage(MakeStageConfig(dir.root));
    Log log;
    EventRecorder recorder(stage.Events(), log);

    auto menu = MakeLoggingNode("menu", log);
    auto result = stage.Transition(AlreadyBuilt{menu});

    REQUIRE(result.IsCompleted());
    REQUIRE(result.Get());
    REQUIRE(log == Log{"event:simulation.paused", "menu.setup", "event:setup-done",
                       "event:simulation.resumed", "menu.start", "event:start-done"});
    REQUIRE(stage.Slot().GetActive() == menu);
    REQUIRE_FALSE(stage.Pause().IsPaused());
    REQUIRE(stage.Events().EmitCount(sh::TransitionEvents::TeardownDone) == 0);
    REQUIRE(stage.Controller().GetPhase() == TransitionPhase::Idle);
    REQUIRE(stage.Controller().CompletedCount() == 1);
}

TEST_CASE("Replacing content runs the full sequence in order", "[transition][controller]") {
    TestContentDir dir;
    sh::core::Stage stage(MakeStageConfig(dir.root));
    Log log;

    auto menu = MakeLoggingNode("menu", log);
    REQUIRE(stage.Transition(AlreadyBuilt{menu}).IsCompleted());

    EventRecorder recorder(stage.Events(), log);
    log.clear();

    auto level = MakeLoggingNode("level", log);
    auto result = stage.Transition(AlreadyBuilt{level});

    // The cleanup frame and removal confirmation need real ticks.
    REQUIRE_FALSE(result.IsReady());
    REQUIRE(stage.Controller().GetPhase() == TransitionPhase::AwaitingCleanupFrame);
    REQUIRE_FALSE(menu->IsDestroyed());

    REQUIRE(TicksUntilDone(stage, 0.25f) == 2);
    REQUIRE(result.IsCompleted());
    REQUIRE(result.Get());

    REQUIRE(log == Log{"event:simulation.paused", "menu.teardown", "event:teardown-done",
                       "menu.destroyed", "level.setup", "event:setup-done",
                       "event:simulation.resumed", "level.start", "event:start-done"});
    REQUIRE(menu->IsDestroyed());
    REQUIRE(stage.Slot().GetActive() == level);
    REQUIRE(level->IsAttached());
    REQUIRE_FALSE(stage.Pause().IsPaused());
}

TEST_CASE("Setup receives the transition params", "[transition][controller]") {
    sh::core::Stage stage(MakeStageConfig({}));

    sh::content::ParamList received;
    auto node = std::make_shared<ContentNode>("level");
    node->SetSetupHook([&received](const sh::content::ParamList& params) {
        received = params;
        return sh::core::Task<void>::Resolved();
    });

    nlohmann::json options = {{"difficulty", "hard"}};
    auto result = stage.Transition(AlreadyBuilt{node}, sh::content::ParamList{options, nlohmann::json(2)});

    REQUIRE(result.IsCompleted());
    REQUIRE(received.size() == 2);
    REQUIRE(received[0]["difficulty"] == "hard");
    REQUIRE(received[1] == 2);
}

TEST_CASE("Fades bracket removal and the pause flag", "[transition][controller]") {
    sh::core::Stage stage(MakeStageConfig({}, 0.5));
    auto& gate = stage.Gate();
    auto& pause = stage.Pause();

    auto menu = std::make_shared<ContentNode>("menu");
    auto first = stage.Transition(AlreadyBuilt{menu});
    REQUIRE_FALSE(first.IsReady());
    TicksUntilDone(stage, 0.25f);
    REQUIRE(first.IsCompleted());
    REQUIRE_FALSE(pause.IsPaused());

    bool pausedDuringTeardown = false;
    float coverageAtTeardown = -1.0f;
    menu->SetTeardownHook([&]() {
        pausedDuringTeardown = pause.IsPaused();
        coverageAtTeardown = gate.GetCoverage();
        return sh::core::Task<void>::Resolved();
    });

    float coverageAtDestroy = -1.0f;
    bool fadePlayingAtDestroy = true;
    menu->SetDestroyCallback([&](ContentNode&) {
        coverageAtDestroy = gate.GetCoverage();
        fadePlayingAtDestroy = gate.IsPlaying();
    });

    bool fadePlayingAtResume = true;
    float coverageAtResume = -1.0f;
    sh::core::EventBus::ScopedSubscription onResume(
        stage.Events().Subscribe(sh::TransitionEvents::SimulationResumed, [&]() {
            fadePlayingAtResume = gate.IsPlaying();
            coverageAtResume = gate.GetCoverage();
        }));

    bool pausedAtStart = true;
    auto level = std::make_shared<ContentNode>("level");
    level->SetStartHook([&]() {
        pausedAtStart = pause.IsPaused();
        return sh::core::Task<void>::Resolved();
    });

    auto result = stage.Transition(AlreadyBuilt{level});
    std::vector<bool> pausedWhileCovered;
    while (stage.Controller().IsBusy()) {
        pausedWhileCovered.push_back(pause.IsPaused());
        stage.Tick(0.25f);
    }

    REQUIRE(result.IsCompleted());
    REQUIRE(pausedDuringTeardown);
    REQUIRE(coverageAtTeardown == Catch::Approx(0.0f));
    REQUIRE(coverageAtDestroy == Catch::Approx(1.0f));
    REQUIRE_FALSE(fadePlayingAtDestroy);
    REQUIRE_FALSE(fadePlayingAtResume);
    REQUIRE(coverageAtResume == Catch::Approx(0.0f));
    REQUIRE_FALSE(pausedAtStart);
    REQUIRE(std::all_of(pausedWhileCovered.begin(), pausedWhileCovered.end(), [](bool p) { return p; }));
}

TEST_CASE("Paused content is not advanced during a transition", "[transition][controller]") {
    sh::core::Stage stage(MakeStageConfig({}, 0.5));

    auto menu = std::make_shared<ContentNode>("menu");
    auto first = stage.Transition(AlreadyBuilt{menu});
    TicksUntilDone(stage, 0.25f);
    REQUIRE(first.IsCompleted());

    stage.Tick(0.25f);
    const auto updatesBefore = menu->GetUpdateCount();
    REQUIRE(updatesBefore == 1);

    auto result = stage.Transition(AlreadyBuilt{std::make_shared<ContentNode>("level")});
    TicksUntilDone(stage, 0.25f);

    REQUIRE(result.IsCompleted());
    REQUIRE(menu->GetUpdateCount() == updatesBefore);
}

TEST_CASE("Each hook is awaited before the pipeline moves on", "[transition][controller]") {
    sh::core::Stage stage(MakeStageConfig({}));
    auto& events = stage.Events();

    sh::core::TaskSource<void> teardown;
    auto menu = std::make_shared<ContentNode>("menu");
    menu->SetTeardownHook([&teardown]() { return teardown.GetTask(); });
    REQUIRE(stage.Transition(AlreadyBuilt{menu}).IsCompleted());

    sh::core::TaskSource<void> setup;
    bool started = false;
    auto level = std::make_shared<ContentNode>("level");
    level->SetSetupHook([&setup](const sh::content::ParamList&) { return setup.GetTask(); });
    level->SetStartHook([&started]() {
        started = true;
        return sh::core::Task<void>::Resolved();
    });

    auto result = stage.Transition(AlreadyBuilt{level});

    for (int i = 0; i < 10; ++i) {
        stage.Tick(0.25f);
    }
    REQUIRE(stage.Controller().GetPhase() == TransitionPhase::TearingDown);
    REQUIRE(events.EmitCount(sh::TransitionEvents::TeardownDone) == 0);
    REQUIRE_FALSE(menu->IsDestroyed());

    teardown.Complete();
    for (int i = 0; i < 10; ++i) {
        stage.Tick(0.25f);
    }
    REQUIRE(menu->IsDestroyed());
    REQUIRE(stage.Controller().GetPhase() == TransitionPhase::SettingUp);
    REQUIRE(stage.Slot().GetActive() == level);
    REQUIRE(events.EmitCount(sh::TransitionEvents::SetupDone) == 1);
    REQUIRE(stage.Pause().IsPaused());
    REQUIRE_FALSE(started);

    setup.Complete();
    stage.Tick(0.25f);
    REQUIRE(result.IsCompleted());
    REQUIRE(started);
    REQUIRE(events.EmitCount(sh::TransitionEvents::StartDone) == 2);
}

TEST_CASE("Absent hooks take as long as instant hooks", "[transition][controller]") {
    auto measure = [](bool withHooks) {
        sh::core::Stage stage(MakeStageConfig({}, 0.5));
        auto makeNode = [withHooks](const std::string& name) {
            auto node = std::make_shared<ContentNode>(name);
            if (withHooks) {
                node->SetTeardownHook([]() { return sh::core::Task<void>::Resolved(); });
                node->SetSetupHook([](const sh::content::ParamList&) { return sh::core::Task<void>::Resolved(); });
                node->SetStartHook([]() { return sh::core::Task<void>::Resolved(); });
            }
            return node;
        };

        std::vector<int> ticks;
        auto first = stage.Transition(AlreadyBuilt{makeNode("first")});
        ticks.push_back(TicksUntilDone(stage, 0.25f));
        auto second = stage.Transition(AlreadyBuilt{makeNode("second")});
        ticks.push_back(TicksUntilDone(stage, 0.25f));
        if (!first.IsCompleted() || !second.IsCompleted()) {
            ticks.push_back(-1);
        }
        return ticks;
    };

    const auto bare = measure(false);
    const auto instant = measure(true);

    REQUIRE(bare == instant);
    REQUIRE(bare[0] > 0);
    REQUIRE(bare[1] > bare[0]);
}

TEST_CASE("Identifier targets load through the address convention", "[transition][controller]") {
    TestContentDir dir;
    dir.WriteScene("menu", {{"name", "MainMenu"}, {"behaviour", "Menu"}});

    sh::core::Stage stage(MakeStageConfig(dir.root));
    bool setupCalled = false;
    std::size_t paramCount = 99;
    REQUIRE(stage.Behaviours().Register("Menu", [&](ContentNode& node) {
        node.SetSetupHook([&](const sh::content::ParamList& params) {
            setupCalled = true;
            paramCount = params.size();
            return sh::core::Task<void>::Resolved();
        });
    }));

    auto result = stage.Transition(sh::content::Identifier{"menu"}, {});
    REQUIRE_FALSE(result.IsReady());
    REQUIRE(stage.Controller().GetPhase() == TransitionPhase::Loading);
    REQUIRE(stage.Pause().IsPaused());

    REQUIRE(TickUntilIdle(stage));
    REQUIRE(result.IsCompleted());
    REQUIRE(result.Get());

    const auto& active = stage.Slot().GetActive();
    REQUIRE(active);
    REQUIRE(active->GetName() == "MainMenu");
    REQUIRE(active->GetAddress() == "res://scenes/menu/scene.json");
    REQUIRE(setupCalled);
    REQUIRE(paramCount == 0);
    REQUIRE(stage.Events().EmitCount(sh::TransitionEvents::TeardownDone) == 0);
    REQUIRE(stage.Events().EmitCount(sh::TransitionEvents::StartDone) == 1);
    REQUIRE_FALSE(stage.Pause().IsPaused());
}

TEST_CASE("Template targets instantiate without waiting", "[transition][controller]") {
    sh::core::Stage stage(MakeStageConfig({}));
    auto resource = std::make_shared<sh::content::ContentTemplate>(
        "Credits", "", nlohmann::json{{"scroll", 12}});

    auto result = stage.Transition(sh::content::Template{resource});

    REQUIRE(result.IsCompleted());
    REQUIRE(stage.Slot().GetActive()->GetName() == "Credits");
    REQUIRE(stage.Slot().GetActive()->Properties()["scroll"] == 12);
}

TEST_CASE("A failed load is reported and leaves nothing half attached", "[transition][controller]") {
    TestContentDir dir;
    sh::core::Stage stage(MakeStageConfig(dir.root));

    auto menu = std::make_shared<ContentNode>("menu");
    REQUIRE(stage.Transition(AlreadyBuilt{menu}).IsCompleted());

    auto result = stage.Transition(sh::content::Identifier{"missing"});
    REQUIRE(TickUntilIdle(stage));

    REQUIRE(result.IsFailed());
    try {
        result.Get();
        FAIL("expected a ContentLoadError");
    } catch (const sh::core::ContentLoadError& e) {
        REQUIRE(e.address() == "res://scenes/missing/scene.json");
    }

    REQUIRE(menu->IsDestroyed());
    REQUIRE_FALSE(stage.Slot().IsOccupied());
    REQUIRE(stage.Pause().IsPaused());
    REQUIRE(stage.Controller().GetPhase() == TransitionPhase::Idle);
    REQUIRE(stage.Controller().FailedCount() == 1);
    REQUIRE(stage.Events().EmitCount(sh::TransitionEvents::TransitionFailed) == 1);
    REQUIRE(stage.Events().EmitCount(sh::TransitionEvents::SetupDone) == 1);

    // The controller accepts a new transition afterwards.
    auto recovery = stage.Transition(AlreadyBuilt{std::make_shared<ContentNode>("fallback")});
    REQUIRE(recovery.IsCompleted());
    REQUIRE(stage.Slot().GetActive()->GetName() == "fallback");
    REQUIRE_FALSE(stage.Pause().IsPaused());
}

TEST_CASE("Hook failures surface as HookError", "[transition][controller]") {
    sh::core::Stage stage(MakeStageConfig({}));

    SECTION("setup throws") {
        auto node = std::make_shared<ContentNode>("broken");
        node->SetSetupHook([](const sh::content::ParamList&) -> sh::core::Task<void> {
            throw std::runtime_error("no save data");
        });

        auto result = stage.Transition(AlreadyBuilt{node});

        REQUIRE(result.IsFailed());
        try {
            result.Get();
            FAIL("expected a HookError");
        } catch (const sh::core::HookError& e) {
            REQUIRE(e.hook() == "setup");
            REQUIRE(e.nodeName() == "broken");
            REQUIRE(e.details() == "no save data");
        }
        REQUIRE(stage.Slot().GetActive() == node);
        REQUIRE(stage.Pause().IsPaused());
        REQUIRE_FALSE(stage.Controller().IsBusy());
        REQUIRE(stage.Events().EmitCount(sh::TransitionEvents::SetupDone) == 0);
    }

    SECTION("teardown task fails") {
        sh::core::TaskSource<void> teardown;
        auto menu = std::make_shared<ContentNode>("menu");
        menu->SetTeardownHook([&teardown]() { return teardown.GetTask(); });
        REQUIRE(stage.Transition(AlreadyBuilt{menu}).IsCompleted());

        auto result = stage.Transition(AlreadyBuilt{std::make_shared<ContentNode>("level")});
        teardown.Fail(std::make_exception_ptr(std::runtime_error("autosave failed")));
        stage.Tick(0.25f);

        REQUIRE(result.IsFailed());
        REQUIRE_THROWS_AS(result.Get(), sh::core::HookError);
        REQUIRE(stage.Slot().GetActive() == menu);
        REQUIRE_FALSE(menu->IsDestroyed());
        REQUIRE(stage.Events().EmitCount(sh::TransitionEvents::TeardownDone) == 0);
        REQUIRE(stage.Events().EmitCount(sh::TransitionEvents::TransitionFailed) == 1);
    }
}

TEST_CASE("A second transition is rejected while one is in flight", "[transition][controller]") {
    sh::core::Stage stage(MakeStageConfig({}));

    sh::core::TaskSource<void> teardown;
    auto menu = std::make_shared<ContentNode>("menu");
    menu->SetTeardownHook([&teardown]() { return teardown.GetTask(); });
    REQUIRE(stage.Transition(AlreadyBuilt{menu}).IsCompleted());

    auto level = std::make_shared<ContentNode>("level");
    auto first = stage.Transition(AlreadyBuilt{level});
    auto second = stage.Transition(AlreadyBuilt{std::make_shared<ContentNode>("intruder")});

    REQUIRE(second.IsFailed());
    REQUIRE_THROWS_AS(second.Get(), sh::core::TransitionBusyError);
    REQUIRE(stage.Controller().GetPhase() == TransitionPhase::TearingDown);

    teardown.Complete();
    TicksUntilDone(stage, 0.25f);

    REQUIRE(first.IsCompleted());
    REQUIRE(stage.Slot().GetActive() == level);
    REQUIRE(stage.Events().EmitCount(sh::TransitionEvents::TransitionFailed) == 0);
}

TEST_CASE("Content that requests a transition from its update still gets a cleanup frame",
          "[transition][controller]") {
    sh::core::Stage stage(MakeStageConfig({}));

    auto menu = std::make_shared<ContentNode>("menu");
    REQUIRE(stage.Transition(AlreadyBuilt{menu}).IsCompleted());

    auto level = std::make_shared<ContentNode>("level");
    sh::core::Task<bool> result;
    menu->SetUpdateCallback([&stage, &level, &result](ContentNode&, float) {
        if (!result.IsValid()) {
            result = stage.Transition(AlreadyBuilt{level});
        }
    });

    std::uint64_t teardownFrame = 0;
    std::uint64_t destroyFrame = 0;
    sh::core::EventBus::ScopedSubscription onTeardown(
        stage.Events().Subscribe(sh::TransitionEvents::TeardownDone,
                                 [&]() { teardownFrame = stage.GetFrameCount(); }));
    menu->SetDestroyCallback([&](ContentNode&) { destroyFrame = stage.GetFrameCount(); });

    stage.Tick(0.25f);
    REQUIRE(result.IsValid());
    REQUIRE(teardownFrame == stage.GetFrameCount());
    REQUIRE(stage.Controller().GetPhase() == TransitionPhase::AwaitingCleanupFrame);
    REQUIRE_FALSE(menu->IsDestroyed());

    TicksUntilDone(stage, 0.25f);
    REQUIRE(result.IsCompleted());
    REQUIRE(destroyFrame == teardownFrame + 1);
    REQUIRE(stage.Slot().GetActive() == level);
}

TEST_CASE("A hook throwing a non-standard exception leaves the controller usable",
          "[transition][controller]") {
    sh::core::Stage stage(MakeStageConfig({}));

    auto broken = std::make_shared<ContentNode>("broken");
    broken->SetSetupHook([](const sh::content::ParamList&) -> sh::core::Task<void> { throw 42; });

    auto result = stage.Transition(AlreadyBuilt{broken});
    REQUIRE(result.IsFailed());
    try {
        result.Get();
        FAIL("expected a HookError");
    } catch (const sh::core::HookError& e) {
        REQUIRE(e.hook() == "setup");
        REQUIRE(e.nodeName() == "broken");
        REQUIRE(e.details() == "non-standard exception");
    }
    REQUIRE_FALSE(stage.Controller().IsBusy());

    auto recovery = stage.Transition(AlreadyBuilt{std::make_shared<ContentNode>("fallback")});
    TicksUntilDone(stage, 0.25f);

    REQUIRE(recovery.IsCompleted());
    REQUIRE(broken->IsDestroyed());
    REQUIRE(stage.Slot().GetActive()->GetName() == "fallback");
    REQUIRE_FALSE(stage.Pause().IsPaused());
}

TEST_CASE("Transitioning to the active node destroys it and fails the attach", "[transition][controller]") {
    sh::core::Stage stage(MakeStageConfig({}));
    Log log;

    auto menu = MakeLoggingNode("menu", log);
    REQUIRE(stage.Transition(AlreadyBuilt{menu}).IsCompleted());
    log.clear();

    auto result = stage.Transition(AlreadyBuilt{menu});
    TicksUntilDone(stage, 0.25f);

    REQUIRE(result.IsFailed());
    REQUIRE_THROWS_AS(result.Get(), sh::core::ContentLoadError);
    REQUIRE(log == Log{"menu.teardown", "menu.destroyed"});
    REQUIRE(menu->IsDestroyed());
    REQUIRE_FALSE(stage.Slot().IsOccupied());
    REQUIRE(stage.Pause().IsPaused());
    REQUIRE(stage.Controller().GetPhase() == TransitionPhase::Idle);
    REQUIRE(stage.Events().EmitCount(sh::TransitionEvents::TeardownDone) == 1);
    REQUIRE(stage.Events().EmitCount(sh::TransitionEvents::TransitionFailed) == 1);
}

TEST_CASE("Transition phases have readable names", "[transition][controller]") {
    REQUIRE(std::string(sh::transition::ToString(TransitionPhase::AwaitingRemoval)) == "awaiting-removal");
    REQUIRE(std::string(sh::transition::ToString(TransitionPhase::Idle)) == "idle");
}
