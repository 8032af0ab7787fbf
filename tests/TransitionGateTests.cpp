#include "sh/transition/TransitionGate.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace {

sh::transition::TransitionAsset Fade(double seconds) {
    sh::transition::TransitionAsset asset;
    asset.name = "fade";
    asset.durationSeconds = seconds;
    asset.color = glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
    return asset;
}

} // namespace

TEST_CASE("TransitionGate covers then uncovers over its duration", "[transition][gate]") {
    sh::transition::TransitionGate gate(Fade(1.0));

    auto out = gate.PlayOut();
    REQUIRE(gate.IsPlaying());
    REQUIRE(gate.GetCoverage() == Catch::Approx(0.0f));

    gate.Update(0.5f);
    REQUIRE_FALSE(out.IsReady());
    REQUIRE(gate.GetCoverage() == Catch::Approx(0.5f));
    REQUIRE(gate.GetOverlayColor().a == Catch::Approx(0.5f));

    gate.Update(0.5f);
    REQUIRE(out.IsCompleted());
    REQUIRE_FALSE(gate.IsPlaying());
    REQUIRE(gate.GetCoverage() == Catch::Approx(1.0f));

    auto in = gate.PlayIn();
    gate.Update(0.25f);
    REQUIRE(gate.GetCoverage() == Catch::Approx(0.75f));
    gate.Update(2.0f);
    REQUIRE(in.IsCompleted());
    REQUIRE(gate.GetCoverage() == Catch::Approx(0.0f));
}

TEST_CASE("TransitionGate with zero duration finishes immediately", "[transition][gate]") {
    sh::transition::TransitionGate gate(Fade(0.0));

    REQUIRE(gate.PlayOut().IsCompleted());
    REQUIRE(gate.GetCoverage() == Catch::Approx(1.0f));
    REQUIRE(gate.PlayIn().IsCompleted());
    REQUIRE(gate.GetCoverage() == Catch::Approx(0.0f));
}

TEST_CASE("TransitionGate finishes an interrupted run", "[transition][gate]") {
    sh::transition::TransitionGate gate(Fade(1.0));

    auto out = gate.PlayOut();
    gate.Update(0.25f);
    auto in = gate.PlayIn();

    REQUIRE(out.IsCompleted());
    REQUIRE_FALSE(in.IsReady());
    REQUIRE(gate.GetDirection() == sh::transition::TransitionGate::Direction::In);
}
