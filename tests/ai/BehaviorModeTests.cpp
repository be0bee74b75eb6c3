/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE BehaviorModeTests
#include <boost/test/unit_test.hpp>

#include "ai/BehaviorMode.hpp"
#include "ai/pathfinding/NavGrid.hpp"
#include "collisions/AABB.hpp"
#include "entities/Agent.hpp"
#include <cmath>
#include <sstream>
#include <vector>

using namespace Nightfall;

namespace {

constexpr float CELL = 10.0f;

AABB cellBlocker(int x, int y) {
    return AABB::fromRect(x * CELL + 1.0f, y * CELL + 1.0f, CELL - 2.0f, CELL - 2.0f);
}

NavGrid gridWithBlocked(int cols, int rows, const std::vector<GridCell>& blocked) {
    std::vector<AABB> obstacles;
    for (const auto& c : blocked) {
        obstacles.push_back(cellBlocker(c.x, c.y));
    }
    return NavGrid::build(cols * CELL, rows * CELL, CELL, obstacles, 0);
}

Agent makeAgent() {
    return Agent(1, Vector2D(50.0f, 50.0f), CollisionShape::box(8.0f, 8.0f));
}

} // namespace

BOOST_AUTO_TEST_SUITE(ModeTransitionTests)

BOOST_AUTO_TEST_CASE(NightBeginHaltsEveryMode) {
    BOOST_CHECK(transitionOnSignal(BehaviorMode::CHASE, DayNightSignal::NIGHT_BEGIN) == BehaviorMode::HALT);
    BOOST_CHECK(transitionOnSignal(BehaviorMode::FLEE, DayNightSignal::NIGHT_BEGIN) == BehaviorMode::HALT);
    BOOST_CHECK(transitionOnSignal(BehaviorMode::HALT, DayNightSignal::NIGHT_BEGIN) == BehaviorMode::HALT);
}

BOOST_AUTO_TEST_CASE(HaltWindowOnlyReleasesHalt) {
    BOOST_CHECK(transitionOnSignal(BehaviorMode::HALT, DayNightSignal::HALT_WINDOW_ELAPSED) == BehaviorMode::FLEE);
    BOOST_CHECK(transitionOnSignal(BehaviorMode::CHASE, DayNightSignal::HALT_WINDOW_ELAPSED) == BehaviorMode::CHASE);
    BOOST_CHECK(transitionOnSignal(BehaviorMode::FLEE, DayNightSignal::HALT_WINDOW_ELAPSED) == BehaviorMode::FLEE);
}

BOOST_AUTO_TEST_CASE(DayBeginChasesFromEveryMode) {
    BOOST_CHECK(transitionOnSignal(BehaviorMode::HALT, DayNightSignal::DAY_BEGIN) == BehaviorMode::CHASE);
    BOOST_CHECK(transitionOnSignal(BehaviorMode::FLEE, DayNightSignal::DAY_BEGIN) == BehaviorMode::CHASE);
    BOOST_CHECK(transitionOnSignal(BehaviorMode::CHASE, DayNightSignal::DAY_BEGIN) == BehaviorMode::CHASE);
}

BOOST_AUTO_TEST_CASE(NamesForLogging) {
    std::ostringstream os;
    os << BehaviorMode::FLEE << " " << DayNightSignal::HALT_WINDOW_ELAPSED << " " << Facing::LEFT;
    BOOST_CHECK_EQUAL(os.str(), "flee halt-window-elapsed left");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(GoalSelectionTests)

BOOST_AUTO_TEST_CASE(ChaseTargetsPlayerCell) {
    NavGrid grid = gridWithBlocked(10, 10, {});
    auto goal = selectGoal(BehaviorMode::CHASE, GridCell{1, 1}, GridCell{7, 3}, grid);
    BOOST_REQUIRE(goal.has_value());
    BOOST_CHECK_EQUAL(*goal, (GridCell{7, 3}));
}

BOOST_AUTO_TEST_CASE(HaltHasNoGoal) {
    NavGrid grid = gridWithBlocked(10, 10, {});
    BOOST_CHECK(!selectGoal(BehaviorMode::HALT, GridCell{1, 1}, GridCell{7, 3}, grid).has_value());
}

BOOST_AUTO_TEST_CASE(FleeMirrorsAwayFromPlayer) {
    NavGrid grid = gridWithBlocked(10, 10, {});
    auto goal = selectGoal(BehaviorMode::FLEE, GridCell{5, 5}, GridCell{3, 4}, grid);
    BOOST_REQUIRE(goal.has_value());
    BOOST_CHECK_EQUAL(*goal, (GridCell{7, 6}));
}

BOOST_AUTO_TEST_CASE(FleeGoalIsClampedToGrid) {
    NavGrid grid = gridWithBlocked(10, 10, {});
    auto goal = selectGoal(BehaviorMode::FLEE, GridCell{8, 1}, GridCell{4, 5}, grid);
    BOOST_REQUIRE(goal.has_value());
    BOOST_CHECK_EQUAL(*goal, (GridCell{9, 0}));
}

BOOST_AUTO_TEST_CASE(BlockedFleeGoalFallsBackToFarthestCorner) {
    // Mirror of (5,5) around (3,5) is (7,5)
    NavGrid grid = gridWithBlocked(10, 10, {GridCell{7, 5}});
    auto goal = selectGoal(BehaviorMode::FLEE, GridCell{5, 5}, GridCell{3, 5}, grid);
    BOOST_REQUIRE(goal.has_value());
    BOOST_CHECK_EQUAL(*goal, (GridCell{9, 0}));
}

BOOST_AUTO_TEST_CASE(EqualCornerDistancesPickFirstCorner) {
    // Player row 5 of 11 rows: (9,0) and (9,10) are equally far
    NavGrid grid = gridWithBlocked(10, 11, {GridCell{7, 5}});
    auto goal = selectGoal(BehaviorMode::FLEE, GridCell{5, 5}, GridCell{3, 5}, grid);
    BOOST_REQUIRE(goal.has_value());
    BOOST_CHECK_EQUAL(*goal, (GridCell{9, 0}));
}

BOOST_AUTO_TEST_CASE(BlockedCornersAreSkipped) {
    NavGrid grid = gridWithBlocked(10, 10, {GridCell{7, 5}, GridCell{9, 0}});
    auto goal = selectGoal(BehaviorMode::FLEE, GridCell{5, 5}, GridCell{3, 5}, grid);
    BOOST_REQUIRE(goal.has_value());
    BOOST_CHECK_EQUAL(*goal, (GridCell{9, 9}));
}

BOOST_AUTO_TEST_CASE(NoFreeCornerMeansNoGoal) {
    NavGrid grid = gridWithBlocked(10, 10, {GridCell{7, 5}, GridCell{0, 0}, GridCell{9, 0},
                                            GridCell{0, 9}, GridCell{9, 9}});
    BOOST_CHECK(!selectGoal(BehaviorMode::FLEE, GridCell{5, 5}, GridCell{3, 5}, grid).has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(FacingTests)

BOOST_AUTO_TEST_CASE(DominantAxisWins) {
    BOOST_CHECK(facingFromVector(Vector2D(5.0f, 1.0f)) == Facing::RIGHT);
    BOOST_CHECK(facingFromVector(Vector2D(-5.0f, 1.0f)) == Facing::LEFT);
    BOOST_CHECK(facingFromVector(Vector2D(1.0f, 5.0f)) == Facing::DOWN);
    BOOST_CHECK(facingFromVector(Vector2D(1.0f, -5.0f)) == Facing::UP);
}

BOOST_AUTO_TEST_CASE(TiesAndZeroFaceVertically) {
    BOOST_CHECK(facingFromVector(Vector2D(3.0f, -3.0f)) == Facing::UP);
    BOOST_CHECK(facingFromVector(Vector2D(0.0f, 0.0f)) == Facing::DOWN);
}

BOOST_AUTO_TEST_CASE(AnimationKeys) {
    BOOST_CHECK_EQUAL(animationKey(BehaviorMode::HALT, Facing::LEFT, true), "halt");
    BOOST_CHECK_EQUAL(animationKey(BehaviorMode::CHASE, Facing::LEFT, true), "run_left");
    BOOST_CHECK_EQUAL(animationKey(BehaviorMode::FLEE, Facing::UP, false), "idle_up");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(AgentModeTests)

BOOST_AUTO_TEST_CASE(NewAgentChasesWithImmediateSearch) {
    Agent agent = makeAgent();
    BOOST_CHECK(agent.getMode() == BehaviorMode::CHASE);
    BOOST_CHECK_EQUAL(agent.getLastRecalc(), Agent::NEVER_RECALCULATED);
    BOOST_CHECK(!agent.isHit());
    BOOST_CHECK(!agent.hasActiveWaypoint());
}

BOOST_AUTO_TEST_CASE(EnteringFleeResetsPathState) {
    Agent agent = makeAgent();
    agent.setPath({Vector2D(60.0f, 50.0f), Vector2D(70.0f, 50.0f)});
    agent.setLastRecalc(12.0f);

    BOOST_CHECK(agent.applySignal(DayNightSignal::NIGHT_BEGIN));
    BOOST_CHECK(agent.getMode() == BehaviorMode::HALT);
    // Halting keeps the throttle timestamp
    BOOST_CHECK_EQUAL(agent.getLastRecalc(), 12.0f);

    BOOST_CHECK(agent.applySignal(DayNightSignal::HALT_WINDOW_ELAPSED));
    BOOST_CHECK(agent.getMode() == BehaviorMode::FLEE);
    BOOST_CHECK_EQUAL(agent.getLastRecalc(), Agent::NEVER_RECALCULATED);
    BOOST_CHECK(agent.getWaypoints().empty());
    BOOST_CHECK_EQUAL(agent.getCursor(), 0u);
}

BOOST_AUTO_TEST_CASE(RepeatedSignalReportsNoChange) {
    Agent agent = makeAgent();
    BOOST_CHECK(!agent.applySignal(DayNightSignal::DAY_BEGIN));
    BOOST_CHECK(!agent.applySignal(DayNightSignal::HALT_WINDOW_ELAPSED));
}

BOOST_AUTO_TEST_CASE(OnlyFleeingAgentsCanBeCaught) {
    Agent agent = makeAgent();
    BOOST_CHECK(!agent.markCaught(1.0f));

    agent.applySignal(DayNightSignal::NIGHT_BEGIN);
    BOOST_CHECK(!agent.markCaught(1.0f));

    agent.applySignal(DayNightSignal::HALT_WINDOW_ELAPSED);
    agent.setVelocity(Vector2D(100.0f, 0.0f));
    agent.setPath({Vector2D(60.0f, 50.0f)});
    BOOST_CHECK(agent.markCaught(2.0f));
    BOOST_CHECK(agent.isHit());
    BOOST_CHECK_EQUAL(agent.getHitTime(), 2.0f);
    BOOST_CHECK_EQUAL(agent.getVelocity(), Vector2D(0.0f, 0.0f));
    BOOST_CHECK(!agent.hasActiveWaypoint());

    // A second catch is ignored
    BOOST_CHECK(!agent.markCaught(3.0f));
    BOOST_CHECK_EQUAL(agent.getHitTime(), 2.0f);
}

BOOST_AUTO_TEST_CASE(CaughtAgentsIgnoreSignals) {
    Agent agent = makeAgent();
    agent.applySignal(DayNightSignal::NIGHT_BEGIN);
    agent.applySignal(DayNightSignal::HALT_WINDOW_ELAPSED);
    agent.markCaught(5.0f);

    BOOST_CHECK(!agent.applySignal(DayNightSignal::DAY_BEGIN));
    BOOST_CHECK(agent.getMode() == BehaviorMode::FLEE);
}

BOOST_AUTO_TEST_CASE(DespawnAfterDelay) {
    Agent agent = makeAgent();
    BOOST_CHECK(!agent.despawnDue(100.0f, 0.7f));

    agent.applySignal(DayNightSignal::NIGHT_BEGIN);
    agent.applySignal(DayNightSignal::HALT_WINDOW_ELAPSED);
    agent.markCaught(10.0f);
    BOOST_CHECK(!agent.despawnDue(10.5f, 0.7f));
    BOOST_CHECK(agent.despawnDue(10.75f, 0.7f));
}

BOOST_AUTO_TEST_CASE(FacingOnlyFollowsRunningVelocity) {
    Agent agent = makeAgent();
    agent.setVelocity(Vector2D(-3.0f, 0.0f));
    agent.updateFacing();
    BOOST_CHECK(agent.getFacing() == Facing::DOWN);
    BOOST_CHECK_EQUAL(agent.getAnimationKey(), "idle_down");

    agent.setVelocity(Vector2D(-80.0f, 10.0f));
    agent.updateFacing();
    BOOST_CHECK(agent.getFacing() == Facing::LEFT);
    BOOST_CHECK_EQUAL(agent.getAnimationKey(), "run_left");
}

BOOST_AUTO_TEST_CASE(RandomUnitVectorIsUnitLengthAndSeededById) {
    Agent a(7, Vector2D(0.0f, 0.0f), CollisionShape::box(1.0f, 1.0f));
    Agent b(7, Vector2D(5.0f, 5.0f), CollisionShape::box(1.0f, 1.0f));
    Vector2D va = a.randomUnitVector();
    Vector2D vb = b.randomUnitVector();
    BOOST_CHECK_CLOSE(va.length(), 1.0f, 0.01f);
    BOOST_CHECK_EQUAL(va, vb);
}

BOOST_AUTO_TEST_SUITE_END()
