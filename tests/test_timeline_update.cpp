/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "timeline.hpp"
#include "tween.hpp"
#include "tween_test_target.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace twl::tween;
using namespace twl::tween::test;

class TimelineUpdateTest : public ::testing::Test {
protected:
    // A: x 0 -> 100 over 500ms, then B: y 1 -> 51 over 300ms
    Timeline& makeSequence() {
        return Timeline::createSequence()
            .push(Tween::to(target_, POS_X, 500).target(100.0f).ease(EasingType::LINEAR))
            .push(Tween::to(target_, POS_Y, 300).target(51.0f).ease(EasingType::LINEAR));
    }

    TestTarget target_;
};

// ============================================================================
// Forward playback
// ============================================================================

TEST_F(TimelineUpdateTest, SequencePlaysChildrenOneAfterAnother) {
    Timeline& root = makeSequence().start();

    root.update(250);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);
    EXPECT_FLOAT_EQ(target_.y(), 1.0f);

    root.update(400);
    EXPECT_FLOAT_EQ(target_.x(), 100.0f);
    EXPECT_FLOAT_EQ(target_.y(), 26.0f);

    root.update(150);
    EXPECT_FLOAT_EQ(target_.y(), 51.0f);
    EXPECT_TRUE(root.isFinished());

    root.free();
}

TEST_F(TimelineUpdateTest, ParallelPlaysChildrenTogether) {
    Timeline& root = Timeline::createParallel()
                         .push(Tween::to(target_, POS_X, 100).target(100.0f).ease(EasingType::LINEAR))
                         .push(Tween::to(target_, POS_Y, 200).target(51.0f).ease(EasingType::LINEAR))
                         .start();

    root.update(100);
    EXPECT_FLOAT_EQ(target_.x(), 100.0f);
    EXPECT_FLOAT_EQ(target_.y(), 26.0f);
    EXPECT_FALSE(root.isFinished());

    root.update(100);
    EXPECT_FLOAT_EQ(target_.y(), 51.0f);
    EXPECT_TRUE(root.isFinished());

    root.free();
}

TEST_F(TimelineUpdateTest, LargeDeltaSkipsToEndValues) {
    Timeline& root = makeSequence().start();

    root.update(10000);

    EXPECT_FLOAT_EQ(target_.x(), 100.0f);
    EXPECT_FLOAT_EQ(target_.y(), 51.0f);
    EXPECT_TRUE(root.isFinished());

    root.free();
}

TEST_F(TimelineUpdateTest, RootDelayHoldsChildren) {
    Timeline& root = makeSequence().delay(100).start();

    root.update(50);
    EXPECT_FALSE(root.isInitialized());
    EXPECT_FLOAT_EQ(target_.x(), 0.0f);

    root.update(100);
    EXPECT_TRUE(root.isInitialized());
    EXPECT_FLOAT_EQ(target_.x(), 10.0f);

    root.free();
}

TEST_F(TimelineUpdateTest, PausedTimelineIgnoresUpdates) {
    Timeline& root = makeSequence().start();

    root.update(100);
    root.pause();
    root.update(200);
    EXPECT_FLOAT_EQ(target_.x(), 20.0f);

    root.resume();
    root.update(100);
    EXPECT_FLOAT_EQ(target_.x(), 40.0f);

    root.free();
}

TEST_F(TimelineUpdateTest, UnstartedTimelineDoesNothing) {
    Timeline& root = makeSequence();

    root.update(300);

    EXPECT_FALSE(root.isStarted());
    EXPECT_EQ(target_.writes(), 0);

    root.free();
}

// ============================================================================
// Rewind and time symmetry
// ============================================================================

TEST_F(TimelineUpdateTest, RewindRestoresStartValues) {
    Timeline& root = makeSequence().start();

    root.update(250);
    root.update(400);
    root.update(-650);

    EXPECT_FLOAT_EQ(target_.x(), 0.0f);
    EXPECT_FLOAT_EQ(target_.y(), 1.0f);
    EXPECT_TRUE(root.isFinished());

    root.free();
}

TEST_F(TimelineUpdateTest, RewindFromPastTheEndRestoresStartValues) {
    Timeline& root = makeSequence().start();

    root.update(900);
    root.update(-900);

    EXPECT_FLOAT_EQ(target_.x(), 0.0f);
    EXPECT_FLOAT_EQ(target_.y(), 1.0f);

    root.free();
}

TEST_F(TimelineUpdateTest, ScrubbingIsSymmetric) {
    Timeline& root = makeSequence().start();

    const std::vector<int> steps = {120, 75, 310, 95, 140};
    std::vector<std::pair<float, float>> forward_states;
    forward_states.emplace_back(target_.x(), target_.y());
    for (const int step : steps) {
        root.update(step);
        forward_states.emplace_back(target_.x(), target_.y());
    }

    // Stepping back by the same deltas lands on the same values
    for (size_t i = steps.size(); i-- > 1;) {
        root.update(-steps[i]);
        EXPECT_FLOAT_EQ(target_.x(), forward_states[i].first) << "step " << i;
        EXPECT_FLOAT_EQ(target_.y(), forward_states[i].second) << "step " << i;
    }

    root.free();
}

TEST_F(TimelineUpdateTest, ReplayAfterRewindMatchesFirstPlay) {
    Timeline& root = makeSequence().start();

    root.update(650);
    const float x = target_.x();
    const float y = target_.y();

    root.update(-650);
    root.update(650);

    EXPECT_FLOAT_EQ(target_.x(), x);
    EXPECT_FLOAT_EQ(target_.y(), y);

    root.free();
}

// ============================================================================
// Repeat and yoyo
// ============================================================================

TEST_F(TimelineUpdateTest, RepeatRestartsChildrenFromStartValues) {
    Timeline& root = Timeline::createSequence()
                         .push(Tween::to(target_, POS_X, 100).target(100.0f).ease(EasingType::LINEAR))
                         .repeat(1, 0)
                         .start();

    root.update(150);
    EXPECT_EQ(root.getIteration(), 2);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);

    root.update(50);
    EXPECT_FLOAT_EQ(target_.x(), 100.0f);
    EXPECT_TRUE(root.isFinished());

    root.free();
}

TEST_F(TimelineUpdateTest, RepeatRewindsAcrossIterations) {
    Timeline& root = Timeline::createSequence()
                         .push(Tween::to(target_, POS_X, 100).target(100.0f).ease(EasingType::LINEAR))
                         .repeat(1, 0)
                         .start();

    root.update(150);
    root.update(-75);
    EXPECT_FLOAT_EQ(target_.x(), 75.0f);

    root.update(-75);
    EXPECT_FLOAT_EQ(target_.x(), 0.0f);
    EXPECT_TRUE(root.isFinished());

    root.free();
}

TEST_F(TimelineUpdateTest, RepeatDelayHoldsEndValues) {
    Timeline& root = Timeline::createSequence()
                         .push(Tween::to(target_, POS_X, 100).target(100.0f).ease(EasingType::LINEAR))
                         .repeat(1, 200)
                         .start();

    root.update(200);
    EXPECT_EQ(root.getIteration(), 1);
    EXPECT_FLOAT_EQ(target_.x(), 100.0f);

    root.update(150);
    EXPECT_EQ(root.getIteration(), 2);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);

    root.free();
}

TEST_F(TimelineUpdateTest, RewindIntoRepeatDelayHoldsStartValues) {
    Timeline& root = Timeline::createSequence()
                         .push(Tween::to(target_, POS_X, 100).target(100.0f).ease(EasingType::LINEAR))
                         .repeat(1, 100)
                         .start();

    root.update(150);
    EXPECT_FLOAT_EQ(target_.x(), 100.0f);
    root.update(100);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);

    // Leaving the second pass backwards forces its start values
    root.update(-100);
    EXPECT_EQ(root.getIteration(), 1);
    EXPECT_FLOAT_EQ(target_.x(), 0.0f);

    root.update(-100);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);

    root.free();
}

TEST_F(TimelineUpdateTest, RestartKeepsEarliestStartOnSharedTarget) {
    Timeline& root = Timeline::createSequence()
                         .push(Tween::to(target_, POS_X, 100).target(100.0f).ease(EasingType::LINEAR).delay(50))
                         .push(Tween::to(target_, POS_X, 100).target(200.0f).ease(EasingType::LINEAR))
                         .repeat(1, 0)
                         .start();
    EXPECT_EQ(root.getDuration(), 250);

    // B restores 100 first, then A restores 0
    root.update(250);
    EXPECT_EQ(root.getIteration(), 2);
    EXPECT_FLOAT_EQ(target_.x(), 0.0f);

    root.update(25);
    EXPECT_FLOAT_EQ(target_.x(), 0.0f);

    root.update(75);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);

    root.free();
}

TEST_F(TimelineUpdateTest, NestedRepeatReplaysInsideEachParentPass) {
    Timeline& root = Timeline::createSequence()
                         .push(Timeline::createSequence()
                                   .push(Tween::to(target_, POS_X, 100).target(100.0f).ease(EasingType::LINEAR))
                                   .repeat(1, 0))
                         .repeat(1, 0)
                         .start();
    EXPECT_EQ(root.getDuration(), 200);
    EXPECT_EQ(root.getFullDuration(), 400);

    root.update(150);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);

    root.update(100);
    EXPECT_EQ(root.getIteration(), 2);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);

    root.update(100);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);

    root.update(-350);
    EXPECT_FLOAT_EQ(target_.x(), 0.0f);

    root.free();
}

TEST_F(TimelineUpdateTest, NestedYoyoUnderYoyoParentIsSymmetric) {
    Timeline& root = Timeline::createSequence()
                         .push(Timeline::createSequence()
                                   .push(Tween::to(target_, POS_X, 100).target(100.0f).ease(EasingType::LINEAR))
                                   .repeatYoyo(1, 0))
                         .repeatYoyo(1, 0)
                         .start();

    const std::vector<int> steps = {50, 75, 90, 60, 100};
    std::vector<float> forward_states;
    forward_states.push_back(target_.x());
    for (const int step : steps) {
        root.update(step);
        forward_states.push_back(target_.x());
    }
    EXPECT_FLOAT_EQ(forward_states[1], 50.0f);
    EXPECT_FLOAT_EQ(forward_states[2], 75.0f);
    EXPECT_FLOAT_EQ(forward_states[4], 75.0f);

    for (size_t i = steps.size(); i-- > 1;) {
        root.update(-steps[i]);
        EXPECT_FLOAT_EQ(target_.x(), forward_states[i]) << "step " << i;
    }

    root.update(-steps[0]);
    EXPECT_FLOAT_EQ(target_.x(), 0.0f);

    root.free();
}

TEST_F(TimelineUpdateTest, YoyoPlaysSecondPassBackwards) {
    Timeline& root = Timeline::createSequence()
                         .push(Tween::to(target_, POS_X, 100).target(100.0f).ease(EasingType::LINEAR))
                         .repeatYoyo(1, 0)
                         .start();

    root.update(100);
    EXPECT_FLOAT_EQ(target_.x(), 100.0f);

    root.update(25);
    EXPECT_FLOAT_EQ(target_.x(), 75.0f);

    root.update(75);
    EXPECT_FLOAT_EQ(target_.x(), 0.0f);
    EXPECT_TRUE(root.isFinished());

    root.free();
}

TEST_F(TimelineUpdateTest, YoyoRewindIsSymmetric) {
    Timeline& root = Timeline::createSequence()
                         .push(Tween::to(target_, POS_X, 100).target(100.0f).ease(EasingType::LINEAR))
                         .repeatYoyo(1, 0)
                         .start();

    root.update(150);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);

    root.update(-75);
    EXPECT_FLOAT_EQ(target_.x(), 75.0f);

    root.update(-75);
    EXPECT_FLOAT_EQ(target_.x(), 0.0f);

    root.free();
}

TEST_F(TimelineUpdateTest, YoyoSequenceReversesChildOrder) {
    Timeline& root = makeSequence().repeatYoyo(1, 0).start();

    root.update(800);
    EXPECT_FLOAT_EQ(target_.x(), 100.0f);
    EXPECT_FLOAT_EQ(target_.y(), 51.0f);

    // The reversed pass unwinds B before A
    root.update(150);
    EXPECT_FLOAT_EQ(target_.x(), 100.0f);
    EXPECT_FLOAT_EQ(target_.y(), 26.0f);

    root.update(400);
    EXPECT_FLOAT_EQ(target_.y(), 1.0f);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);

    root.update(250);
    EXPECT_FLOAT_EQ(target_.x(), 0.0f);
    EXPECT_TRUE(root.isFinished());

    root.free();
}

// ============================================================================
// Callbacks
// ============================================================================

TEST_F(TimelineUpdateTest, CallbacksFireInPlaybackOrder) {
    EventLog log;

    Timeline& root = Timeline::createSequence()
                         .push(Tween::to(target_, POS_X, 100).target(1.0f).addCallback(EventType::ANY, log.recorder("a")))
                         .push(Tween::to(target_, POS_Y, 100).target(1.0f).addCallback(EventType::ANY, log.recorder("b")))
                         .addCallback(EventType::ANY, log.recorder("root"))
                         .start();

    root.update(200);

    const std::vector<std::pair<std::string, EventType>> expected = {
        {"root", EventType::BEGIN},
        {"root", EventType::START},
        {"a", EventType::BEGIN},
        {"a", EventType::START},
        {"a", EventType::END},
        {"a", EventType::COMPLETE},
        {"b", EventType::BEGIN},
        {"b", EventType::START},
        {"b", EventType::END},
        {"b", EventType::COMPLETE},
        {"root", EventType::END},
        {"root", EventType::COMPLETE},
    };
    EXPECT_EQ(log.events, expected);

    root.free();
}

TEST_F(TimelineUpdateTest, BackwardCallbacksOnRewind) {
    EventLog log;

    Timeline& root = Timeline::createSequence()
                         .push(Tween::to(target_, POS_X, 100).target(1.0f))
                         .addCallback(EventType::ANY_BACKWARD, log.recorder("root"))
                         .start();

    root.update(100);
    EXPECT_TRUE(log.events.empty());

    root.update(-100);

    const std::vector<EventType> expected = {EventType::BACK_BEGIN, EventType::BACK_START,
                                             EventType::BACK_END, EventType::BACK_COMPLETE};
    EXPECT_EQ(log.of("root"), expected);

    root.free();
}

TEST_F(TimelineUpdateTest, RepeatFiresStartPerPass) {
    EventLog log;

    Timeline& root = Timeline::createSequence()
                         .push(Tween::to(target_, POS_X, 100).target(1.0f))
                         .repeat(2, 0)
                         .addCallback(EventType::START | EventType::COMPLETE, log.recorder("root"))
                         .start();

    root.update(300);

    const std::vector<EventType> expected = {EventType::START, EventType::START, EventType::START,
                                             EventType::COMPLETE};
    EXPECT_EQ(log.of("root"), expected);

    root.free();
}

TEST_F(TimelineUpdateTest, ThrowingCallbackDoesNotStopPlayback) {
    int calls = 0;

    Timeline& root = Timeline::createSequence()
                         .push(Tween::to(target_, POS_X, 100).target(100.0f).ease(EasingType::LINEAR))
                         .addCallback(EventType::START, [](EventType, TimedUnit&) {
                             throw std::runtime_error("callback failure");
                         })
                         .addCallback(EventType::START, [&calls](EventType, TimedUnit&) { ++calls; })
                         .start();

    EXPECT_NO_THROW(root.update(50));
    EXPECT_EQ(calls, 1);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);

    root.free();
}

TEST_F(TimelineUpdateTest, CallTweenFiresWhenReached) {
    int calls = 0;

    Timeline& root = Timeline::createSequence()
                         .pushPause(100)
                         .push(Tween::call([&calls](EventType, TimedUnit&) { ++calls; }))
                         .start();

    root.update(99);
    EXPECT_EQ(calls, 0);

    root.update(1);
    EXPECT_EQ(calls, 1);

    root.free();
}

// ============================================================================
// Target queries
// ============================================================================

TEST_F(TimelineUpdateTest, ContainsTargetSearchesWholeTree) {
    TestTarget other;
    TestTarget absent;

    Timeline& root = Timeline::createSequence()
                         .push(Tween::to(target_, POS_X, 100).target(1.0f))
                         .beginParallel()
                         .push(Tween::to(other, POS_Y, 100).target(1.0f))
                         .end();

    EXPECT_TRUE(root.containsTarget(&target_));
    EXPECT_TRUE(root.containsTarget(&other));
    EXPECT_TRUE(root.containsTarget(&other, POS_Y));
    EXPECT_FALSE(root.containsTarget(&other, POS_X));
    EXPECT_FALSE(root.containsTarget(&absent));
    EXPECT_FALSE(root.containsTarget(nullptr));

    root.free();
}

TEST_F(TimelineUpdateTest, KillTargetKillsWholeTimeline) {
    TestTarget other;

    Timeline& root = Timeline::createParallel()
                         .push(Tween::to(target_, POS_X, 100).target(100.0f).ease(EasingType::LINEAR))
                         .push(Tween::to(other, POS_X, 100).target(100.0f).ease(EasingType::LINEAR))
                         .start();

    root.update(50);
    root.killTarget(&other, POS_Y);
    EXPECT_FALSE(root.isKilled());

    root.killTarget(&other);
    EXPECT_TRUE(root.isKilled());
    EXPECT_TRUE(root.isFinished());

    root.update(50);
    EXPECT_FLOAT_EQ(target_.x(), 50.0f);

    root.free();
}
