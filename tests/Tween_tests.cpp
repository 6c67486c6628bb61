// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>
#include <vector>

#include "core/TweenEngine.hpp"
#include "mock/MockTargets.hpp"

using namespace eanim;
using namespace eanim::mock;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class TweenTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        engine.generated_accessors().expose<&MockTransform::alpha>("alpha");
        engine.generated_accessors().expose<&MockTransform::position>("position");
        engine.generated_accessors().expose<&MockTransform::frame>("frame");
        transform = std::make_shared<MockTransform>();
    }

    TweenEngine engine;
    std::shared_ptr<MockTransform> transform;
};

TEST_F(TweenTest, StartsUninitializedAndResolvesOnFirstUpdate)
{
    auto tween = engine.to(transform, "alpha", 1.0f);
    EXPECT_EQ(tween->state(), TweenState::Uninitialized);
    EXPECT_FALSE(tween->binding(TweenCapability::Getter));
    EXPECT_EQ(tween->target_key(), transform.get());
    EXPECT_EQ(tween->property(), "alpha");
    EXPECT_THAT(tween->describe(), HasSubstr("alpha on "));

    engine.tick(0.5f);
    EXPECT_EQ(tween->state(), TweenState::Tweening);
    EXPECT_TRUE(tween->binding(TweenCapability::Getter));
    EXPECT_FLOAT_EQ(tween->position(), 0.5f);
    EXPECT_FLOAT_EQ(transform->alpha, 0.5f);
}

TEST_F(TweenTest, StopFreezesValue)
{
    auto tween = engine.to(transform, "alpha", 1.0f);
    engine.tick(0.25f);
    tween->stop();

    engine.tick(0.5f);
    EXPECT_FLOAT_EQ(transform->alpha, 0.25f);
    EXPECT_EQ(tween->state(), TweenState::Complete);
    EXPECT_EQ(tween->completed_by(), TweenCompletedBy::Stop);
    EXPECT_FALSE(tween->is_active());
}

TEST_F(TweenTest, FinishJumpsToEnd)
{
    auto tween = engine.to(transform, "alpha", 1.0f);
    engine.tick(0.25f);
    tween->finish();

    EXPECT_FLOAT_EQ(transform->alpha, 1.0f);
    EXPECT_EQ(tween->completed_by(), TweenCompletedBy::Finish);
}

TEST_F(TweenTest, CancelRevertsToStart)
{
    transform->alpha = 0.2f;
    auto tween = engine.to(transform, "alpha", 1.0f);
    engine.tick(0.5f);
    tween->cancel();

    EXPECT_FLOAT_EQ(transform->alpha, 0.2f);
    EXPECT_EQ(tween->completed_by(), TweenCompletedBy::Cancel);
}

TEST_F(TweenTest, DelayKeepsTweenWaiting)
{
    auto tween = engine.to(transform, "alpha", 1.0f);
    tween->delay(0.5f);

    engine.tick(0.25f);
    EXPECT_EQ(tween->state(), TweenState::Waiting);
    EXPECT_FLOAT_EQ(transform->alpha, 0.0f);

    engine.tick(0.75f);
    EXPECT_EQ(tween->state(), TweenState::Tweening);
    EXPECT_FLOAT_EQ(transform->alpha, 0.5f);
}

TEST_F(TweenTest, FinishWhileWaitingWritesEnd)
{
    auto tween = engine.to(transform, "alpha", 1.0f);
    tween->delay(1.0f);
    engine.tick(0.1f);
    ASSERT_EQ(tween->state(), TweenState::Waiting);

    tween->finish();
    EXPECT_FLOAT_EQ(transform->alpha, 1.0f);
}

TEST_F(TweenTest, DestroyedTargetFailsTheTween)
{
    auto target = std::make_shared<MockTransform>();
    auto tween = engine.to(target, "alpha", 1.0f);
    target.reset();

    engine.tick(0.1f);
    EXPECT_EQ(tween->state(), TweenState::Error);
    ASSERT_TRUE(tween->error());
    EXPECT_EQ(tween->error()->code, ResolutionErrorCode::TargetNotFound);
    EXPECT_EQ(engine.group_count(), 0u);
}

TEST_F(TweenTest, FromUsesCurrentValueAsEnd)
{
    transform->alpha = 0.8f;
    auto tween = engine.from(transform, "alpha", 0.0f);
    engine.tick(0.5f);

    EXPECT_FLOAT_EQ(tween->start_value(), 0.0f);
    EXPECT_FLOAT_EQ(tween->end_value(), 0.8f);
    EXPECT_FLOAT_EQ(transform->alpha, 0.4f);
}

TEST_F(TweenTest, ByAddsDifference)
{
    transform->position = glm::vec3(1.0f);
    auto tween = engine.by(transform, "position", glm::vec3(2.0f, 0.0f, 0.0f));
    engine.tick(0.5f);

    EXPECT_FLOAT_EQ(tween->end_value().x, 3.0f);
    EXPECT_FLOAT_EQ(transform->position.x, 2.0f);
    EXPECT_FLOAT_EQ(transform->position.y, 1.0f);

    engine.tick(0.5f);
    EXPECT_FLOAT_EQ(transform->position.x, 3.0f);
}

TEST_F(TweenTest, IntTweenTruncates)
{
    engine.to(transform, "frame", 10);
    engine.tick(0.55f);
    EXPECT_EQ(transform->frame, 5);
}

TEST_F(TweenTest, ZeroDurationCompletesOnFirstStep)
{
    auto tween = engine.to(transform, "alpha", 1.0f);
    tween->over(0.0f);
    engine.tick(0.01f);

    EXPECT_FLOAT_EQ(transform->alpha, 1.0f);
    EXPECT_EQ(tween->completed_by(), TweenCompletedBy::Complete);
}

TEST_F(TweenTest, InvalidDurationFails)
{
    auto negative = engine.to(transform, "alpha", 1.0f);
    negative->over(-1.0f);
    auto nan = engine.to(transform, "position", glm::vec3(1.0f));
    nan->over(std::nanf(""));
    engine.tick(0.1f);

    EXPECT_EQ(negative->state(), TweenState::Error);
    EXPECT_EQ(negative->error()->code, ResolutionErrorCode::ActivationFailed);
    EXPECT_EQ(nan->state(), TweenState::Error);
}

TEST_F(TweenTest, EventsFireInLifecycleOrder)
{
    std::vector<TweenEvent> events;
    TweenCompletedBy completed_by = TweenCompletedBy::Undefined;

    auto tween = engine.to(transform, "alpha", 1.0f);
    tween->over(0.5f)
        .on_initialize([&](const TweenEventArgs& args) { events.push_back(args.event); })
        .on_start([&](const TweenEventArgs& args) { events.push_back(args.event); })
        .on_update([&](const TweenEventArgs& args) { events.push_back(args.event); })
        .on_complete([&](const TweenEventArgs& args) { events.push_back(args.event); completed_by = args.completed_by; });

    engine.tick(0.25f);
    engine.tick(0.25f);

    EXPECT_THAT(events, ElementsAre(
        TweenEvent::Initialize, TweenEvent::Start, TweenEvent::Update, TweenEvent::Update, TweenEvent::Complete));
    EXPECT_EQ(completed_by, TweenCompletedBy::Complete);
}

TEST_F(TweenTest, EventsBubbleToEngine)
{
    int completed = 0, errors = 0;
    engine.on_complete([&](const TweenEventArgs&) { ++completed; });
    engine.on_error([&](const TweenEventArgs& args) { ++errors; EXPECT_FALSE(args.error.empty()); });

    engine.to(transform, "alpha", 1.0f);
    engine.to(transform, "missing", 1.0f);
    engine.tick(1.0f);

    EXPECT_EQ(completed, 1);
    EXPECT_EQ(errors, 1);
}

TEST_F(TweenTest, EasingShapesPosition)
{
    auto tween = engine.to(transform, "alpha", 1.0f);
    tween->ease(easing::ease_in);
    engine.tick(0.5f);

    EXPECT_FLOAT_EQ(tween->position(), 0.5f);
    EXPECT_FLOAT_EQ(transform->alpha, 0.25f);
}

TEST_F(TweenTest, TimeScaleSlowsScaledTweens)
{
    engine.set_time_scale(0.5f);
    engine.to(transform, "alpha", 1.0f);
    engine.tick(0.5f);

    EXPECT_FLOAT_EQ(transform->alpha, 0.25f);
}

TEST_F(TweenTest, UnscaledTimingIgnoresTimeScale)
{
    engine.set_time_scale(0.0f);
    auto tween = engine.to(transform, "alpha", 1.0f);
    tween->timing(TweenTiming::Menu);
    engine.tick(0.5f);

    EXPECT_FLOAT_EQ(transform->alpha, 0.5f);
}

TEST_F(TweenTest, AnyStepSizeFinishesExactlyAtEnd)
{
    for (float step : { 0.3f, 0.1f, 1.0f / 3.0f, 0.7f, 0.016f })
    {
        auto target = std::make_shared<MockTransform>();
        auto tween = engine.to(target, "alpha", 1.0f);
        tween->over(2.0f);

        const int max_ticks = static_cast<int>(std::ceil(2.0f / step)) + 1;
        int ticks = 0;
        while (tween->is_active() && ticks < max_ticks)
        {
            engine.tick(step);
            ++ticks;
        }

        EXPECT_EQ(tween->state(), TweenState::Complete) << "step " << step;
        EXPECT_EQ(target->alpha, 1.0f) << "step " << step;
    }
}

TEST_F(TweenTest, OverlapsComparesTimeWindows)
{
    auto a = engine.to(transform, "alpha", 1.0f);
    auto b = engine.to(transform, "alpha", 0.0f);
    auto c = engine.to(transform, "alpha", 0.5f);
    b->delay(2.0f);
    c->delay(0.5f);

    EXPECT_FALSE(a->overlaps(*b));
    EXPECT_TRUE(a->overlaps(*c));

    auto instant = engine.to(transform, "alpha", 0.0f);
    instant->over(0.0f).delay(5.0f);
    EXPECT_TRUE(a->overlaps(*instant));
}

TEST_F(TweenTest, OverwriteIgnoresDisjointTweens)
{
    auto a = engine.to(transform, "alpha", 1.0f);
    auto b = engine.to(transform, "alpha", 0.0f);
    b->delay(2.0f);

    a->overwrite(*b);
    EXPECT_TRUE(a->is_active());
}

TEST_F(TweenTest, OverwriteFollowsPolicyOfNewTween)
{
    auto a = engine.to(transform, "alpha", 1.0f);
    engine.tick(0.5f);

    auto b = engine.to(transform, "alpha", 0.0f);
    b->overwrite_policy(TweenOverwrite::OnStart | TweenOverwrite::Cancel);
    engine.tick(0.1f);

    EXPECT_EQ(a->state(), TweenState::Complete);
    EXPECT_EQ(a->completed_by(), TweenCompletedBy::Cancel | TweenCompletedBy::Overwrite);
    EXPECT_TRUE(b->is_active());
}

TEST_F(TweenTest, ImmediateOverwriteHappensOnInitialize)
{
    auto a = engine.to(transform, "alpha", 1.0f);
    engine.tick(0.1f);

    auto b = engine.to(transform, "alpha", 0.0f);
    b->overwrite_policy(TweenOverwrite::Immediate).delay(1.0f);
    engine.tick(0.1f);

    EXPECT_EQ(b->state(), TweenState::Waiting);
    EXPECT_EQ(a->completed_by(), TweenCompletedBy::Stop | TweenCompletedBy::Overwrite);
}

TEST_F(TweenTest, NoneOverwriteLeavesOthersRunning)
{
    auto a = engine.to(transform, "alpha", 1.0f);
    engine.tick(0.1f);

    auto b = engine.to(transform, "alpha", 0.0f);
    b->overwrite_policy(TweenOverwrite::None);
    engine.tick(0.1f);

    EXPECT_TRUE(a->is_active());
    EXPECT_TRUE(b->is_active());
}

TEST_F(TweenTest, ResetReturnsToUnused)
{
    auto tween = engine.to(transform, "alpha", 1.0f);
    engine.tick(0.5f);
    tween->stop();
    tween->reset();

    EXPECT_EQ(tween->state(), TweenState::Unused);
    EXPECT_EQ(tween->target(), nullptr);
    EXPECT_FALSE(tween->binding(TweenCapability::Getter));
    EXPECT_FALSE(tween->update());
}
