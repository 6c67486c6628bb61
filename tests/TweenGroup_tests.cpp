// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/TweenEngine.hpp"
#include "mock/MockTargets.hpp"

using namespace eanim;
using namespace eanim::mock;
using ::testing::ElementsAre;

class TweenGroupTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        engine.generated_accessors().expose<&MockTransform::alpha>("alpha");
        engine.generated_accessors().expose<&MockTransform::position>("position");
        engine.generated_accessors().expose<&MockTransform::frame>("frame");
        transform = std::make_shared<MockTransform>();
        group = engine.create_group();
    }

    TweenEngine engine;
    std::shared_ptr<MockTransform> transform;
    std::shared_ptr<TweenGroup> group;
};

TEST_F(TweenGroupTest, TwoSecondTweenEndsAtEndValue)
{
    auto tween = group->to(transform, "alpha", 10.0f);
    tween->over(2.0f);

    for (int i = 0; i < 7; ++i)
        engine.tick(0.3f);

    EXPECT_EQ(transform->alpha, 10.0f);
    EXPECT_EQ(tween->completed_by(), TweenCompletedBy::Complete);
    EXPECT_FALSE(group->has());
}

TEST_F(TweenGroupTest, SameTickOverwriteLeavesOnlyLaterTween)
{
    std::vector<std::string> log;
    auto a = group->to(transform, "alpha", 1.0f);
    auto b = group->to(transform, "alpha", -1.0f);
    a->on_complete([&](const TweenEventArgs&) { log.push_back("A complete"); });
    b->on_start([&](const TweenEventArgs&) { log.push_back("B start"); });
    b->on_update([&](const TweenEventArgs&) { log.push_back("B update"); });

    engine.tick(0.5f);

    EXPECT_THAT(log, ElementsAre("B start", "A complete", "B update"));
    EXPECT_EQ(a->completed_by(), TweenCompletedBy::Stop | TweenCompletedBy::Overwrite);
    EXPECT_TRUE(b->is_active());
    EXPECT_EQ(group->size(), 1u);
    EXPECT_FLOAT_EQ(transform->alpha, -0.5f);
}

TEST_F(TweenGroupTest, PendingTweensStepInReverseOrder)
{
    std::vector<std::string> initialized;
    group->on_initialize([&](const TweenEventArgs& args) { initialized.push_back(args.tween->property()); });

    group->to(transform, "alpha", 1.0f);
    group->to(transform, "position", glm::vec3(1.0f));
    group->to(transform, "frame", 4);
    engine.tick(0.1f);

    EXPECT_THAT(initialized, ElementsAre("frame", "position", "alpha"));
    EXPECT_EQ(group->size(), 3u);
}

TEST_F(TweenGroupTest, StopFreezesMatchingTweens)
{
    group->to(transform, "alpha", 1.0f);
    auto position = group->to(transform, "position", glm::vec3(4.0f));
    engine.tick(0.25f);

    group->stop(transform.get(), "alpha");
    engine.tick(0.25f);

    EXPECT_FLOAT_EQ(transform->alpha, 0.25f);
    EXPECT_FLOAT_EQ(transform->position.x, 2.0f);
    EXPECT_TRUE(position->is_active());
    EXPECT_FALSE(group->has(transform.get(), "alpha"));
    EXPECT_TRUE(group->has(transform.get(), "position"));
}

TEST_F(TweenGroupTest, FinishAndCancelWithoutFilterMatchAll)
{
    transform->frame = 2;
    group->to(transform, "alpha", 1.0f);
    group->to(transform, "frame", 12);
    engine.tick(0.5f);

    group->finish();
    EXPECT_FLOAT_EQ(transform->alpha, 1.0f);
    EXPECT_EQ(transform->frame, 12);

    auto other = std::make_shared<MockTransform>();
    group->to(other, "alpha", 1.0f);
    engine.tick(0.5f);
    group->cancel(other.get());
    EXPECT_FLOAT_EQ(other->alpha, 0.0f);
}

TEST_F(TweenGroupTest, HasAndReset)
{
    EXPECT_FALSE(group->has());

    group->to(transform, "alpha", 1.0f);
    EXPECT_TRUE(group->has());
    EXPECT_TRUE(group->has(transform.get()));
    EXPECT_TRUE(group->has(transform.get(), "alpha"));
    EXPECT_FALSE(group->has(transform.get(), "position"));
    EXPECT_TRUE(engine.has(transform.get(), "alpha"));

    group->reset();
    EXPECT_FALSE(group->has());
    EXPECT_FALSE(group->in_use());
    EXPECT_EQ(group->engine(), nullptr);
    EXPECT_EQ(group->default_target<MockTransform>(), nullptr);
}

TEST_F(TweenGroupTest, UseWhileInUseThrows)
{
    EXPECT_THROW(group->use(&engine, &engine), std::logic_error);

    group->reset();
    EXPECT_NO_THROW(group->use(transform, &engine, &engine));
    EXPECT_EQ(group->default_target<MockTransform>(), transform);
}

TEST_F(TweenGroupTest, AddRequiresGroupInUse)
{
    auto idle = std::make_shared<TweenGroup>();
    auto tween = std::make_shared<TypedTween<MockTransform, float>>();
    EXPECT_THROW(idle->add(tween), std::logic_error);
    EXPECT_THROW(group->add(nullptr), std::invalid_argument);
}

TEST_F(TweenGroupTest, CreatorsValidateArguments)
{
    EXPECT_THROW(group->to(std::shared_ptr<MockTransform>{}, "alpha", 1.0f), std::invalid_argument);
    EXPECT_THROW(group->to(transform, "", 1.0f), std::invalid_argument);
}

TEST_F(TweenGroupTest, DefaultTargetCreators)
{
    auto targeted = engine.create_group(transform);
    EXPECT_EQ(targeted->default_target<MockTransform>(), transform);
    EXPECT_EQ(targeted->default_target<MockSprite>(), nullptr);

    auto tween = targeted->to<MockTransform, float>("alpha", 1.0f);
    EXPECT_EQ(tween->target(), transform);
    EXPECT_THROW((targeted->to<MockSprite, float>("opacity", 0.0f)), std::logic_error);
    EXPECT_THROW((group->to<MockTransform, float>("alpha", 1.0f)), std::logic_error);
}

TEST_F(TweenGroupTest, OptionsCascadeFromGroup)
{
    group->over(2.0f);
    auto tween = group->to(transform, "alpha", 1.0f);
    engine.tick(1.0f);

    EXPECT_FLOAT_EQ(tween->get_duration(), 2.0f);
    EXPECT_FLOAT_EQ(transform->alpha, 0.5f);

    // Tween options win over group options
    auto fast = group->to(transform, "position", glm::vec3(1.0f));
    fast->over(0.5f);
    engine.tick(0.25f);
    EXPECT_FLOAT_EQ(transform->position.x, 0.5f);
}

TEST_F(TweenGroupTest, TimingSelectsPhaseBucket)
{
    auto late = group->to(transform, "alpha", 1.0f);
    late->timing(TweenTiming::LateUpdate | TweenTiming::DefaultTime);
    auto physics = group->to(transform, "position", glm::vec3(1.0f));
    physics->timing(TweenTiming::Physics);

    // First step happens in the first processed phase
    engine.advance(0.5f);
    engine.process(TweenTiming::Update);
    EXPECT_FLOAT_EQ(transform->alpha, 0.5f);
    EXPECT_FLOAT_EQ(transform->position.x, 0.5f);

    engine.advance(0.25f);
    engine.process(TweenTiming::Update);
    EXPECT_FLOAT_EQ(transform->alpha, 0.5f);
    EXPECT_FLOAT_EQ(transform->position.x, 0.5f);

    engine.process(TweenTiming::FixedUpdate);
    EXPECT_FLOAT_EQ(transform->alpha, 0.5f);
    EXPECT_FLOAT_EQ(transform->position.x, 0.75f);

    engine.process(TweenTiming::LateUpdate);
    EXPECT_FLOAT_EQ(transform->alpha, 0.75f);
}

TEST_F(TweenGroupTest, FailingTweenDoesNotAffectSiblings)
{
    auto broken = group->to(transform, "missing", 1.0f);
    auto working = group->to(transform, "alpha", 1.0f);
    engine.tick(0.5f);

    EXPECT_EQ(broken->state(), TweenState::Error);
    EXPECT_TRUE(working->is_active());
    EXPECT_FLOAT_EQ(transform->alpha, 0.5f);
    EXPECT_EQ(group->size(), 1u);
}

TEST_F(TweenGroupTest, EmptyGroupIsUnregistered)
{
    group->to(transform, "alpha", 1.0f);
    EXPECT_TRUE(group->registered());
    EXPECT_EQ(engine.group_count(), 1u);

    engine.tick(1.0f);
    EXPECT_FALSE(group->registered());
    EXPECT_EQ(engine.group_count(), 0u);

    // Adding again registers again
    group->to(transform, "alpha", 0.0f);
    EXPECT_TRUE(group->registered());
    EXPECT_EQ(engine.group_count(), 1u);
}

TEST_F(TweenGroupTest, EngineQueriesSpanGroups)
{
    auto second = engine.create_group();
    group->to(transform, "alpha", 1.0f);
    second->to(transform, "position", glm::vec3(2.0f));
    engine.tick(0.5f);

    EXPECT_TRUE(engine.has(transform.get()));
    EXPECT_FALSE(engine.has(nullptr));

    engine.finish(transform.get());
    EXPECT_FLOAT_EQ(transform->alpha, 1.0f);
    EXPECT_FLOAT_EQ(transform->position.x, 2.0f);
    EXPECT_FALSE(engine.has(transform.get()));
}

TEST_F(TweenGroupTest, OverwriteAcrossGroups)
{
    auto second = engine.create_group();
    auto a = group->to(transform, "alpha", 1.0f);
    engine.tick(0.25f);

    auto b = second->to(transform, "alpha", 0.0f);
    engine.tick(0.25f);

    EXPECT_FALSE(a->is_active());
    EXPECT_TRUE(has_flag(a->completed_by(), TweenCompletedBy::Overwrite));
    EXPECT_TRUE(b->is_active());
}

TEST_F(TweenGroupTest, ThrowingGetterFailsOnlyItsTween)
{
    engine.static_accessors().teach<MockTransform, float>("alpha",
        [](MockTransform&) -> float { throw std::runtime_error("getter broke"); },
        [](MockTransform& t, const float& v) { t.alpha = v; });

    std::vector<std::string> errors;
    auto position = group->to(transform, "position", glm::vec3(1.0f));
    auto alpha = group->to(transform, "alpha", 1.0f);
    alpha->on_error([&](const TweenEventArgs& args) { errors.push_back(args.error); });

    EXPECT_NO_THROW(engine.tick(0.1f));
    EXPECT_EQ(alpha->state(), TweenState::Error);
    ASSERT_TRUE(alpha->error());
    EXPECT_EQ(alpha->error()->code, ResolutionErrorCode::ActivationFailed);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("getter broke"), std::string::npos);

    EXPECT_EQ(position->state(), TweenState::Tweening);
    EXPECT_TRUE(group->has(transform.get(), "position"));

    engine.tick(1.0f);
    EXPECT_EQ(position->state(), TweenState::Complete);
    EXPECT_EQ(transform->position, glm::vec3(1.0f));
    EXPECT_FALSE(group->has());
}

TEST_F(TweenGroupTest, ThrowingSetterStopsTweenWithoutCompleting)
{
    engine.static_accessors().teach<MockTransform, float>("alpha",
        [](MockTransform& t) { return t.alpha; },
        [](MockTransform&, const float&) { throw std::runtime_error("setter broke"); });

    bool completed = false;
    auto alpha = group->to(transform, "alpha", 1.0f);
    alpha->on_complete([&](const TweenEventArgs&) { completed = true; });
    auto frame = group->to(transform, "frame", 10);

    EXPECT_NO_THROW(engine.tick(0.5f));
    EXPECT_EQ(alpha->state(), TweenState::Error);
    EXPECT_FALSE(completed);
    EXPECT_EQ(transform->frame, 5);

    // Finishing a failed tween does nothing
    alpha->finish();
    EXPECT_EQ(alpha->state(), TweenState::Error);
}

TEST_F(TweenGroupTest, ThrowingArithmeticFailsTween)
{
    engine.generated_accessors().expose<&MockPanel::size>("size");
    engine.static_arithmetic().teach<MockVec2>(
        [](const MockVec2& start, const MockVec2& end) { return end - start; },
        [](const MockVec2& start, const MockVec2& diff) { return start + diff; },
        [](const MockVec2&, const MockVec2&, const MockVec2&, float) -> MockVec2 {
            throw std::runtime_error("no interpolation");
        });

    auto panel = std::make_shared<MockPanel>();
    auto size = group->to(panel, "size", MockVec2{ 4.0f, 2.0f });

    EXPECT_NO_THROW(engine.tick(0.5f));
    EXPECT_EQ(size->state(), TweenState::Error);
    EXPECT_EQ(panel->size, MockVec2{});
    EXPECT_FALSE(group->has());
}

TEST_F(TweenGroupTest, FinishedTweenOutlivesDroppedGroup)
{
    engine.enable_pooling(false);

    std::shared_ptr<Tween> tween;
    {
        auto dropped = engine.create_group();
        dropped->over(2.0f).delay(0.5f);
        tween = dropped->to(transform, "alpha", 1.0f);
    }
    EXPECT_EQ(engine.group_count(), 1u);

    engine.tick(3.0f);
    EXPECT_EQ(tween->state(), TweenState::Complete);
    EXPECT_EQ(engine.group_count(), 0u);

    EXPECT_EQ(tween->group(), nullptr);
    EXPECT_EQ(tween->parent_options(), &engine);
    EXPECT_FLOAT_EQ(tween->get_duration(), 2.0f);
    EXPECT_FLOAT_EQ(tween->get_delay(), 0.5f);
    EXPECT_TRUE(tween->overlaps(*tween));
}

TEST_F(TweenGroupTest, RecycledGroupDoesNotCascadeToOldTween)
{
    std::shared_ptr<Tween> tween;
    {
        auto first = engine.create_group();
        first->over(2.0f);
        tween = first->to(transform, "alpha", 1.0f);
    }
    engine.tick(2.0f);
    ASSERT_EQ(tween->state(), TweenState::Complete);

    auto reused = engine.create_group();
    reused->over(5.0f);
    EXPECT_FLOAT_EQ(tween->get_duration(), 2.0f);
    EXPECT_EQ(tween->parent_options(), &engine);
}
