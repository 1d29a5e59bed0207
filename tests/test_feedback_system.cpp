#include <doctest/doctest.h>

#include "bomber/game/FeedbackSystem.h"
#include "bomber/game/Seed.h"

#include <algorithm>
#include <string>
#include <vector>

using bomber::game::FeedbackSystem;
using bomber::game::GameEvent;
using bomber::game::GameEventType;
using bomber::game::PhraseCategory;

namespace {

bool IsPhrase(PhraseCategory category, const std::string& text)
{
    const auto& lines = bomber::game::Phrases(category);
    return std::find(lines.begin(), lines.end(), text) != lines.end();
}

GameEvent Event(GameEventType type, float x, float y, int points)
{
    GameEvent event{};
    event.type = type;
    event.position = {x, y};
    event.points = points;
    return event;
}

} // namespace

TEST_CASE("Session start line shows for three seconds")
{
    FeedbackSystem feedback{7u};
    feedback.onSessionStart();
    CHECK(IsPhrase(PhraseCategory::Start, feedback.message()));
    CHECK(feedback.messageTimer() == doctest::Approx(3.0f));

    feedback.update(2.5f);
    CHECK_FALSE(feedback.message().empty());
    feedback.update(0.5f);
    CHECK(feedback.message().empty());
}

TEST_CASE("Hit, combo and miss pick a line from their own list")
{
    FeedbackSystem feedback{7u};
    feedback.onEvents({Event(GameEventType::Hit, 0.0f, 0.0f, 10)});
    CHECK(IsPhrase(PhraseCategory::Hit, feedback.message()));
    CHECK(feedback.messageTimer() == doctest::Approx(2.0f));

    feedback.onEvents({Event(GameEventType::Combo, 0.0f, 0.0f, 30)});
    CHECK(IsPhrase(PhraseCategory::Combo, feedback.message()));

    feedback.onEvents({Event(GameEventType::Explosion, 0.0f, 0.0f, 0)});
    CHECK(IsPhrase(PhraseCategory::Miss, feedback.message()));

    feedback.onUpgradeApplied();
    CHECK(IsPhrase(PhraseCategory::Upgrade, feedback.message()));
}

TEST_CASE("A drop alone leaves the message alone")
{
    FeedbackSystem feedback{7u};
    feedback.onEvents({Event(GameEventType::Drop, 0.0f, 0.0f, 0)});
    CHECK(feedback.message().empty());
    CHECK(feedback.floatingNumberCount() == 0);
}

TEST_CASE("An explosion without a kill in the same tick shows a miss line")
{
    FeedbackSystem feedback{7u};
    feedback.onEvents({Event(GameEventType::Drop, 0.0f, 0.0f, 0), Event(GameEventType::Explosion, 50.0f, 50.0f, 0)});
    CHECK(IsPhrase(PhraseCategory::Miss, feedback.message()));
    CHECK(feedback.messageTimer() == doctest::Approx(2.0f));
    CHECK(feedback.floatingNumberCount() == 0);
}

TEST_CASE("An explosion that destroys a target shows a hit line, not a miss")
{
    FeedbackSystem feedback{7u};
    feedback.onEvents({Event(GameEventType::Explosion, 50.0f, 50.0f, 0),
                       Event(GameEventType::TargetDestroyed, 52.0f, 50.0f, 20),
                       Event(GameEventType::Hit, 50.0f, 50.0f, 20)});
    CHECK(IsPhrase(PhraseCategory::Hit, feedback.message()));
    CHECK(feedback.floatingNumberCount() == 1);
}

TEST_CASE("Destroyed targets leave a rising, fading number")
{
    FeedbackSystem feedback{7u};
    feedback.onEvents({Event(GameEventType::TargetDestroyed, 100.0f, 200.0f, 50),
                       Event(GameEventType::TargetDestroyed, 120.0f, 200.0f, 20),
                       Event(GameEventType::Combo, 110.0f, 200.0f, 70)});
    CHECK(feedback.floatingNumberCount() == 2);

    feedback.update(0.5f);
    bomber::rendering::HudState hud{};
    feedback.fillHud(hud);
    REQUIRE(hud.floatingNumbers.size() == 2);
    CHECK(hud.floatingNumbers[0].amount == 50);
    CHECK(hud.floatingNumbers[0].x == doctest::Approx(100.0f));
    CHECK(hud.floatingNumbers[0].y == doctest::Approx(188.0f));
    CHECK(hud.floatingNumbers[0].alpha == doctest::Approx(0.5f));
    CHECK(IsPhrase(PhraseCategory::Combo, hud.message));
    CHECK(hud.messageAlpha == doctest::Approx(1.0f));

    feedback.update(0.5f);
    CHECK(feedback.floatingNumberCount() == 0);
}

TEST_CASE("Message fades out over its last moments")
{
    FeedbackSystem feedback{7u};
    feedback.onEvents({Event(GameEventType::Hit, 0.0f, 0.0f, 10)});
    feedback.update(1.75f);

    bomber::rendering::HudState hud{};
    feedback.fillHud(hud);
    CHECK(hud.messageAlpha == doctest::Approx(0.625f));

    feedback.reset();
    feedback.fillHud(hud);
    CHECK(hud.message.empty());
    CHECK(hud.messageAlpha == 0.0f);
}

TEST_CASE("Zero seed resolves to a clock seed, explicit seeds pass through")
{
    CHECK(bomber::game::ResolveSeed(42u) == 42u);
    CHECK(bomber::game::ResolveSeed(0u) != 0u);
}

TEST_CASE("Explicitly seeded feedback repeats its phrase choices")
{
    FeedbackSystem first{5u};
    FeedbackSystem second{5u};
    for (int i = 0; i < 8; ++i) {
        first.onEvents({Event(GameEventType::Hit, 0.0f, 0.0f, 10)});
        second.onEvents({Event(GameEventType::Hit, 0.0f, 0.0f, 10)});
        CHECK(first.message() == second.message());
    }

    // Unseeded systems still pick valid lines.
    FeedbackSystem unseeded{};
    unseeded.onSessionStart();
    CHECK(IsPhrase(PhraseCategory::Start, unseeded.message()));
}
