#include "TestMaterials.h"
#include "core/WorldContactCalculator.h"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <variant>
#include <vector>

using namespace SandSim;

namespace {

class RecordingSink : public WorldEventSink {
public:
    void queueEvent(const WorldEvent& event) override { events.push_back(event); }

    std::vector<WorldEvent> events;
};

} // namespace

class ContactTest : public Test::WorldTestBase {};

TEST_F(ContactTest, BlastReachUsesNearestPoint)
{
    spdlog::info("Starting ContactTest::BlastReachUsesNearestPoint test");
    const Vector2i center{ 0, 0 };
    EXPECT_TRUE(WorldContactCalculator::blastReaches(center, 3.0f, DirtyRect::fromBounds(-1, -1, 1, 1)));
    EXPECT_TRUE(WorldContactCalculator::blastReaches(center, 3.0f, DirtyRect::fromBounds(3, 0, 5, 5)));
    EXPECT_FALSE(WorldContactCalculator::blastReaches(center, 3.0f, DirtyRect::fromBounds(3, 1, 5, 5)));
    EXPECT_FALSE(WorldContactCalculator::blastReaches(center, 3.0f, DirtyRect{}));
}

TEST_F(ContactTest, DamageAndHealAreAggregatedPerMaterial)
{
    spdlog::info("Starting ContactTest::DamageAndHealAreAggregatedPerMaterial test");
    RecordingSink sink;
    world->setEventSink(&sink);

    place(10, 10, "thorns");
    place(11, 10, "thorns");
    place(12, 10, "spring");
    world->setActorHitboxes({ { .actor_id = 7, .rect = DirtyRect::fromBounds(10, 8, 12, 9) } });

    const StepStats step = world->advance();

    EXPECT_EQ(step.contactEvents, 2u);
    ASSERT_EQ(sink.events.size(), 2u);
    ASSERT_EQ(world->lastEvents().size(), 2u);

    const auto* damage = std::get_if<ContactEvent>(&sink.events[0]);
    ASSERT_NE(damage, nullptr);
    EXPECT_EQ(damage->actor_id, 7u);
    EXPECT_EQ(damage->tick, 1u);
    EXPECT_EQ(damage->material, id("thorns"));
    EXPECT_EQ(damage->kind, ContactKind::Damage);
    EXPECT_EQ(damage->cell_count, 2u);
    EXPECT_FLOAT_EQ(damage->amount, 4.0f);

    const auto* heal = std::get_if<ContactEvent>(&sink.events[1]);
    ASSERT_NE(heal, nullptr);
    EXPECT_EQ(heal->material, id("spring"));
    EXPECT_EQ(heal->kind, ContactKind::Heal);
    EXPECT_EQ(heal->cell_count, 1u);
    EXPECT_FLOAT_EQ(heal->amount, 1.5f);

    // Contacts repeat every tick while the actor stays put.
    world->advance();
    EXPECT_EQ(sink.events.size(), 4u);
}

TEST_F(ContactTest, ExplosiveCarvesTerrainAndHitsNearbyActors)
{
    spdlog::info("Starting ContactTest::ExplosiveCarvesTerrainAndHitsNearbyActors test");
    RecordingSink sink;
    world->setEventSink(&sink);

    fill("stone", 0, 20, 30, 30);
    place(15, 20, "tnt");
    world->setActorHitboxes({
        { .actor_id = 1, .rect = DirtyRect::fromBounds(14, 17, 16, 19) },
        { .actor_id = 2, .rect = DirtyRect::fromBounds(50, 5, 52, 7) },
        { .actor_id = 3, .rect = DirtyRect::fromBounds(17, 18, 18, 19) },
    });

    const StepStats step = world->advance();

    EXPECT_EQ(step.blasts, 1u);
    ASSERT_EQ(sink.events.size(), 1u);
    const auto* blast = std::get_if<BlastEvent>(&sink.events[0]);
    ASSERT_NE(blast, nullptr);
    EXPECT_EQ(blast->center, (Vector2i{ 15, 20 }));
    EXPECT_EQ(blast->material, id("tnt"));
    EXPECT_FLOAT_EQ(blast->radius, 3.0f);
    EXPECT_FLOAT_EQ(blast->damage, 40.0f);
    EXPECT_FLOAT_EQ(blast->force, 12.0f);
    EXPECT_EQ(blast->cells_cleared, 18u);
    EXPECT_EQ(blast->actors_hit, (std::vector<uint32_t>{ 1, 3 }));

    EXPECT_TRUE(world->getCell(15, 20).isEmpty());
    EXPECT_TRUE(world->getCell(15, 23).isEmpty());
    EXPECT_EQ(materialAt(15, 24), id("stone"));
    EXPECT_EQ(materialAt(19, 20), id("stone"));

    // Nothing explosive left, so the next tick is quiet.
    world->advance();
    EXPECT_EQ(sink.events.size(), 1u);
}

TEST_F(ContactTest, DisabledContactsProduceNoEvents)
{
    spdlog::info("Starting ContactTest::DisabledContactsProduceNoEvents test");
    SimulationSettings settings = Test::singleThreadedSettings();
    settings.contacts_enabled = false;
    createWorld(settings);

    RecordingSink sink;
    world->setEventSink(&sink);
    place(10, 10, "thorns");
    place(12, 10, "tnt");
    world->setActorHitboxes({ { .actor_id = 1, .rect = DirtyRect::fromBounds(10, 8, 12, 9) } });

    world->advance(3);

    EXPECT_TRUE(sink.events.empty());
    EXPECT_TRUE(world->lastEvents().empty());
    EXPECT_EQ(materialAt(12, 10), id("tnt"));
}
