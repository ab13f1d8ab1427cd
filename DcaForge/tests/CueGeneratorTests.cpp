// tests/CueGeneratorTests.cpp - Generation and persistence orchestration
#include <gtest/gtest.h>

#include "TestScripts.h"
#include "core/CueGenerator.h"

namespace {

Script twoSpeakers()
{
    Script script;
    script << comment("Page 2")
           << character("ALICE") << dialogue("one")
           << character("BOB") << dialogue("two");
    return script;
}

} // namespace

TEST(CueGeneratorTest, GenerateUsesStoreChannels)
{
    FakeCueStore store;
    store.channels = castChannels();

    CueGenerator generator(&store);

    int generatedCount = -1;
    QObject::connect(&generator, &CueGenerator::cuesGenerated,
                     [&generatedCount](int count) { generatedCount = count; });

    const DcaAllocationResult result = generator.generate(twoSpeakers());
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.cues.size(), 2);
    EXPECT_EQ(generatedCount, 2);

    EXPECT_EQ(result.cues[0].channels(1), "1");
    EXPECT_EQ(result.cues[1].name(), "p2 +Bob -Alice: \"two\"");
    EXPECT_EQ(result.cues[1].channels(2), "2");
    EXPECT_TRUE(result.cues[1].slot(1).isEmpty());

    // Generation never writes
    EXPECT_TRUE(store.stored.isEmpty());
}

TEST(CueGeneratorTest, OptionsReachAllocator)
{
    FakeCueStore store;
    store.channels = castChannels();

    DcaOptions options;
    options.previewLength = 2;

    CueGenerator generator(&store);
    generator.setOptions(options);

    const DcaAllocationResult result = generator.generate(twoSpeakers());
    ASSERT_EQ(result.cues.size(), 2);
    EXPECT_EQ(result.cues[0].name(), "p2 +Alice: \"on...\"");
}

TEST(CueGeneratorTest, PersistWritesInOrder)
{
    FakeCueStore store;
    store.channels = castChannels();
    CueGenerator generator(&store);

    QList<int> points;
    QObject::connect(&generator, &CueGenerator::cuePersisted,
                     [&points](int, int point) { points.append(point); });

    const DcaAllocationResult result = generator.generate(twoSpeakers());
    ASSERT_TRUE(generator.persist(result.cues));

    EXPECT_EQ(generator.persistedCount(), 2);
    ASSERT_EQ(store.stored.size(), 2);
    EXPECT_EQ(store.stored[0].name(), result.cues[0].name());
    EXPECT_EQ(store.stored[1].number(), 2);
    EXPECT_EQ(points, (QList<int>{ 10, 20 }));
}

TEST(CueGeneratorTest, PersistStopsAtFirstFailure)
{
    FakeCueStore store;
    store.channels = castChannels();
    store.failAt = 1;
    CueGenerator generator(&store);

    QStringList failures;
    QObject::connect(&generator, &CueGenerator::persistFailed,
                     [&failures](const QString& error) { failures.append(error); });

    const DcaAllocationResult result = generator.generate(twoSpeakers());
    const QList<DcaCue> generated = result.cues;

    EXPECT_FALSE(generator.persist(result.cues));
    EXPECT_EQ(generator.persistedCount(), 1);
    EXPECT_EQ(store.stored.size(), 1);
    EXPECT_TRUE(generator.lastError().contains("disk full"));
    ASSERT_EQ(failures.size(), 1);
    EXPECT_EQ(failures[0], generator.lastError());

    // The generated list is left as it was
    EXPECT_EQ(result.cues, generated);
    EXPECT_EQ(result.cues[1].point(), 0);
}

TEST(CueGeneratorTest, SlotExhaustionIsSignalled)
{
    FakeCueStore store;
    CueGenerator generator(&store);

    DcaOptions options;
    options.slotCount = 1;
    generator.setOptions(options);

    QStringList exhausted;
    QObject::connect(&generator, &CueGenerator::slotExhausted,
                     [&exhausted](const QString& character, int) { exhausted.append(character); });

    Script script;
    script << character("ALICE & BOB") << dialogue("duet");

    const DcaAllocationResult result = generator.generate(script);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.anomalies.size(), 1);
    EXPECT_EQ(exhausted, QStringList{ "Bob" });
}

TEST(CueGeneratorTest, RejectedScriptSetsError)
{
    FakeCueStore store;
    CueGenerator generator(&store);

    int generatedSignals = 0;
    QObject::connect(&generator, &CueGenerator::cuesGenerated,
                     [&generatedSignals](int) { ++generatedSignals; });

    Script script;
    script << ScriptElement(static_cast<ElementKind>(-1), "bad");

    const DcaAllocationResult result = generator.generate(script);
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(generator.lastError().isEmpty());
    EXPECT_EQ(generatedSignals, 0);
}

TEST(CueGeneratorTest, WorksWithoutStore)
{
    CueGenerator generator(nullptr);

    Script script;
    script << character("ALICE") << dialogue("solo");

    const DcaAllocationResult result = generator.generate(script);
    ASSERT_EQ(result.cues.size(), 1);
    EXPECT_EQ(result.cues[0].label(1), "Alice");
    EXPECT_TRUE(result.cues[0].channels(1).isNull());

    EXPECT_FALSE(generator.persist(result.cues));
    EXPECT_EQ(generator.persistedCount(), 0);
}
