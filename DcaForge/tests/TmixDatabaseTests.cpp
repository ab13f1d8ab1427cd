// tests/TmixDatabaseTests.cpp - SQLite show file store
#include <QFileInfo>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "storage/TmixDatabase.h"

namespace {

class TmixDatabaseTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir_.isValid());
        path_ = dir_.filePath("show.tmix");
        ASSERT_TRUE(db_.open(path_)) << db_.lastError().toStdString();
    }

    DcaCue makeCue(int number, const QString& name)
    {
        DcaSnapshot snapshot;
        snapshot[0] = DcaSlot{ "7", "Horton" };
        snapshot[3].label = "Jojo";
        return DcaCue(number, name, snapshot);
    }

    QTemporaryDir dir_;
    QString path_;
    TmixDatabase db_;
};

} // namespace

TEST_F(TmixDatabaseTest, NewFileGetsSchemaAndDefaultConfig)
{
    EXPECT_TRUE(db_.isOpen());
    EXPECT_TRUE(QFileInfo::exists(path_));
    EXPECT_EQ(db_.config("venue"), "Theatre");
    EXPECT_EQ(db_.config("consoleModel"), "GLD-112");
    EXPECT_EQ(db_.allConfig().size(), TmixDatabase::defaultConfig().size());
    EXPECT_TRUE(db_.allCues().isEmpty());

    QStringList tables = db_.tables();
    tables.sort();
    EXPECT_EQ(tables, (QStringList{ "actorGroups", "actorProfiles", "actors", "config", "cues",
                                    "ensembles", "fxCache", "positions", "profiles",
                                    "sceneCache", "snippetCache" }));
}

TEST_F(TmixDatabaseTest, ExistingConfigIsNotReset)
{
    ASSERT_TRUE(db_.setConfig("venue", "Palace"));
    db_.close();

    ASSERT_TRUE(db_.open(path_));
    EXPECT_EQ(db_.config("venue"), "Palace");
    EXPECT_TRUE(db_.config("noSuchParam").isNull());
}

TEST_F(TmixDatabaseTest, AddCueAssignsPointsInTens)
{
    EXPECT_EQ(db_.nextCueNumber(), qMakePair(0, 10));

    EXPECT_EQ(db_.addCue(makeCue(1, "first")), 10);
    EXPECT_EQ(db_.addCue(makeCue(2, "second")), 20);
    EXPECT_EQ(db_.nextCueNumber(), qMakePair(2, 30));

    // No number given: next after the highest
    const int point = db_.addCue(makeCue(0, "third"));
    ASSERT_EQ(point, 30);
    EXPECT_EQ(db_.cue(point)->number(), 3);
}

TEST_F(TmixDatabaseTest, ExplicitPointIsKept)
{
    DcaCue cue = makeCue(5, "placed");
    cue.setPoint(55);
    EXPECT_EQ(db_.addCue(cue), 55);
    EXPECT_EQ(db_.addCue(makeCue(6, "after")), 65);
}

TEST_F(TmixDatabaseTest, CueRoundTripKeepsNullSlots)
{
    const DcaCue original = makeCue(1, "p3 +Horton");
    const int point = db_.addCue(original);
    ASSERT_GT(point, 0);

    const std::optional<DcaCue> stored = db_.cue(point);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->name(), "p3 +Horton");
    EXPECT_EQ(stored->channels(1), "7");
    EXPECT_EQ(stored->label(1), "Horton");
    EXPECT_TRUE(stored->channels(4).isNull());
    EXPECT_EQ(stored->label(4), "Jojo");
    EXPECT_TRUE(stored->slot(12).isEmpty());

    DcaCue expected = original;
    expected.setPoint(point);
    EXPECT_EQ(*stored, expected);

    EXPECT_FALSE(db_.cue(999).has_value());
}

TEST_F(TmixDatabaseTest, AllCuesOrderedByPoint)
{
    DcaCue late = makeCue(1, "late");
    late.setPoint(50);
    DcaCue early = makeCue(2, "early");
    early.setPoint(20);

    ASSERT_EQ(db_.addCue(late), 50);
    ASSERT_EQ(db_.addCue(early), 20);

    const QList<DcaCue> cues = db_.allCues();
    ASSERT_EQ(cues.size(), 2);
    EXPECT_EQ(cues[0].name(), "early");
    EXPECT_EQ(cues[1].name(), "late");
}

TEST_F(TmixDatabaseTest, UpdateDeleteAndClear)
{
    const int point = db_.addCue(makeCue(1, "before"));
    ASSERT_GT(point, 0);

    DcaCue changed = *db_.cue(point);
    changed.setName("after");
    changed.setSlot(1, DcaSlot());
    ASSERT_TRUE(db_.updateCue(point, changed));
    EXPECT_EQ(db_.cue(point)->name(), "after");
    EXPECT_TRUE(db_.cue(point)->slot(1).isEmpty());

    EXPECT_FALSE(db_.updateCue(999, changed));
    EXPECT_FALSE(db_.lastError().isEmpty());

    EXPECT_TRUE(db_.deleteCue(point));
    EXPECT_FALSE(db_.deleteCue(point));
    EXPECT_TRUE(db_.lastError().contains("no cue at point"));

    db_.addCue(makeCue(1, "a"));
    db_.addCue(makeCue(2, "b"));
    ASSERT_TRUE(db_.clearCues());
    EXPECT_TRUE(db_.allCues().isEmpty());
}

TEST_F(TmixDatabaseTest, RollbackRestoresClearedCues)
{
    db_.addCue(makeCue(1, "a"));
    db_.addCue(makeCue(2, "b"));

    ASSERT_TRUE(db_.beginTransaction());
    ASSERT_TRUE(db_.clearCues());
    db_.addCue(makeCue(1, "replacement"));
    ASSERT_TRUE(db_.rollback());

    const QList<DcaCue> cues = db_.allCues();
    ASSERT_EQ(cues.size(), 2);
    EXPECT_EQ(cues[0].name(), "a");
    EXPECT_EQ(cues[1].name(), "b");

    ASSERT_TRUE(db_.beginTransaction());
    ASSERT_TRUE(db_.clearCues());
    ASSERT_TRUE(db_.commit());
    EXPECT_TRUE(db_.allCues().isEmpty());
}

TEST_F(TmixDatabaseTest, ProfilesAndEnsembles)
{
    EXPECT_GT(db_.addProfile(7, "Horton"), 0);
    EXPECT_GT(db_.addProfile(2, "Mayzie", "MAYZ"), 0);
    EXPECT_GT(db_.addEnsemble("Bird Girls", "3,4,5"), 0);

    const QList<Profile> profiles = db_.profiles();
    ASSERT_EQ(profiles.size(), 2);
    EXPECT_EQ(profiles[0].name, "Mayzie");     // Ordered by channel
    EXPECT_EQ(profiles[0].label, "MAYZ");
    EXPECT_TRUE(profiles[1].label.isNull());

    EXPECT_EQ(db_.channelForCharacter("Horton"), 7);
    EXPECT_EQ(db_.channelForCharacter("Nobody"), -1);
    EXPECT_FALSE(db_.profileByName("Nobody").has_value());

    ASSERT_EQ(db_.ensembles().size(), 1);
    EXPECT_EQ(db_.ensembles()[0].channels, "3,4,5");

    const QHash<QString, QString> channels = db_.characterChannels();
    EXPECT_EQ(channels.size(), 3);
    EXPECT_EQ(channels.value("Horton"), "7");
    EXPECT_EQ(channels.value("Mayzie"), "2");
    EXPECT_EQ(channels.value("Bird Girls"), "3,4,5");
}

TEST_F(TmixDatabaseTest, ClosedStoreReportsErrors)
{
    db_.close();
    EXPECT_FALSE(db_.isOpen());

    EXPECT_EQ(db_.addCue(makeCue(1, "nowhere")), -1);
    EXPECT_FALSE(db_.lastError().isEmpty());
    EXPECT_FALSE(db_.clearCues());
    EXPECT_TRUE(db_.characterChannels().isEmpty());
}

TEST(TmixDatabaseMemoryTest, InMemoryStore)
{
    TmixDatabase db;
    ASSERT_TRUE(db.open(":memory:"));
    EXPECT_EQ(db.config("venue"), "Theatre");
    EXPECT_EQ(db.addCue(DcaCue(1, "only", DcaSnapshot())), 10);
}

TEST(TmixDatabaseMemoryTest, IndependentConnections)
{
    TmixDatabase first;
    TmixDatabase second;
    ASSERT_TRUE(first.open(":memory:"));
    ASSERT_TRUE(second.open(":memory:"));

    first.addProfile(1, "Horton");
    EXPECT_EQ(first.profiles().size(), 1);
    EXPECT_TRUE(second.profiles().isEmpty());
}
