// tests/SettingsTests.cpp - QSettings wrapper with defaults and validation
#include <QSettings>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "utils/Settings.h"

namespace {

class SettingsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir_.isValid());
        path_ = dir_.filePath("dcaforge.ini");
    }

    void writeRaw(const QString& key, const QVariant& value)
    {
        QSettings raw(path_, QSettings::IniFormat);
        raw.setValue(key, value);
        raw.sync();
    }

    QTemporaryDir dir_;
    QString path_;
};

} // namespace

TEST_F(SettingsTest, DefaultsApplyToEmptyFile)
{
    Settings settings(path_);

    EXPECT_EQ(settings.getInt(Settings::Keys::Dca::LookaheadWindow), 7);
    EXPECT_EQ(settings.getInt(Settings::Keys::Dca::SlotCount), 12);
    EXPECT_EQ(settings.getInt(Settings::Keys::Dca::PreviewLength), 30);
    EXPECT_EQ(settings.getString(Settings::Keys::Workspace::Database), "mix/show.tmix");
    EXPECT_TRUE(settings.getString(Settings::Keys::Workspace::Script).isEmpty());
    EXPECT_EQ(settings.getString(Settings::Keys::Advanced::LogLevel), "Info");
    EXPECT_TRUE(settings.getBool(Settings::Keys::Advanced::EnableLogging));
    EXPECT_EQ(settings.fileName(), path_);
}

TEST_F(SettingsTest, StoredValuesWin)
{
    writeRaw(Settings::Keys::Dca::LookaheadWindow, 4);
    writeRaw(Settings::Keys::Workspace::Database, "mix/seuss.tmix");

    Settings settings(path_);
    EXPECT_EQ(settings.getInt(Settings::Keys::Dca::LookaheadWindow), 4);
    EXPECT_EQ(settings.getString(Settings::Keys::Workspace::Database), "mix/seuss.tmix");
}

TEST_F(SettingsTest, OutOfRangeValuesAreReset)
{
    writeRaw(Settings::Keys::Dca::SlotCount, 40);
    writeRaw(Settings::Keys::Dca::LookaheadWindow, "lots");
    writeRaw(Settings::Keys::Dca::PreviewLength, 10);
    writeRaw(Settings::Keys::Advanced::LogLevel, "Loud");

    Settings settings(path_);
    EXPECT_EQ(settings.getInt(Settings::Keys::Dca::SlotCount), 12);
    EXPECT_EQ(settings.getInt(Settings::Keys::Dca::LookaheadWindow), 7);
    EXPECT_EQ(settings.getInt(Settings::Keys::Dca::PreviewLength), 10);
    EXPECT_EQ(settings.getString(Settings::Keys::Advanced::LogLevel), "Info");

    QSettings raw(path_, QSettings::IniFormat);
    EXPECT_EQ(raw.value(Settings::Keys::Dca::SlotCount).toInt(), 12);
}

TEST_F(SettingsTest, SetValueNotifiesOnlyOnChange)
{
    Settings settings(path_);

    int changes = 0;
    QVariant lastOld;
    QVariant lastNew;
    QObject::connect(&settings, &Settings::settingChanged,
        [&](const QString&, const QVariant& oldValue, const QVariant& newValue) {
            ++changes;
            lastOld = oldValue;
            lastNew = newValue;
        });

    settings.setValue(Settings::Keys::Dca::SlotCount, 8);
    settings.setValue(Settings::Keys::Dca::SlotCount, 8);

    EXPECT_EQ(changes, 1);
    EXPECT_FALSE(lastOld.isValid());
    EXPECT_EQ(lastNew.toInt(), 8);
    EXPECT_EQ(settings.getInt(Settings::Keys::Dca::SlotCount), 8);
}

TEST_F(SettingsTest, ValuesPersistToFile)
{
    {
        Settings settings(path_);
        settings.setValue(Settings::Keys::Workspace::Script, "scripts/seussical.fountain");
    }

    Settings reopened(path_);
    EXPECT_EQ(reopened.getString(Settings::Keys::Workspace::Script), "scripts/seussical.fountain");
    EXPECT_TRUE(reopened.contains(Settings::Keys::Workspace::Script));
}

TEST_F(SettingsTest, RemoveFallsBackToDefault)
{
    Settings settings(path_);
    settings.setValue(Settings::Keys::Dca::PreviewLength, 50);
    settings.remove(Settings::Keys::Dca::PreviewLength);

    EXPECT_FALSE(settings.contains(Settings::Keys::Dca::PreviewLength));
    EXPECT_EQ(settings.getInt(Settings::Keys::Dca::PreviewLength), 30);
}

TEST_F(SettingsTest, ResetToDefaults)
{
    Settings settings(path_);
    settings.setValue(Settings::Keys::Dca::LookaheadWindow, 3);
    settings.setValue("custom/key", "x");

    bool reset = false;
    QObject::connect(&settings, &Settings::settingsReset, [&reset]() { reset = true; });

    settings.resetToDefaults();

    EXPECT_TRUE(reset);
    EXPECT_EQ(settings.getInt(Settings::Keys::Dca::LookaheadWindow), 7);
    EXPECT_FALSE(settings.contains("custom/key"));
    EXPECT_EQ(settings.getDefaultValue(Settings::Keys::Dca::SlotCount).toInt(), 12);
}
