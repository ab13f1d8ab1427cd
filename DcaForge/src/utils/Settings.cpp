// src/utils/Settings.cpp - Settings Manager Implementation
#include "Settings.h"

#include <QCoreApplication>
#include <QDebug>
#include <QMutexLocker>
#include <QStringList>

Settings::Settings(QObject* parent)
    : QObject(parent)
    , settings_(nullptr)
{
    settings_ = new QSettings(
        QSettings::IniFormat,
        QSettings::UserScope,
        QCoreApplication::organizationName(),
        QCoreApplication::applicationName(),
        this
    );

    initializeDefaults();
    validateSettings();

    qDebug() << "Settings initialized. File location:" << settings_->fileName();
}

Settings::Settings(const QString& filePath, QObject* parent)
    : QObject(parent)
    , settings_(new QSettings(filePath, QSettings::IniFormat, this))
{
    initializeDefaults();
    validateSettings();

    qDebug() << "Settings initialized. File location:" << settings_->fileName();
}

Settings::~Settings()
{
    sync();
}

// Core Settings Interface

QVariant Settings::value(const QString& key, const QVariant& defaultValue) const
{
    QMutexLocker locker(&mutex_);
    return settings_->value(key, defaults_.value(key, defaultValue));
}

void Settings::setValue(const QString& key, const QVariant& value)
{
    QMutexLocker locker(&mutex_);

    QVariant oldValue = settings_->value(key);

    if (oldValue != value) {
        settings_->setValue(key, value);

        locker.unlock();
        emit settingChanged(key, oldValue, value);
    }
}

void Settings::remove(const QString& key)
{
    QMutexLocker locker(&mutex_);

    if (settings_->contains(key)) {
        QVariant oldValue = settings_->value(key);
        settings_->remove(key);

        locker.unlock();
        emit settingChanged(key, oldValue, QVariant());
    }
}

bool Settings::contains(const QString& key) const
{
    QMutexLocker locker(&mutex_);
    return settings_->contains(key);
}

// Convenience Accessors

QString Settings::getString(const QString& key, const QString& defaultValue) const
{
    return value(key, defaultValue).toString();
}

int Settings::getInt(const QString& key, int defaultValue) const
{
    return value(key, defaultValue).toInt();
}

bool Settings::getBool(const QString& key, bool defaultValue) const
{
    return value(key, defaultValue).toBool();
}

void Settings::sync()
{
    QMutexLocker locker(&mutex_);
    settings_->sync();
}

QString Settings::fileName() const
{
    return settings_->fileName();
}

// Default Values Management

QVariant Settings::getDefaultValue(const QString& key) const
{
    QMutexLocker locker(&mutex_);
    return defaults_.value(key);
}

void Settings::resetToDefaults()
{
    QMutexLocker locker(&mutex_);

    settings_->clear();

    for (auto it = defaults_.constBegin(); it != defaults_.constEnd(); ++it) {
        settings_->setValue(it.key(), it.value());
    }

    settings_->sync();

    locker.unlock();
    emit settingsReset();

    qDebug() << "Settings reset to defaults";
}

// Private Implementation

void Settings::initializeDefaults()
{
    // DCA generation
    defaults_[Keys::Dca::LookaheadWindow] = 7;     // dialogue blocks
    defaults_[Keys::Dca::SlotCount] = 12;
    defaults_[Keys::Dca::PreviewLength] = 30;      // characters

    // Workspace
    defaults_[Keys::Workspace::Database] = QStringLiteral("mix/show.tmix");
    defaults_[Keys::Workspace::Script] = QString();

    // Advanced
    defaults_[Keys::Advanced::LogLevel] = QStringLiteral("Info");
    defaults_[Keys::Advanced::EnableLogging] = true;
    defaults_[Keys::Advanced::LogFilePath] = QString();

    qDebug() << "Initialized" << defaults_.size() << "default settings";
}

void Settings::validateSettings()
{
    QMutexLocker locker(&mutex_);

    resetIfOutOfRange(Keys::Dca::LookaheadWindow, Limits::MinLookaheadWindow, Limits::MaxLookaheadWindow);
    resetIfOutOfRange(Keys::Dca::SlotCount, 1, 12);
    resetIfOutOfRange(Keys::Dca::PreviewLength, Limits::MinPreviewLength, Limits::MaxPreviewLength);

    const QStringList validLevels = { "Debug", "Info", "Warning", "Critical" };
    QString level = settings_->value(Keys::Advanced::LogLevel, defaults_[Keys::Advanced::LogLevel]).toString();
    if (!validLevels.contains(level)) {
        settings_->setValue(Keys::Advanced::LogLevel, defaults_[Keys::Advanced::LogLevel]);
        qWarning() << "Invalid log level" << level << ", reset to default";
    }

    settings_->sync();
}

void Settings::resetIfOutOfRange(const QString& key, int minimum, int maximum)
{
    bool ok = false;
    int current = settings_->value(key, defaults_[key]).toInt(&ok);
    if (!ok || current < minimum || current > maximum) {
        settings_->setValue(key, defaults_[key]);
        qWarning() << "Invalid" << key << "value, reset to default" << defaults_[key].toInt();
    }
}
