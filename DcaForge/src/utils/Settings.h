// src/utils/Settings.h - Application Settings Manager
#pragma once

#include <QMap>
#include <QMutex>
#include <QObject>
#include <QSettings>
#include <QString>
#include <QVariant>

/**
 * @brief Centralized settings management for DcaForge
 *
 * Wraps QSettings with a table of defaults and validation. Values read for a
 * key that was never stored fall back to the registered default.
 */
class Settings : public QObject
{
    Q_OBJECT

public:
    // Settings stored under the user scope for the application
    explicit Settings(QObject* parent = nullptr);

    // Settings stored in an explicit INI file
    explicit Settings(const QString& filePath, QObject* parent = nullptr);

    ~Settings();

    // Core settings interface
    QVariant value(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);
    void remove(const QString& key);
    bool contains(const QString& key) const;

    // Convenience accessors
    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;

    void sync();
    QString fileName() const;

    // Default values management
    QVariant getDefaultValue(const QString& key) const;
    void resetToDefaults();

    struct Keys {
        struct Dca {
            static inline const QString LookaheadWindow = QStringLiteral("dca/lookaheadWindow");
            static inline const QString SlotCount = QStringLiteral("dca/slotCount");
            static inline const QString PreviewLength = QStringLiteral("dca/previewLength");
        };

        struct Workspace {
            static inline const QString Database = QStringLiteral("workspace/database");
            static inline const QString Script = QStringLiteral("workspace/script");
        };

        struct Advanced {
            static inline const QString LogLevel = QStringLiteral("advanced/logLevel");
            static inline const QString EnableLogging = QStringLiteral("advanced/enableLogging");
            static inline const QString LogFilePath = QStringLiteral("advanced/logFilePath");
        };
    };

    // Accepted ranges, shared with the command line
    struct Limits {
        static constexpr int MinLookaheadWindow = 1;
        static constexpr int MaxLookaheadWindow = 100;
        static constexpr int MinPreviewLength = 4;
        static constexpr int MaxPreviewLength = 200;
    };

signals:
    void settingChanged(const QString& key, const QVariant& oldValue, const QVariant& newValue);
    void settingsReset();

private:
    void initializeDefaults();
    void validateSettings();
    void resetIfOutOfRange(const QString& key, int minimum, int maximum);

    QSettings* settings_;
    QMap<QString, QVariant> defaults_;
    mutable QMutex mutex_;
};
