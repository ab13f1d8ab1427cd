// src/utils/Logging.h - Qt Message Handler with Level Filtering
#pragma once

#include <QString>
#include <QtGlobal>

#include <functional>

/**
 * @brief Process-wide log output for qDebug()/qInfo()/qWarning()/qCritical()
 *
 * install() replaces Qt's default handler. Each message is written as one
 * "[time] [LEVEL] message" line to stderr and, when a log file is set,
 * appended to that file. Messages below the configured level are dropped.
 */
class Logging
{
public:
    enum class Level {
        Debug = 0,
        Info,
        Warning,
        Critical
    };

    static void install(Level level = Level::Info, const QString& logFilePath = QString());
    static void uninstall();

    static void setLevel(Level level);
    static Level level();

    // Accepts "Debug", "Info", "Warning", "Critical" (case-insensitive)
    static Level levelFromString(const QString& name, bool* ok = nullptr);
    static QString levelToString(Level level);

    // Test-only: receives every line that passes the filter. Pass nullptr to clear.
    static void setSink(std::function<void(const QString&)> sink);

private:
    static void handleMessage(QtMsgType type, const QMessageLogContext& context, const QString& message);
    static Level levelForType(QtMsgType type);
};
