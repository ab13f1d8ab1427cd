// src/utils/Logging.cpp - Qt Message Handler Implementation
#include "Logging.h"

#include <QDateTime>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>

#include <cstdio>
#include <functional>
#include <memory>

namespace {

QMutex g_mutex;
Logging::Level g_level = Logging::Level::Info;
std::unique_ptr<QFile> g_logFile;
std::function<void(const QString&)> g_sink;

} // namespace

void Logging::install(Level level, const QString& logFilePath)
{
    {
        QMutexLocker locker(&g_mutex);

        g_level = level;
        g_logFile.reset();

        if (!logFilePath.isEmpty()) {
            auto file = std::make_unique<QFile>(logFilePath);
            if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                g_logFile = std::move(file);
            }
            else {
                std::fprintf(stderr, "Cannot open log file %s: %s\n",
                             qPrintable(logFilePath), qPrintable(file->errorString()));
            }
        }

    }

    qInstallMessageHandler(&Logging::handleMessage);
}

void Logging::uninstall()
{
    qInstallMessageHandler(nullptr);

    QMutexLocker locker(&g_mutex);
    g_logFile.reset();
}

void Logging::setLevel(Level level)
{
    QMutexLocker locker(&g_mutex);
    g_level = level;
}

Logging::Level Logging::level()
{
    QMutexLocker locker(&g_mutex);
    return g_level;
}

Logging::Level Logging::levelFromString(const QString& name, bool* ok)
{
    const QString key = name.trimmed().toLower();
    if (ok) {
        *ok = true;
    }

    if (key == "debug") {
        return Level::Debug;
    }
    if (key == "info") {
        return Level::Info;
    }
    if (key == "warning") {
        return Level::Warning;
    }
    if (key == "critical") {
        return Level::Critical;
    }

    if (ok) {
        *ok = false;
    }
    return Level::Info;
}

QString Logging::levelToString(Level level)
{
    switch (level) {
    case Level::Debug:    return QStringLiteral("Debug");
    case Level::Info:     return QStringLiteral("Info");
    case Level::Warning:  return QStringLiteral("Warning");
    case Level::Critical: return QStringLiteral("Critical");
    }
    return QStringLiteral("Info");
}

void Logging::setSink(std::function<void(const QString&)> sink)
{
    QMutexLocker locker(&g_mutex);
    g_sink = std::move(sink);
}

Logging::Level Logging::levelForType(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:    return Level::Debug;
    case QtInfoMsg:     return Level::Info;
    case QtWarningMsg:  return Level::Warning;
    case QtCriticalMsg:
    case QtFatalMsg:    return Level::Critical;
    }
    return Level::Info;
}

void Logging::handleMessage(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    Q_UNUSED(context);

    const Level messageLevel = levelForType(type);

    QMutexLocker locker(&g_mutex);

    if (static_cast<int>(messageLevel) < static_cast<int>(g_level)) {
        return;
    }

    const QString tag = (type == QtFatalMsg) ? QStringLiteral("FATAL") : levelToString(messageLevel).toUpper();
    const QString line = QStringLiteral("[%1] [%2] %3")
        .arg(QDateTime::currentDateTime().toString(QStringLiteral("hh:mm:ss.zzz")), tag, message);

    // One full line per call, flushed, so concurrent messages never interleave
    const QByteArray bytes = line.toLocal8Bit();
    std::fprintf(stderr, "%s\n", bytes.constData());
    std::fflush(stderr);

    if (g_logFile) {
        QTextStream stream(g_logFile.get());
        stream << line << '\n';
        stream.flush();
    }

    // Called unlocked so a sink may log itself
    const std::function<void(const QString&)> sink = g_sink;
    locker.unlock();

    if (sink) {
        sink(line);
    }
}
