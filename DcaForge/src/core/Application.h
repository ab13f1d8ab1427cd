// src/core/Application.h - Core DcaForge Application Class
#pragma once

#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>
#include <memory>

#include "DcaAllocator.h"
#include "script/ScriptElement.h"

// Forward declarations
class CueGenerator;
class Settings;
class TmixDatabase;

/**
 * @brief The DcaForge command line application
 *
 * Reads a script, opens the show file, generates the DCA cue list and writes
 * it back. Settings supply defaults for every option; command line values
 * win over settings.
 */
class DcaForgeApplication : public QObject
{
    Q_OBJECT

public:
    enum ExitCode {
        ExitSuccess = 0,
        ExitFailure = 1,
        ExitUsage = 2
    };

    explicit DcaForgeApplication(QObject* parent = nullptr);
    ~DcaForgeApplication();

    /**
     * @brief Run one generation from the given arguments
     * @param arguments Full argument list, program name first
     * @return Process exit code
     */
    int run(const QStringList& arguments);

    // Valid after run()
    const QList<DcaCue>& generatedCues() const { return generatedCues_; }
    QString lastError() const { return lastError_; }

signals:
    /**
     * @brief Emitted when a run stops on an error
     * @param message Error message
     */
    void criticalError(const QString& message);

private:
    struct Options {
        QString scriptPath;
        QString databasePath;
        QString settingsPath;
        QString exportPath;
        DcaOptions dca;
        bool dryRun = false;
        bool replace = false;
        bool verbose = false;
        bool listCharacters = false;
    };

    /**
     * @brief Parse arguments on top of the values from settings
     * @return ExitSuccess to continue, anything else to stop with that code
     */
    int parseArguments(const QStringList& arguments, Options* options);

    void loadSettings(const QString& settingsPath);
    void setupLogging(bool verbose);

    bool loadScript(const QString& path, Script* script);
    bool openStore(const Options& options);
    bool exportCues(const QString& path, const QList<DcaCue>& cues);
    void printCharacters(const Script& script) const;

    /**
     * @brief Write the cues in one transaction, clearing the old list first on replace
     * @return false with the show file unchanged if any step fails
     */
    bool storeCues(const QList<DcaCue>& cues, bool replace);
    int fail(const QString& message, int code = ExitFailure);

    std::unique_ptr<Settings> settings_;
    std::unique_ptr<TmixDatabase> database_;
    std::unique_ptr<CueGenerator> generator_;

    QList<DcaCue> generatedCues_;
    QString lastError_;
};
