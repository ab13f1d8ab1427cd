// src/core/Application.cpp - Core DcaForge Application Implementation
#include "Application.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QTextStream>

#include "CharacterNames.h"
#include "CueGenerator.h"
#include "script/FountainParser.h"
#include "script/ScriptJson.h"
#include "storage/TmixDatabase.h"
#include "utils/Logging.h"
#include "utils/Settings.h"

namespace {

bool parseInt(const QString& text, int* value)
{
    bool ok = false;
    const int parsed = text.toInt(&ok);
    if (ok) {
        *value = parsed;
    }
    return ok;
}

} // namespace

DcaForgeApplication::DcaForgeApplication(QObject* parent)
    : QObject(parent)
{
}

DcaForgeApplication::~DcaForgeApplication()
{
    // The generator holds a pointer to the database
    generator_.reset();
    database_.reset();
}

int DcaForgeApplication::run(const QStringList& arguments)
{
    generator_.reset();
    generatedCues_.clear();
    lastError_.clear();

    Options options;
    const int parseResult = parseArguments(arguments, &options);
    if (parseResult != ExitSuccess || options.scriptPath.isEmpty()) {
        return parseResult;
    }

    Script script;
    if (!loadScript(options.scriptPath, &script)) {
        return ExitFailure;
    }

    if (options.listCharacters) {
        printCharacters(script);
        return ExitSuccess;
    }

    if (!openStore(options)) {
        return ExitFailure;
    }

    generator_ = std::make_unique<CueGenerator>(database_.get());
    generator_->setOptions(options.dca);

    connect(generator_.get(), &CueGenerator::slotExhausted, this,
        [](const QString& character, int cueNumber) {
            qWarning().noquote() << QStringLiteral("Cue %1: %2 shares DCA 1, all DCAs were in use")
                .arg(QString::number(cueNumber), character);
        });

    const DcaAllocationResult result = generator_->generate(script);
    if (!result.ok) {
        return fail(QStringLiteral("Generation failed: %1").arg(result.error));
    }

    generatedCues_ = result.cues;

    QTextStream out(stdout);
    out << "Generated " << result.cues.size() << " DCA cues";
    if (!result.anomalies.isEmpty()) {
        out << " (" << result.anomalies.size() << " DCA conflicts, widen the pool or shorten the window)";
    }
    out << Qt::endl;

    if (!options.exportPath.isEmpty() && !exportCues(options.exportPath, result.cues)) {
        return ExitFailure;
    }

    if (options.dryRun) {
        qInfo() << "Dry run, show file left unchanged";
        return ExitSuccess;
    }

    if (!storeCues(result.cues, options.replace)) {
        return ExitFailure;
    }

    out << "Stored " << generator_->persistedCount() << " cues in "
        << database_->filePath() << Qt::endl;
    return ExitSuccess;
}

// Private Implementation

int DcaForgeApplication::parseArguments(const QStringList& arguments, Options* options)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Generates DCA mute/unmute cues for a show file from a script."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    const QCommandLineOption scriptOption(QStringList() << "s" << "script",
        QStringLiteral("Script to read (.fountain, or .json element list)."), QStringLiteral("file"));
    const QCommandLineOption databaseOption(QStringList() << "d" << "database",
        QStringLiteral("Show file (.tmix) to read channels from and write cues to."), QStringLiteral("file"));
    const QCommandLineOption windowOption(QStringList() << "w" << "window",
        QStringLiteral("Dialogue blocks to look ahead before muting."), QStringLiteral("blocks"));
    const QCommandLineOption slotsOption("slots",
        QStringLiteral("Number of DCAs available (1-12)."), QStringLiteral("count"));
    const QCommandLineOption previewOption("preview-length",
        QStringLiteral("Characters of dialogue shown in cue names."), QStringLiteral("chars"));
    const QCommandLineOption dryRunOption(QStringList() << "n" << "dry-run",
        QStringLiteral("Generate cues without writing the show file."));
    const QCommandLineOption replaceOption("replace",
        QStringLiteral("Delete existing cues before writing."));
    const QCommandLineOption exportOption(QStringList() << "e" << "export",
        QStringLiteral("Also write the generated cues as JSON."), QStringLiteral("file"));
    const QCommandLineOption settingsOption("settings",
        QStringLiteral("Read settings from an INI file."), QStringLiteral("file"));
    const QCommandLineOption verboseOption(QStringList() << "v" << "verbose",
        QStringLiteral("Log debug output."));
    const QCommandLineOption listOption("list-characters",
        QStringLiteral("Print every character in the script and exit."));

    parser.addOptions({ scriptOption, databaseOption, windowOption, slotsOption, previewOption,
                        dryRunOption, replaceOption, exportOption, settingsOption, verboseOption,
                        listOption });
    parser.addPositionalArgument(QStringLiteral("script"), QStringLiteral("Script file, if --script is not given."),
                                 QStringLiteral("[script]"));

    if (!parser.parse(arguments)) {
        return fail(parser.errorText(), ExitUsage);
    }

    QTextStream out(stdout);

    if (parser.isSet(helpOption)) {
        out << parser.helpText();
        return ExitSuccess;
    }

    if (parser.isSet(versionOption)) {
        out << QCoreApplication::applicationName() << ' '
            << QCoreApplication::applicationVersion() << Qt::endl;
        return ExitSuccess;
    }

    options->settingsPath = parser.value(settingsOption);
    options->verbose = parser.isSet(verboseOption);

    loadSettings(options->settingsPath);
    setupLogging(options->verbose);

    // Settings first, command line on top
    options->dca.lookaheadWindow = settings_->getInt(Settings::Keys::Dca::LookaheadWindow);
    options->dca.slotCount = settings_->getInt(Settings::Keys::Dca::SlotCount);
    options->dca.previewLength = settings_->getInt(Settings::Keys::Dca::PreviewLength);
    options->databasePath = settings_->getString(Settings::Keys::Workspace::Database);
    options->scriptPath = settings_->getString(Settings::Keys::Workspace::Script);

    if (parser.isSet(windowOption)) {
        int window = 0;
        if (!parseInt(parser.value(windowOption), &window)
            || window < Settings::Limits::MinLookaheadWindow || window > Settings::Limits::MaxLookaheadWindow) {
            return fail(QStringLiteral("Invalid --window value: %1 (expected %2-%3)")
                .arg(parser.value(windowOption))
                .arg(Settings::Limits::MinLookaheadWindow)
                .arg(Settings::Limits::MaxLookaheadWindow), ExitUsage);
        }
        options->dca.lookaheadWindow = window;
    }

    if (parser.isSet(slotsOption)) {
        int slotCount = 0;
        if (!parseInt(parser.value(slotsOption), &slotCount) || !DcaCue::isValidDca(slotCount)) {
            return fail(QStringLiteral("Invalid --slots value: %1 (expected 1-%2)")
                .arg(parser.value(slotsOption)).arg(DcaCue::DcaCount), ExitUsage);
        }
        options->dca.slotCount = slotCount;
    }

    if (parser.isSet(previewOption)) {
        int length = 0;
        if (!parseInt(parser.value(previewOption), &length)
            || length < Settings::Limits::MinPreviewLength || length > Settings::Limits::MaxPreviewLength) {
            return fail(QStringLiteral("Invalid --preview-length value: %1 (expected %2-%3)")
                .arg(parser.value(previewOption))
                .arg(Settings::Limits::MinPreviewLength)
                .arg(Settings::Limits::MaxPreviewLength), ExitUsage);
        }
        options->dca.previewLength = length;
    }

    if (parser.isSet(databaseOption)) {
        options->databasePath = parser.value(databaseOption);
    }

    const QStringList positional = parser.positionalArguments();
    if (parser.isSet(scriptOption)) {
        options->scriptPath = parser.value(scriptOption);
    }
    else if (!positional.isEmpty()) {
        options->scriptPath = positional.first();
    }

    if (positional.size() > (parser.isSet(scriptOption) ? 0 : 1)) {
        return fail(QStringLiteral("Unexpected arguments: %1").arg(positional.join(' ')), ExitUsage);
    }

    options->exportPath = parser.value(exportOption);
    options->dryRun = parser.isSet(dryRunOption);
    options->replace = parser.isSet(replaceOption);
    options->listCharacters = parser.isSet(listOption);

    if (options->scriptPath.isEmpty()) {
        return fail(QStringLiteral("No script given; use --script or set %1")
            .arg(Settings::Keys::Workspace::Script), ExitUsage);
    }

    if (options->dryRun && options->replace) {
        qWarning() << "--replace has no effect with --dry-run";
    }

    return ExitSuccess;
}

void DcaForgeApplication::loadSettings(const QString& settingsPath)
{
    if (settingsPath.isEmpty()) {
        settings_ = std::make_unique<Settings>();
    }
    else {
        settings_ = std::make_unique<Settings>(settingsPath);
    }
}

void DcaForgeApplication::setupLogging(bool verbose)
{
    bool ok = false;
    const QString levelName = settings_->getString(Settings::Keys::Advanced::LogLevel);
    Logging::Level level = Logging::levelFromString(levelName, &ok);
    if (!ok) {
        qWarning() << "Unknown log level" << levelName << ", using Info";
    }
    if (verbose) {
        level = Logging::Level::Debug;
    }

    const QString logFile = settings_->getBool(Settings::Keys::Advanced::EnableLogging)
        ? settings_->getString(Settings::Keys::Advanced::LogFilePath)
        : QString();

    Logging::install(level, logFile);
    qDebug() << "Logging at level" << Logging::levelToString(level);
}

bool DcaForgeApplication::loadScript(const QString& path, Script* script)
{
    if (!QFileInfo::exists(path)) {
        fail(QStringLiteral("Script not found: %1").arg(path));
        return false;
    }

    if (QFileInfo(path).suffix().compare(QLatin1String("json"), Qt::CaseInsensitive) == 0) {
        QString error;
        if (!ScriptJson::loadFile(path, script, &error)) {
            fail(QStringLiteral("Cannot read script %1: %2").arg(path, error));
            return false;
        }
    }
    else {
        FountainParser parser;
        if (!parser.loadFile(path)) {
            fail(QStringLiteral("Cannot read script %1: %2").arg(path, parser.lastError()));
            return false;
        }
        *script = parser.elements();
    }

    qInfo().noquote() << "Read" << script->size() << "script elements from" << path;
    return true;
}

bool DcaForgeApplication::openStore(const Options& options)
{
    database_ = std::make_unique<TmixDatabase>();

    // A dry run never creates or alters the show file
    if (options.dryRun && !QFileInfo::exists(options.databasePath)) {
        qWarning().noquote() << "Show file" << options.databasePath
                             << "not found, generating without channel assignments";
        if (!database_->open(QStringLiteral(":memory:"))) {
            fail(QStringLiteral("Cannot open scratch show file: %1").arg(database_->lastError()));
            return false;
        }
        return true;
    }

    if (!options.dryRun) {
        QDir().mkpath(QFileInfo(options.databasePath).absolutePath());
    }

    if (!database_->open(options.databasePath, !options.dryRun, !options.dryRun)) {
        fail(QStringLiteral("Cannot open show file %1: %2").arg(options.databasePath, database_->lastError()));
        return false;
    }

    return true;
}

bool DcaForgeApplication::exportCues(const QString& path, const QList<DcaCue>& cues)
{
    QJsonArray array;
    for (const DcaCue& cue : cues) {
        array.append(cue.toJson());
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        fail(QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
        return false;
    }

    file.write(QJsonDocument(array).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        fail(QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
        return false;
    }

    qInfo().noquote() << "Exported" << cues.size() << "cues to" << path;
    return true;
}

void DcaForgeApplication::printCharacters(const Script& script) const
{
    QTextStream out(stdout);
    for (const QString& name : CharacterNames::allCharacters(script)) {
        out << name;
        if (CharacterNames::identity(name) != name) {
            out << " (label: " << CharacterNames::identity(name) << ")";
        }
        out << Qt::endl;
    }
}

bool DcaForgeApplication::storeCues(const QList<DcaCue>& cues, bool replace)
{
    if (!database_->beginTransaction()) {
        fail(QStringLiteral("Cannot write show file: %1").arg(database_->lastError()));
        return false;
    }

    QString error;
    QList<DcaCue> toStore = cues;

    if (replace) {
        if (!database_->clearCues()) {
            error = QStringLiteral("Cannot clear existing cues: %1").arg(database_->lastError());
        }
    }
    else {
        // Append after the cues already in the file
        const int offset = database_->nextCueNumber().first;
        for (DcaCue& cue : toStore) {
            cue.setNumber(cue.number() + offset);
        }
    }

    if (error.isEmpty() && !generator_->persist(toStore)) {
        error = generator_->lastError();
    }

    if (error.isEmpty() && database_->commit()) {
        if (replace) {
            qInfo() << "Replaced existing cues";
        }
        return true;
    }

    if (error.isEmpty()) {
        error = QStringLiteral("Cannot write show file: %1").arg(database_->lastError());
    }
    if (!database_->rollback()) {
        qCritical().noquote() << "Show file rollback failed:" << database_->lastError();
    }
    fail(error + QStringLiteral(" (show file left unchanged)"));
    return false;
}

int DcaForgeApplication::fail(const QString& message, int code)
{
    lastError_ = message;
    qCritical().noquote() << message;
    emit criticalError(message);
    return code;
}
