// src/storage/TmixDatabase.cpp - SQLite Show File Store Implementation
#include "TmixDatabase.h"

#include <QDebug>
#include <QFileInfo>
#include <QSqlError>
#include <QSqlQuery>
#include <QSqlRecord>
#include <QUuid>
#include <QVariant>

namespace {

QVariant nullable(const QString& value)
{
    return value.isNull() ? QVariant() : QVariant(value);
}

QString stringOrNull(const QVariant& value)
{
    return value.isNull() ? QString() : value.toString();
}

} // namespace

TmixDatabase::TmixDatabase()
    : connectionName_(QStringLiteral("tmix-") + QUuid::createUuid().toString(QUuid::WithoutBraces))
{
}

TmixDatabase::~TmixDatabase()
{
    close();
}

bool TmixDatabase::open(const QString& filePath, bool createSchema, bool initConfig)
{
    close();
    lastError_.clear();

    const bool isNew = filePath == QLatin1String(":memory:") || !QFileInfo::exists(filePath);

    db_ = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connectionName_);
    db_.setDatabaseName(filePath);

    if (!db_.open()) {
        fail(QStringLiteral("cannot open %1: %2").arg(filePath, db_.lastError().text()));
        close();
        return false;
    }

    filePath_ = filePath;

    if (createSchema && !this->createSchema()) {
        close();
        return false;
    }

    if (createSchema && initConfig && isNew && !this->initConfig()) {
        close();
        return false;
    }

    qDebug() << "Opened show file" << filePath << (isNew ? "(new)" : "");
    return true;
}

void TmixDatabase::close()
{
    if (db_.isValid()) {
        db_.close();
        db_ = QSqlDatabase();
        QSqlDatabase::removeDatabase(connectionName_);
    }
    filePath_.clear();
}

QStringList TmixDatabase::tables() const
{
    return db_.isOpen() ? db_.tables() : QStringList();
}

// Transactions

bool TmixDatabase::beginTransaction()
{
    if (!isOpen()) {
        return fail(QStringLiteral("begin transaction: no show file open"));
    }
    if (!db_.transaction()) {
        return fail(QStringLiteral("begin transaction: %1").arg(db_.lastError().text()));
    }
    return true;
}

bool TmixDatabase::commit()
{
    if (!db_.commit()) {
        return fail(QStringLiteral("commit: %1").arg(db_.lastError().text()));
    }
    return true;
}

bool TmixDatabase::rollback()
{
    if (!db_.rollback()) {
        return fail(QStringLiteral("rollback: %1").arg(db_.lastError().text()));
    }
    qDebug() << "Rolled back changes to" << filePath_;
    return true;
}

// Cue List

QPair<int, int> TmixDatabase::nextCueNumber() const
{
    QSqlQuery query(db_);
    query.prepare(QStringLiteral("SELECT MAX(number), MAX(point) FROM cues"));

    if (!exec(query, QStringLiteral("next cue number")) || !query.next()) {
        return qMakePair(0, 10);
    }

    const int maxNumber = query.value(0).isNull() ? 0 : query.value(0).toInt();
    const int maxPoint = query.value(1).isNull() ? 0 : query.value(1).toInt();
    return qMakePair(maxNumber, maxPoint + 10);
}

int TmixDatabase::addCue(const DcaCue& cue)
{
    if (!isOpen()) {
        fail(QStringLiteral("add cue: no show file open"));
        return -1;
    }

    DcaCue stored = cue;
    if (stored.number() <= 0 || stored.point() <= 0) {
        const QPair<int, int> next = nextCueNumber();
        if (stored.number() <= 0) {
            stored.setNumber(next.first + 1);
        }
        if (stored.point() <= 0) {
            stored.setPoint(next.second);
        }
    }

    const QStringList columns = cueColumns();
    QStringList placeholders;
    for (const QString& column : columns) {
        placeholders.append(QStringLiteral(":") + column);
    }

    QSqlQuery query(db_);
    query.prepare(QStringLiteral("INSERT INTO cues (%1) VALUES (%2)")
        .arg(columns.join(QStringLiteral(", ")), placeholders.join(QStringLiteral(", "))));
    bindCue(query, stored);

    if (!exec(query, QStringLiteral("add cue %1").arg(stored.number()))) {
        return -1;
    }

    qDebug() << "Stored cue" << stored.number() << "at point" << stored.point();
    return stored.point();
}

std::optional<DcaCue> TmixDatabase::cue(int point) const
{
    QSqlQuery query(db_);
    query.prepare(QStringLiteral("SELECT %1 FROM cues WHERE point = :point")
        .arg(cueColumns().join(QStringLiteral(", "))));
    query.bindValue(QStringLiteral(":point"), point);

    if (!exec(query, QStringLiteral("get cue at point %1").arg(point)) || !query.next()) {
        return std::nullopt;
    }
    return cueFromQuery(query);
}

QList<DcaCue> TmixDatabase::allCues() const
{
    QList<DcaCue> cues;

    QSqlQuery query(db_);
    query.prepare(QStringLiteral("SELECT %1 FROM cues ORDER BY point")
        .arg(cueColumns().join(QStringLiteral(", "))));

    if (!exec(query, QStringLiteral("list cues"))) {
        return cues;
    }

    while (query.next()) {
        cues.append(cueFromQuery(query));
    }
    return cues;
}

bool TmixDatabase::updateCue(int point, const DcaCue& cue)
{
    QStringList assignments;
    const QStringList columns = cueColumns();
    for (const QString& column : columns) {
        assignments.append(QStringLiteral("%1 = :%1").arg(column));
    }

    QSqlQuery query(db_);
    query.prepare(QStringLiteral("UPDATE cues SET %1 WHERE point = :oldPoint")
        .arg(assignments.join(QStringLiteral(", "))));
    bindCue(query, cue);
    query.bindValue(QStringLiteral(":oldPoint"), point);

    if (!exec(query, QStringLiteral("update cue at point %1").arg(point))) {
        return false;
    }
    if (query.numRowsAffected() == 0) {
        return fail(QStringLiteral("update cue: no cue at point %1").arg(point));
    }
    return true;
}

bool TmixDatabase::deleteCue(int point)
{
    QSqlQuery query(db_);
    query.prepare(QStringLiteral("DELETE FROM cues WHERE point = :point"));
    query.bindValue(QStringLiteral(":point"), point);

    if (!exec(query, QStringLiteral("delete cue at point %1").arg(point))) {
        return false;
    }
    if (query.numRowsAffected() == 0) {
        return fail(QStringLiteral("delete cue: no cue at point %1").arg(point));
    }
    return true;
}

bool TmixDatabase::clearCues()
{
    QSqlQuery query(db_);
    query.prepare(QStringLiteral("DELETE FROM cues"));

    if (!exec(query, QStringLiteral("clear cues"))) {
        return false;
    }

    qDebug() << "Cleared" << query.numRowsAffected() << "cues from" << filePath_;
    return true;
}

// Profiles and Ensembles

QList<Profile> TmixDatabase::profiles() const
{
    QList<Profile> result;

    QSqlQuery query(db_);
    query.prepare(QStringLiteral("SELECT id, channel, name, label FROM profiles ORDER BY channel"));

    if (!exec(query, QStringLiteral("list profiles"))) {
        return result;
    }

    while (query.next()) {
        Profile profile;
        profile.id = query.value(0).toInt();
        profile.channel = query.value(1).toInt();
        profile.name = stringOrNull(query.value(2));
        profile.label = stringOrNull(query.value(3));
        result.append(profile);
    }
    return result;
}

std::optional<Profile> TmixDatabase::profileByName(const QString& name) const
{
    QSqlQuery query(db_);
    query.prepare(QStringLiteral("SELECT id, channel, name, label FROM profiles WHERE name = :name"));
    query.bindValue(QStringLiteral(":name"), name);

    if (!exec(query, QStringLiteral("get profile %1").arg(name)) || !query.next()) {
        return std::nullopt;
    }

    Profile profile;
    profile.id = query.value(0).toInt();
    profile.channel = query.value(1).toInt();
    profile.name = stringOrNull(query.value(2));
    profile.label = stringOrNull(query.value(3));
    return profile;
}

int TmixDatabase::channelForCharacter(const QString& character) const
{
    const std::optional<Profile> profile = profileByName(character);
    return profile ? profile->channel : -1;
}

int TmixDatabase::addProfile(int channel, const QString& name, const QString& label)
{
    QSqlQuery query(db_);
    query.prepare(QStringLiteral("INSERT INTO profiles (channel, name, label) VALUES (:channel, :name, :label)"));
    query.bindValue(QStringLiteral(":channel"), channel);
    query.bindValue(QStringLiteral(":name"), name);
    query.bindValue(QStringLiteral(":label"), nullable(label));

    if (!exec(query, QStringLiteral("add profile %1").arg(name))) {
        return -1;
    }
    return query.lastInsertId().toInt();
}

QList<Ensemble> TmixDatabase::ensembles() const
{
    QList<Ensemble> result;

    QSqlQuery query(db_);
    query.prepare(QStringLiteral("SELECT id, name, channels FROM ensembles ORDER BY id"));

    if (!exec(query, QStringLiteral("list ensembles"))) {
        return result;
    }

    while (query.next()) {
        Ensemble ensemble;
        ensemble.id = query.value(0).toInt();
        ensemble.name = stringOrNull(query.value(1));
        ensemble.channels = stringOrNull(query.value(2));
        result.append(ensemble);
    }
    return result;
}

int TmixDatabase::addEnsemble(const QString& name, const QString& channels)
{
    QSqlQuery query(db_);
    query.prepare(QStringLiteral("INSERT INTO ensembles (name, channels) VALUES (:name, :channels)"));
    query.bindValue(QStringLiteral(":name"), name);
    query.bindValue(QStringLiteral(":channels"), channels);

    if (!exec(query, QStringLiteral("add ensemble %1").arg(name))) {
        return -1;
    }
    return query.lastInsertId().toInt();
}

QHash<QString, QString> TmixDatabase::characterChannels() const
{
    QHash<QString, QString> channels;

    const QList<Profile> allProfiles = profiles();
    for (const Profile& profile : allProfiles) {
        if (!profile.name.isEmpty()) {
            channels.insert(profile.name, QString::number(profile.channel));
        }
    }

    const QList<Ensemble> allEnsembles = ensembles();
    for (const Ensemble& ensemble : allEnsembles) {
        if (!ensemble.name.isEmpty()) {
            channels.insert(ensemble.name, ensemble.channels);
        }
    }

    return channels;
}

// Console Configuration

QString TmixDatabase::config(const QString& param) const
{
    QSqlQuery query(db_);
    query.prepare(QStringLiteral("SELECT value FROM config WHERE param = :param"));
    query.bindValue(QStringLiteral(":param"), param);

    if (!exec(query, QStringLiteral("get config %1").arg(param)) || !query.next()) {
        return QString();
    }
    return stringOrNull(query.value(0));
}

bool TmixDatabase::setConfig(const QString& param, const QString& value)
{
    QSqlQuery query(db_);
    query.prepare(QStringLiteral("INSERT OR REPLACE INTO config (param, value) VALUES (:param, :value)"));
    query.bindValue(QStringLiteral(":param"), param);
    query.bindValue(QStringLiteral(":value"), nullable(value));

    return exec(query, QStringLiteral("set config %1").arg(param));
}

QMap<QString, QString> TmixDatabase::allConfig() const
{
    QMap<QString, QString> result;

    QSqlQuery query(db_);
    query.prepare(QStringLiteral("SELECT param, value FROM config"));

    if (!exec(query, QStringLiteral("list config"))) {
        return result;
    }

    while (query.next()) {
        result.insert(query.value(0).toString(), stringOrNull(query.value(1)));
    }
    return result;
}

const QMap<QString, QString>& TmixDatabase::defaultConfig()
{
    static const QMap<QString, QString> defaults = {
        { "targetConsole", "GLD-112" },
        { "consoleModel", "GLD-112" },
        { "consoleVersion", "1.61" },
        { "consoleIP", "192.168.1.1" },
        { "consoleMAC", "00:00:00:00:00:00" },
        { "autoConnect", "1" },
        { "designer", "" },
        { "venue", "Theatre" },
        { "dcas", "1,2,3,4,5,6,7,8" },
        { "channels", "1,2,3,4,5,6,7,8,9,10,11,12,13,14,15,16" },
        { "backupChannels", "" },
        { "fxAssigns", "1,2,3,4" },
        { "fxMutes", "1,2,3,4" },
        { "defaultFX", "-1" },
        { "fxBusMap", "4=1104,1=1101,2=1102,3=1103" },
        { "buttonMap", "1=17,0=18" },
        { "muteButtonMap", "" },
        { "muteButtonAssignKeys", "" },
        { "profileSchemaVersion", "2" },
        { "snippetRecall", "0" },
        { "sceneRecall", "0" },
        { "qLabCues", "0" },
        { "qLabPasscode", "" },
        { "qLabSuppressBack", "0" },
        { "enableChannelMonitoring", "0" },
        { "activeChannelHighlight", "1" },
        { "gangLR", "0" },
        { "gangLRChannels", "" },
        { "gangLRName", "Band" },
        { "gangLRColour", "11" },
        { "labelLR", "1" },
        { "labelTargetBus", "1410" },
        { "consoleMuteDCAUnassign", "0" },
        { "suppressDCAMuteBackupSwitch", "0" },
        { "channelLevels", "1" },
        { "cueZeroSnippets", "" },
        { "cueZeroResetLevels", "1" },
        { "cueZeroScenes", "" },
        { "cueZeroScenePoints", "" },
        { "dimDCAFaders", "0" },
        { "dimDCAFadersSuppressColours", "0" },
        { "qlclDyn1", "0" },
        { "spareBackup", "0" },
        { "minVersion", "3.1" },
    };
    return defaults;
}

// Private Implementation

bool TmixDatabase::createSchema()
{
    QStringList cueDefinitions;
    cueDefinitions << QStringLiteral("number INTEGER DEFAULT 999")
                   << QStringLiteral("point INTEGER DEFAULT 0")
                   << QStringLiteral("name TEXT");
    for (int dca = 1; dca <= DcaCue::DcaCount; ++dca) {
        cueDefinitions << channelsColumn(dca) + QStringLiteral(" TEXT");
    }
    for (int dca = 1; dca <= DcaCue::DcaCount; ++dca) {
        cueDefinitions << labelColumn(dca) + QStringLiteral(" TEXT");
    }
    cueDefinitions << QStringLiteral("channelPositions TEXT")
                   << QStringLiteral("channelProfiles TEXT")
                   << QStringLiteral("fxMutes TEXT")
                   << QStringLiteral("channelFX TEXT")
                   << QStringLiteral("snippets TEXT")
                   << QStringLiteral("qLabCue TEXT")
                   << QStringLiteral("channelLevels TEXT")
                   << QStringLiteral("scenes TEXT")
                   << QStringLiteral("colour INTEGER")
                   << QStringLiteral("scenePoints TEXT");

    const QStringList statements = {
        QStringLiteral("CREATE TABLE IF NOT EXISTS config (param TEXT PRIMARY KEY, value TEXT)"),
        QStringLiteral("CREATE TABLE IF NOT EXISTS cues (%1)").arg(cueDefinitions.join(QStringLiteral(", "))),
        QStringLiteral("CREATE TABLE IF NOT EXISTS profiles (id INTEGER PRIMARY KEY, channel INTEGER, "
                       "name TEXT, label TEXT, \"default\" INTEGER DEFAULT 1, data TEXT)"),
        QStringLiteral("CREATE TABLE IF NOT EXISTS ensembles (id INTEGER PRIMARY KEY, name TEXT, "
                       "channels TEXT, channelProfiles TEXT)"),
        QStringLiteral("CREATE TABLE IF NOT EXISTS positions (id INTEGER PRIMARY KEY, name TEXT, "
                       "shortName TEXT, delay REAL, pan REAL, buses TEXT)"),
        QStringLiteral("CREATE TABLE IF NOT EXISTS actors (id INTEGER PRIMARY KEY, channel INTEGER, "
                       "name TEXT, \"order\" INTEGER DEFAULT 0, active INTEGER DEFAULT 0)"),
        QStringLiteral("CREATE TABLE IF NOT EXISTS actorProfiles (actor INTEGER, profile INTEGER, data TEXT, "
                       "PRIMARY KEY (actor, profile))"),
        QStringLiteral("CREATE TABLE IF NOT EXISTS actorGroups (id INTEGER PRIMARY KEY, name TEXT, data TEXT)"),
        QStringLiteral("CREATE TABLE IF NOT EXISTS snippetCache (snippet INTEGER PRIMARY KEY, name TEXT)"),
        QStringLiteral("CREATE TABLE IF NOT EXISTS fxCache (fx INTEGER PRIMARY KEY, name TEXT)"),
        QStringLiteral("CREATE TABLE IF NOT EXISTS sceneCache (scene INTEGER PRIMARY KEY, "
                       "point INTEGER DEFAULT 0, name TEXT)"),
    };

    for (const QString& statement : statements) {
        QSqlQuery query(db_);
        query.prepare(statement);
        if (!exec(query, QStringLiteral("create schema"))) {
            return false;
        }
    }
    return true;
}

bool TmixDatabase::initConfig()
{
    if (!db_.transaction()) {
        return fail(QStringLiteral("init config: %1").arg(db_.lastError().text()));
    }

    const QMap<QString, QString>& defaults = defaultConfig();
    for (auto it = defaults.constBegin(); it != defaults.constEnd(); ++it) {
        if (!setConfig(it.key(), it.value())) {
            db_.rollback();
            return false;
        }
    }

    if (!db_.commit()) {
        return fail(QStringLiteral("init config: %1").arg(db_.lastError().text()));
    }

    qDebug() << "Initialized" << defaults.size() << "default config values";
    return true;
}

bool TmixDatabase::exec(QSqlQuery& query, const QString& context) const
{
    if (!db_.isOpen()) {
        return fail(QStringLiteral("%1: no show file open").arg(context));
    }
    if (!query.exec()) {
        return fail(QStringLiteral("%1: %2").arg(context, query.lastError().text()));
    }
    return true;
}

bool TmixDatabase::fail(const QString& message) const
{
    lastError_ = message;
    qWarning().noquote() << "Show file error:" << message;
    return false;
}

DcaCue TmixDatabase::cueFromQuery(const QSqlQuery& query) const
{
    const QSqlRecord record = query.record();

    DcaCue cue;
    cue.setNumber(query.value(record.indexOf(QStringLiteral("number"))).toInt());
    cue.setPoint(query.value(record.indexOf(QStringLiteral("point"))).toInt());
    cue.setName(stringOrNull(query.value(record.indexOf(QStringLiteral("name")))));
    cue.setColour(query.value(record.indexOf(QStringLiteral("colour"))).toInt());

    for (int dca = 1; dca <= DcaCue::DcaCount; ++dca) {
        DcaSlot slot;
        slot.channels = stringOrNull(query.value(record.indexOf(channelsColumn(dca))));
        slot.label = stringOrNull(query.value(record.indexOf(labelColumn(dca))));
        cue.setSlot(dca, slot);
    }
    return cue;
}

void TmixDatabase::bindCue(QSqlQuery& query, const DcaCue& cue) const
{
    query.bindValue(QStringLiteral(":number"), cue.number());
    query.bindValue(QStringLiteral(":point"), cue.point());
    query.bindValue(QStringLiteral(":name"), nullable(cue.name()));
    query.bindValue(QStringLiteral(":colour"), cue.colour());

    for (int dca = 1; dca <= DcaCue::DcaCount; ++dca) {
        query.bindValue(QStringLiteral(":") + channelsColumn(dca), nullable(cue.channels(dca)));
        query.bindValue(QStringLiteral(":") + labelColumn(dca), nullable(cue.label(dca)));
    }
}

QString TmixDatabase::channelsColumn(int dca)
{
    return QStringLiteral("dca%1Channels").arg(dca, 2, 10, QLatin1Char('0'));
}

QString TmixDatabase::labelColumn(int dca)
{
    return QStringLiteral("dca%1Label").arg(dca, 2, 10, QLatin1Char('0'));
}

QStringList TmixDatabase::cueColumns()
{
    QStringList columns;
    columns << QStringLiteral("number") << QStringLiteral("point")
            << QStringLiteral("name") << QStringLiteral("colour");
    for (int dca = 1; dca <= DcaCue::DcaCount; ++dca) {
        columns << channelsColumn(dca) << labelColumn(dca);
    }
    return columns;
}
