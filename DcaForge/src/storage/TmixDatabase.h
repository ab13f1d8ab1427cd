// src/storage/TmixDatabase.h - SQLite Show File Store
#pragma once

#include <QHash>
#include <QList>
#include <QMap>
#include <QPair>
#include <QSqlDatabase>
#include <QString>
#include <QStringList>

#include <optional>

#include "CueStore.h"

class QSqlQuery;

/**
 * @brief Channel profile of one character
 */
struct Profile {
    int id = 0;
    int channel = 0;
    QString name;
    QString label;
};

/**
 * @brief Named group of channels, e.g. a chorus sharing one DCA
 */
struct Ensemble {
    int id = 0;
    QString name;
    QString channels;   // Comma-joined channel numbers
};

/**
 * @brief Show file (.tmix) access through Qt SQL
 *
 * A .tmix file is an SQLite database holding the console configuration, the
 * channel profiles, the ensembles and the cue list, plus the actor, position
 * and console cache tables. A new file gets all of them; this class reads and
 * writes only the tables the cue generator touches.
 *
 * Every operation reports failure through its return value and lastError().
 */
class TmixDatabase : public CueStore
{
public:
    TmixDatabase();
    ~TmixDatabase() override;

    TmixDatabase(const TmixDatabase&) = delete;
    TmixDatabase& operator=(const TmixDatabase&) = delete;

    /**
     * @brief Open (and optionally create) a show file
     * @param filePath Path to the .tmix file
     * @param createSchema Create missing tables
     * @param initConfig Fill the config table with defaults when the file is new
     * @return true if the database is ready for use
     */
    bool open(const QString& filePath, bool createSchema = true, bool initConfig = true);
    void close();
    bool isOpen() const { return db_.isOpen(); }
    QString filePath() const { return filePath_; }
    QStringList tables() const;

    // Transactions
    bool beginTransaction();
    bool commit();
    bool rollback();

    // Cue list
    QPair<int, int> nextCueNumber() const;  // (highest number, highest point + 10)
    int addCue(const DcaCue& cue) override;
    std::optional<DcaCue> cue(int point) const;
    QList<DcaCue> allCues() const;
    bool updateCue(int point, const DcaCue& cue);
    bool deleteCue(int point);
    bool clearCues();

    // Profiles and ensembles
    QList<Profile> profiles() const;
    std::optional<Profile> profileByName(const QString& name) const;
    int channelForCharacter(const QString& character) const;   // -1 if unknown
    int addProfile(int channel, const QString& name, const QString& label = QString());
    QList<Ensemble> ensembles() const;
    int addEnsemble(const QString& name, const QString& channels);
    QHash<QString, QString> characterChannels() const override;

    // Console configuration (key/value)
    QString config(const QString& param) const;
    bool setConfig(const QString& param, const QString& value);
    QMap<QString, QString> allConfig() const;
    static const QMap<QString, QString>& defaultConfig();

    QString lastError() const override { return lastError_; }

private:
    bool createSchema();
    bool initConfig();
    bool exec(QSqlQuery& query, const QString& context) const;
    bool fail(const QString& message) const;
    DcaCue cueFromQuery(const QSqlQuery& query) const;
    void bindCue(QSqlQuery& query, const DcaCue& cue) const;

    static QString channelsColumn(int dca);
    static QString labelColumn(int dca);
    static QStringList cueColumns();

    QSqlDatabase db_;
    QString connectionName_;
    QString filePath_;
    mutable QString lastError_;
};
