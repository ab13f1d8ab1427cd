// src/core/CueGenerator.h - DCA Cue Generation Orchestrator
#pragma once

#include <QList>
#include <QObject>
#include <QString>

#include "DcaAllocator.h"
#include "DcaCue.h"
#include "script/ScriptElement.h"

class CueStore;

/**
 * @brief Connects a script and a cue store to the DCA allocator
 *
 * generate() reads the character/channel mapping from the store and runs a
 * fresh allocator over the script; it never writes. persist() is the separate
 * step that hands the generated cues to the store in order.
 */
class CueGenerator : public QObject
{
    Q_OBJECT

public:
    explicit CueGenerator(CueStore* store, QObject* parent = nullptr);
    ~CueGenerator();

    void setOptions(const DcaOptions& options) { options_ = options; }
    const DcaOptions& options() const { return options_; }

    DcaAllocationResult generate(const Script& script);

    /**
     * @brief Write cues to the store in list order
     *
     * Stops at the first cue the store refuses. Cues already written stay
     * written; the list itself is never modified.
     *
     * @return true if every cue was stored
     */
    bool persist(const QList<DcaCue>& cues);

    int persistedCount() const { return persistedCount_; }
    QString lastError() const { return lastError_; }

signals:
    void cuesGenerated(int count);
    void slotExhausted(const QString& character, int cueNumber);
    void cuePersisted(int number, int point);
    void persistFailed(const QString& error);

private:
    CueStore* store_;
    DcaOptions options_;
    int persistedCount_ = 0;
    QString lastError_;
};
