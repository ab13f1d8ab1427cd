// src/core/DcaAllocator.h - DCA Allocation and Cue Emission
#pragma once

#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

#include <set>

#include "ChannelMap.h"
#include "DcaCue.h"
#include "script/ScriptElement.h"

/**
 * @brief Tunable parameters of an allocation run
 */
struct DcaOptions {
    int lookaheadWindow = 7;    // Dialogue blocks examined before muting
    int slotCount = 12;         // DCAs available, 1..12
    int previewLength = 30;     // Characters of dialogue in cue names
};

/**
 * @brief Non-fatal problem found during a run
 *
 * Raised when every DCA is taken at unmute time and the character had to be
 * forced onto DCA 1. It means the lookahead window is too wide for the pool.
 */
struct DcaAnomaly {
    int elementIndex = -1;
    int cueNumber = 0;
    QString character;
    int dca = 0;
    QString message;
};

/**
 * @brief Output of one allocation run
 */
struct DcaAllocationResult {
    bool ok = true;
    QString error;
    QList<DcaCue> cues;
    QList<DcaAnomaly> anomalies;
};

/**
 * @brief Walks a script once and emits DCA mute/unmute cues
 *
 * Each speaking character is bound to the lowest free DCA just before it
 * speaks and released once the lookahead shows it will not speak within the
 * window. Scene headings mute every active character except those who speak
 * first in the new scene.
 *
 * Every emitted cue carries the complete twelve-slot snapshot. Identical
 * input always gives identical output.
 *
 * State is private to the instance and reset by run(); use one allocator per
 * concurrent run.
 */
class DcaAllocator
{
public:
    explicit DcaAllocator(const ChannelMap& channels, const DcaOptions& options = DcaOptions());

    DcaAllocationResult run(const Script& script);

    const DcaOptions& options() const { return options_; }

    // State inspection, valid after run()
    QStringList activeCharacters() const { return assignment_.keys(); }
    int dcaFor(const QString& character) const { return assignment_.value(character, 0); }
    QList<int> freeDcas() const;
    const DcaSnapshot& snapshot() const { return snapshot_; }
    int page() const { return page_; }

private:
    void reset();
    void handleComment(const ScriptElement& element);
    void handleSceneHeading(const Script& script, int index);
    void handleCharacter(const Script& script, int index);

    int acquireDca(const QString& character, int index);
    void unmute(const QString& character);
    void mute(const QString& character);
    void emitCue(const QString& name);

    QString characterCueName(const QStringList& unmuted, const QStringList& muted,
                             const QString& preview) const;
    QString sceneChangeCueName(const QStringList& muted, const QString& preview) const;

    ChannelMap channels_;
    DcaOptions options_;

    // Run state
    QMap<QString, int> assignment_;     // Active character -> DCA number
    std::set<int> freeDcas_;
    DcaSnapshot snapshot_;
    int page_ = 0;
    int nextCueNumber_ = 1;
    QList<DcaCue> cues_;
    QList<DcaAnomaly> anomalies_;
};
