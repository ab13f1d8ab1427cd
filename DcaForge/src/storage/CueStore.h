// src/storage/CueStore.h - Cue and Character Store Interface
#pragma once

#include <QHash>
#include <QString>

#include "core/DcaCue.h"

/**
 * @brief Storage seen by the cue generator
 *
 * Supplies the character/ensemble to channel mapping and accepts generated
 * cues. TmixDatabase implements it on top of the console's .tmix file.
 */
class CueStore
{
public:
    virtual ~CueStore() = default;

    /**
     * @brief Every individual profile and every ensemble, mapped to channels
     *
     * Individuals map to a single channel number ("7"); ensembles map to the
     * comma-joined channels of their members ("3,4,5").
     */
    virtual QHash<QString, QString> characterChannels() const = 0;

    /**
     * @brief Persist a cue
     * @return The point the store assigned, or -1 on failure (see lastError())
     */
    virtual int addCue(const DcaCue& cue) = 0;

    virtual QString lastError() const = 0;
};
