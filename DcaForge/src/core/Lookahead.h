// src/core/Lookahead.h - Speaking Lookahead Analysis
#pragma once

#include <QSet>
#include <QString>

#include "script/ScriptElement.h"

/**
 * @brief Answers "does this character speak again soon?" over a script
 *
 * All scans start at an element index and never look past a scene heading:
 * a scene boundary always ends liveness.
 */
class Lookahead
{
public:
    static constexpr int DefaultWindow = 7;

    /**
     * @brief Check whether a character speaks within the next dialogue blocks
     *
     * Scans script[from..]. Each character heading is one dialogue block. The
     * character counts as live if it is named in one of the next @p window
     * headings; a scene heading or the end of the script ends the scan.
     *
     * @param script The full script
     * @param from Index of the first element to examine
     * @param character Character identity to look for
     * @param window Number of dialogue blocks to examine
     * @param skipFirst Ignore the first heading encountered (the current block)
     */
    static bool speaksWithin(const Script& script, int from, const QString& character,
                             int window = DefaultWindow, bool skipFirst = false);

    /**
     * @brief Characters of the first heading before the next scene boundary
     *
     * Returns an empty set if a scene heading or the end of the script comes
     * before any character heading.
     */
    static QSet<QString> firstSpeakers(const Script& script, int from);
};
