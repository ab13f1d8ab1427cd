// src/core/LinePreview.h - Dialogue Previews for Cue Names
#pragma once

#include <QString>

#include "script/ScriptElement.h"

/**
 * @brief Short dialogue snippets used to make cue names readable
 *
 * Both functions look at script[from, to) and return a null string when the
 * range holds no dialogue.
 */
class LinePreview
{
public:
    static constexpr int DefaultLength = 30;

    // First dialogue in the range, cut to "text..." when longer than length
    static QString start(const Script& script, int from, int to, int length = DefaultLength);

    // Last dialogue in the range, cut to "...text" when longer than length
    static QString end(const Script& script, int from, int to, int length = DefaultLength);
};
