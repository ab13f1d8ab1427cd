// src/core/CharacterNames.h - Character Heading Normalization
#pragma once

#include <QString>
#include <QStringList>

#include "script/ScriptElement.h"

/**
 * @brief Turns raw character headings into character identities
 *
 * A heading such as "HORTON (V.O.) & MAYZIE" yields {"Horton", "Mayzie"}.
 * Pieces that already contain lowercase letters ("Dr. Seuss") are kept as
 * written; all-caps pieces are title-cased.
 *
 * Identities are truncated to MaxNameLength characters, the width of a DCA
 * scribble strip label. Two long names sharing the same prefix therefore map
 * to the same identity.
 */
class CharacterNames
{
public:
    static constexpr int MaxNameLength = 12;

    /**
     * @brief Split and clean a heading, keeping speaking order
     * @return Full names (not truncated); empty for an empty heading
     */
    static QStringList split(const QString& heading);

    /**
     * @brief Split a heading into truncated character identities
     */
    static QStringList identities(const QString& heading);

    /**
     * @brief Truncate a name to the identity/label width
     */
    static QString identity(const QString& name);

    /**
     * @brief Title-case each word, where a word starts after any non-letter
     */
    static QString titleCase(const QString& text);

    /**
     * @brief Sorted, de-duplicated list of every character named in a script
     */
    static QStringList allCharacters(const Script& script);
};
