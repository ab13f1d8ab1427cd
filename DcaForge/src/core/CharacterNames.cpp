// src/core/CharacterNames.cpp - Character Heading Normalization Implementation
#include "CharacterNames.h"

#include <QRegularExpression>
#include <QSet>

#include <algorithm>

QStringList CharacterNames::split(const QString& heading)
{
    static const QRegularExpression parentheticals(QStringLiteral("\\([^)]*\\)"));

    QString cleaned = heading;
    cleaned.remove(parentheticals);

    QStringList names;
    const QStringList pieces = cleaned.split(QStringLiteral(" & "));
    for (const QString& piece : pieces) {
        const QString name = piece.trimmed();
        if (name.isEmpty()) {
            continue;
        }

        bool hasLower = false;
        for (const QChar& c : name) {
            if (c.isLower()) {
                hasLower = true;
                break;
            }
        }

        names.append(hasLower ? name : titleCase(name));
    }
    return names;
}

QStringList CharacterNames::identities(const QString& heading)
{
    QStringList result;
    const QStringList names = split(heading);
    for (const QString& name : names) {
        result.append(identity(name));
    }
    return result;
}

QString CharacterNames::identity(const QString& name)
{
    return name.trimmed().left(MaxNameLength);
}

QString CharacterNames::titleCase(const QString& text)
{
    QString result;
    result.reserve(text.size());

    bool previousIsLetter = false;
    for (const QChar& c : text) {
        if (c.isLetter()) {
            result.append(previousIsLetter ? c.toLower() : c.toUpper());
            previousIsLetter = true;
        }
        else {
            result.append(c);
            previousIsLetter = false;
        }
    }
    return result;
}

QStringList CharacterNames::allCharacters(const Script& script)
{
    QSet<QString> seen;
    for (const ScriptElement& element : script) {
        if (element.kind != ElementKind::Character) {
            continue;
        }
        const QStringList names = split(element.text);
        for (const QString& name : names) {
            seen.insert(name);
        }
    }

    QStringList characters(seen.begin(), seen.end());
    std::sort(characters.begin(), characters.end());
    return characters;
}
