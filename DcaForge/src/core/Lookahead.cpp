// src/core/Lookahead.cpp - Speaking Lookahead Analysis Implementation
#include "Lookahead.h"

#include "CharacterNames.h"

bool Lookahead::speaksWithin(const Script& script, int from, const QString& character,
                             int window, bool skipFirst)
{
    int examined = 0;
    bool firstSkipped = !skipFirst;

    for (int i = qMax(0, from); i < script.size(); ++i) {
        if (examined >= window) {
            return false;
        }

        const ScriptElement& element = script[i];
        if (element.kind == ElementKind::SceneHeading) {
            return false;
        }
        if (element.kind != ElementKind::Character) {
            continue;
        }

        if (!firstSkipped) {
            firstSkipped = true;
            continue;
        }

        if (CharacterNames::identities(element.text).contains(character)) {
            return true;
        }
        ++examined;
    }

    return false;
}

QSet<QString> Lookahead::firstSpeakers(const Script& script, int from)
{
    QSet<QString> speakers;

    for (int i = qMax(0, from); i < script.size(); ++i) {
        const ScriptElement& element = script[i];
        if (element.kind == ElementKind::SceneHeading) {
            break;
        }
        if (element.kind == ElementKind::Character) {
            const QStringList names = CharacterNames::identities(element.text);
            for (const QString& name : names) {
                speakers.insert(name);
            }
            break;
        }
    }

    return speakers;
}
