// src/script/ScriptElement.h - Parsed Script Element Types
#pragma once

#include <QList>
#include <QString>

/**
 * @brief Kinds of script elements that drive DCA cue generation
 *
 * Other screenplay elements (action, transitions, parentheticals) carry no
 * information for microphone timing and are dropped by the readers.
 */
enum class ElementKind {
    SceneHeading,   // Scene boundary
    Character,      // Character heading, possibly "A & B"
    Dialogue,       // Spoken text following a character heading
    Comment         // Note, e.g. "Page 12" markers
};

/**
 * @brief One element of a parsed script
 */
struct ScriptElement {
    ElementKind kind = ElementKind::Comment;
    QString text;

    ScriptElement() = default;
    ScriptElement(ElementKind k, const QString& t) : kind(k), text(t) {}

    bool operator==(const ScriptElement& other) const {
        return kind == other.kind && text == other.text;
    }
};

using Script = QList<ScriptElement>;

// Display names, matching the Fountain element type names
QString elementKindToString(ElementKind kind);
ElementKind elementKindFromString(const QString& name, bool* ok = nullptr);
