// src/script/FountainParser.h - Fountain Screenplay Reader
#pragma once

#include <QString>
#include <QStringList>

#include "ScriptElement.h"

/**
 * @brief Reads the subset of the Fountain screenplay format used by show scripts
 *
 * Produces scene headings, character headings, dialogue and notes. Notes are
 * written as [[...]] and become Comment elements, which is how page markers
 * such as [[Page 12]] reach the cue generator. Action lines, transitions,
 * parentheticals, sections, synopses and the title page are skipped.
 *
 * The reader assumes well-formed input. It never fails on content, only on
 * I/O.
 */
class FountainParser
{
public:
    FountainParser() = default;

    bool parse(const QString& text);
    bool loadFile(const QString& filePath);

    Script elements() const { return elements_; }
    QString lastError() const { return lastError_; }

private:
    QStringList preprocess(const QString& text) const;
    int skipTitlePage(const QStringList& lines) const;

    bool isSceneHeading(const QString& line) const;
    bool isCharacterHeading(const QString& line) const;
    bool isTransition(const QString& line) const;

    QString cleanSceneHeading(const QString& line) const;
    QString cleanCharacterHeading(const QString& line) const;

    int readNote(const QStringList& lines, int index);
    int readDialogueBlock(const QStringList& lines, int index);
    void flushDialogue(QStringList& buffer);

    Script elements_;
    QString lastError_;
};
