// src/script/FountainParser.cpp - Fountain Screenplay Reader Implementation
#include "FountainParser.h"

#include <QDebug>
#include <QFile>
#include <QRegularExpression>
#include <QTextStream>

namespace {

bool hasLetter(const QString& text)
{
    for (const QChar& c : text) {
        if (c.isLetter()) {
            return true;
        }
    }
    return false;
}

bool hasLowercase(const QString& text)
{
    for (const QChar& c : text) {
        if (c.isLower()) {
            return true;
        }
    }
    return false;
}

QString withoutParentheticals(const QString& text)
{
    static const QRegularExpression parens(QStringLiteral("\\([^)]*\\)"));
    QString result = text;
    result.remove(parens);
    return result;
}

} // namespace

bool FountainParser::parse(const QString& text)
{
    elements_.clear();
    lastError_.clear();

    const QStringList lines = preprocess(text);
    bool previousBlank = true;

    for (int i = skipTitlePage(lines); i < lines.size(); ++i) {
        const QString line = lines[i].trimmed();

        if (line.isEmpty()) {
            previousBlank = true;
            continue;
        }

        // Notes do not break the blank-line context around them
        if (line.startsWith(QLatin1String("[["))) {
            i = readNote(lines, i);
            continue;
        }

        if (isSceneHeading(line) && (previousBlank || line.startsWith('.'))) {
            elements_.append(ScriptElement(ElementKind::SceneHeading, cleanSceneHeading(line)));
            previousBlank = false;
            continue;
        }

        const bool nextHasText = i + 1 < lines.size() && !lines[i + 1].trimmed().isEmpty();
        if (previousBlank && nextHasText && isCharacterHeading(line)) {
            i = readDialogueBlock(lines, i);
            previousBlank = false;
            continue;
        }

        // Action, transition, section or synopsis
        previousBlank = false;
    }

    qDebug() << "Parsed Fountain script:" << elements_.size() << "elements";
    return true;
}

bool FountainParser::loadFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        lastError_ = QStringLiteral("cannot open %1: %2").arg(filePath, file.errorString());
        qWarning().noquote() << "Failed to open script:" << lastError_;
        return false;
    }

    QTextStream stream(&file);
    return parse(stream.readAll());
}

QStringList FountainParser::preprocess(const QString& text) const
{
    static const QRegularExpression boneyard(QStringLiteral("/\\*.*?\\*/"),
        QRegularExpression::DotMatchesEverythingOption);

    QString normalized = text;
    normalized.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    normalized.replace('\r', '\n');
    normalized.remove(boneyard);

    return normalized.split('\n');
}

int FountainParser::skipTitlePage(const QStringList& lines) const
{
    static const QRegularExpression titleKey(QStringLiteral("^[A-Za-z][A-Za-z ]*:"));

    int first = 0;
    while (first < lines.size() && lines[first].trimmed().isEmpty()) {
        ++first;
    }

    if (first >= lines.size() || !titleKey.match(lines[first]).hasMatch()) {
        return 0;
    }

    // Title page runs until the first blank line
    int i = first;
    while (i < lines.size() && !lines[i].trimmed().isEmpty()) {
        ++i;
    }
    return i;
}

bool FountainParser::isSceneHeading(const QString& line) const
{
    static const QRegularExpression heading(
        QStringLiteral("^(INT\\.?/EXT|I/E|INT|EXT|EST)[.\\s]"),
        QRegularExpression::CaseInsensitiveOption);

    if (line.startsWith('.')) {
        return line.size() > 1 && line[1] != '.';
    }
    return heading.match(line).hasMatch();
}

bool FountainParser::isTransition(const QString& line) const
{
    if (line.startsWith('>')) {
        return !line.endsWith('<');
    }
    return line.endsWith(QLatin1String("TO:")) && !hasLowercase(line);
}

bool FountainParser::isCharacterHeading(const QString& line) const
{
    if (line.startsWith('@')) {
        return line.size() > 1;
    }

    static const QString nonCharacterPrefixes = QStringLiteral("!>#=~");
    if (nonCharacterPrefixes.contains(line[0]) || isTransition(line)) {
        return false;
    }

    QString bare = withoutParentheticals(line).trimmed();
    if (bare.endsWith('^')) {
        bare.chop(1);
    }
    return hasLetter(bare) && !hasLowercase(bare);
}

QString FountainParser::cleanSceneHeading(const QString& line) const
{
    static const QRegularExpression sceneNumber(QStringLiteral("\\s*#[^#]*#$"));

    QString heading = line;
    if (heading.startsWith('.')) {
        heading.remove(0, 1);
    }
    heading.remove(sceneNumber);
    return heading.trimmed();
}

QString FountainParser::cleanCharacterHeading(const QString& line) const
{
    QString heading = line;
    if (heading.startsWith('@')) {
        heading.remove(0, 1);
    }
    if (heading.endsWith('^')) {
        heading.chop(1);
    }
    return heading.trimmed();
}

int FountainParser::readNote(const QStringList& lines, int index)
{
    QStringList parts;
    int i = index;

    for (; i < lines.size(); ++i) {
        parts.append(lines[i].trimmed());
        if (lines[i].contains(QLatin1String("]]"))) {
            break;
        }
    }

    QString note = parts.join('\n');
    note.remove(0, 2);
    const int close = note.lastIndexOf(QLatin1String("]]"));
    if (close >= 0) {
        note.truncate(close);
    }

    elements_.append(ScriptElement(ElementKind::Comment, note.trimmed()));
    return qMin(i, static_cast<int>(lines.size()) - 1);
}

int FountainParser::readDialogueBlock(const QStringList& lines, int index)
{
    elements_.append(ScriptElement(ElementKind::Character, cleanCharacterHeading(lines[index].trimmed())));

    QStringList buffer;
    int i = index + 1;

    for (; i < lines.size(); ++i) {
        const QString line = lines[i].trimmed();
        if (line.isEmpty()) {
            break;
        }

        if (line.startsWith(QLatin1String("[["))) {
            flushDialogue(buffer);
            i = readNote(lines, i);
            continue;
        }

        if (line.startsWith('(') && line.endsWith(')')) {
            flushDialogue(buffer);
            continue;
        }

        buffer.append(line);
    }

    flushDialogue(buffer);
    return i - 1;
}

void FountainParser::flushDialogue(QStringList& buffer)
{
    if (!buffer.isEmpty()) {
        elements_.append(ScriptElement(ElementKind::Dialogue, buffer.join('\n')));
        buffer.clear();
    }
}
