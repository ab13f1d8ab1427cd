// src/core/LinePreview.cpp - Dialogue Previews Implementation
#include "LinePreview.h"

namespace {
const QString Ellipsis = QStringLiteral("...");
}

QString LinePreview::start(const Script& script, int from, int to, int length)
{
    const int last = qMin(to, static_cast<int>(script.size()));

    for (int i = qMax(0, from); i < last; ++i) {
        if (script[i].kind == ElementKind::Dialogue) {
            const QString& line = script[i].text;
            return line.size() > length ? line.left(length) + Ellipsis : line;
        }
    }
    return QString();
}

QString LinePreview::end(const Script& script, int from, int to, int length)
{
    const int first = qMax(0, from);

    for (int i = qMin(to, static_cast<int>(script.size())) - 1; i >= first; --i) {
        if (script[i].kind == ElementKind::Dialogue) {
            const QString& line = script[i].text;
            return line.size() > length ? Ellipsis + line.right(length) : line;
        }
    }
    return QString();
}
