// src/script/ScriptElement.cpp - Script Element Helpers
#include "ScriptElement.h"

#include <QHash>

namespace {

const QHash<QString, ElementKind>& kindNameMap()
{
    static const QHash<QString, ElementKind> map = {
        { QStringLiteral("Scene Heading"), ElementKind::SceneHeading },
        { QStringLiteral("Character"), ElementKind::Character },
        { QStringLiteral("Dialogue"), ElementKind::Dialogue },
        { QStringLiteral("Comment"), ElementKind::Comment },
    };
    return map;
}

} // namespace

QString elementKindToString(ElementKind kind)
{
    switch (kind) {
    case ElementKind::SceneHeading: return QStringLiteral("Scene Heading");
    case ElementKind::Character:    return QStringLiteral("Character");
    case ElementKind::Dialogue:     return QStringLiteral("Dialogue");
    case ElementKind::Comment:      return QStringLiteral("Comment");
    }
    return QStringLiteral("Unknown");
}

ElementKind elementKindFromString(const QString& name, bool* ok)
{
    const auto& map = kindNameMap();
    auto it = map.constFind(name.trimmed());
    if (ok) {
        *ok = (it != map.constEnd());
    }
    return it != map.constEnd() ? it.value() : ElementKind::Comment;
}
