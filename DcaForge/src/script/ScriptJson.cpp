// src/script/ScriptJson.cpp - JSON Script Element Reader Implementation
#include "ScriptJson.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace {

bool fail(QString* error, const QString& message)
{
    if (error) {
        *error = message;
    }
    qWarning().noquote() << "Script JSON rejected:" << message;
    return false;
}

} // namespace

bool ScriptJson::parse(const QByteArray& data, Script* script, QString* error)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        return fail(error, parseError.errorString());
    }
    if (!doc.isArray()) {
        return fail(error, QStringLiteral("top-level value must be an array of elements"));
    }

    const QJsonArray array = doc.array();
    Script elements;
    elements.reserve(array.size());

    for (int i = 0; i < array.size(); ++i) {
        if (!array[i].isObject()) {
            return fail(error, QStringLiteral("element %1 is not an object").arg(i));
        }

        const QJsonObject obj = array[i].toObject();
        const QString type = obj.value("type").toString();

        bool ok = false;
        ElementKind kind = elementKindFromString(type, &ok);
        if (!ok) {
            return fail(error, QStringLiteral("element %1 has unknown type '%2'").arg(i).arg(type));
        }

        elements.append(ScriptElement(kind, obj.value("text").toString()));
    }

    if (script) {
        *script = elements;
    }
    return true;
}

bool ScriptJson::loadFile(const QString& filePath, Script* script, QString* error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(error, QStringLiteral("cannot open %1: %2").arg(filePath, file.errorString()));
    }

    return parse(file.readAll(), script, error);
}
