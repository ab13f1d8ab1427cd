// src/script/ScriptJson.h - JSON Script Element Reader
#pragma once

#include <QByteArray>
#include <QString>

#include "ScriptElement.h"

/**
 * @brief Reads a pre-parsed script stored as JSON
 *
 * The document is an array of objects:
 *   [ { "type": "Scene Heading", "text": "INT. JUNGLE - DAY" }, ... ]
 *
 * Any element whose type is not one of the known kinds rejects the whole
 * document; no partial script is returned.
 */
class ScriptJson
{
public:
    static bool parse(const QByteArray& data, Script* script, QString* error = nullptr);
    static bool loadFile(const QString& filePath, Script* script, QString* error = nullptr);
};
