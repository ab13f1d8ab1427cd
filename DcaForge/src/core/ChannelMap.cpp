// src/core/ChannelMap.cpp - Character to Channel Mapping Implementation
#include "ChannelMap.h"

#include <QDebug>

#include <algorithm>

#include "CharacterNames.h"
#include "storage/CueStore.h"

ChannelMap::ChannelMap(const QHash<QString, QString>& channels)
{
    // Sorted so that identity collisions resolve the same way on every run
    QStringList names = channels.keys();
    std::sort(names.begin(), names.end());

    for (const QString& name : names) {
        const QString key = CharacterNames::identity(name);
        if (key.isEmpty()) {
            continue;
        }

        if (channels_.contains(key)) {
            qWarning().noquote() << "Channel map: profile" << name
                                 << "collides with an existing entry as" << key << "- ignored";
            continue;
        }
        channels_.insert(key, channels.value(name));
    }
}

ChannelMap ChannelMap::fromStore(const CueStore& store)
{
    ChannelMap map(store.characterChannels());
    qDebug() << "Loaded channel map with" << map.size() << "entries";
    return map;
}

QStringList ChannelMap::characters() const
{
    QStringList names = channels_.keys();
    std::sort(names.begin(), names.end());
    return names;
}
