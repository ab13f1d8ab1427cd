// src/core/ChannelMap.h - Character to Channel Mapping
#pragma once

#include <QHash>
#include <QString>
#include <QStringList>

class CueStore;

/**
 * @brief Read-only mapping from character identity to microphone channel(s)
 *
 * Keys are character identities (see CharacterNames::identity), so a profile
 * named with more than twelve characters still resolves. A name that is not
 * present has no physical channel; the allocator still labels its DCA.
 */
class ChannelMap
{
public:
    ChannelMap() = default;
    explicit ChannelMap(const QHash<QString, QString>& channels);

    static ChannelMap fromStore(const CueStore& store);

    bool contains(const QString& character) const { return channels_.contains(character); }
    QString channelsFor(const QString& character) const { return channels_.value(character); }

    int size() const { return channels_.size(); }
    bool isEmpty() const { return channels_.isEmpty(); }
    QStringList characters() const;

private:
    QHash<QString, QString> channels_;
};
