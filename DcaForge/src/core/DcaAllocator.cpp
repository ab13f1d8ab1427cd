// src/core/DcaAllocator.cpp - DCA Allocation and Cue Emission Implementation
#include "DcaAllocator.h"

#include <QDebug>
#include <QRegularExpression>
#include <QSet>

#include "CharacterNames.h"
#include "LinePreview.h"
#include "Lookahead.h"

DcaAllocator::DcaAllocator(const ChannelMap& channels, const DcaOptions& options)
    : channels_(channels)
    , options_(options)
{
    options_.slotCount = qBound(1, options_.slotCount, static_cast<int>(DcaCue::DcaCount));
    options_.lookaheadWindow = qMax(0, options_.lookaheadWindow);
    options_.previewLength = qMax(0, options_.previewLength);

    reset();
}

DcaAllocationResult DcaAllocator::run(const Script& script)
{
    reset();

    qDebug() << "Generating DCA cues for" << script.size() << "elements, window"
             << options_.lookaheadWindow << "slots" << options_.slotCount;

    DcaAllocationResult result;

    for (int i = 0; i < script.size(); ++i) {
        const ScriptElement& element = script[i];

        switch (element.kind) {
        case ElementKind::Comment:
            handleComment(element);
            break;
        case ElementKind::SceneHeading:
            handleSceneHeading(script, i);
            break;
        case ElementKind::Character:
            handleCharacter(script, i);
            break;
        case ElementKind::Dialogue:
            break;
        default:
            result.ok = false;
            result.error = QStringLiteral("element %1 has unknown kind %2")
                .arg(i).arg(static_cast<int>(element.kind));
            qCritical().noquote() << "DCA generation rejected:" << result.error;
            reset();
            return result;
        }
    }

    result.cues = cues_;
    result.anomalies = anomalies_;

    qDebug() << "Generated" << cues_.size() << "DCA cues," << anomalies_.size() << "anomalies";
    return result;
}

QList<int> DcaAllocator::freeDcas() const
{
    return QList<int>(freeDcas_.begin(), freeDcas_.end());
}

// Private Implementation

void DcaAllocator::reset()
{
    assignment_.clear();
    freeDcas_.clear();
    for (int dca = 1; dca <= options_.slotCount; ++dca) {
        freeDcas_.insert(dca);
    }
    snapshot_ = DcaSnapshot();
    page_ = 0;
    nextCueNumber_ = 1;
    cues_.clear();
    anomalies_.clear();
}

void DcaAllocator::handleComment(const ScriptElement& element)
{
    static const QRegularExpression pageMarker(QStringLiteral("^Page (\\d+)$"));

    QRegularExpressionMatch match = pageMarker.match(element.text.trimmed());
    if (match.hasMatch()) {
        page_ = match.captured(1).toInt();
    }
}

void DcaAllocator::handleSceneHeading(const Script& script, int index)
{
    const QSet<QString> firstSpeakers = Lookahead::firstSpeakers(script, index + 1);

    // QMap iterates in name order, which is also the cue name order
    QStringList toMute;
    for (auto it = assignment_.constBegin(); it != assignment_.constEnd(); ++it) {
        if (!firstSpeakers.contains(it.key())) {
            toMute.append(it.key());
        }
    }

    if (toMute.isEmpty()) {
        return;
    }

    for (const QString& character : toMute) {
        mute(character);
    }

    const QString preview = LinePreview::end(script, 0, index, options_.previewLength);
    emitCue(sceneChangeCueName(toMute, preview));
}

void DcaAllocator::handleCharacter(const Script& script, int index)
{
    const QStringList speaking = CharacterNames::identities(script[index].text);
    const QSet<QString> currentlySpeaking(speaking.begin(), speaking.end());

    // Unmute pass, in speaking order
    QStringList toUnmute;
    for (const QString& character : speaking) {
        if (assignment_.contains(character)) {
            continue;
        }
        assignment_.insert(character, acquireDca(character, index));
        toUnmute.append(character);
    }

    // Mute pass over everyone else who is live
    QStringList toMute;
    for (auto it = assignment_.constBegin(); it != assignment_.constEnd(); ++it) {
        if (currentlySpeaking.contains(it.key())) {
            continue;
        }
        if (!Lookahead::speaksWithin(script, index + 1, it.key(), options_.lookaheadWindow, false)) {
            toMute.append(it.key());
        }
    }

    if (toUnmute.isEmpty() && toMute.isEmpty()) {
        return;
    }

    for (const QString& character : toUnmute) {
        unmute(character);
    }
    for (const QString& character : toMute) {
        mute(character);
    }

    const QString preview = LinePreview::start(script, index + 1, script.size(), options_.previewLength);
    emitCue(characterCueName(toUnmute, toMute, preview));
}

int DcaAllocator::acquireDca(const QString& character, int index)
{
    if (!freeDcas_.empty()) {
        const int dca = *freeDcas_.begin();
        freeDcas_.erase(freeDcas_.begin());
        return dca;
    }

    // Pool exhausted: share DCA 1 rather than drop the character
    DcaAnomaly anomaly;
    anomaly.elementIndex = index;
    anomaly.cueNumber = nextCueNumber_;
    anomaly.character = character;
    anomaly.dca = 1;
    anomaly.message = QStringLiteral("No free DCA for %1 at element %2; forced onto DCA 1")
        .arg(character).arg(index);
    anomalies_.append(anomaly);

    qWarning().noquote() << anomaly.message;
    return 1;
}

void DcaAllocator::unmute(const QString& character)
{
    DcaSlot& slot = snapshot_[assignment_.value(character) - 1];
    slot.channels = channels_.contains(character) ? channels_.channelsFor(character) : QString();
    slot.label = character;
}

void DcaAllocator::mute(const QString& character)
{
    const int dca = assignment_.take(character);

    // A DCA shared after exhaustion stays with its remaining character
    for (auto it = assignment_.constBegin(); it != assignment_.constEnd(); ++it) {
        if (it.value() == dca) {
            unmute(it.key());
            return;
        }
    }

    snapshot_[dca - 1].clear();
    freeDcas_.insert(dca);
}

void DcaAllocator::emitCue(const QString& name)
{
    DcaCue cue(nextCueNumber_++, name, snapshot_);
    qDebug().noquote() << "Cue" << cue.number() << name;
    cues_.append(cue);
}

QString DcaAllocator::characterCueName(const QStringList& unmuted, const QStringList& muted,
                                       const QString& preview) const
{
    QStringList parts;
    parts.append(QStringLiteral("p%1").arg(page_));

    if (!unmuted.isEmpty()) {
        QStringList tokens;
        for (const QString& character : unmuted) {
            tokens.append(QStringLiteral("+%1").arg(character));
        }
        parts.append(tokens.join(QStringLiteral(", ")));
    }

    if (!muted.isEmpty()) {
        QStringList tokens;
        for (const QString& character : muted) {
            tokens.append(QStringLiteral("-%1").arg(character));
        }
        parts.append(tokens.join(QStringLiteral(", ")));
    }

    QString name = parts.join(' ');
    if (!preview.isNull()) {
        name += QStringLiteral(": \"%1\"").arg(preview);
    }
    return name;
}

QString DcaAllocator::sceneChangeCueName(const QStringList& muted, const QString& preview) const
{
    QString name = QStringLiteral("p%1 -%2- Scene Change")
        .arg(QString::number(page_), muted.join(QStringLiteral(", ")));
    if (!preview.isNull()) {
        name += QStringLiteral(" - ") + preview;
    }
    return name;
}
