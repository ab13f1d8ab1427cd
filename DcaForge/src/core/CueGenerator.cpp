// src/core/CueGenerator.cpp - DCA Cue Generation Orchestrator Implementation
#include "CueGenerator.h"

#include <QDebug>

#include "ChannelMap.h"
#include "storage/CueStore.h"

CueGenerator::CueGenerator(CueStore* store, QObject* parent)
    : QObject(parent)
    , store_(store)
{
    qDebug() << "CueGenerator initialized";
}

CueGenerator::~CueGenerator() = default;

DcaAllocationResult CueGenerator::generate(const Script& script)
{
    lastError_.clear();

    ChannelMap channels;
    if (store_) {
        channels = ChannelMap::fromStore(*store_);
    }
    else {
        qWarning() << "No cue store; generating without channel assignments";
    }

    qDebug() << "Loaded" << channels.size() << "character channel mappings";

    DcaAllocator allocator(channels, options_);
    DcaAllocationResult result = allocator.run(script);

    if (!result.ok) {
        lastError_ = result.error;
        return result;
    }

    for (const DcaAnomaly& anomaly : result.anomalies) {
        emit slotExhausted(anomaly.character, anomaly.cueNumber);
    }

    emit cuesGenerated(result.cues.size());
    return result;
}

bool CueGenerator::persist(const QList<DcaCue>& cues)
{
    persistedCount_ = 0;
    lastError_.clear();

    if (!store_) {
        lastError_ = QStringLiteral("No cue store to write to");
        qCritical().noquote() << lastError_;
        emit persistFailed(lastError_);
        return false;
    }

    for (const DcaCue& cue : cues) {
        const int point = store_->addCue(cue);
        if (point < 0) {
            lastError_ = QStringLiteral("Failed to store cue %1 (%2): %3")
                .arg(QString::number(cue.number()), cue.name(), store_->lastError());
            qCritical().noquote() << lastError_;
            emit persistFailed(lastError_);
            return false;
        }

        ++persistedCount_;
        emit cuePersisted(cue.number(), point);
    }

    qDebug() << "Stored" << persistedCount_ << "DCA cues";
    return true;
}
