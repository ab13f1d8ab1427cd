// src/core/DcaCue.cpp - DCA Cue Record Implementation
#include "DcaCue.h"

#include <QDebug>
#include <QJsonArray>

DcaCue::DcaCue(int number, const QString& name, const DcaSnapshot& snapshot)
    : number_(number)
    , point_(0)
    , name_(name)
    , colour_(0)
    , slots_(snapshot)
{
}

const DcaSlot& DcaCue::slot(int dca) const
{
    static const DcaSlot emptySlot;

    if (!isValidDca(dca)) {
        qWarning() << "DCA" << dca << "out of range on cue" << number_;
        return emptySlot;
    }
    return slots_[dca - 1];
}

void DcaCue::setSlot(int dca, const DcaSlot& slot)
{
    if (!isValidDca(dca)) {
        qWarning() << "Ignoring DCA" << dca << "on cue" << number_;
        return;
    }
    slots_[dca - 1] = slot;
}

QJsonObject DcaCue::toJson() const
{
    QJsonObject json;
    json["number"] = number_;
    json["point"] = point_;
    json["name"] = name_;
    json["colour"] = colour_;

    QJsonArray dcas;
    for (int dca = 1; dca <= DcaCount; ++dca) {
        const DcaSlot& s = slots_[dca - 1];
        QJsonObject entry;
        entry["dca"] = dca;
        entry["channels"] = s.channels.isNull() ? QJsonValue() : QJsonValue(s.channels);
        entry["label"] = s.label.isNull() ? QJsonValue() : QJsonValue(s.label);
        dcas.append(entry);
    }
    json["dcas"] = dcas;

    return json;
}

bool DcaCue::operator==(const DcaCue& other) const
{
    return number_ == other.number_
        && point_ == other.point_
        && name_ == other.name_
        && colour_ == other.colour_
        && slots_ == other.slots_;
}
