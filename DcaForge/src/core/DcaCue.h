// src/core/DcaCue.h - DCA Cue Record
#pragma once

#include <QJsonObject>
#include <QString>

#include <array>

/**
 * @brief Channel and label carried by one DCA slot
 *
 * A null channels string means no microphone channel is assigned; a null
 * label means the slot's scribble strip is blank.
 */
struct DcaSlot {
    QString channels;   // "7" for an individual, "3,4,5" for an ensemble
    QString label;

    bool isEmpty() const { return channels.isNull() && label.isNull(); }
    void clear() { channels = QString(); label = QString(); }

    bool operator==(const DcaSlot& other) const {
        return channels == other.channels && label == other.label;
    }
    bool operator!=(const DcaSlot& other) const { return !(*this == other); }
};

/**
 * @brief Complete state of every DCA slot, indexed by DCA number - 1
 */
using DcaSnapshot = std::array<DcaSlot, 12>;

/**
 * @brief One generated DCA cue
 *
 * Each cue holds the complete snapshot of all twelve slots as of the cue,
 * so recalling any single cue reproduces the full console state.
 */
class DcaCue
{
public:
    static constexpr int DcaCount = 12;

    DcaCue() = default;
    DcaCue(int number, const QString& name, const DcaSnapshot& snapshot);

    int number() const { return number_; }
    int point() const { return point_; }
    QString name() const { return name_; }
    int colour() const { return colour_; }

    void setNumber(int number) { number_ = number; }
    void setPoint(int point) { point_ = point; }
    void setName(const QString& name) { name_ = name; }
    void setColour(int colour) { colour_ = colour; }

    // DCA numbers are 1-based
    const DcaSlot& slot(int dca) const;
    void setSlot(int dca, const DcaSlot& slot);
    QString channels(int dca) const { return slot(dca).channels; }
    QString label(int dca) const { return slot(dca).label; }

    const DcaSnapshot& snapshot() const { return slots_; }
    static bool isValidDca(int dca) { return dca >= 1 && dca <= DcaCount; }

    QJsonObject toJson() const;

    bool operator==(const DcaCue& other) const;
    bool operator!=(const DcaCue& other) const { return !(*this == other); }

private:
    int number_ = 0;
    int point_ = 0;         // Provisional; the store assigns the final value
    QString name_;
    int colour_ = 0;
    DcaSnapshot slots_;
};
