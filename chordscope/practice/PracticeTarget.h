#pragma once

#include <QMetaType>
#include <QString>
#include <QVector>

#include "chordscope/recognition/TemplateBank.h"

class QRandomGenerator;

namespace chordscope::practice {

// The chord a practice round asks for, with one concrete voicing to show the player.
struct PracticeTarget {
    recognition::ChordTemplate chord;
    int inversion = -1;           // -1 when inversions are off
    QVector<int> orderedPcs;      // bass first
    QVector<int> voicing;         // suggested MIDI notes, bass first, within A0..C8

    bool isValid() const { return !chord.pitchClasses.isEmpty(); }
    int bassPc() const { return orderedPcs.isEmpty() ? -1 : orderedPcs.first(); }
};

enum class AttemptResult {
    Idle,       // nothing held
    Partial,    // only target tones so far, not all of them (or the wrong one in the bass)
    Wrong,      // a pitch class foreign to the target is held
    Correct     // exactly the target pitch classes
};

// Lowest and highest playable notes (88-key range).
constexpr int kLowestNote = 21;
constexpr int kHighestNote = 108;

// Picks a random template that differs from `avoid` (by root and type) when the pool allows it.
// Returns nullptr for an empty pool.
const recognition::ChordTemplate* pickDifferent(const QVector<recognition::ChordTemplate>& pool,
                                                const recognition::ChordTemplate* avoid,
                                                QRandomGenerator& rng);

// Builds the target for a chord in the given inversion (-1 or 0 for root position).
// The voicing anchors the root near middle C, stacks the tones upward, rotates
// for the inversion and then shifts whole octaves to put the bass near middle C.
PracticeTarget makeTarget(const recognition::ChordTemplate& chord, int inversion);

// Root position, or a random inversion when inversions are allowed.
PracticeTarget makeRandomTarget(const recognition::ChordTemplate& chord, bool allowInversions, QRandomGenerator& rng);

// Compares the held notes with the target. With requireBass the lowest held
// note must be the target's bass tone for the attempt to count as correct.
AttemptResult judgeAttempt(const PracticeTarget& target, const QVector<int>& heldNotes, bool requireBass);

// "C⁷" or "C⁷ (2nd inversion)".
QString targetLabel(const PracticeTarget& target);

// "E4 G4 C5"
QString voicingToString(const QVector<int>& notes);

} // namespace chordscope::practice

Q_DECLARE_METATYPE(chordscope::practice::PracticeTarget)
