#pragma once

#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include <vector>

namespace chordscope::theory {

// 12-bit membership mask over pitch classes (bit n == pitch class n).
using PitchClassSet = quint16;

// Normalized pitch class: 0=C, 1=C#, ... 11=B. Safe for negative input.
inline int toPitchClass(int note) {
    return ((note % 12) + 12) % 12;
}

inline PitchClassSet pitchClassBit(int pc) {
    return PitchClassSet(1u << toPitchClass(pc));
}

inline bool containsPitchClass(PitchClassSet set, int pc) {
    return (set & pitchClassBit(pc)) != 0;
}

int pitchClassCount(PitchClassSet set);

// Collapses absolute note ids (any octave, any sign) to their pitch classes.
PitchClassSet reduceToPitchClassSet(const QVector<int>& notes);
PitchClassSet reduceToPitchClassSet(const QSet<int>& notes);
PitchClassSet reduceToPitchClassSet(const std::vector<int>& notes);

// Members in ascending order.
QVector<int> pitchClassesOf(PitchClassSet set);

// Sharp spelling: C C# D D# E F F# G G# A A# B.
QString rootName(int pc);
const QStringList& rootNames();

// "C E G" for {0,4,7}, in the given order.
QString pcsToNotes(const QVector<int>& pcs);

// Scale-degree label for a semitone offset from the root (reduced mod 12):
// 1 ♭2 2 ♭3 3 4 ♭5 5 #5 6 ♭7 7. Display only.
QString intervalName(int semitones);

} // namespace chordscope::theory
