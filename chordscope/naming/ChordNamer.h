#pragma once

#include <QString>
#include <QVector>

#include "chordscope/recognition/ChordMatch.h"
#include "chordscope/theory/ChordVocabulary.h"

namespace chordscope::naming {

struct FormattedMatch {
    QString displayName;   // e.g. "C", "Am⁷", "C⁹/E", "F⁵/C"
    QString inversion;     // null when no bass could be determined
    QString bassName;      // null when no bass could be determined
    QString longName;      // e.g. "Dominant Seventh"
};

// One row of the chord-tone grid shown under the top match.
struct ChordToneRow {
    int pc = 0;
    QString noteName;
    int semitones = 0;     // above the root, 0..11
    QString degree;        // intervalName(semitones)
    bool present = false;  // pressed by the player
};

// Display name, inversion/slash-bass wording and long name for a match.
// soundingNotes are absolute note ids; the lowest one is the bass.
//
// Chords of up to four tones use inversion ordinals ("root position", "1st inversion", ...,
// "no chord tone in bass"). Larger chords always read "slash bass" and show "/<bass>".
// Two-tone fifths show "/<bass>" when the bass is not the root.
// Suffix and long name come from the vocabulary the bank was built from.
FormattedMatch formatMatch(const recognition::ChordMatch& match, const QVector<int>& soundingNotes,
                           const theory::ChordVocabulary& vocabulary = theory::ChordVocabulary::builtins());

// "root position" for 0, "1st inversion", "2nd inversion", "3rd inversion", "<n>th inversion".
QString inversionLabel(int bassIndex);

QVector<ChordToneRow> chordToneRows(const recognition::ChordMatch& match);

} // namespace chordscope::naming
