#pragma once

#include <QString>
#include <QVector>

#include "chordscope/theory/ChordVocabulary.h"

namespace chordscope::recognition {

// One candidate interpretation of the pressed pitch classes.
struct ChordMatch {
    int root = 0;                 // 0..11
    theory::TypeKey typeKey;      // vocabulary key, or "single"
    int priorityIndex = -1;       // -1 sorts after every listed type
    int matchedCount = 0;         // |pressed ∩ chord|
    int chordSize = 0;            // unique pitch classes in the chord
    bool isSubset = false;        // every pressed pitch class is a chord tone
    bool exactMatch = false;      // matchedCount == |pressed|
    QVector<int> matchedPcs;      // ascending; a dyad fifth lists lower then upper
    QVector<int> missingPcs;      // chord tones not pressed, formula order
    QVector<int> extraPcs;        // pressed tones foreign to the chord, ascending
    QVector<int> chordPcs;        // all chord tones, formula order; a dyad fifth lists lower then upper

    bool isSingleNote() const { return typeKey == theory::singleNoteKey(); }

    bool operator==(const ChordMatch& o) const {
        return root == o.root && typeKey == o.typeKey && priorityIndex == o.priorityIndex
            && matchedCount == o.matchedCount && chordSize == o.chordSize && isSubset == o.isSubset
            && exactMatch == o.exactMatch && matchedPcs == o.matchedPcs && missingPcs == o.missingPcs
            && extraPcs == o.extraPcs && chordPcs == o.chordPcs;
    }
    bool operator!=(const ChordMatch& o) const { return !(*this == o); }
};

} // namespace chordscope::recognition
