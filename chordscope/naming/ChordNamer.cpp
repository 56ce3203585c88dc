#include "chordscope/naming/ChordNamer.h"

#include "chordscope/theory/ChordVocabulary.h"
#include "chordscope/theory/PitchClass.h"

#include <algorithm>

namespace chordscope::naming {
namespace {

// Chord tones read upward from the root: the index is the inversion ordinal.
// chordPcs already follows the formula of whichever bank produced the match;
// fifths found by the dyad rules list the lower tone first, so rotate to the root.
static QVector<int> orderedChordTones(const recognition::ChordMatch& match) {
    QVector<int> tones = match.chordPcs;
    const int rootIdx = tones.indexOf(match.root);
    if (rootIdx > 0) std::rotate(tones.begin(), tones.begin() + rootIdx, tones.end());
    return tones;
}

static QString ordinal(int n) {
    switch (n) {
    case 1: return QStringLiteral("1st");
    case 2: return QStringLiteral("2nd");
    case 3: return QStringLiteral("3rd");
    default: return QString("%1th").arg(n);
    }
}

} // namespace

QString inversionLabel(int bassIndex) {
    if (bassIndex < 0) return QStringLiteral("no chord tone in bass");
    if (bassIndex == 0) return QStringLiteral("root position");
    return ordinal(bassIndex) + QStringLiteral(" inversion");
}

FormattedMatch formatMatch(const recognition::ChordMatch& match, const QVector<int>& soundingNotes,
                           const theory::ChordVocabulary& vocabulary) {
    FormattedMatch out;
    const QString rootName = theory::rootName(match.root);

    if (match.isSingleNote()) {
        out.displayName = rootName;
        out.longName = QStringLiteral("Single Note");
        return out;
    }

    out.displayName = rootName + theory::suffixFor(match.typeKey, vocabulary);
    out.longName = theory::longNameFor(match.typeKey, vocabulary);
    if (soundingNotes.isEmpty()) return out;

    const int bassNote = *std::min_element(soundingNotes.cbegin(), soundingNotes.cend());
    const int bassPc = theory::toPitchClass(bassNote);
    out.bassName = theory::rootName(bassPc);

    if (match.chordSize <= 4) {
        out.inversion = inversionLabel(orderedChordTones(match).indexOf(bassPc));
    } else {
        // 9ths and up: slash notation instead of high-numbered inversions.
        out.inversion = QStringLiteral("slash bass");
    }

    const bool extended = match.chordSize > 4;
    const bool invertedFifth = match.typeKey == theory::fifthKey() && match.chordSize == 2 && bassPc != match.root;
    if (extended || invertedFifth) out.displayName += QStringLiteral("/") + out.bassName;
    return out;
}

QVector<ChordToneRow> chordToneRows(const recognition::ChordMatch& match) {
    QVector<ChordToneRow> rows;
    rows.reserve(match.chordPcs.size());
    for (int pc : match.chordPcs) {
        ChordToneRow r;
        r.pc = pc;
        r.noteName = theory::rootName(pc);
        r.semitones = theory::toPitchClass(pc - match.root);
        r.degree = theory::intervalName(r.semitones);
        r.present = match.matchedPcs.contains(pc);
        rows.push_back(std::move(r));
    }
    return rows;
}

} // namespace chordscope::naming
