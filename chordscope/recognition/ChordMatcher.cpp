#include "chordscope/recognition/ChordMatcher.h"

#include "chordscope/recognition/MatchRanker.h"

#include <QHash>

namespace chordscope::recognition {
namespace {

using theory::PitchClassSet;

static ChordMatch singleNoteMatch(int pc) {
    ChordMatch m;
    m.root = pc;
    m.typeKey = theory::singleNoteKey();
    m.priorityIndex = -1;
    m.matchedCount = 1;
    m.chordSize = 1;
    m.isSubset = true;
    m.exactMatch = true;
    m.matchedPcs = {pc};
    m.chordPcs = {pc};
    return m;
}

// Priority of "fifth" in the bank being matched against; the builtin slot if the bank has none.
static int fifthPriority(const QVector<ChordTemplate>& templates) {
    for (const auto& t : templates) {
        if (t.typeKey == theory::fifthKey()) return t.priorityIndex;
    }
    return theory::ChordVocabulary::builtins().priorityIndex(theory::fifthKey());
}

// Tones are stored lower then upper as heard, so a fourth lists the root second.
static ChordMatch fifthMatch(int root, int lowerPc, int upperPc, int priorityIndex) {
    ChordMatch m;
    m.root = root;
    m.typeKey = theory::fifthKey();
    m.priorityIndex = priorityIndex;
    m.matchedCount = 2;
    m.chordSize = 2;
    m.isSubset = true;
    m.exactMatch = true;
    m.matchedPcs = {lowerPc, upperPc};
    m.chordPcs = {lowerPc, upperPc};
    return m;
}

// Register-aware dyad rules. Returns false when the interval is left to general matching.
static bool matchDyad(const QVector<int>& pressedNotes, PitchClassSet pressed,
                      const QVector<ChordTemplate>& templates, QVector<ChordMatch>& out) {
    const QVector<int> pcs = theory::pitchClassesOf(pressed);
    const int pcA = pcs[0];
    const int pcB = pcs[1];

    // Lowest sounding note per pitch class decides which class is below.
    QHash<int, int> lowestNote;
    for (int n : pressedNotes) {
        const int pc = theory::toPitchClass(n);
        auto it = lowestNote.find(pc);
        if (it == lowestNote.end()) lowestNote.insert(pc, n);
        else if (n < it.value()) it.value() = n;
    }

    const int lowerPc = lowestNote.value(pcA) <= lowestNote.value(pcB) ? pcA : pcB;
    const int upperPc = lowerPc == pcA ? pcB : pcA;
    const int interval = theory::toPitchClass(upperPc - lowerPc);

    if (interval == 0) {
        out.push_back(singleNoteMatch(lowerPc));
        return true;
    }
    if (interval == 7) {
        out.push_back(fifthMatch(lowerPc, lowerPc, upperPc, fifthPriority(templates)));
        return true;
    }
    if (interval == 5) {
        // A fourth is a fifth heard from above.
        out.push_back(fifthMatch(upperPc, lowerPc, upperPc, fifthPriority(templates)));
        return true;
    }
    return false;
}

static QVector<ChordMatch> matchTemplates(PitchClassSet pressed, const QVector<ChordTemplate>& templates) {
    QVector<ChordMatch> results;
    const QVector<int> pressedPcs = theory::pitchClassesOf(pressed);

    for (const auto& t : templates) {
        const PitchClassSet common = PitchClassSet(pressed & t.mask);
        if (common == 0) continue;

        ChordMatch m;
        m.root = t.root;
        m.typeKey = t.typeKey;
        m.priorityIndex = t.priorityIndex;
        m.matchedCount = theory::pitchClassCount(common);
        m.chordSize = t.size;
        m.isSubset = PitchClassSet(pressed & ~t.mask) == 0;
        m.chordPcs = t.pitchClasses;
        for (int pc : pressedPcs) {
            if (theory::containsPitchClass(t.mask, pc)) m.matchedPcs.push_back(pc);
            else m.extraPcs.push_back(pc);
        }
        for (int pc : t.pitchClasses) {
            if (!theory::containsPitchClass(pressed, pc)) m.missingPcs.push_back(pc);
        }
        results.push_back(std::move(m));
    }

    // Exactness needs the full pressed-set size, so it is settled after scoring.
    const int pressedSize = pressedPcs.size();
    for (auto& m : results) m.exactMatch = (m.matchedCount == pressedSize);
    return results;
}

} // namespace

QVector<ChordMatch> recognize(const QVector<int>& pressedNotes, const QVector<ChordTemplate>& templates) {
    QVector<ChordMatch> out;
    if (pressedNotes.isEmpty()) return out;

    const PitchClassSet pressed = theory::reduceToPitchClassSet(pressedNotes);
    const int distinct = theory::pitchClassCount(pressed);

    if (distinct == 1) {
        out.push_back(singleNoteMatch(theory::pitchClassesOf(pressed).first()));
        return out;
    }
    if (distinct == 2 && matchDyad(pressedNotes, pressed, templates, out)) {
        return out;
    }

    out = matchTemplates(pressed, templates);
    rankMatches(out);
    return out;
}

QVector<ChordMatch> recognize(const QVector<int>& pressedNotes) {
    if (pressedNotes.isEmpty()) return {};
    const TemplateSnapshot bank = getTemplates();
    return recognize(pressedNotes, *bank);
}

QVector<ChordMatch> recognize(const QSet<int>& pressedNotes) {
    return recognize(QVector<int>(pressedNotes.cbegin(), pressedNotes.cend()));
}

QVector<ChordMatch> recognize(const std::vector<int>& pressedNotes) {
    return recognize(QVector<int>(pressedNotes.cbegin(), pressedNotes.cend()));
}

} // namespace chordscope::recognition
