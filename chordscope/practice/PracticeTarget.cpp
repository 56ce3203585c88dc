#include "chordscope/practice/PracticeTarget.h"

#include "chordscope/naming/ChordNamer.h"
#include "chordscope/theory/PitchClass.h"

#include <QRandomGenerator>
#include <QStringList>

#include <algorithm>
#include <climits>
#include <cstdlib>

namespace chordscope::practice {
namespace {

constexpr int kAnchorNote = 60; // middle C

static bool sameChord(const recognition::ChordTemplate& a, const recognition::ChordTemplate& b) {
    return a.root == b.root && a.typeKey == b.typeKey;
}

static int closestNote(int pc, int target) {
    int best = -1;
    int bestDist = INT_MAX;
    for (int m = kLowestNote; m <= kHighestNote; ++m) {
        if (theory::toPitchClass(m) != pc) continue;
        const int d = std::abs(m - target);
        if (d < bestDist) {
            bestDist = d;
            best = m;
        }
    }
    return best;
}

// Whole-octave shift (-6..6) that keeps every note in range with the bass nearest
// middle C; the lowest shift wins a tie. Returns false when no shift fits.
static bool bestOctaveShift(const QVector<int>& notes, int& shiftOut) {
    bool found = false;
    int bestDist = INT_MAX;
    for (int k = -6; k <= 6; ++k) {
        int lo = INT_MAX;
        int hi = INT_MIN;
        for (int n : notes) {
            lo = std::min(lo, n + k * 12);
            hi = std::max(hi, n + k * 12);
        }
        if (lo < kLowestNote || hi > kHighestNote) continue;
        const int d = std::abs(notes.first() + k * 12 - kAnchorNote);
        if (d < bestDist) {
            bestDist = d;
            shiftOut = k;
            found = true;
        }
    }
    return found;
}

} // namespace

const recognition::ChordTemplate* pickDifferent(const QVector<recognition::ChordTemplate>& pool,
                                                const recognition::ChordTemplate* avoid,
                                                QRandomGenerator& rng) {
    if (pool.isEmpty()) return nullptr;
    if (!avoid) return &pool[rng.bounded(int(pool.size()))];
    if (pool.size() == 1) return &pool.first();

    for (int i = 0; i < 8; ++i) {
        const auto& cand = pool[rng.bounded(int(pool.size()))];
        if (!sameChord(cand, *avoid)) return &cand;
    }
    for (const auto& p : pool) {
        if (!sameChord(p, *avoid)) return &p;
    }
    return &pool.first();
}

PracticeTarget makeTarget(const recognition::ChordTemplate& chord, int inversion) {
    PracticeTarget t;
    t.chord = chord;

    QVector<int> fromRoot = chord.pitchClasses;
    const int n = fromRoot.size();
    if (n == 0) return t;
    const int rootIdx = fromRoot.indexOf(chord.root);
    if (rootIdx > 0) std::rotate(fromRoot.begin(), fromRoot.begin() + rootIdx, fromRoot.end());

    const int inv = inversion < 0 ? 0 : inversion % n;
    t.inversion = inversion < 0 ? -1 : inv;

    // Stack upward from the root nearest middle C.
    QVector<int> stacked;
    stacked.reserve(n);
    int prev = closestNote(fromRoot.first(), kAnchorNote);
    stacked.push_back(prev);
    for (int i = 1; i < n; ++i) {
        int cand = prev + theory::toPitchClass(fromRoot[i] - prev);
        if (cand <= prev) cand += 12;
        while (cand > kHighestNote) cand -= 12;
        while (cand < kLowestNote) cand += 12;
        stacked.push_back(cand);
        prev = cand;
    }

    QVector<int> voicing = stacked;
    QVector<int> ordered = fromRoot;
    std::rotate(voicing.begin(), voicing.begin() + inv, voicing.end());
    std::rotate(ordered.begin(), ordered.begin() + inv, ordered.end());
    for (int i = 1; i < n; ++i) {
        while (voicing[i] <= voicing[i - 1]) voicing[i] += 12;
    }

    int shift = 0;
    if (bestOctaveShift(voicing, shift)) {
        for (int& v : voicing) v += shift * 12;
    } else {
        while (*std::max_element(voicing.cbegin(), voicing.cend()) > kHighestNote) {
            for (int& v : voicing) v -= 12;
        }
        while (*std::min_element(voicing.cbegin(), voicing.cend()) < kLowestNote) {
            for (int& v : voicing) v += 12;
        }
    }
    for (int& v : voicing) {
        while (v > kHighestNote) v -= 12;
        while (v < kLowestNote) v += 12;
    }

    t.orderedPcs = ordered;
    t.voicing = voicing;
    return t;
}

PracticeTarget makeRandomTarget(const recognition::ChordTemplate& chord, bool allowInversions, QRandomGenerator& rng) {
    if (!allowInversions) return makeTarget(chord, -1);
    const int n = chord.pitchClasses.size();
    return makeTarget(chord, n > 1 ? int(rng.bounded(n)) : 0);
}

AttemptResult judgeAttempt(const PracticeTarget& target, const QVector<int>& heldNotes, bool requireBass) {
    if (heldNotes.isEmpty()) return AttemptResult::Idle;

    const theory::PitchClassSet pressed = theory::reduceToPitchClassSet(heldNotes);
    const theory::PitchClassSet wanted = target.chord.mask;
    if (theory::PitchClassSet(pressed & ~wanted) != 0) return AttemptResult::Wrong;
    if (pressed != wanted) return AttemptResult::Partial;

    if (requireBass && target.inversion >= 0) {
        const int lowest = *std::min_element(heldNotes.cbegin(), heldNotes.cend());
        if (theory::toPitchClass(lowest) != target.bassPc()) return AttemptResult::Partial;
    }
    return AttemptResult::Correct;
}

QString targetLabel(const PracticeTarget& target) {
    if (!target.isValid()) return QString();
    QString label = theory::rootName(target.chord.root) + theory::suffixFor(target.chord.typeKey);
    if (target.inversion >= 0) label += QString(" (%1)").arg(naming::inversionLabel(target.inversion));
    return label;
}

QString voicingToString(const QVector<int>& notes) {
    QStringList parts;
    for (int n : notes) parts.push_back(theory::rootName(theory::toPitchClass(n)) + QString::number(n / 12 - 1));
    return parts.join(' ');
}

} // namespace chordscope::practice
