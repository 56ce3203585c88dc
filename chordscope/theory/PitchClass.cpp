#include "chordscope/theory/PitchClass.h"

namespace chordscope::theory {
namespace {

template <typename Container>
static PitchClassSet reduceNotes(const Container& notes) {
    PitchClassSet set = 0;
    for (int n : notes) set |= pitchClassBit(n);
    return set;
}

} // namespace

int pitchClassCount(PitchClassSet set) {
    int count = 0;
    for (int pc = 0; pc < 12; ++pc) {
        if (containsPitchClass(set, pc)) ++count;
    }
    return count;
}

PitchClassSet reduceToPitchClassSet(const QVector<int>& notes) {
    return reduceNotes(notes);
}

PitchClassSet reduceToPitchClassSet(const QSet<int>& notes) {
    return reduceNotes(notes);
}

PitchClassSet reduceToPitchClassSet(const std::vector<int>& notes) {
    return reduceNotes(notes);
}

QVector<int> pitchClassesOf(PitchClassSet set) {
    QVector<int> out;
    for (int pc = 0; pc < 12; ++pc) {
        if (containsPitchClass(set, pc)) out.push_back(pc);
    }
    return out;
}

const QStringList& rootNames() {
    static const QStringList kNames = {"C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};
    return kNames;
}

QString rootName(int pc) {
    return rootNames().at(toPitchClass(pc));
}

QString pcsToNotes(const QVector<int>& pcs) {
    QStringList names;
    names.reserve(pcs.size());
    for (int pc : pcs) names.push_back(rootName(pc));
    return names.join(' ');
}

QString intervalName(int semitones) {
    static const char* kDegrees[12] = {
        "1", "♭2", "2", "♭3", "3", "4", "♭5", "5", "#5", "6", "♭7", "7"};
    return QString::fromUtf8(kDegrees[toPitchClass(semitones)]);
}

} // namespace chordscope::theory
