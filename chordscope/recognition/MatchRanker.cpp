#include "chordscope/recognition/MatchRanker.h"

#include <algorithm>
#include <limits>

namespace chordscope::recognition {
namespace {

static int effectivePriority(const ChordMatch& m) {
    return m.priorityIndex < 0 ? std::numeric_limits<int>::max() : m.priorityIndex;
}

} // namespace

bool compareMatches(const ChordMatch& a, const ChordMatch& b) {
    if (a.exactMatch != b.exactMatch) return a.exactMatch;
    if (a.matchedCount != b.matchedCount) return a.matchedCount > b.matchedCount;
    const int pa = effectivePriority(a);
    const int pb = effectivePriority(b);
    if (pa != pb) return pa < pb;
    if (a.chordSize != b.chordSize) return a.chordSize < b.chordSize;
    return a.root < b.root;
}

void rankMatches(QVector<ChordMatch>& matches) {
    std::stable_sort(matches.begin(), matches.end(), compareMatches);
}

bool isRanked(const QVector<ChordMatch>& matches) {
    for (int i = 1; i < matches.size(); ++i) {
        if (compareMatches(matches[i], matches[i - 1])) return false;
    }
    return true;
}

} // namespace chordscope::recognition
