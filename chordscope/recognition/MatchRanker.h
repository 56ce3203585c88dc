#pragma once

#include <QVector>

#include "chordscope/recognition/ChordMatch.h"

namespace chordscope::recognition {

// Strict ordering "a ranks before b". First differing key wins:
//  1) exactMatch first
//  2) more matched pitch classes
//  3) lower priority index (unlisted types last)
//  4) smaller chord
//  5) lower root
bool compareMatches(const ChordMatch& a, const ChordMatch& b);

// Stable sort by compareMatches.
void rankMatches(QVector<ChordMatch>& matches);

bool isRanked(const QVector<ChordMatch>& matches);

} // namespace chordscope::recognition
