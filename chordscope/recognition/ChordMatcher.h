#pragma once

#include <QSet>
#include <QVector>

#include <vector>

#include "chordscope/recognition/ChordMatch.h"
#include "chordscope/recognition/TemplateBank.h"

namespace chordscope::recognition {

// Ranked chord candidates for the sounding notes (absolute note ids, any order).
// - Empty input yields an empty list.
// - Octaves of one pitch class yield a single "single" match.
// - Two pitch classes a fifth or a fourth apart yield a single "fifth" match:
//   rooted on the lower-sounding class for a fifth, the upper one for a fourth.
// - Everything else is scored against every template; zero-overlap templates are dropped.
QVector<ChordMatch> recognize(const QVector<int>& pressedNotes);
QVector<ChordMatch> recognize(const QSet<int>& pressedNotes);
QVector<ChordMatch> recognize(const std::vector<int>& pressedNotes);

// Same, against an explicit bank snapshot.
QVector<ChordMatch> recognize(const QVector<int>& pressedNotes, const QVector<ChordTemplate>& templates);

} // namespace chordscope::recognition
