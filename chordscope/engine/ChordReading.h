#pragma once

#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QVector>

#include "chordscope/naming/ChordNamer.h"
#include "chordscope/recognition/ChordMatch.h"

namespace chordscope::engine {

struct FormattedCandidate {
    recognition::ChordMatch match;
    naming::FormattedMatch name;
};

// Everything a presentation layer needs for one held-note set.
struct ChordReading {
    QVector<int> heldNotes;                       // press order
    QVector<recognition::ChordMatch> matches;     // full ranked list
    bool hasTop = false;
    FormattedCandidate top;
    QVector<naming::ChordToneRow> topTones;
    QVector<FormattedCandidate> alternatives;     // matches after the top, capped

    bool isEmpty() const { return !hasTop; }

    // Headline text: "C/E (1st inversion)", or "No matching chords".
    QString summary() const;

    QJsonObject toJsonObject() const;
    QString toJsonString(bool compact = true) const;
};

// Recognizes and formats in one step.
ChordReading readChord(const QVector<int>& heldNotes, int maxAlternatives);

} // namespace chordscope::engine

Q_DECLARE_METATYPE(chordscope::engine::ChordReading)
