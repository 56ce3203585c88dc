#include "chordscope/engine/ChordRecognitionSession.h"

#include "chordscope/theory/PitchClass.h"

#include <QDebug>
#include <QtGlobal>

namespace chordscope::engine {

ChordRecognitionSession::ChordRecognitionSession(QObject* parent)
    : QObject(parent) {
    qRegisterMetaType<chordscope::engine::ChordReading>();
}

void ChordRecognitionSession::setMaxAlternatives(int n) {
    m_maxAlternatives = qBound(0, n, 12);
}

void ChordRecognitionSession::noteOn(int note) {
    if (m_held.noteOn(note)) refresh();
}

void ChordRecognitionSession::noteOff(int note) {
    if (m_held.noteOff(note)) refresh();
}

void ChordRecognitionSession::midiMessage(const std::vector<unsigned char>& message) {
    if (m_held.applyMidiMessage(message)) refresh();
}

void ChordRecognitionSession::allNotesOff() {
    if (m_held.clear()) refresh();
}

void ChordRecognitionSession::refresh() {
    m_reading = readChord(m_held.notes(), m_maxAlternatives);
    ++m_readingCount;

    if (m_verbose) {
        QVector<int> pcs;
        for (int n : m_held.sortedNotes()) pcs.push_back(theory::toPitchClass(n));
        qDebug().noquote() << QString("ChordRecognitionSession: held [%1] -> %2 (%3 candidates)")
                                  .arg(theory::pcsToNotes(pcs))
                                  .arg(m_reading.summary())
                                  .arg(m_reading.matches.size());
    }

    emit readingChanged(m_reading);
}

} // namespace chordscope::engine
