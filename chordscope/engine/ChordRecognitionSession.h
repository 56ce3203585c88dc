#pragma once

#include <QObject>

#include <vector>

#include "chordscope/engine/ChordReading.h"
#include "chordscope/input/HeldNotes.h"

namespace chordscope::engine {

// Live recognition: owns the held-note state and re-reads the chord on every change.
// Lives on one thread; feed it from other threads with queued invocations only.
class ChordRecognitionSession : public QObject {
    Q_OBJECT
public:
    explicit ChordRecognitionSession(QObject* parent = nullptr);

    void setMaxAlternatives(int n);
    int maxAlternatives() const { return m_maxAlternatives; }

    void setVerbose(bool verbose) { m_verbose = verbose; }
    bool verbose() const { return m_verbose; }

    const input::HeldNotes& heldNotes() const { return m_held; }
    const ChordReading& currentReading() const { return m_reading; }
    int readingCount() const { return m_readingCount; }

public slots:
    void noteOn(int note);
    void noteOff(int note);
    void midiMessage(const std::vector<unsigned char>& message);
    void allNotesOff();

signals:
    void readingChanged(const chordscope::engine::ChordReading& reading);

private:
    void refresh();

    input::HeldNotes m_held;
    ChordReading m_reading;
    int m_maxAlternatives = 5;
    int m_readingCount = 0;
    bool m_verbose = false;
};

} // namespace chordscope::engine
