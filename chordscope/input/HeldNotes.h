#pragma once

#include <QVector>

#include <vector>

namespace chordscope::input {

// Currently sounding notes, in press order.
class HeldNotes {
public:
    // Each mutator returns true when the held set changed.
    bool noteOn(int note);
    bool noteOff(int note);
    bool clear();

    // Note on: status 0x9n with velocity > 0.
    // Note off: status 0x8n, or 0x9n with velocity 0.
    // Anything else (CC, pitch bend, sysex, short messages) is ignored.
    bool applyMidiMessage(const std::vector<unsigned char>& message);

    const QVector<int>& notes() const { return m_notes; }
    QVector<int> sortedNotes() const;
    bool contains(int note) const { return m_notes.contains(note); }
    bool isEmpty() const { return m_notes.isEmpty(); }
    int size() const { return m_notes.size(); }

private:
    QVector<int> m_notes;
};

} // namespace chordscope::input
