#include "chordscope/input/HeldNotes.h"

#include <algorithm>

namespace chordscope::input {

bool HeldNotes::noteOn(int note) {
    if (m_notes.contains(note)) return false;
    m_notes.push_back(note);
    return true;
}

bool HeldNotes::noteOff(int note) {
    return m_notes.removeOne(note);
}

bool HeldNotes::clear() {
    if (m_notes.isEmpty()) return false;
    m_notes.clear();
    return true;
}

bool HeldNotes::applyMidiMessage(const std::vector<unsigned char>& message) {
    if (message.size() < 3) return false;
    const unsigned char status = message[0] & 0xF0;
    const int note = message[1];
    const int velocity = message[2];

    if (status == 0x90 && velocity > 0) return noteOn(note);
    if (status == 0x80 || (status == 0x90 && velocity == 0)) return noteOff(note);
    return false;
}

QVector<int> HeldNotes::sortedNotes() const {
    QVector<int> out = m_notes;
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace chordscope::input
