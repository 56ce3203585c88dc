#pragma once

#include <QObject>
#include <QString>
#include <QStringList>

#include <memory>
#include <vector>

class RtMidiIn;

namespace chordscope::midi {

// Thin RtMidi input adapter. Raw channel messages arrive on RtMidi's thread and are
// re-emitted as midiMessage() on the thread this object lives on.
class RtMidiNoteSource : public QObject {
    Q_OBJECT
public:
    explicit RtMidiNoteSource(QObject* parent = nullptr);
    ~RtMidiNoteSource() override;

    QStringList availablePorts();

    // Opens the first port whose name contains `portName` (case-insensitive);
    // an empty name opens port 0. Returns false and sets lastError() on failure.
    bool open(const QString& portName);
    bool open(int portIndex);
    void close();

    bool isOpen() const { return m_open; }
    QString portName() const { return m_portName; }
    QString lastError() const { return m_lastError; }

signals:
    void midiMessage(const std::vector<unsigned char>& message);

private:
    bool ensureInput();
    void fail(const QString& message);

    static void inputCallback(double deltatime, std::vector<unsigned char>* message, void* userData);

    std::unique_ptr<RtMidiIn> m_in;
    bool m_open = false;
    QString m_portName;
    QString m_lastError;
};

} // namespace chordscope::midi
