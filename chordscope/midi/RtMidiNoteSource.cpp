#include "chordscope/midi/RtMidiNoteSource.h"

#include "RtMidi.h"

#include <QDebug>
#include <QMetaObject>
#include <QPointer>

namespace chordscope::midi {

RtMidiNoteSource::RtMidiNoteSource(QObject* parent)
    : QObject(parent) {}

RtMidiNoteSource::~RtMidiNoteSource() {
    close();
}

bool RtMidiNoteSource::ensureInput() {
    if (m_in) return true;
    try {
        m_in = std::make_unique<RtMidiIn>();
    } catch (const RtMidiError& e) {
        fail(QString("RtMidiIn init failed: %1").arg(QString::fromStdString(e.getMessage())));
        return false;
    }
    return true;
}

void RtMidiNoteSource::fail(const QString& message) {
    m_lastError = message;
    qWarning().noquote() << "RtMidiNoteSource:" << message;
}

QStringList RtMidiNoteSource::availablePorts() {
    QStringList out;
    if (!ensureInput()) return out;
    try {
        const unsigned int count = m_in->getPortCount();
        for (unsigned int i = 0; i < count; ++i) out.push_back(QString::fromStdString(m_in->getPortName(i)));
    } catch (const RtMidiError& e) {
        fail(QString("port enumeration failed: %1").arg(QString::fromStdString(e.getMessage())));
    }
    return out;
}

bool RtMidiNoteSource::open(const QString& portName) {
    const QStringList ports = availablePorts();
    if (ports.isEmpty()) {
        fail("no MIDI input ports available");
        return false;
    }
    if (portName.trimmed().isEmpty()) return open(0);

    for (int i = 0; i < ports.size(); ++i) {
        if (ports[i].contains(portName.trimmed(), Qt::CaseInsensitive)) return open(i);
    }
    fail(QString("no MIDI input port matches '%1'").arg(portName));
    return false;
}

bool RtMidiNoteSource::open(int portIndex) {
    if (!ensureInput()) return false;
    close();
    try {
        if (portIndex < 0 || unsigned(portIndex) >= m_in->getPortCount()) {
            fail(QString("MIDI input port %1 out of range").arg(portIndex));
            return false;
        }
        m_portName = QString::fromStdString(m_in->getPortName(unsigned(portIndex)));
        m_in->openPort(unsigned(portIndex));
        m_in->setCallback(&RtMidiNoteSource::inputCallback, this);
        // Drop sysex, timing and active sensing.
        m_in->ignoreTypes(true, true, true);
    } catch (const RtMidiError& e) {
        fail(QString("failed to open '%1': %2").arg(m_portName, QString::fromStdString(e.getMessage())));
        m_portName.clear();
        return false;
    }

    m_open = true;
    m_lastError.clear();
    qInfo().noquote() << QString("RtMidiNoteSource: listening on '%1'").arg(m_portName);
    return true;
}

void RtMidiNoteSource::close() {
    if (!m_in || !m_open) return;
    try {
        m_in->cancelCallback();
        m_in->closePort();
    } catch (const RtMidiError& e) {
        fail(QString("close failed: %1").arg(QString::fromStdString(e.getMessage())));
    }
    m_open = false;
    m_portName.clear();
}

void RtMidiNoteSource::inputCallback(double /*deltatime*/, std::vector<unsigned char>* message, void* userData) {
    auto* self = static_cast<RtMidiNoteSource*>(userData);
    if (!self || !message || message->empty()) return;

    // Runs on RtMidi's thread: copy the bytes and hop to the owner thread.
    QPointer<RtMidiNoteSource> guard(self);
    std::vector<unsigned char> bytes = *message;
    QMetaObject::invokeMethod(self, [guard, bytes]() {
        if (guard) emit guard->midiMessage(bytes);
    }, Qt::QueuedConnection);
}

} // namespace chordscope::midi
