#include "chordscope/config/MonitorSettings.h"
#include "chordscope/engine/ChordReading.h"
#include "chordscope/engine/ChordRecognitionSession.h"
#include "chordscope/input/HeldNotes.h"

#include <QCoreApplication>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>
#include <QTemporaryDir>
#include <QtGlobal>

using chordscope::engine::ChordReading;
using chordscope::engine::ChordRecognitionSession;
using chordscope::input::HeldNotes;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(int a, int b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectStrEq(const QString& a, const QString& b, const QString& msg) {
    expect(a == b, msg + QString(" (got '%1' expected '%2')").arg(a, b));
}

} // namespace

static void testHeldNotes() {
    HeldNotes h;
    expect(h.isEmpty(), "starts empty");
    expect(h.noteOn(64), "note on changes the set");
    expect(!h.noteOn(64), "repeated note on is ignored");
    expect(h.noteOn(60), "second note");
    expect(h.notes() == QVector<int>({64, 60}), "press order kept");
    expect(h.sortedNotes() == QVector<int>({60, 64}), "sortedNotes ascending");
    expect(!h.noteOff(61), "releasing an unheld note changes nothing");
    expect(h.noteOff(64), "release");
    expect(h.notes() == QVector<int>({60}), "one note left");
    expect(h.clear(), "clear removes notes");
    expect(!h.clear(), "clearing an empty set changes nothing");

    expect(h.applyMidiMessage({0x90, 60, 100}), "note on channel 1");
    expect(h.applyMidiMessage({0x93, 67, 80}), "note on channel 4");
    expect(h.contains(60) && h.contains(67), "both held");
    expect(h.applyMidiMessage({0x90, 60, 0}), "note on with velocity 0 is a release");
    expect(h.applyMidiMessage({0x83, 67, 64}), "note off");
    expect(h.isEmpty(), "all released");
    expect(!h.applyMidiMessage({0xB0, 64, 127}), "control change ignored");
    expect(!h.applyMidiMessage({0xE0, 0, 64}), "pitch bend ignored");
    expect(!h.applyMidiMessage({0x90, 60}), "short message ignored");
    expect(!h.applyMidiMessage({}), "empty message ignored");
}

static void testSession() {
    ChordRecognitionSession session;
    int emitted = 0;
    ChordReading last;
    QObject::connect(&session, &ChordRecognitionSession::readingChanged, [&](const ChordReading& r) {
        ++emitted;
        last = r;
    });

    session.noteOn(60);
    expectEq(emitted, 1, "first note emits");
    expectStrEq(last.summary(), "C", "single note summary");

    session.noteOn(64);
    session.noteOn(67);
    expectEq(emitted, 3, "each change emits");
    expectStrEq(last.summary(), "C (root position)", "C major summary");
    expectEq(last.alternatives.size(), 5, "default alternatives cap");

    session.noteOn(67);
    expectEq(emitted, 3, "unchanged held set emits nothing");

    session.noteOff(60);
    expectStrEq(last.summary(), "C (1st inversion)", "E G reads as C over E");
    expect(session.currentReading().heldNotes == QVector<int>({64, 67}), "reading carries the held notes");

    session.allNotesOff();
    expectEq(emitted, 5, "all notes off emits once");
    expect(last.isEmpty(), "nothing held -> empty reading");
    expectStrEq(last.summary(), "No matching chords", "empty summary");
    expect(last.matches.isEmpty(), "nothing held -> no matches");

    session.allNotesOff();
    expectEq(emitted, 5, "second all notes off emits nothing");

    session.setMaxAlternatives(2);
    session.midiMessage({0x90, 60, 90});
    session.midiMessage({0x90, 65, 90});
    expectStrEq(last.top.name.displayName, "F⁵/C", "raw MIDI feeds the session");
    session.midiMessage({0xB0, 1, 10});
    expectEq(session.readingCount(), 7, "control changes do not re-read");
    session.midiMessage({0x90, 69, 90});
    expectStrEq(last.summary(), "F (2nd inversion)", "C F A -> F over C");
    expectEq(last.alternatives.size(), 2, "alternatives follow the configured cap");

    session.setMaxAlternatives(99);
    expectEq(session.maxAlternatives(), 12, "alternatives cap clamped");
}

static void testReadingJson() {
    const ChordReading r = chordscope::engine::readChord({64, 67, 72}, 3);
    expect(r.hasTop, "E G C has a top match");
    expectEq(r.topTones.size(), 3, "three chord-tone rows");
    expectEq(r.alternatives.size(), 3, "three alternatives");

    const QJsonDocument doc = QJsonDocument::fromJson(r.toJsonString(true).toUtf8());
    expect(doc.isObject(), "reading serialises to a JSON object");
    const QJsonObject o = doc.object();
    expectEq(o.value("held").toArray().size(), 3, "held array");
    const QJsonObject top = o.value("top").toObject();
    expectStrEq(top.value("display_name").toString(), "C", "top display name");
    expectStrEq(top.value("type").toString(), "major", "top type");
    expectStrEq(top.value("inversion").toString(), "1st inversion", "top inversion");
    expectStrEq(top.value("bass").toString(), "E", "top bass");
    expectEq(top.value("tones").toArray().size(), 3, "top tones");
    expectStrEq(top.value("tones").toArray().at(1).toObject().value("degree").toString(), "3", "second tone is the third");
    expectEq(o.value("alternatives").toArray().size(), 3, "alternatives array");

    const ChordReading empty = chordscope::engine::readChord({}, 5);
    const QJsonObject e = empty.toJsonObject();
    expect(!e.contains("top"), "empty reading has no top");
    expect(e.value("alternatives").toArray().isEmpty(), "empty reading has no alternatives");

    const ChordReading single = chordscope::engine::readChord({62, 74}, 5);
    const QJsonObject s = single.toJsonObject().value("top").toObject();
    expectStrEq(s.value("long_name").toString(), "Single Note", "single note long name");
    expect(!s.contains("bass") && !s.contains("inversion"), "single note carries no bass");
}

static void testSettings() {
    using namespace chordscope::config;

    QTemporaryDir dir;
    expect(dir.isValid(), "temporary dir");
    if (!dir.isValid()) return;
    const QString path = dir.filePath("monitor.ini");

    {
        QSettings s(path, QSettings::IniFormat);
        const MonitorSettings d = loadMonitorSettings(s, "monitor");
        expect(d.inputPort.isEmpty(), "default port is empty");
        expectEq(d.maxAlternatives, 5, "default alternatives");
        expect(!d.verbose && !d.json, "default flags");
    }
    {
        QSettings s(path, QSettings::IniFormat);
        MonitorSettings m;
        m.inputPort = "Keystation";
        m.maxAlternatives = 3;
        m.verbose = true;
        m.json = true;
        saveMonitorSettings(s, "monitor", m);
        s.sync();
        expect(s.status() == QSettings::NoError, "settings saved");
    }
    {
        QSettings s(path, QSettings::IniFormat);
        const MonitorSettings m = loadMonitorSettings(s, "monitor");
        expectStrEq(m.inputPort, "Keystation", "port round trip");
        expectEq(m.maxAlternatives, 3, "alternatives round trip");
        expect(m.verbose && m.json, "flags round trip");

        s.setValue("monitor/maxAlternatives", 40);
        expectEq(loadMonitorSettings(s, "monitor").maxAlternatives, 12, "out-of-range alternatives clamped");
        expect(loadMonitorSettings(s, "other").inputPort.isEmpty(), "prefixes are independent");
    }
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testHeldNotes();
    testSession();
    testReadingJson();
    testSettings();

    if (g_failures == 0) {
        qInfo("ChordscopeSessionTests: PASS");
        return 0;
    }

    qWarning("ChordscopeSessionTests: FAIL (%d failures)", g_failures);
    return 1;
}
