#include "chordscope/config/PracticeSettings.h"
#include "chordscope/practice/PracticeFilter.h"
#include "chordscope/practice/PracticeSession.h"
#include "chordscope/practice/PracticeStats.h"
#include "chordscope/practice/PracticeTarget.h"
#include "chordscope/recognition/TemplateBank.h"
#include "chordscope/theory/ChordVocabulary.h"

#include <QCoreApplication>
#include <QDebug>
#include <QEventLoop>
#include <QJsonObject>
#include <QObject>
#include <QRandomGenerator>
#include <QSet>
#include <QSettings>
#include <QStringList>
#include <QTemporaryDir>
#include <QTimer>
#include <QtGlobal>

#include <algorithm>

using chordscope::practice::AttemptResult;
using chordscope::practice::PracticeFilter;
using chordscope::practice::PracticeSession;
using chordscope::practice::PracticeStats;
using chordscope::practice::PracticeTarget;
using chordscope::recognition::ChordTemplate;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(qint64 a, qint64 b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectStrEq(const QString& a, const QString& b, const QString& msg) {
    expect(a == b, msg + QString(" (got '%1' expected '%2')").arg(a, b));
}

static void expectNotes(const QVector<int>& got, const QVector<int>& want, const QString& msg) {
    QStringList g, w;
    for (int v : got) g.push_back(QString::number(v));
    for (int v : want) w.push_back(QString::number(v));
    expect(got == want, msg + QString(" (got [%1] expected [%2])").arg(g.join(','), w.join(',')));
}

static const ChordTemplate* findTemplate(int root, const QString& type) {
    static const chordscope::recognition::TemplateSnapshot bank = chordscope::recognition::getTemplates();
    for (const auto& t : *bank) {
        if (t.root == root && t.typeKey == type) return &t;
    }
    return nullptr;
}

static void play(PracticeSession& s, const QVector<int>& notes) {
    for (int n : notes) s.noteOn(n);
}

// Root C, major category only: the pool is C⁵ and C.
static PracticeFilter cOnlyMajor() {
    PracticeFilter f;
    f.categories = {"major"};
    f.roots = {0};
    return f;
}

} // namespace

static void testCategories() {
    using namespace chordscope::practice;

    expectEq(practiceCategories().size(), 14, "fourteen categories");
    expect(findCategory("flatRaised") != nullptr, "flatRaised category exists");
    expect(findCategory("nope") == nullptr, "unknown category");

    const auto& vocab = chordscope::theory::ChordVocabulary::builtins();
    for (const auto* f : vocab.allFormulas()) {
        expect(!typeTags(f->key).isEmpty() || f->key == "fifth", QString("%1 has category tags").arg(f->key));
    }
    for (const auto& c : practiceCategories()) {
        for (const QString& type : c.types) {
            expect(vocab.formula(type) != nullptr, QString("%1 lists known type %2").arg(c.key, type));
        }
    }

    const PracticeFilter d = PracticeFilter::defaults();
    expect(d.allowsType("major") && d.allowsType("dim") && d.allowsType("sus4"), "default triads allowed");
    expect(d.allowsType("fifth"), "fifth allowed through the major list");
    expect(!d.allowsType("m7"), "m7 needs the seventh category too");
    expect(!d.allowsType("m6"), "m6 needs the sixth category too");
    expect(d.roots == naturalRoots(), "default roots are the naturals");

    PracticeFilter minorSevenths;
    minorSevenths.categories = {"minor", "seventh"};
    expect(minorSevenths.allowsType("m7") && minorSevenths.allowsType("7"), "minor + seventh admit m7 and 7");
    expect(!minorSevenths.allowsType("m9"), "m9 also needs ninth");
    expect(!minorSevenths.allowsType("fifth"), "fifth only through a category listing it");

    const auto pool = filterTemplates(*chordscope::recognition::getTemplates(), d);
    expectEq(pool.size(), 7 * 7, "default pool: seven triad types on seven natural roots");
    for (const auto& t : pool) expect(naturalRoots().contains(t.root), "pool roots are natural");

    expect(filterTemplates(*chordscope::recognition::getTemplates(), PracticeFilter()).isEmpty(),
           "nothing enabled -> empty pool");
}

static void testPickDifferent() {
    using chordscope::practice::pickDifferent;
    QRandomGenerator rng(42);

    const ChordTemplate* c = findTemplate(0, "major");
    const ChordTemplate* g = findTemplate(7, "major");
    expect(c && g, "C and G major templates exist");
    if (!c || !g) return;

    expect(pickDifferent({}, nullptr, rng) == nullptr, "empty pool -> nothing");

    const QVector<ChordTemplate> one = {*c};
    expect(pickDifferent(one, c, rng) == &one.first(), "single-entry pool repeats");

    const QVector<ChordTemplate> two = {*c, *g};
    for (int i = 0; i < 20; ++i) {
        const ChordTemplate* p = pickDifferent(two, &two.first(), rng);
        expect(p && p->root == 7, "never repeats the avoided chord");
    }
    const ChordTemplate* any = pickDifferent(two, nullptr, rng);
    expect(any == &two[0] || any == &two[1], "no avoid -> any pool entry");
}

static void testTargets() {
    using namespace chordscope::practice;

    const ChordTemplate* c = findTemplate(0, "major");
    const ChordTemplate* g = findTemplate(7, "major");
    const ChordTemplate* c13 = findTemplate(0, "13");
    expect(c && g && c13, "templates exist");
    if (!c || !g || !c13) return;

    const PracticeTarget root = makeTarget(*c, -1);
    expect(root.isValid(), "target valid");
    expectEq(root.inversion, -1, "no inversion requested");
    expectNotes(root.voicing, {60, 64, 67}, "C major voiced from middle C");
    expectNotes(root.orderedPcs, {0, 4, 7}, "root position order");
    expectStrEq(targetLabel(root), "C", "root position label");
    expectStrEq(voicingToString(root.voicing), "C4 E4 G4", "voicing names");

    const PracticeTarget first = makeTarget(*c, 1);
    expectNotes(first.voicing, {64, 67, 72}, "first inversion stacks above E4");
    expectEq(first.bassPc(), 4, "E in the bass");
    expectStrEq(targetLabel(first), "C (1st inversion)", "inversion label");

    const PracticeTarget second = makeTarget(*c, 2);
    expectNotes(second.voicing, {55, 60, 64}, "second inversion drops to G3, nearest middle C");
    expectNotes(second.orderedPcs, {7, 0, 4}, "second inversion order");

    expectNotes(makeTarget(*g, -1).voicing, {55, 59, 62}, "G roots below middle C when closer");

    const PracticeTarget thirteenth = makeTarget(*c13, -1);
    expectEq(thirteenth.voicing.size(), 7, "every tone voiced");
    for (int n : thirteenth.voicing) {
        expect(n >= kLowestNote && n <= kHighestNote, "voicing in piano range");
    }
    expect(std::is_sorted(thirteenth.voicing.cbegin(), thirteenth.voicing.cend()), "voicing ascends");

    QRandomGenerator rng(3);
    expectEq(makeRandomTarget(*c, false, rng).inversion, -1, "inversions off");
    for (int i = 0; i < 10; ++i) {
        const int inv = makeRandomTarget(*c, true, rng).inversion;
        expect(inv >= 0 && inv < 3, "random inversion within the chord");
    }
}

static void testJudge() {
    using namespace chordscope::practice;

    const ChordTemplate* c = findTemplate(0, "major");
    if (!c) return;
    const PracticeTarget root = makeTarget(*c, -1);

    expect(judgeAttempt(root, {}, false) == AttemptResult::Idle, "nothing held");
    expect(judgeAttempt(root, {60}, false) == AttemptResult::Partial, "one tone so far");
    expect(judgeAttempt(root, {60, 64, 67}, false) == AttemptResult::Correct, "exact pitch classes");
    expect(judgeAttempt(root, {48, 64, 67, 72}, true) == AttemptResult::Correct, "octave doublings are fine");
    expect(judgeAttempt(root, {60, 64, 66}, false) == AttemptResult::Wrong, "foreign pitch class");
    expect(judgeAttempt(root, {60, 64, 67, 70}, false) == AttemptResult::Wrong, "extra tone is wrong");

    const PracticeTarget inverted = makeTarget(*c, 1);
    expect(judgeAttempt(inverted, {60, 64, 67}, true) == AttemptResult::Partial, "right tones, wrong bass");
    expect(judgeAttempt(inverted, {64, 67, 72}, true) == AttemptResult::Correct, "E in the bass");
    expect(judgeAttempt(inverted, {60, 64, 67}, false) == AttemptResult::Correct, "bass ignored when not required");
}

static void testStats() {
    using namespace chordscope::practice;

    PracticeStats s;
    expect(s.isEmpty(), "starts empty");
    s.record("m7", 9, true, 1000);
    s.record("m7", 9, false, 500);
    s.record("m7", 2, true, 3000);
    s.record("major", 0, true, 800);

    expectEq(s.chordCount(), 3, "three chords");
    expectStrEq(PracticeStats::chordKey("m7", 9), "m7@9", "chord key");

    const StatLine m7 = s.forType("m7");
    expectEq(m7.attempts, 3, "m7 attempts");
    expectEq(m7.correct, 2, "m7 correct");
    expectEq(m7.totalTimeMs, 4000, "failed attempts add no time");

    const StatLine a = s.forRoot(9);
    expectEq(a.attempts, 2, "root A attempts");
    expectEq(a.correct, 1, "root A correct");

    const StatLine am7 = s.forChord("m7", 9);
    expectEq(am7.averageTimeMs(), 1000, "average over correct attempts");
    expect(qFuzzyCompare(am7.accuracy(), 50.0), "accuracy percent");
    expectEq(StatLine().averageTimeMs(), -1, "no solves -> no average");
    expect(StatLine().accuracy() == 0.0, "no attempts -> zero accuracy");

    PracticeFilter everything;
    for (const auto& c : practiceCategories()) everything.categories.insert(c.key);

    const auto byAttempts = s.rows(everything, StatsSortKey::Attempts, true);
    expectEq(byAttempts.size(), 3, "all rows");
    if (!byAttempts.isEmpty()) {
        expectStrEq(byAttempts.first().displayName, "Am⁷", "most attempted first");
        expectStrEq(byAttempts.first().longName, "Minor Seventh", "row long name");
    }

    const auto bySpeed = s.rows(everything, StatsSortKey::AverageTime, false);
    if (bySpeed.size() == 3) {
        expectStrEq(bySpeed[0].displayName, "C", "fastest first");
        expectStrEq(bySpeed[2].displayName, "Dm⁷", "slowest last");
    }

    const auto defaults = s.rows(PracticeFilter::defaults(), StatsSortKey::Root, false);
    expectEq(defaults.size(), 1, "default filter hides sevenths");

    PracticeFilter onlyD = everything;
    onlyD.roots = {2};
    expectEq(s.rows(onlyD, StatsSortKey::Root, false).size(), 1, "root filter");

    const QJsonObject json = s.toJsonObject();
    const QJsonObject am7Json = json.value("by_chord").toObject().value("m7@9").toObject();
    expectEq(am7Json.value("attempts").toInt(), 2, "json chord attempts");
    expectStrEq(am7Json.value("type").toString(), "m7", "json chord type");
    expectEq(json.value("by_type").toObject().value("m7").toObject().value("correct").toInt(), 2, "json type table");

    StatsSortKey key = StatsSortKey::Chord;
    expect(parseStatsSortKey("avg", key) && key == StatsSortKey::AverageTime, "avg sort key");
    expect(!parseStatsSortKey("bogus", key), "unknown sort key");

    QTemporaryDir dir;
    expect(dir.isValid(), "temporary dir");
    if (!dir.isValid()) return;
    const QString path = dir.filePath("practice.ini");
    {
        QSettings store(path, QSettings::IniFormat);
        savePracticeStats(store, "practice/stats", s);
        store.sync();
        expect(store.status() == QSettings::NoError, "stats saved");
    }
    {
        QSettings store(path, QSettings::IniFormat);
        const PracticeStats loaded = loadPracticeStats(store, "practice/stats");
        expect(loaded == s, "stats round trip, type and root tables included");

        PracticeStats smaller;
        smaller.record("dim", 11, true, 100);
        savePracticeStats(store, "practice/stats", smaller);
        expect(loadPracticeStats(store, "practice/stats") == smaller, "saving replaces older entries");

        store.beginWriteArray("broken/chords");
        store.setArrayIndex(0);
        store.setValue("type", "major");
        store.setValue("root", 14);
        store.setValue("attempts", 3);
        store.endArray();
        expect(loadPracticeStats(store, "broken").isEmpty(), "out-of-range root skipped");
    }

    s.reset();
    expect(s.isEmpty() && s.forType("m7").attempts == 0, "reset clears every table");
}

static void testPracticeSettings() {
    using namespace chordscope::config;

    QTemporaryDir dir;
    expect(dir.isValid(), "temporary dir");
    if (!dir.isValid()) return;
    QSettings store(dir.filePath("settings.ini"), QSettings::IniFormat);

    const PracticeSettings d = loadPracticeSettings(store, "practice");
    expect(!d.allowInversions && d.showNotes && !d.trackStats, "default flags");
    expect(qFuzzyCompare(d.holdSeconds, 2.0), "default hold time");

    PracticeSettings p;
    p.allowInversions = true;
    p.showNotes = false;
    p.holdSeconds = 0.5;
    p.trackStats = true;
    savePracticeSettings(store, "practice", p);
    const PracticeSettings r = loadPracticeSettings(store, "practice");
    expect(r.allowInversions && !r.showNotes && r.trackStats, "flags round trip");
    expect(qFuzzyCompare(r.holdSeconds, 0.5), "hold round trip");

    store.setValue("practice/holdSeconds", 30);
    expect(qFuzzyCompare(loadPracticeSettings(store, "practice").holdSeconds, 10.0), "hold time clamped");
}

static void testSession() {
    PracticeSession s(chordscope::recognition::getTemplates());
    s.setSeed(7);
    s.setHoldMs(0);
    s.setFilter(cOnlyMajor());
    expectEq(s.pool().size(), 2, "C⁵ and C in the pool");
    expectEq(s.holdMs(), 0, "no hold time");
    expect(!s.allowInversions(), "inversions off by default");
    expect(s.filter().roots == QSet<int>{0}, "filter kept");
    expect(s.currentTarget().isValid(), "a target is waiting");
    expect(s.state() == PracticeSession::State::Idle, "idle before a round");

    int targets = 0;
    int solvedCount = 0;
    int wrong = 0;
    int statsChanges = 0;
    bool lastClean = true;
    QObject::connect(&s, &PracticeSession::targetChanged, [&](const PracticeTarget&) { ++targets; });
    QObject::connect(&s, &PracticeSession::solved, [&](bool clean, qint64) { ++solvedCount; lastClean = clean; });
    QObject::connect(&s, &PracticeSession::wrongPress, [&] { ++wrong; });
    QObject::connect(&s, &PracticeSession::statsChanged, [&] { ++statsChanges; });

    expect(s.start(), "round starts");
    expect(s.state() == PracticeSession::State::Running, "running");
    expect(s.trackStats(), "starting a round turns tracking on");
    expectEq(targets, 1, "start shows a target");

    // A wrong note, then the right chord.
    s.noteOn(61);
    expectEq(wrong, 1, "C# is foreign to both chords");
    expect(s.hadWrongPress(), "wrong press remembered");
    s.noteOff(61);
    const PracticeTarget firstTarget = s.currentTarget();
    play(s, firstTarget.voicing);
    expectEq(s.heldNotes().notes().size(), firstTarget.voicing.size(), "every voiced note held");
    expectEq(solvedCount, 1, "solved once every tone is down");
    expect(!lastClean, "solve after a wrong note is not clean");
    expectEq(s.score(), 1, "round score");
    expect(s.state() == PracticeSession::State::Solved, "solved");
    const auto line = s.stats().forChord(firstTarget.chord.typeKey, firstTarget.chord.root);
    expectEq(line.attempts, 1, "attempt recorded");
    expectEq(line.correct, 0, "not counted as correct");
    expectEq(statsChanges, 1, "stats changed once");

    // The next chord waits for every key to come up.
    s.noteOff(firstTarget.voicing.first());
    expectEq(targets, 1, "still showing the solved chord");
    s.allNotesOff();
    expectEq(targets, 2, "next target after release");
    expect(s.state() == PracticeSession::State::Idle, "back to free play");
    const PracticeTarget secondTarget = s.currentTarget();
    expect(secondTarget.chord.typeKey != firstTarget.chord.typeKey, "next target differs");

    // Free play keeps recording while tracking is on.
    play(s, secondTarget.voicing);
    expectEq(solvedCount, 2, "second solve");
    expect(lastClean, "clean solve");
    expectEq(s.score(), 1, "free play does not score");
    expectEq(s.stats().forChord(secondTarget.chord.typeKey, 0).correct, 1, "clean solve counted");
    expectEq(statsChanges, 2, "stats changed again");
    s.allNotesOff();

    s.stop();
    expect(!s.trackStats(), "stop turns tracking off");
    play(s, s.currentTarget().voicing);
    expectEq(solvedCount, 3, "still checked after stop");
    expectEq(statsChanges, 2, "nothing recorded after stop");
    s.allNotesOff();

    const PracticeTarget beforeSkip = s.currentTarget();
    expect(s.skip(), "skip");
    expect(s.currentTarget().chord.typeKey != beforeSkip.chord.typeKey, "skip moves to another chord");

    expect(s.start(), "second round");
    s.stop();
    expect(s.state() == PracticeSession::State::Stopped, "stopping a running round");
    expectEq(s.score(), 1, "score kept after stopping");

    s.resetStats();
    expect(s.stats().isEmpty(), "stats reset");
    expectEq(statsChanges, 3, "reset announced");

    PracticeFilter none;
    s.setFilter(none);
    expect(s.pool().isEmpty(), "empty pool");
    expect(!s.currentTarget().isValid(), "no target without a pool");
    expect(!s.start(), "cannot start without chords");
}

static void testInversionSession() {
    PracticeSession s(chordscope::recognition::getTemplates());
    s.setSeed(11);
    s.setHoldMs(0);
    s.setFilter(cOnlyMajor());
    s.setAllowInversions(true);

    for (int i = 0; i < 50 && s.currentTarget().inversion <= 0; ++i) s.skip();
    const PracticeTarget t = s.currentTarget();
    expect(t.inversion > 0, "an inverted target came up");
    if (t.inversion <= 0) return;

    int solvedCount = 0;
    QObject::connect(&s, &PracticeSession::solved, [&](bool, qint64) { ++solvedCount; });

    // Root-position notes: right pitch classes, wrong bass.
    QVector<int> rootPosition;
    for (int pc : t.chord.pitchClasses) rootPosition.push_back(60 + pc);
    play(s, rootPosition);
    expectEq(solvedCount, 0, "wrong bass does not solve");
    expect(!s.hadWrongPress(), "wrong bass is not a wrong note");
    s.allNotesOff();

    play(s, t.voicing);
    expectEq(solvedCount, 1, "the shown inversion solves");
}

static void testHoldTime() {
    PracticeSession s(chordscope::recognition::getTemplates());
    s.setSeed(5);
    s.setHoldMs(30);
    s.setFilter(cOnlyMajor());

    int solvedCount = 0;
    QObject::connect(&s, &PracticeSession::solved, [&](bool, qint64) { ++solvedCount; });

    play(s, s.currentTarget().voicing);
    expectEq(solvedCount, 0, "not solved before the hold time");

    QEventLoop loop;
    QTimer::singleShot(300, &loop, &QEventLoop::quit);
    loop.exec();
    expectEq(solvedCount, 1, "solved after holding");

    s.allNotesOff();
    play(s, s.currentTarget().voicing);
    s.noteOff(s.currentTarget().voicing.first());
    QTimer::singleShot(300, &loop, &QEventLoop::quit);
    loop.exec();
    expectEq(solvedCount, 1, "releasing early cancels the hold");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testCategories();
    testPickDifferent();
    testTargets();
    testJudge();
    testStats();
    testPracticeSettings();
    testSession();
    testInversionSession();
    testHoldTime();

    if (g_failures == 0) {
        qInfo("ChordscopePracticeTests: PASS");
        return 0;
    }

    qWarning("ChordscopePracticeTests: FAIL (%d failures)", g_failures);
    return 1;
}
