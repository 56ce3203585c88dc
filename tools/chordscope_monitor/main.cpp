#include "chordscope/config/MonitorSettings.h"
#include "chordscope/config/PracticeSettings.h"
#include "chordscope/engine/ChordReading.h"
#include "chordscope/engine/ChordRecognitionSession.h"
#include "chordscope/midi/RtMidiNoteSource.h"
#include "chordscope/practice/PracticeSession.h"
#include "chordscope/recognition/TemplateBank.h"
#include "chordscope/theory/ChordVocabulary.h"
#include "chordscope/theory/PitchClass.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QSet>
#include <QSettings>
#include <QTextStream>

using chordscope::config::MonitorSettings;
using chordscope::config::PracticeSettings;
using chordscope::engine::ChordReading;
using chordscope::practice::PracticeFilter;
using chordscope::practice::PracticeStats;

namespace {

static QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

static void printReading(const ChordReading& r, const MonitorSettings& settings) {
    if (settings.json) {
        out() << r.toJsonString(true) << Qt::endl;
        return;
    }

    out() << r.summary();
    if (r.hasTop) {
        out() << "  [" << r.top.name.longName;
        if (!r.top.name.bassName.isNull()) out() << ", bass " << r.top.name.bassName;
        out() << "]";
    }
    out() << Qt::endl;

    if (settings.verbose && r.hasTop) {
        for (const auto& row : r.topTones) {
            out() << QString("    %1\t%2\t%3\t%4")
                         .arg(row.degree, -3)
                         .arg(row.semitones, 2)
                         .arg(row.noteName, -2)
                         .arg(row.present ? QStringLiteral("✓") : QString())
                  << Qt::endl;
        }
    }
    for (const auto& alt : r.alternatives) {
        out() << QString("    alt: %1  %2/%3%4")
                     .arg(alt.name.displayName)
                     .arg(alt.match.matchedCount)
                     .arg(alt.match.chordSize)
                     .arg(alt.match.isSubset ? QStringLiteral(" subset") : QString())
              << Qt::endl;
    }
}

static bool parseNoteList(const QString& text, QVector<int>& notesOut) {
    notesOut.clear();
    const QStringList parts = text.split(',', Qt::SkipEmptyParts);
    for (const QString& p : parts) {
        bool ok = false;
        const int n = p.trimmed().toInt(&ok);
        if (!ok) return false;
        notesOut.push_back(n);
    }
    return true;
}

static void listChords() {
    const auto& vocab = chordscope::theory::ChordVocabulary::builtins();
    for (const QString& key : vocab.priority()) {
        const auto* f = vocab.formula(key);
        if (!f) continue;
        QStringList iv;
        for (int i : f->intervals) iv.push_back(QString::number(i));
        out() << QString("%1\tC%2\t%3\t[%4]").arg(f->key, -8).arg(f->suffix, -8).arg(f->longName, -44).arg(iv.join(','))
              << Qt::endl;
    }
}

// Comma-separated sharp root names (F# or Fs) or numbers 0-11, or "all" or "naturals".
static bool parseRootList(const QString& text, QSet<int>& rootsOut) {
    rootsOut.clear();
    const QString t = text.trimmed().toLower();
    if (t == "all") {
        for (int pc = 0; pc < 12; ++pc) rootsOut.insert(pc);
        return true;
    }
    if (t == "naturals") {
        rootsOut = chordscope::practice::naturalRoots();
        return true;
    }
    for (const QString& part : text.split(',', Qt::SkipEmptyParts)) {
        const QString p = part.trimmed();
        bool ok = false;
        const int n = p.toInt(&ok);
        if (ok && n >= 0 && n < 12) {
            rootsOut.insert(n);
            continue;
        }
        const int idx = chordscope::theory::rootNames().indexOf(p.toUpper().replace('S', '#'));
        if (idx < 0) return false;
        rootsOut.insert(idx);
    }
    return !rootsOut.isEmpty();
}

static bool parseCategoryList(const QString& text, QSet<QString>& categoriesOut) {
    categoriesOut.clear();
    if (text.trimmed().toLower() == "all") {
        for (const auto& c : chordscope::practice::practiceCategories()) categoriesOut.insert(c.key);
        return true;
    }
    for (const QString& part : text.split(',', Qt::SkipEmptyParts)) {
        const auto* c = chordscope::practice::findCategory(part.trimmed());
        if (!c) return false;
        categoriesOut.insert(c->key);
    }
    return true;
}

static void listCategories() {
    for (const auto& c : chordscope::practice::practiceCategories()) {
        out() << QString("%1\t%2\t%3").arg(c.key, -12).arg(c.label, -12).arg(c.types.join(' ')) << Qt::endl;
    }
}

static void printStats(const PracticeStats& stats, const PracticeFilter& filter,
                       chordscope::practice::StatsSortKey key, bool descending, bool json) {
    if (json) {
        out() << QJsonDocument(stats.toJsonObject()).toJson(QJsonDocument::Compact) << Qt::endl;
        return;
    }
    const auto rows = stats.rows(filter, key, descending);
    if (rows.isEmpty()) {
        out() << "No data" << Qt::endl;
        return;
    }
    out() << QString("%1 %2 %3 %4 %5 %6 %7")
                 .arg(QStringLiteral("Chord"), -10)
                 .arg(QStringLiteral("Description"), -44)
                 .arg(QStringLiteral("Root"), -5)
                 .arg(QStringLiteral("Accuracy"), 9)
                 .arg(QStringLiteral("Attempts"), 9)
                 .arg(QStringLiteral("Correct"), 8)
                 .arg(QStringLiteral("Avg ms"), 8)
          << Qt::endl;
    for (const auto& r : rows) {
        const qint64 avg = r.line.averageTimeMs();
        out() << QString("%1 %2 %3 %4 %5 %6 %7")
                     .arg(r.displayName, -10)
                     .arg(r.longName, -44)
                     .arg(chordscope::theory::rootName(r.root), -5)
                     .arg(QString::number(r.line.accuracy(), 'f', 0) + "%", 9)
                     .arg(r.line.attempts, 9)
                     .arg(r.line.correct, 8)
                     .arg(avg < 0 ? QStringLiteral("-") : QString::number(avg), 8)
              << Qt::endl;
    }
}

static void printTarget(const chordscope::practice::PracticeTarget& t, const PracticeSettings& ps) {
    if (!t.isValid()) {
        out() << "Nothing to practise with these categories and roots." << Qt::endl;
        return;
    }
    out() << "Play: " << chordscope::practice::targetLabel(t);
    if (ps.showNotes) out() << "    " << chordscope::practice::voicingToString(t.voicing);
    out() << Qt::endl;
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("chordscope");
    QCoreApplication::setApplicationName("chordscope_monitor");

    QCommandLineParser parser;
    parser.setApplicationDescription("Names the chord formed by the notes held on a MIDI input.");
    parser.addHelpOption();
    const QCommandLineOption portOpt("port", "MIDI input port (name substring).", "name");
    const QCommandLineOption listPortsOpt("list-ports", "List MIDI input ports and exit.");
    const QCommandLineOption listChordsOpt("list-chords", "List the chord vocabulary and exit.");
    const QCommandLineOption altOpt("alternatives", "Alternative interpretations to show (0-12).", "n");
    const QCommandLineOption verboseOpt("verbose", "Show the chord-tone grid and per-event traces.");
    const QCommandLineOption jsonOpt("json", "Print one JSON object per reading.");
    const QCommandLineOption notesOpt("notes", "Recognize a comma-separated note list and exit.", "list");
    const QCommandLineOption saveOpt("save", "Persist the effective settings.");
    const QCommandLineOption practiceOpt("practice", "Practice mode: name a chord, check what is played.");
    const QCommandLineOption startOpt("start", "Practice: begin a timed round right away (turns stat tracking on).");
    const QCommandLineOption categoriesOpt("categories", "Practice: chord categories, comma-separated, or 'all'.", "list");
    const QCommandLineOption rootsOpt("roots", "Practice: roots (C,F#,... or 0-11), 'all' or 'naturals'.", "list");
    const QCommandLineOption inversionsOpt("inversions", "Practice: ask for inversions and check the bass.");
    const QCommandLineOption holdOpt("hold", "Practice: seconds a chord must be held (0-10).", "seconds");
    const QCommandLineOption hideNotesOpt("hide-notes", "Practice: do not print a suggested voicing.");
    const QCommandLineOption listCategoriesOpt("list-categories", "List practice categories and exit.");
    const QCommandLineOption statsOpt("stats", "Print practice statistics and exit.");
    const QCommandLineOption sortOpt("sort", "Statistics order: chord, description, root, accuracy, attempts, correct, avg.", "key");
    const QCommandLineOption resetStatsOpt("reset-stats", "Clear practice statistics.");
    parser.addOptions({portOpt, listPortsOpt, listChordsOpt, altOpt, verboseOpt, jsonOpt, notesOpt, saveOpt,
                       practiceOpt, startOpt, categoriesOpt, rootsOpt, inversionsOpt, holdOpt, hideNotesOpt,
                       listCategoriesOpt, statsOpt, sortOpt, resetStatsOpt});
    parser.process(app);

    QSettings store;
    MonitorSettings settings = chordscope::config::loadMonitorSettings(store, "monitor");
    if (parser.isSet(portOpt)) settings.inputPort = parser.value(portOpt);
    if (parser.isSet(altOpt)) {
        bool ok = false;
        const int n = parser.value(altOpt).toInt(&ok);
        if (!ok) {
            qWarning().noquote() << "invalid --alternatives value:" << parser.value(altOpt);
            return 2;
        }
        settings.maxAlternatives = qBound(0, n, 12);
    }
    if (parser.isSet(verboseOpt)) settings.verbose = true;
    if (parser.isSet(jsonOpt)) settings.json = true;

    PracticeSettings practiceSettings = chordscope::config::loadPracticeSettings(store, "practice");
    if (parser.isSet(inversionsOpt)) practiceSettings.allowInversions = true;
    if (parser.isSet(hideNotesOpt)) practiceSettings.showNotes = false;
    if (parser.isSet(holdOpt)) {
        bool ok = false;
        const double secs = parser.value(holdOpt).toDouble(&ok);
        if (!ok) {
            qWarning().noquote() << "invalid --hold value:" << parser.value(holdOpt);
            return 2;
        }
        practiceSettings.holdSeconds = qBound(0.0, secs, 10.0);
    }

    PracticeFilter filter = PracticeFilter::defaults();
    if (parser.isSet(categoriesOpt) && !parseCategoryList(parser.value(categoriesOpt), filter.categories)) {
        qWarning().noquote() << "invalid --categories list:" << parser.value(categoriesOpt) << "(see --list-categories)";
        return 2;
    }
    if (parser.isSet(rootsOpt) && !parseRootList(parser.value(rootsOpt), filter.roots)) {
        qWarning().noquote() << "invalid --roots list:" << parser.value(rootsOpt);
        return 2;
    }

    if (parser.isSet(saveOpt)) {
        chordscope::config::saveMonitorSettings(store, "monitor", settings);
        chordscope::config::savePracticeSettings(store, "practice", practiceSettings);
        store.sync();
        if (store.status() != QSettings::NoError) qWarning() << "failed to save settings to" << store.fileName();
    }

    if (parser.isSet(listCategoriesOpt)) {
        listCategories();
        return 0;
    }

    PracticeStats stats = chordscope::practice::loadPracticeStats(store, "practice/stats");
    if (parser.isSet(resetStatsOpt)) {
        stats.reset();
        chordscope::practice::savePracticeStats(store, "practice/stats", stats);
        store.sync();
    }
    if (parser.isSet(statsOpt)) {
        auto key = chordscope::practice::StatsSortKey::Attempts;
        if (parser.isSet(sortOpt) && !chordscope::practice::parseStatsSortKey(parser.value(sortOpt), key)) {
            qWarning().noquote() << "invalid --sort key:" << parser.value(sortOpt);
            return 2;
        }
        PracticeFilter statsFilter = filter;
        if (!parser.isSet(rootsOpt)) statsFilter.roots.clear();
        if (!parser.isSet(categoriesOpt)) {
            for (const auto& c : chordscope::practice::practiceCategories()) statsFilter.categories.insert(c.key);
        }
        const bool descending = key != chordscope::practice::StatsSortKey::Chord
                             && key != chordscope::practice::StatsSortKey::Description
                             && key != chordscope::practice::StatsSortKey::Root;
        printStats(stats, statsFilter, key, descending, settings.json);
        return 0;
    }
    if (parser.isSet(resetStatsOpt)) return 0;

    if (parser.isSet(listChordsOpt)) {
        listChords();
        return 0;
    }

    if (parser.isSet(notesOpt)) {
        QVector<int> notes;
        if (!parseNoteList(parser.value(notesOpt), notes)) {
            qWarning().noquote() << "invalid --notes list:" << parser.value(notesOpt);
            return 2;
        }
        printReading(chordscope::engine::readChord(notes, settings.maxAlternatives), settings);
        return 0;
    }

    chordscope::midi::RtMidiNoteSource source;
    if (parser.isSet(listPortsOpt)) {
        const QStringList ports = source.availablePorts();
        for (int i = 0; i < ports.size(); ++i) out() << i << ": " << ports[i] << Qt::endl;
        return source.lastError().isEmpty() ? 0 : 1;
    }

    // Build the bank before the first note arrives.
    chordscope::recognition::getTemplates();

    if (parser.isSet(practiceOpt)) {
        auto* practice = new chordscope::practice::PracticeSession(&app);
        practice->setVerbose(settings.verbose);
        practice->setStats(stats);
        practice->setHoldMs(int(practiceSettings.holdSeconds * 1000.0 + 0.5));
        practice->setAllowInversions(practiceSettings.allowInversions);
        practice->setTrackStats(practiceSettings.trackStats);
        practice->setFilter(filter);
        if (practice->pool().isEmpty()) {
            qWarning().noquote() << "chordscope_monitor: no chords match these categories and roots";
            return 2;
        }

        QObject::connect(&source, &chordscope::midi::RtMidiNoteSource::midiMessage,
                         practice, &chordscope::practice::PracticeSession::midiMessage);
        QObject::connect(practice, &chordscope::practice::PracticeSession::targetChanged,
                         [&practiceSettings](const chordscope::practice::PracticeTarget& t) { printTarget(t, practiceSettings); });
        QObject::connect(practice, &chordscope::practice::PracticeSession::wrongPress, [] {
            out() << "  wrong note" << Qt::endl;
        });
        QObject::connect(practice, &chordscope::practice::PracticeSession::solved, [practice](bool clean, qint64 ms) {
            out() << (clean ? QString("  solved in %1 ms").arg(ms) : QString("  solved after a wrong note (%1 ms)").arg(ms));
            if (practice->score() > 0) out() << "  score " << practice->score();
            out() << Qt::endl;
        });
        QObject::connect(practice, &chordscope::practice::PracticeSession::statsChanged, [&store, practice] {
            chordscope::practice::savePracticeStats(store, "practice/stats", practice->stats());
            store.sync();
            if (store.status() != QSettings::NoError) qWarning() << "failed to save statistics to" << store.fileName();
        });

        if (!source.open(settings.inputPort)) {
            qWarning().noquote() << "chordscope_monitor:" << source.lastError();
            return 1;
        }
        out() << "Practising on " << source.portName() << Qt::endl;
        if (parser.isSet(startOpt)) practice->start();
        else printTarget(practice->currentTarget(), practiceSettings);
        return app.exec();
    }

    chordscope::engine::ChordRecognitionSession session;
    session.setMaxAlternatives(settings.maxAlternatives);
    session.setVerbose(settings.verbose);
    QObject::connect(&source, &chordscope::midi::RtMidiNoteSource::midiMessage,
                     &session, &chordscope::engine::ChordRecognitionSession::midiMessage);
    QObject::connect(&session, &chordscope::engine::ChordRecognitionSession::readingChanged,
                     [&settings](const ChordReading& r) { printReading(r, settings); });

    if (!source.open(settings.inputPort)) {
        qWarning().noquote() << "chordscope_monitor:" << source.lastError();
        return 1;
    }
    out() << "Listening on " << source.portName() << Qt::endl;
    return app.exec();
}
