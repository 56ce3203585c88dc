#include "chordscope/practice/PracticeStats.h"

#include "chordscope/naming/ChordNamer.h"
#include "chordscope/recognition/ChordMatch.h"

#include <QDebug>
#include <QSettings>
#include <QStringList>

#include <algorithm>
#include <limits>
#include <utility>

namespace chordscope::practice {
namespace {

static void addTo(StatLine& line, const StatLine& delta) {
    line.attempts += delta.attempts;
    line.correct += delta.correct;
    line.totalTimeMs += delta.totalTimeMs;
}

static QJsonObject lineJson(const StatLine& l) {
    QJsonObject o;
    o.insert("attempts", l.attempts);
    o.insert("correct", l.correct);
    o.insert("total_time_ms", double(l.totalTimeMs));
    return o;
}

static bool splitChordKey(const QString& key, theory::TypeKey& type, int& root) {
    const int at = key.lastIndexOf('@');
    if (at <= 0) return false;
    bool ok = false;
    root = key.mid(at + 1).toInt(&ok);
    type = key.left(at);
    return ok && root >= 0 && root < 12;
}

static qint64 averageSortValue(const StatLine& l) {
    const qint64 avg = l.averageTimeMs();
    return avg < 0 ? std::numeric_limits<qint64>::max() : avg;
}

// Strict ascending order for one key.
static bool rowLess(const ChordStatRow& a, const ChordStatRow& b, StatsSortKey key) {
    switch (key) {
    case StatsSortKey::Chord: return a.displayName.localeAwareCompare(b.displayName) < 0;
    case StatsSortKey::Description: return a.longName.localeAwareCompare(b.longName) < 0;
    case StatsSortKey::Root: return a.root < b.root;
    case StatsSortKey::Accuracy: return a.line.accuracy() < b.line.accuracy();
    case StatsSortKey::Attempts: return a.line.attempts < b.line.attempts;
    case StatsSortKey::Correct: return a.line.correct < b.line.correct;
    case StatsSortKey::AverageTime: return averageSortValue(a.line) < averageSortValue(b.line);
    }
    return false;
}

} // namespace

bool parseStatsSortKey(const QString& text, StatsSortKey& out) {
    const QString t = text.trimmed().toLower();
    if (t == "chord") out = StatsSortKey::Chord;
    else if (t == "description") out = StatsSortKey::Description;
    else if (t == "root") out = StatsSortKey::Root;
    else if (t == "accuracy") out = StatsSortKey::Accuracy;
    else if (t == "attempts") out = StatsSortKey::Attempts;
    else if (t == "correct") out = StatsSortKey::Correct;
    else if (t == "avg" || t == "speed") out = StatsSortKey::AverageTime;
    else return false;
    return true;
}

QString PracticeStats::chordKey(const theory::TypeKey& type, int root) {
    return QString("%1@%2").arg(type).arg(root);
}

void PracticeStats::record(const theory::TypeKey& type, int root, bool correct, qint64 timeMs) {
    StatLine delta;
    delta.attempts = 1;
    if (correct) {
        delta.correct = 1;
        delta.totalTimeMs = qMax<qint64>(0, timeMs);
    }
    merge(type, root, delta);
}

void PracticeStats::merge(const theory::TypeKey& type, int root, const StatLine& line) {
    addTo(m_byType[type], line);
    addTo(m_byRoot[root], line);
    addTo(m_byChord[chordKey(type, root)], line);
}

void PracticeStats::reset() {
    m_byType.clear();
    m_byRoot.clear();
    m_byChord.clear();
}

QVector<ChordStatRow> PracticeStats::rows(const PracticeFilter& filter, StatsSortKey key, bool descending) const {
    QStringList keys = m_byChord.keys();
    keys.sort();

    QVector<ChordStatRow> out;
    for (const QString& k : keys) {
        ChordStatRow row;
        if (!splitChordKey(k, row.type, row.root)) continue;
        if (!filter.allowsType(row.type)) continue;
        if (!filter.roots.isEmpty() && !filter.roots.contains(row.root)) continue;

        recognition::ChordMatch m;
        m.root = row.root;
        m.typeKey = row.type;
        const naming::FormattedMatch name = naming::formatMatch(m, {});
        row.displayName = name.displayName;
        row.longName = name.longName;
        row.line = m_byChord.value(k);
        out.push_back(std::move(row));
    }

    std::stable_sort(out.begin(), out.end(), [key, descending](const ChordStatRow& a, const ChordStatRow& b) {
        return descending ? rowLess(b, a, key) : rowLess(a, b, key);
    });
    return out;
}

QJsonObject PracticeStats::toJsonObject() const {
    QJsonObject byType;
    for (auto it = m_byType.cbegin(); it != m_byType.cend(); ++it) byType.insert(it.key(), lineJson(it.value()));

    QJsonObject byRoot;
    for (auto it = m_byRoot.cbegin(); it != m_byRoot.cend(); ++it) byRoot.insert(QString::number(it.key()), lineJson(it.value()));

    QJsonObject byChord;
    for (auto it = m_byChord.cbegin(); it != m_byChord.cend(); ++it) {
        QJsonObject o = lineJson(it.value());
        theory::TypeKey type;
        int root = 0;
        if (splitChordKey(it.key(), type, root)) {
            o.insert("type", type);
            o.insert("root", root);
        }
        byChord.insert(it.key(), o);
    }

    QJsonObject o;
    o.insert("by_type", byType);
    o.insert("by_root", byRoot);
    o.insert("by_chord", byChord);
    return o;
}

PracticeStats loadPracticeStats(QSettings& settings, const QString& prefix) {
    PracticeStats stats;
    const QString base = prefix.isEmpty() ? QString("practice/stats") : prefix;

    const int n = settings.beginReadArray(base + "/chords");
    for (int i = 0; i < n; ++i) {
        settings.setArrayIndex(i);
        const QString type = settings.value("type").toString();
        const int root = settings.value("root", -1).toInt();
        StatLine line;
        line.attempts = settings.value("attempts", 0).toInt();
        if (type.isEmpty() || root < 0 || root > 11 || line.attempts <= 0) {
            qWarning().noquote() << QString("PracticeStats: skipping malformed entry %1 under %2").arg(i).arg(base);
            continue;
        }
        line.correct = qBound(0, settings.value("correct", 0).toInt(), line.attempts);
        line.totalTimeMs = line.correct ? qMax<qint64>(0, settings.value("totalTimeMs", 0).toLongLong()) : 0;
        stats.merge(type, root, line);
    }
    settings.endArray();
    return stats;
}

void savePracticeStats(QSettings& settings, const QString& prefix, const PracticeStats& stats) {
    const QString base = prefix.isEmpty() ? QString("practice/stats") : prefix;

    QStringList keys = stats.chords().keys();
    keys.sort();

    settings.remove(base + "/chords");
    settings.beginWriteArray(base + "/chords", keys.size());
    int i = 0;
    for (const QString& key : keys) {
        theory::TypeKey type;
        int root = 0;
        if (!splitChordKey(key, type, root)) continue;
        const StatLine line = stats.chords().value(key);
        settings.setArrayIndex(i++);
        settings.setValue("type", type);
        settings.setValue("root", root);
        settings.setValue("attempts", line.attempts);
        settings.setValue("correct", line.correct);
        settings.setValue("totalTimeMs", line.totalTimeMs);
    }
    settings.endArray();
}

} // namespace chordscope::practice
