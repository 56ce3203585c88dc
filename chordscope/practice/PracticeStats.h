#pragma once

#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QVector>
#include <QtGlobal>

#include "chordscope/practice/PracticeFilter.h"
#include "chordscope/theory/ChordVocabulary.h"

class QSettings;

namespace chordscope::practice {

// Attempts and solve times for one bucket (a type, a root, or one chord).
struct StatLine {
    int attempts = 0;
    int correct = 0;
    qint64 totalTimeMs = 0;      // summed over correct attempts only

    double accuracy() const { return attempts ? 100.0 * correct / attempts : 0.0; }
    // -1 until something was solved cleanly.
    qint64 averageTimeMs() const { return correct ? (totalTimeMs + correct / 2) / correct : -1; }

    bool operator==(const StatLine& o) const {
        return attempts == o.attempts && correct == o.correct && totalTimeMs == o.totalTimeMs;
    }
};

struct ChordStatRow {
    theory::TypeKey type;
    int root = 0;
    QString displayName;         // "C⁷"
    QString longName;            // "Dominant Seventh"
    StatLine line;
};

enum class StatsSortKey { Chord, Description, Root, Accuracy, Attempts, Correct, AverageTime };

bool parseStatsSortKey(const QString& text, StatsSortKey& out);

/**
 * PracticeStats: per-type, per-root and per-chord results of practice rounds.
 *
 * Every recorded round lands in all three tables, so the type and root tables
 * are always the sums of the chord table.
 */
class PracticeStats {
public:
    void record(const theory::TypeKey& type, int root, bool correct, qint64 timeMs);
    // Adds a whole bucket of earlier results for one chord.
    void merge(const theory::TypeKey& type, int root, const StatLine& line);
    void reset();

    bool isEmpty() const { return m_byChord.isEmpty(); }
    int chordCount() const { return m_byChord.size(); }

    StatLine forType(const theory::TypeKey& type) const { return m_byType.value(type); }
    StatLine forRoot(int root) const { return m_byRoot.value(root); }
    StatLine forChord(const theory::TypeKey& type, int root) const { return m_byChord.value(chordKey(type, root)); }
    // Keyed by chordKey().
    const QHash<QString, StatLine>& chords() const { return m_byChord; }

    // Chord rows admitted by the filter (an empty root set admits every root), sorted.
    // Unsolved chords sort as slowest for AverageTime.
    QVector<ChordStatRow> rows(const PracticeFilter& filter, StatsSortKey key, bool descending) const;

    QJsonObject toJsonObject() const;

    // "type@root", e.g. "m7@9"
    static QString chordKey(const theory::TypeKey& type, int root);

    bool operator==(const PracticeStats& o) const {
        return m_byType == o.m_byType && m_byRoot == o.m_byRoot && m_byChord == o.m_byChord;
    }

private:
    QHash<theory::TypeKey, StatLine> m_byType;
    QHash<int, StatLine> m_byRoot;
    QHash<QString, StatLine> m_byChord;
};

// Stored as one array entry per chord under "<prefix>/chords"; the type and root
// tables are rebuilt from it on load.
PracticeStats loadPracticeStats(QSettings& settings, const QString& prefix);
void savePracticeStats(QSettings& settings, const QString& prefix, const PracticeStats& stats);

} // namespace chordscope::practice
