#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

namespace chordscope::theory {

using TypeKey = QString;

// Reserved type key for octave-only input (never part of the vocabulary).
inline const TypeKey& singleNoteKey() {
    static const TypeKey kSingle = QStringLiteral("single");
    return kSingle;
}

inline const TypeKey& fifthKey() {
    static const TypeKey kFifth = QStringLiteral("fifth");
    return kFifth;
}

struct ChordFormula {
    TypeKey key;             // stable id, e.g. "m7b5", "9sus4"
    QVector<int> intervals;  // semitones from root, root first; may exceed 11 (9th == 14)
    QString suffix;          // display suffix appended to the root name, e.g. "m⁷♭⁵"
    QString longName;        // e.g. "Half-Diminished (Minor Seventh Flat Five)"
    QStringList tags;        // "triad", "seventh", "added", "six_seven", "ninth", "eleventh", "thirteenth"
};

// Static chord vocabulary plus the priority order used for tie-breaking.
// Priority never filters: it only orders otherwise equal candidates.
class ChordVocabulary {
public:
    static const ChordVocabulary& builtins();

    // Appends a formula (vocabulary order == insertion order). Re-adding a key replaces it in place.
    void addFormula(ChordFormula formula);
    // Types missing from the priority list sort after every listed type.
    void setPriority(const QStringList& keys);

    const ChordFormula* formula(const TypeKey& key) const;
    QVector<const ChordFormula*> allFormulas() const;
    QVector<const ChordFormula*> formulasWithTag(const QString& tag) const;

    const QStringList& priority() const { return m_priority; }
    // -1 when absent.
    int priorityIndex(const TypeKey& key) const;

    int size() const { return m_order.size(); }
    bool isEmpty() const { return m_order.isEmpty(); }

private:
    QHash<TypeKey, ChordFormula> m_formulas;
    QVector<TypeKey> m_order;
    QStringList m_priority;
    QHash<TypeKey, int> m_priorityIndex;
};

// Lookups against the builtin vocabulary; unknown keys fall back to the raw key.
QString suffixFor(const TypeKey& key);
QString longNameFor(const TypeKey& key);
QString suffixFor(const TypeKey& key, const ChordVocabulary& vocabulary);
QString longNameFor(const TypeKey& key, const ChordVocabulary& vocabulary);

} // namespace chordscope::theory
