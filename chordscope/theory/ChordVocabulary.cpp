#include "chordscope/theory/ChordVocabulary.h"

#include <utility>

namespace chordscope::theory {
namespace {

static ChordVocabulary makeBuiltins() {
    ChordVocabulary v;

    auto add = [&](QString key, QVector<int> iv, const char* suffix, QString longName, QString tag) {
        ChordFormula f;
        f.key = std::move(key);
        f.intervals = std::move(iv);
        f.suffix = QString::fromUtf8(suffix);
        f.longName = std::move(longName);
        f.tags = QStringList{std::move(tag)};
        v.addFormula(std::move(f));
    };

    // Triads, power chord and sixths
    add("fifth", {0, 7}, "⁵", "Power Fifth", "triad");
    add("major", {0, 4, 7}, "", "Major", "triad");
    add("minor", {0, 3, 7}, "m", "Minor", "triad");
    add("dim", {0, 3, 6}, "°", "Diminished", "triad");
    add("aug", {0, 4, 8}, "⁺", "Augmented", "triad");
    add("sus2", {0, 2, 7}, "sus²", "Suspended 2nd", "triad");
    add("sus4", {0, 5, 7}, "sus⁴", "Suspended 4th", "triad");
    // Literal major third + flat fifth; not a third-less lowered fifth.
    add("flat5", {0, 4, 6}, "♭⁵", "Flat Fifth", "triad");
    add("6", {0, 4, 7, 9}, "⁶", "Sixth", "triad");
    add("m6", {0, 3, 7, 9}, "m⁶", "Minor Sixth", "triad");

    // Sevenths
    add("7", {0, 4, 7, 10}, "⁷", "Dominant Seventh", "seventh");
    add("m7", {0, 3, 7, 10}, "m⁷", "Minor Seventh", "seventh");
    add("dim7", {0, 3, 6, 9}, "°⁷", "Diminished Seventh", "seventh");
    add("M7", {0, 4, 7, 11}, "M⁷", "Major Seventh", "seventh");
    add("mM7", {0, 3, 7, 11}, "mM⁷", "Minor Major Seventh", "seventh");
    add("7sus2", {0, 2, 7, 10}, "⁷sus²", "Seventh Suspended 2nd", "seventh");
    add("7sus4", {0, 5, 7, 10}, "⁷sus⁴", "Seventh Suspended 4th", "seventh");
    add("7b5", {0, 4, 6, 10}, "⁷♭⁵", "Seventh Flat Fifth", "seventh");
    add("7#5", {0, 4, 8, 10}, "⁷⁺⁵", "Seventh Raised Fifth", "seventh");
    add("m7b5", {0, 3, 6, 10}, "m⁷♭⁵", "Half-Diminished (Minor Seventh Flat Five)", "seventh");
    add("m7#5", {0, 3, 8, 10}, "m⁷⁺⁵", "Minor Seventh Raised Fifth", "seventh");

    // Added tones
    add("add9", {0, 4, 7, 14}, "add⁹", "Added Ninth", "added");
    add("madd9", {0, 3, 7, 14}, "madd⁹", "Minor Added Ninth", "added");
    add("add11", {0, 4, 7, 17}, "add¹¹", "Added Eleventh", "added");
    add("madd11", {0, 3, 7, 17}, "madd¹¹", "Minor Added Eleventh", "added");
    add("add13", {0, 4, 7, 21}, "add¹³", "Added Thirteenth", "added");
    add("madd13", {0, 3, 7, 21}, "madd¹³", "Minor Added Thirteenth", "added");

    // Six-seven / six-nine
    add("7/6", {0, 4, 7, 9, 10}, "⁷/⁶", "Seven-Six Combination", "six_seven");
    add("9/6", {0, 4, 7, 9, 14}, "⁹/⁶", "Nine-Six Combination", "six_seven");
    add("m9/6", {0, 3, 7, 9, 14}, "m⁹/⁶", "Minor Nine-Six Combination", "six_seven");

    // Ninths
    add("9", {0, 4, 7, 10, 14}, "⁹", "Ninth", "ninth");
    add("m9", {0, 3, 7, 10, 14}, "m⁹", "Minor Ninth", "ninth");
    add("b9", {0, 4, 7, 10, 13}, "♭⁹", "Flat Ninth", "ninth");
    add("mb9", {0, 3, 7, 10, 13}, "m♭⁹", "Minor Flat Ninth", "ninth");
    add("9#5", {0, 4, 8, 10, 14}, "⁹⁺⁵", "Ninth Raised Fifth", "ninth");
    add("9sus4", {0, 5, 7, 10, 14}, "⁹sus⁴", "Ninth Suspended 4th", "ninth");
    add("9b5", {0, 4, 6, 10, 14}, "⁹♭⁵", "Ninth Flat Fifth", "ninth");
    add("m9b5", {0, 3, 6, 10, 14}, "m⁹♭⁵", "Minor Ninth Flat Fifth", "ninth");
    add("m9#5", {0, 3, 8, 10, 14}, "m⁹⁺⁵", "Minor Ninth Raised Fifth", "ninth");
    add("M9", {0, 4, 7, 11, 14}, "M⁹", "Major Ninth", "ninth");

    // Elevenths
    add("11", {0, 4, 7, 10, 14, 17}, "¹¹", "Eleventh", "eleventh");
    add("m11", {0, 3, 7, 10, 14, 17}, "m¹¹", "Minor Eleventh", "eleventh");
    add("M11", {0, 4, 7, 11, 14, 17}, "M¹¹", "Major Eleventh", "eleventh");
    add("11b5", {0, 4, 6, 10, 14, 17}, "¹¹♭⁵", "Eleventh Flat Fifth", "eleventh");
    add("11#5", {0, 4, 8, 10, 14, 17}, "¹¹⁺⁵", "Eleventh Raised Fifth", "eleventh");
    add("11M7", {0, 4, 7, 11, 14, 17}, "¹¹M⁷", "Eleventh with Major Seventh", "eleventh");
    add("11b9", {0, 4, 7, 10, 13, 17}, "¹¹♭⁹", "Eleventh Flat Ninth", "eleventh");
    add("11#9", {0, 4, 7, 10, 15, 17}, "¹¹⁺⁹", "Eleventh Raised Ninth", "eleventh");

    // Thirteenths
    add("13", {0, 4, 7, 10, 14, 17, 21}, "¹³", "Thirteenth", "thirteenth");
    add("M13", {0, 4, 7, 11, 14, 17, 21}, "M¹³", "Major Thirteenth", "thirteenth");
    add("m13", {0, 3, 7, 10, 14, 17, 21}, "m¹³", "Minor Thirteenth", "thirteenth");
    add("13b5", {0, 4, 6, 10, 14, 17, 21}, "¹³♭⁵", "Thirteenth Flat Fifth", "thirteenth");
    add("13#5", {0, 4, 8, 10, 14, 17, 21}, "¹³⁺⁵", "Thirteenth Raised Fifth", "thirteenth");

    // Simpler and more common first: triads, sevenths, added tones, six-seven, ninths, 11ths, 13ths.
    v.setPriority({
        "fifth", "major", "minor", "dim", "aug", "sus2", "sus4", "flat5", "6", "m6",
        "7", "m7", "dim7", "M7", "mM7", "7sus2", "7sus4", "7b5", "7#5", "m7b5", "m7#5",
        "add9", "madd9", "add11", "madd11", "add13", "madd13",
        "7/6", "9/6", "m9/6",
        "9", "m9", "b9", "mb9", "9#5", "9sus4", "9b5", "m9b5", "m9#5", "M9",
        "11", "m11", "M11", "11b5", "11#5", "11M7", "11b9", "11#9",
        "13", "M13", "m13", "13b5", "13#5",
    });
    return v;
}

} // namespace

const ChordVocabulary& ChordVocabulary::builtins() {
    static const ChordVocabulary kBuiltins = makeBuiltins();
    return kBuiltins;
}

void ChordVocabulary::addFormula(ChordFormula formula) {
    if (!m_formulas.contains(formula.key)) m_order.push_back(formula.key);
    const TypeKey key = formula.key;
    m_formulas.insert(key, std::move(formula));
}

void ChordVocabulary::setPriority(const QStringList& keys) {
    m_priority = keys;
    m_priorityIndex.clear();
    for (int i = 0; i < m_priority.size(); ++i) {
        // First occurrence wins if a key is listed twice.
        if (!m_priorityIndex.contains(m_priority[i])) m_priorityIndex.insert(m_priority[i], i);
    }
}

const ChordFormula* ChordVocabulary::formula(const TypeKey& key) const {
    auto it = m_formulas.constFind(key);
    return it == m_formulas.constEnd() ? nullptr : &it.value();
}

QVector<const ChordFormula*> ChordVocabulary::allFormulas() const {
    QVector<const ChordFormula*> out;
    out.reserve(m_order.size());
    for (const auto& key : m_order) out.push_back(formula(key));
    return out;
}

QVector<const ChordFormula*> ChordVocabulary::formulasWithTag(const QString& tag) const {
    QVector<const ChordFormula*> out;
    for (const auto& key : m_order) {
        const ChordFormula* f = formula(key);
        if (f && f->tags.contains(tag)) out.push_back(f);
    }
    return out;
}

int ChordVocabulary::priorityIndex(const TypeKey& key) const {
    return m_priorityIndex.value(key, -1);
}

QString suffixFor(const TypeKey& key) {
    return suffixFor(key, ChordVocabulary::builtins());
}

QString longNameFor(const TypeKey& key) {
    return longNameFor(key, ChordVocabulary::builtins());
}

QString suffixFor(const TypeKey& key, const ChordVocabulary& vocabulary) {
    const ChordFormula* f = vocabulary.formula(key);
    return f ? f->suffix : key;
}

QString longNameFor(const TypeKey& key, const ChordVocabulary& vocabulary) {
    const ChordFormula* f = vocabulary.formula(key);
    return (f && !f->longName.isEmpty()) ? f->longName : key;
}

} // namespace chordscope::theory
