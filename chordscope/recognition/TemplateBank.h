#pragma once

#include <QMutex>
#include <QVector>

#include <memory>

#include "chordscope/theory/ChordVocabulary.h"
#include "chordscope/theory/PitchClass.h"

namespace chordscope::recognition {

// One vocabulary formula transposed to one root.
struct ChordTemplate {
    int root = 0;                          // 0..11
    theory::TypeKey typeKey;
    int priorityIndex = -1;                // position in the vocabulary's priority list, -1 if unlisted
    QVector<int> pitchClasses;             // unique, in formula order (root first)
    theory::PitchClassSet mask = 0;
    int size = 0;                          // unique pitch classes, not raw interval count
};

using TemplateSnapshot = std::shared_ptr<const QVector<ChordTemplate>>;

// Pure builder: 12 roots x every formula, root-major, vocabulary order within a root.
QVector<ChordTemplate> buildTemplates(const theory::ChordVocabulary& vocabulary);

/**
 * TemplateBank: the precomputed template table shared by every recognition call.
 *
 * Built lazily from the builtin vocabulary on first access. A snapshot is never
 * mutated after it is published; regenerate() builds a complete replacement and
 * swaps the pointer, so a reader holding an older snapshot always sees a full bank.
 */
class TemplateBank {
public:
    static TemplateBank& instance();

    TemplateSnapshot templates();

    // Rebuilds from the builtin vocabulary and publishes the result.
    TemplateSnapshot regenerate();
    // Rebuilds from an explicit vocabulary (used by tests and tools).
    TemplateSnapshot regenerate(const theory::ChordVocabulary& vocabulary);

    int buildCount() const;

private:
    TemplateBank() = default;

    TemplateSnapshot m_snapshot;
    int m_buildCount = 0;
    mutable QMutex m_mutex;
};

// Convenience accessors over TemplateBank::instance().
TemplateSnapshot getTemplates();
TemplateSnapshot regenTemplates();

} // namespace chordscope::recognition
