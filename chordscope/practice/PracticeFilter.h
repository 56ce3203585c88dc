#pragma once

#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>

#include "chordscope/recognition/TemplateBank.h"
#include "chordscope/theory/ChordVocabulary.h"

namespace chordscope::practice {

// A user-facing filter group ("Major", "7th", "add9", ...) and the types it lists.
struct PracticeCategory {
    QString key;          // "major", "seventh", "flatRaised", ...
    QString label;        // "Major", "7th", "Flat/Raised", ...
    QStringList types;
};

// The fourteen filter groups, in display order.
const QVector<PracticeCategory>& practiceCategories();
const PracticeCategory* findCategory(const QString& key);

// Categories a type needs enabled, all at once, to be practised.
// "fifth" has none and is allowed when any enabled category lists it.
QStringList typeTags(const theory::TypeKey& type);

// C D E F G A B
QSet<int> naturalRoots();

/**
 * Which chords a practice round may ask for.
 *
 * A type passes when every one of its tags is an enabled category, so enabling
 * "minor" and "seventh" admits m7 while "seventh" alone does not.
 */
struct PracticeFilter {
    QSet<QString> categories;
    QSet<int> roots;

    // Major, minor, diminished, augmented and suspended over the natural roots.
    static PracticeFilter defaults();

    bool allowsType(const theory::TypeKey& type) const;
    bool allowsRoot(int root) const { return roots.contains(root); }
    bool allows(int root, const theory::TypeKey& type) const { return allowsRoot(root) && allowsType(type); }
};

// Templates admitted by the filter, bank order preserved.
QVector<recognition::ChordTemplate> filterTemplates(const QVector<recognition::ChordTemplate>& templates,
                                                    const PracticeFilter& filter);

} // namespace chordscope::practice
