#include "chordscope/practice/PracticeFilter.h"

#include <QHash>

#include <utility>

namespace chordscope::practice {
namespace {

static QVector<PracticeCategory> makeCategories() {
    QVector<PracticeCategory> c;
    auto add = [&](QString key, QString label, QStringList types) {
        c.push_back(PracticeCategory{std::move(key), std::move(label), std::move(types)});
    };

    add("major", "Major", {"fifth", "major", "M7", "M9", "M11", "M13"});
    add("minor", "Minor", {"minor", "m6", "m7", "m9", "m11", "m13"});
    add("diminished", "Diminished", {"dim", "dim7"});
    add("augmented", "Augmented", {"aug", "9#5", "11#5", "13#5", "m9#5", "m7#5"});
    add("suspended", "Suspended", {"sus2", "sus4", "7sus2", "7sus4", "9sus4"});
    add("flatRaised", "Flat/Raised", {"flat5", "7b5", "9b5", "11b5", "13b5", "b9", "mb9", "m9b5"});
    add("sixth", "6th", {"6", "m6", "7/6", "9/6", "m9/6"});
    add("seventh", "7th", {"7", "m7", "dim7", "M7", "mM7", "7b5", "7#5", "m7b5", "m7#5", "7sus2", "7sus4", "7/6"});
    add("add9", "add9", {"add9", "madd9"});
    add("add11", "add11", {"add11", "madd11"});
    add("add13", "add13", {"add13", "madd13"});
    add("ninth", "9th", {"9", "m9", "b9", "mb9", "9#5", "9sus4", "9b5", "m9b5", "m9#5", "M9", "9/6", "m9/6"});
    add("eleventh", "11th", {"11", "m11", "M11", "11b5", "11#5", "11M7", "11b9", "11#9"});
    add("thirteenth", "13th", {"13", "M13", "m13", "13b5", "13#5"});
    return c;
}

static QHash<QString, QStringList> makeTypeTags() {
    QHash<QString, QStringList> t;
    t.insert("fifth", {});
    t.insert("major", {"major"});
    t.insert("minor", {"minor"});
    t.insert("dim", {"diminished"});
    t.insert("aug", {"augmented"});
    t.insert("sus2", {"suspended"});
    t.insert("sus4", {"suspended"});
    t.insert("flat5", {"flatRaised"});
    t.insert("6", {"sixth"});
    t.insert("m6", {"minor", "sixth"});

    t.insert("7", {"seventh"});
    t.insert("m7", {"minor", "seventh"});
    t.insert("dim7", {"diminished", "seventh"});
    t.insert("M7", {"major", "seventh"});
    t.insert("mM7", {"minor", "seventh"});
    t.insert("7sus2", {"seventh", "suspended"});
    t.insert("7sus4", {"seventh", "suspended"});
    t.insert("7b5", {"seventh", "flatRaised"});
    t.insert("7#5", {"seventh", "augmented"});
    t.insert("m7b5", {"minor", "seventh", "flatRaised"});
    t.insert("m7#5", {"minor", "seventh", "augmented"});

    t.insert("add9", {"add9", "major"});
    t.insert("madd9", {"add9", "minor"});
    t.insert("add11", {"add11", "major"});
    t.insert("madd11", {"add11", "minor"});
    t.insert("add13", {"add13", "major"});
    t.insert("madd13", {"add13", "minor"});

    t.insert("7/6", {"seventh", "sixth"});
    t.insert("9/6", {"ninth", "sixth"});
    t.insert("m9/6", {"ninth", "sixth", "minor"});

    t.insert("9", {"ninth", "seventh"});
    t.insert("m9", {"ninth", "seventh", "minor"});
    t.insert("b9", {"ninth", "seventh", "flatRaised"});
    t.insert("mb9", {"ninth", "seventh", "minor", "flatRaised"});
    t.insert("9#5", {"ninth", "seventh", "augmented"});
    t.insert("9sus4", {"ninth", "seventh", "suspended"});
    t.insert("9b5", {"ninth", "seventh", "flatRaised"});
    t.insert("m9b5", {"ninth", "seventh", "minor", "flatRaised"});
    t.insert("m9#5", {"ninth", "seventh", "minor", "augmented"});
    t.insert("M9", {"major", "ninth", "seventh"});

    t.insert("11", {"eleventh"});
    t.insert("m11", {"eleventh", "minor"});
    t.insert("M11", {"eleventh", "major"});
    t.insert("11b5", {"eleventh", "flatRaised"});
    t.insert("11#5", {"eleventh", "augmented"});
    t.insert("11M7", {"eleventh", "major", "seventh"});
    t.insert("11b9", {"eleventh", "ninth", "flatRaised"});
    t.insert("11#9", {"eleventh", "ninth", "augmented"});

    t.insert("13", {"thirteenth"});
    t.insert("M13", {"major", "thirteenth"});
    t.insert("m13", {"minor", "thirteenth"});
    t.insert("13b5", {"thirteenth", "flatRaised"});
    t.insert("13#5", {"thirteenth", "augmented"});
    return t;
}

static const QHash<QString, QStringList>& tagTable() {
    static const QHash<QString, QStringList> kTags = makeTypeTags();
    return kTags;
}

} // namespace

const QVector<PracticeCategory>& practiceCategories() {
    static const QVector<PracticeCategory> kCategories = makeCategories();
    return kCategories;
}

const PracticeCategory* findCategory(const QString& key) {
    for (const auto& c : practiceCategories()) {
        if (c.key == key) return &c;
    }
    return nullptr;
}

QStringList typeTags(const theory::TypeKey& type) {
    return tagTable().value(type);
}

QSet<int> naturalRoots() {
    return QSet<int>{0, 2, 4, 5, 7, 9, 11};
}

PracticeFilter PracticeFilter::defaults() {
    PracticeFilter f;
    f.categories = QSet<QString>{"major", "minor", "diminished", "augmented", "suspended"};
    f.roots = naturalRoots();
    return f;
}

bool PracticeFilter::allowsType(const theory::TypeKey& type) const {
    const QStringList tags = typeTags(type);
    if (tags.isEmpty()) {
        // Untagged types follow the plain category lists.
        for (const QString& key : categories) {
            const PracticeCategory* c = findCategory(key);
            if (c && c->types.contains(type)) return true;
        }
        return false;
    }
    for (const QString& tag : tags) {
        if (!categories.contains(tag)) return false;
    }
    return true;
}

QVector<recognition::ChordTemplate> filterTemplates(const QVector<recognition::ChordTemplate>& templates,
                                                    const PracticeFilter& filter) {
    QVector<recognition::ChordTemplate> out;
    for (const auto& t : templates) {
        if (filter.allows(t.root, t.typeKey)) out.push_back(t);
    }
    return out;
}

} // namespace chordscope::practice
