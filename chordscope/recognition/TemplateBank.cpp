#include "chordscope/recognition/TemplateBank.h"

#include <QDebug>
#include <QElapsedTimer>

namespace chordscope::recognition {

QVector<ChordTemplate> buildTemplates(const theory::ChordVocabulary& vocabulary) {
    QVector<ChordTemplate> out;
    const auto formulas = vocabulary.allFormulas();
    out.reserve(12 * formulas.size());

    for (int root = 0; root < 12; ++root) {
        for (const auto* f : formulas) {
            if (!f) continue;
            ChordTemplate t;
            t.root = root;
            t.typeKey = f->key;
            t.priorityIndex = vocabulary.priorityIndex(f->key);
            for (int iv : f->intervals) {
                const int pc = theory::toPitchClass(root + iv);
                if (theory::containsPitchClass(t.mask, pc)) continue;
                t.mask |= theory::pitchClassBit(pc);
                t.pitchClasses.push_back(pc);
            }
            t.size = t.pitchClasses.size();
            out.push_back(std::move(t));
        }
    }
    return out;
}

TemplateBank& TemplateBank::instance() {
    static TemplateBank bank;
    return bank;
}

TemplateSnapshot TemplateBank::templates() {
    {
        QMutexLocker lock(&m_mutex);
        if (m_snapshot) return m_snapshot;
    }
    return regenerate();
}

TemplateSnapshot TemplateBank::regenerate() {
    return regenerate(theory::ChordVocabulary::builtins());
}

TemplateSnapshot TemplateBank::regenerate(const theory::ChordVocabulary& vocabulary) {
    QElapsedTimer timer;
    timer.start();

    if (vocabulary.isEmpty()) {
        qWarning() << "TemplateBank: empty vocabulary, publishing an empty bank";
    }

    // Build outside the lock; only the pointer swap is serialized.
    auto fresh = std::make_shared<const QVector<ChordTemplate>>(buildTemplates(vocabulary));

    int builds = 0;
    {
        QMutexLocker lock(&m_mutex);
        m_snapshot = fresh;
        builds = ++m_buildCount;
    }

    qInfo().noquote() << QString("TemplateBank: built %1 templates from %2 formulas in %3ms (build #%4)")
                             .arg(fresh->size())
                             .arg(vocabulary.size())
                             .arg(timer.elapsed())
                             .arg(builds);
    return fresh;
}

int TemplateBank::buildCount() const {
    QMutexLocker lock(&m_mutex);
    return m_buildCount;
}

TemplateSnapshot getTemplates() {
    return TemplateBank::instance().templates();
}

TemplateSnapshot regenTemplates() {
    return TemplateBank::instance().regenerate();
}

} // namespace chordscope::recognition
