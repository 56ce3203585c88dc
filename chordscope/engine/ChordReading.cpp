#include "chordscope/engine/ChordReading.h"

#include "chordscope/recognition/ChordMatcher.h"
#include "chordscope/theory/PitchClass.h"

#include <QJsonArray>
#include <QJsonDocument>

#include <algorithm>

namespace chordscope::engine {
namespace {

static QJsonArray toJsonArray(const QVector<int>& values) {
    QJsonArray a;
    for (int v : values) a.append(v);
    return a;
}

static QJsonObject candidateJson(const FormattedCandidate& c) {
    QJsonObject o;
    o.insert("root", c.match.root);
    o.insert("root_name", theory::rootName(c.match.root));
    o.insert("type", c.match.typeKey);
    o.insert("display_name", c.name.displayName);
    o.insert("long_name", c.name.longName);
    if (!c.name.inversion.isNull()) o.insert("inversion", c.name.inversion);
    if (!c.name.bassName.isNull()) o.insert("bass", c.name.bassName);
    o.insert("matched", c.match.matchedCount);
    o.insert("chord_size", c.match.chordSize);
    o.insert("subset", c.match.isSubset);
    o.insert("exact", c.match.exactMatch);
    if (!c.match.missingPcs.isEmpty()) o.insert("missing", toJsonArray(c.match.missingPcs));
    if (!c.match.extraPcs.isEmpty()) o.insert("extra", toJsonArray(c.match.extraPcs));
    return o;
}

} // namespace

QString ChordReading::summary() const {
    if (!hasTop) return QStringLiteral("No matching chords");
    QString s = top.name.displayName;
    if (!top.name.inversion.isEmpty()) s += QString(" (%1)").arg(top.name.inversion);
    return s;
}

QJsonObject ChordReading::toJsonObject() const {
    QJsonObject o;
    o.insert("held", toJsonArray(heldNotes));
    if (hasTop) {
        QJsonObject t = candidateJson(top);
        QJsonArray tones;
        for (const auto& row : topTones) {
            QJsonObject r;
            r.insert("degree", row.degree);
            r.insert("semitones", row.semitones);
            r.insert("note", row.noteName);
            r.insert("present", row.present);
            tones.append(r);
        }
        t.insert("tones", tones);
        o.insert("top", t);
    }
    QJsonArray alts;
    for (const auto& a : alternatives) alts.append(candidateJson(a));
    o.insert("alternatives", alts);
    return o;
}

QString ChordReading::toJsonString(bool compact) const {
    const QJsonDocument doc(toJsonObject());
    return QString::fromUtf8(doc.toJson(compact ? QJsonDocument::Compact : QJsonDocument::Indented));
}

ChordReading readChord(const QVector<int>& heldNotes, int maxAlternatives) {
    ChordReading r;
    r.heldNotes = heldNotes;
    r.matches = recognition::recognize(heldNotes);
    if (r.matches.isEmpty()) return r;

    r.hasTop = true;
    r.top.match = r.matches.first();
    r.top.name = naming::formatMatch(r.top.match, heldNotes);
    r.topTones = naming::chordToneRows(r.top.match);

    const int end = std::min<int>(r.matches.size(), 1 + std::max(0, maxAlternatives));
    for (int i = 1; i < end; ++i) {
        FormattedCandidate c;
        c.match = r.matches[i];
        c.name = naming::formatMatch(c.match, heldNotes);
        r.alternatives.push_back(std::move(c));
    }
    return r;
}

} // namespace chordscope::engine
