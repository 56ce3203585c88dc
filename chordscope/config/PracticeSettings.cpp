#include "chordscope/config/PracticeSettings.h"

#include <QSettings>
#include <QtGlobal>

namespace chordscope::config {
namespace {

static bool readB(QSettings& s, const QString& k, bool def) { return s.value(k, def).toBool(); }
static double readD(QSettings& s, const QString& k, double def) {
    bool ok = false;
    const double v = s.value(k, def).toDouble(&ok);
    return ok ? v : def;
}

} // namespace

PracticeSettings loadPracticeSettings(QSettings& settings, const QString& prefix) {
    PracticeSettings s;
    const QString base = prefix.isEmpty() ? QString("practice") : prefix;

    s.allowInversions = readB(settings, base + "/allowInversions", s.allowInversions);
    s.showNotes = readB(settings, base + "/showNotes", s.showNotes);
    s.holdSeconds = qBound(0.0, readD(settings, base + "/holdSeconds", s.holdSeconds), 10.0);
    s.trackStats = readB(settings, base + "/trackStats", s.trackStats);
    return s;
}

void savePracticeSettings(QSettings& settings, const QString& prefix, const PracticeSettings& s) {
    const QString base = prefix.isEmpty() ? QString("practice") : prefix;

    settings.setValue(base + "/allowInversions", s.allowInversions);
    settings.setValue(base + "/showNotes", s.showNotes);
    settings.setValue(base + "/holdSeconds", qBound(0.0, s.holdSeconds, 10.0));
    settings.setValue(base + "/trackStats", s.trackStats);
}

} // namespace chordscope::config
