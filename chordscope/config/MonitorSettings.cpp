#include "chordscope/config/MonitorSettings.h"

#include <QSettings>
#include <QtGlobal>

namespace chordscope::config {
namespace {

static int readInt(QSettings& s, const QString& k, int def) { return s.value(k, def).toInt(); }
static bool readB(QSettings& s, const QString& k, bool def) { return s.value(k, def).toBool(); }
static QString readS(QSettings& s, const QString& k, const QString& def) { return s.value(k, def).toString(); }

} // namespace

MonitorSettings loadMonitorSettings(QSettings& settings, const QString& prefix) {
    MonitorSettings s;
    const QString base = prefix.isEmpty() ? QString("monitor") : prefix;

    s.inputPort = readS(settings, base + "/inputPort", s.inputPort).trimmed();
    s.maxAlternatives = qBound(0, readInt(settings, base + "/maxAlternatives", s.maxAlternatives), 12);
    s.verbose = readB(settings, base + "/verbose", s.verbose);
    s.json = readB(settings, base + "/json", s.json);
    return s;
}

void saveMonitorSettings(QSettings& settings, const QString& prefix, const MonitorSettings& s) {
    const QString base = prefix.isEmpty() ? QString("monitor") : prefix;

    settings.setValue(base + "/inputPort", s.inputPort);
    settings.setValue(base + "/maxAlternatives", qBound(0, s.maxAlternatives, 12));
    settings.setValue(base + "/verbose", s.verbose);
    settings.setValue(base + "/json", s.json);
}

} // namespace chordscope::config
