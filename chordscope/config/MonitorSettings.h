#pragma once

#include <QString>

class QSettings;

namespace chordscope::config {

// Monitor preferences. Persisted through QSettings under a prefix (e.g. "monitor").
struct MonitorSettings {
    QString inputPort;        // substring of the MIDI input port name; empty = first port
    int maxAlternatives = 5;  // 0..12
    bool verbose = false;
    bool json = false;        // one JSON object per reading instead of text
};

MonitorSettings loadMonitorSettings(QSettings& settings, const QString& prefix);
void saveMonitorSettings(QSettings& settings, const QString& prefix, const MonitorSettings& s);

} // namespace chordscope::config
