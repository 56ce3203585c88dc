#pragma once

#include <QString>

class QSettings;

namespace chordscope::config {

// Practice-mode preferences. Category and root choices are per run (command line);
// these are the ones that persist, under a prefix such as "practice".
struct PracticeSettings {
    bool allowInversions = false;  // ask for random inversions and check the bass
    bool showNotes = true;         // print a suggested voicing with each target
    double holdSeconds = 2.0;      // how long the chord must be held to count, 0..10
    bool trackStats = false;       // record results; turned on by starting a round
};

PracticeSettings loadPracticeSettings(QSettings& settings, const QString& prefix);
void savePracticeSettings(QSettings& settings, const QString& prefix, const PracticeSettings& s);

} // namespace chordscope::config
