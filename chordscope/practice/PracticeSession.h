#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QRandomGenerator>
#include <QTimer>
#include <QVector>

#include <vector>

#include "chordscope/input/HeldNotes.h"
#include "chordscope/practice/PracticeFilter.h"
#include "chordscope/practice/PracticeStats.h"
#include "chordscope/practice/PracticeTarget.h"
#include "chordscope/recognition/TemplateBank.h"

namespace chordscope::practice {

/**
 * PracticeSession: asks for one chord at a time and checks what the player holds.
 *
 * A target counts as solved once exactly its pitch classes (and, with inversions
 * on, its bass) have been held for the hold time. The next target is picked at
 * that moment and shown once every key is released. start() begins a timed,
 * scored round and turns stat tracking on; stop() turns it off again. Without a
 * running round the session still checks and, when tracking, records each target.
 *
 * Lives on one thread; feed it from other threads with queued invocations only.
 */
class PracticeSession : public QObject {
    Q_OBJECT
public:
    enum class State { Idle, Running, Solved, Stopped };

    explicit PracticeSession(QObject* parent = nullptr);
    explicit PracticeSession(recognition::TemplateSnapshot templates, QObject* parent = nullptr);

    void setSeed(quint32 seed) { m_rng.seed(seed); }

    // Changing the filter keeps the current target while it is still allowed.
    void setFilter(const PracticeFilter& filter);
    const PracticeFilter& filter() const { return m_filter; }
    const QVector<recognition::ChordTemplate>& pool() const { return m_pool; }

    void setAllowInversions(bool allow);
    bool allowInversions() const { return m_allowInversions; }

    void setHoldMs(int ms);
    int holdMs() const { return m_holdMs; }

    void setTrackStats(bool track);
    bool trackStats() const { return m_trackStats; }

    void setVerbose(bool verbose) { m_verbose = verbose; }

    void setStats(const PracticeStats& stats) { m_stats = stats; }
    const PracticeStats& stats() const { return m_stats; }
    void resetStats();

    State state() const { return m_state; }
    const PracticeTarget& currentTarget() const { return m_target; }
    int score() const { return m_score; }
    bool hadWrongPress() const { return m_hadWrong; }
    const input::HeldNotes& heldNotes() const { return m_held; }

public slots:
    // False when the filter leaves nothing to practise.
    bool start();
    void stop();
    bool skip();

    void noteOn(int note);
    void noteOff(int note);
    void midiMessage(const std::vector<unsigned char>& message);
    void allNotesOff();

signals:
    void targetChanged(const chordscope::practice::PracticeTarget& target);
    void wrongPress();
    void solved(bool clean, qint64 elapsedMs);
    void statsChanged();

private:
    void rebuildPool();
    void setTarget(const recognition::ChordTemplate* chord);
    void evaluate();
    void completeHold();

    recognition::TemplateSnapshot m_templates;
    PracticeFilter m_filter;
    QVector<recognition::ChordTemplate> m_pool;
    QRandomGenerator m_rng;

    input::HeldNotes m_held;
    PracticeTarget m_target;
    recognition::ChordTemplate m_pending;
    bool m_hasPending = false;

    State m_state = State::Idle;
    PracticeStats m_stats;
    QElapsedTimer m_roundTimer;
    QTimer m_hold;

    int m_holdMs = 2000;
    int m_score = 0;
    bool m_allowInversions = false;
    bool m_trackStats = false;
    bool m_hadWrong = false;
    bool m_verbose = false;
};

} // namespace chordscope::practice
