#include "chordscope/practice/PracticeSession.h"

#include <QDebug>
#include <QtGlobal>

#include <utility>

namespace chordscope::practice {

PracticeSession::PracticeSession(QObject* parent)
    : PracticeSession(recognition::getTemplates(), parent) {}

PracticeSession::PracticeSession(recognition::TemplateSnapshot templates, QObject* parent)
    : QObject(parent)
    , m_templates(std::move(templates))
    , m_filter(PracticeFilter::defaults())
    , m_rng(QRandomGenerator::global()->generate()) {
    qRegisterMetaType<chordscope::practice::PracticeTarget>();

    m_hold.setSingleShot(true);
    connect(&m_hold, &QTimer::timeout, this, &PracticeSession::completeHold);

    rebuildPool();
    setTarget(pickDifferent(m_pool, nullptr, m_rng));
}

void PracticeSession::rebuildPool() {
    m_pool = m_templates ? filterTemplates(*m_templates, m_filter) : QVector<recognition::ChordTemplate>();
    if (m_pool.isEmpty()) qWarning().noquote() << "PracticeSession: no chords match the current filter";
}

void PracticeSession::setFilter(const PracticeFilter& filter) {
    m_filter = filter;
    rebuildPool();

    if (m_pool.isEmpty()) {
        m_hasPending = false;
        if (m_target.isValid()) setTarget(nullptr);
        return;
    }
    if (m_hasPending && !m_filter.allows(m_pending.root, m_pending.typeKey)) {
        const recognition::ChordTemplate* next = pickDifferent(m_pool, &m_target.chord, m_rng);
        m_hasPending = next != nullptr;
        if (next) m_pending = *next;
    }
    if (!m_target.isValid() || !m_filter.allows(m_target.chord.root, m_target.chord.typeKey)) {
        if (m_state == State::Solved) m_state = State::Idle;
        setTarget(pickDifferent(m_pool, nullptr, m_rng));
    }
}

void PracticeSession::setAllowInversions(bool allow) {
    if (m_allowInversions == allow) return;
    m_allowInversions = allow;
    if (m_target.isValid()) {
        const recognition::ChordTemplate chord = m_target.chord;
        setTarget(&chord);
    }
}

void PracticeSession::setHoldMs(int ms) {
    m_holdMs = qBound(0, ms, 10000);
}

void PracticeSession::setTrackStats(bool track) {
    m_trackStats = track;
    if (!track) m_roundTimer.invalidate();
    else if (!m_roundTimer.isValid() && m_target.isValid()) m_roundTimer.start();
}

void PracticeSession::resetStats() {
    m_stats.reset();
    emit statsChanged();
}

bool PracticeSession::start() {
    if (m_pool.isEmpty()) {
        qWarning().noquote() << "PracticeSession: nothing to practise, enable more categories or roots";
        return false;
    }
    m_trackStats = true;
    m_hasPending = false;
    m_state = State::Running;
    const recognition::ChordTemplate* next = pickDifferent(m_pool, m_target.isValid() ? &m_target.chord : nullptr, m_rng);
    const recognition::ChordTemplate chord = *next;
    setTarget(&chord);
    return true;
}

void PracticeSession::stop() {
    m_hold.stop();
    if (m_state == State::Running) m_state = State::Stopped;
    m_trackStats = false;
    m_roundTimer.invalidate();
}

bool PracticeSession::skip() {
    if (m_pool.isEmpty()) return false;
    m_hasPending = false;
    m_state = State::Idle;
    const recognition::ChordTemplate* next = pickDifferent(m_pool, m_target.isValid() ? &m_target.chord : nullptr, m_rng);
    const recognition::ChordTemplate chord = *next;
    setTarget(&chord);
    return true;
}

void PracticeSession::noteOn(int note) {
    if (m_held.noteOn(note)) evaluate();
}

void PracticeSession::noteOff(int note) {
    if (m_held.noteOff(note)) evaluate();
}

void PracticeSession::midiMessage(const std::vector<unsigned char>& message) {
    if (m_held.applyMidiMessage(message)) evaluate();
}

void PracticeSession::allNotesOff() {
    if (m_held.clear()) evaluate();
}

void PracticeSession::setTarget(const recognition::ChordTemplate* chord) {
    m_hold.stop();
    m_hadWrong = false;
    m_target = chord ? makeRandomTarget(*chord, m_allowInversions, m_rng) : PracticeTarget();

    if (m_trackStats && m_target.isValid()) m_roundTimer.start();
    else m_roundTimer.invalidate();

    if (m_verbose) {
        qDebug().noquote() << QString("PracticeSession: target %1 [%2]")
                                  .arg(m_target.isValid() ? targetLabel(m_target) : QStringLiteral("none"))
                                  .arg(voicingToString(m_target.voicing));
    }
    emit targetChanged(m_target);
}

void PracticeSession::evaluate() {
    if (!m_target.isValid()) return;

    if (m_state == State::Solved) {
        // The next target appears once every key is up.
        if (!m_held.isEmpty()) return;
        m_state = State::Idle;
        const bool hadNext = m_hasPending;
        m_hasPending = false;
        const recognition::ChordTemplate next = m_pending;
        setTarget(hadNext ? &next : nullptr);
        return;
    }

    const AttemptResult result = judgeAttempt(m_target, m_held.notes(), m_allowInversions);
    if (result == AttemptResult::Wrong && !m_hadWrong) {
        m_hadWrong = true;
        emit wrongPress();
    }

    if (result != AttemptResult::Correct) {
        m_hold.stop();
        return;
    }
    if (m_holdMs == 0) completeHold();
    else if (!m_hold.isActive()) m_hold.start(m_holdMs);
}

void PracticeSession::completeHold() {
    if (m_state == State::Solved || !m_target.isValid()) return;

    const qint64 elapsed = m_roundTimer.isValid() ? qMax<qint64>(0, m_roundTimer.elapsed() - m_holdMs) : 0;
    const bool clean = !m_hadWrong;
    if (m_state == State::Running) ++m_score;
    m_state = State::Solved;

    if (m_trackStats) {
        m_stats.record(m_target.chord.typeKey, m_target.chord.root, clean, elapsed);
        emit statsChanged();
    }

    const recognition::ChordTemplate* next = pickDifferent(m_pool, &m_target.chord, m_rng);
    m_hasPending = next != nullptr;
    if (next) m_pending = *next;

    if (m_verbose) {
        qDebug().noquote() << QString("PracticeSession: solved %1 in %2ms%3")
                                  .arg(targetLabel(m_target))
                                  .arg(elapsed)
                                  .arg(clean ? QString() : QStringLiteral(" (after a wrong note)"));
    }
    emit solved(clean, elapsed);
}

} // namespace chordscope::practice
