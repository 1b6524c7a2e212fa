#pragma once

namespace strategy {

// Kétállapotú gép egy (szimbólum, stratégia) párhoz.
// Armed -> Triggered: egyszeri jel; Triggered -> Triggered: semmi;
// Triggered -> Armed: csendes visszaállás.
class EdgeDetector {
public:
    enum class State { Armed, Triggered };

    // Igazzal tér vissza, ha ezen a ticken kell jelet adni.
    bool update(bool all_met) {
        const bool fire = all_met && state_ == State::Armed;
        state_ = all_met ? State::Triggered : State::Armed;
        return fire;
    }

    State state() const { return state_; }
    bool triggered() const { return state_ == State::Triggered; }
    void reset() { state_ = State::Armed; }

private:
    State state_{State::Armed};
};

} // namespace strategy
