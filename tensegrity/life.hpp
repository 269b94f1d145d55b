#ifndef PRETENST_TENSEGRITY_LIFE_HPP
#define PRETENST_TENSEGRITY_LIFE_HPP

#include <engine/stage.hpp>

namespace pretenst {

class Tensegrity;

// A requested stage change and the preferences that shape its side effects
struct LifeTransition {
    Stage stage = Stage::Growing;
    bool adopt_lengths = false;
    bool strain_to_stiffness = false;
};

// Current lifecycle stage of a structure. Moving to another stage performs
// that transition's structural side effects and yields a new token.
//
// Legal transitions:
//   Growing    -> Shaping
//   Shaping    -> Slack, Pretensing
//   Slack      -> Shaping, Pretensing
//   Pretensing -> Pretenst
//   Pretenst   -> Slack
class Life {
public:
    Life(Tensegrity& tensegrity, Stage stage);

    Stage stage() const { return stage_; }

    // Throws std::logic_error naming both stages if the transition is not
    // legal. Requesting the current stage does nothing.
    Life with_transition(const LifeTransition& transition) const;

    static bool is_legal(Stage from, Stage to);

private:
    void shaping_to_slack(const LifeTransition& transition) const;
    void pretenst_to_slack(const LifeTransition& transition) const;

    Tensegrity* tensegrity_;
    Stage stage_;
};

}  // namespace pretenst

#endif // PRETENST_TENSEGRITY_LIFE_HPP
