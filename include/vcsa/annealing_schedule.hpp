#pragma once

#include <random>

namespace vcsa {

enum class CoolingLaw {
    kGeometric = 0,       // T *= rate
    kGeometricDecay = 1,  // T *= rate * (1 - i / max_iteration)
};

// Temperature state plus the Metropolis-style acceptance test on integer
// coverage deltas.
class AnnealingSchedule {
public:
    AnnealingSchedule(double initial_temp, double cooling_rate, CoolingLaw law, int max_iteration);

    double temperature() const { return temperature_; }
    CoolingLaw law() const { return law_; }

    // delta > 0 is always accepted. Otherwise accepted with probability
    // exp(delta / T); never when T <= 0. Draws from `rng` only in that branch.
    bool accept(int score_delta, std::mt19937_64& rng) const;

    // Pure form of accept() with the uniform draw supplied by the caller.
    static bool accept_with(int score_delta, double temperature, double u01);

    // Advances the temperature after iteration `iteration` (0-based).
    // Clamped at 0; the decay law reaches it as `iteration` nears max_iteration.
    void cool(int iteration);

private:
    double temperature_ = 0.0;
    double cooling_rate_ = 0.0;
    CoolingLaw law_ = CoolingLaw::kGeometric;
    int max_iteration_ = 0;
};

}  // namespace vcsa
