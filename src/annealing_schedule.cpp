#include "vcsa/annealing_schedule.hpp"

#include <algorithm>
#include <cmath>

namespace vcsa {

AnnealingSchedule::AnnealingSchedule(double initial_temp, double cooling_rate, CoolingLaw law, int max_iteration)
    : temperature_(initial_temp), cooling_rate_(cooling_rate), law_(law), max_iteration_(max_iteration) {}

bool AnnealingSchedule::accept(int score_delta, std::mt19937_64& rng) const {
    if (score_delta > 0) {
        return true;
    }
    if (!(temperature_ > 0.0)) {
        return false;
    }
    std::uniform_real_distribution<double> unif01(0.0, 1.0);
    return accept_with(score_delta, temperature_, unif01(rng));
}

bool AnnealingSchedule::accept_with(int score_delta, double temperature, double u01) {
    if (score_delta > 0) {
        return true;
    }
    if (!(temperature > 0.0)) {
        return false;
    }
    const double p = std::exp(static_cast<double>(score_delta) / temperature);
    return u01 < p;
}

void AnnealingSchedule::cool(int iteration) {
    double factor = cooling_rate_;
    if (law_ == CoolingLaw::kGeometricDecay && max_iteration_ > 0) {
        const double frac = static_cast<double>(iteration) / static_cast<double>(max_iteration_);
        factor *= (1.0 - frac);
    }
    temperature_ = std::max(0.0, temperature_ * factor);
}

}  // namespace vcsa
