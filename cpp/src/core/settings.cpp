#include "lunar_habitat/core/settings.hpp"
#include "lunar_habitat/core/errors.hpp"

namespace lunar_habitat {

ScoreWeights ScoreWeights::normalized() const {
    if (w_volume_eff < 0.0 || w_privacy < 0.0 || w_transit < 0.0 ||
        w_safety < 0.0 || w_sustain < 0.0 || w_energy < 0.0) {
        throw ConfigurationError("Score weights must be non-negative");
    }
    double sum = total();
    if (sum <= 0.0) {
        throw ConfigurationError("Score weights must sum to more than zero");
    }
    ScoreWeights out;
    out.w_volume_eff = w_volume_eff / sum;
    out.w_privacy = w_privacy / sum;
    out.w_transit = w_transit / sum;
    out.w_safety = w_safety / sum;
    out.w_sustain = w_sustain / sum;
    out.w_energy = w_energy / sum;
    return out;
}

}  // namespace lunar_habitat
