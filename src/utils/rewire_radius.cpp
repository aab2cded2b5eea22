// Copyright 2025 Soheil E.nia

#include "rrt_planning/utils/rewire_radius.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "rrt_planning/utils/errors.hpp"

double unitBallVolume(int dimension) {
    const double d = static_cast<double>(dimension);
    return std::pow(M_PI, d / 2.0) / std::tgamma(d / 2.0 + 1.0);
}

RewireRadius makeShrinkingBallRadius(int dimension, double measure, double factor, double cap) {
    if (dimension <= 0) {
        throw ConfigurationError("Rewire radius needs a positive dimension");
    }
    if (!(measure > 0.0) || !std::isfinite(measure)) {
        throw ConfigurationError("Rewire radius needs a positive finite free space measure");
    }
    if (!(factor > 0.0) || !(cap > 0.0)) {
        throw ConfigurationError("rewire_factor and rewire_radius_cap must be positive");
    }

    const double d = static_cast<double>(dimension);
    const double gamma = 2.0 * std::pow(1.0 + 1.0 / d, 1.0 / d) *
                         std::pow(measure / unitBallVolume(dimension), 1.0 / d);

    return [d, gamma, factor, cap](std::size_t n) {
        if (n < 2) {
            return cap;  // log(1) = 0, a single node has nobody to rewire anyway
        }
        const double nd = static_cast<double>(n);
        return std::min(cap, factor * gamma * std::pow(std::log(nd) / nd, 1.0 / d));
    };
}

RewireRadius makeConstantRadius(double radius) {
    if (!(radius >= 0.0) || !std::isfinite(radius)) {
        throw ConfigurationError("Constant rewire radius must be finite and non negative, got " + std::to_string(radius));
    }
    return [radius](std::size_t) { return radius; };
}
