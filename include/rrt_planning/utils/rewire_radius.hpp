// Copyright 2025 Soheil E.nia

#pragma once

#include <cstddef>
#include <functional>

// Neighbourhood radius used by RRT* as a function of the current tree size
using RewireRadius = std::function<double(std::size_t)>;

/*
    Shrinking ball schedule of Karaman and Frazzoli:

        r(n) = min(cap, factor * gamma * (log n / n)^(1/d))
        gamma = 2 (1 + 1/d)^(1/d) (measure / zeta_d)^(1/d)

    zeta_d is the volume of the d dimensional unit ball and measure bounds the free space volume.
    factor > 1 keeps gamma above the asymptotic optimality threshold.
*/
RewireRadius makeShrinkingBallRadius(int dimension, double measure, double factor, double cap);

// Volume of the unit ball in d dimensions
double unitBallVolume(int dimension);

// A fixed radius, mostly for tests and for problems where the schedule is tuned by hand
RewireRadius makeConstantRadius(double radius);
