// Copyright 2025 Soheil E.nia
/**
 * Common includes for the planning core. Everything that is heavy to parse (Eigen, boost) is
 * pulled in here once so the CMake precompiled header can pick it up.
 */
#pragma once

#include <Eigen/Dense>
#include <Eigen/Core>

#include <iostream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <deque>
#include <unordered_set>
#include <unordered_map>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <numeric>
#include <limits>
#include <algorithm>
#include <cmath>
#include <chrono>
#include <atomic>
#include <random>
#include <stdexcept>

#include <boost/container/flat_map.hpp>
