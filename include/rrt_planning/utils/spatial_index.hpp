// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/pch.hpp"

/*
    Nearest neighbor structure over the tree's configurations. Points are only ever appended, and the id of a point
    is its insertion order, which is also the index of the tree node that owns it. That's why there is no payload
    and no removal here.

    All queries return indices sorted by distance, ties broken by the smaller index.
*/
class SpatialIndex {
 public:
    virtual ~SpatialIndex() = default;

    virtual void addPoint(const Eigen::VectorXd& value) = 0;

    // Throws std::logic_error on an empty index. The planner always inserts the root first so this never happens there.
    virtual size_t nearest(const Eigen::VectorXd& query) const = 0;
    virtual std::vector<size_t> knnSearch(const Eigen::VectorXd& query, int k) const = 0;
    // Everything with distance <= radius (inclusive)
    virtual std::vector<size_t> radiusSearch(const Eigen::VectorXd& query, double radius) const = 0;

    virtual size_t size() const = 0;
    virtual void clear() = 0;
    virtual int getDimension() const = 0;
};
