// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/utils/spatial_index.hpp"


// Brute force neighbor search. O(n) per query but exact for any metric you hand it, which is handy for
// small trees, odd state spaces and for cross checking the k-d tree.
class LinearScan : public SpatialIndex {
 public:
    using DistanceFunction = std::function<double(const Eigen::VectorXd&, const Eigen::VectorXd&)>;

    // Defaults to the euclidean metric
    explicit LinearScan(int dimension, DistanceFunction distance = nullptr);

    void addPoint(const Eigen::VectorXd& value) override;
    size_t nearest(const Eigen::VectorXd& query) const override;
    std::vector<size_t> knnSearch(const Eigen::VectorXd& query, int k) const override;
    std::vector<size_t> radiusSearch(const Eigen::VectorXd& query, double radius) const override;

    size_t size() const override;
    void clear() override;
    int getDimension() const override;

 private:
    void checkQuery(const Eigen::VectorXd& query) const;

    int dimension_;
    DistanceFunction distance_;
    std::vector<Eigen::VectorXd> points_;
};
