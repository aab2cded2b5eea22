// Copyright 2025 Soheil E.nia

#include "rrt_planning/utils/linear_scan.hpp"

LinearScan::LinearScan(int dimension, DistanceFunction distance)
    : dimension_(dimension), distance_(std::move(distance)) {
    if (dimension_ <= 0) {
        throw std::invalid_argument("LinearScan dimension must be positive");
    }
    if (!distance_) {
        distance_ = [](const Eigen::VectorXd& a, const Eigen::VectorXd& b) { return (a - b).norm(); };
    }
}

void LinearScan::checkQuery(const Eigen::VectorXd& query) const {
    if (query.size() != dimension_) {
        throw std::invalid_argument("Query state dimension does not match LinearScan dimension");
    }
}

void LinearScan::addPoint(const Eigen::VectorXd& value) {
    if (value.size() != dimension_) {
        throw std::invalid_argument("State dimension does not match LinearScan dimension");
    }
    points_.push_back(value);
}

size_t LinearScan::nearest(const Eigen::VectorXd& query) const {
    checkQuery(query);
    if (points_.empty()) {
        throw std::logic_error("nearest() called on an empty LinearScan");
    }
    size_t best = 0;
    double best_dist = distance_(points_[0], query);
    for (size_t i = 1; i < points_.size(); ++i) {
        double d = distance_(points_[i], query);
        if (d < best_dist) {  // strict, so the first one wins a tie
            best_dist = d;
            best = i;
        }
    }
    return best;
}

std::vector<size_t> LinearScan::knnSearch(const Eigen::VectorXd& query, int k) const {
    checkQuery(query);
    if (k <= 0 || points_.empty()) {
        return {};
    }
    std::vector<std::pair<double, size_t>> all;
    all.reserve(points_.size());
    for (size_t i = 0; i < points_.size(); ++i) {
        all.emplace_back(distance_(points_[i], query), i);
    }
    size_t num = std::min(static_cast<size_t>(k), all.size());
    std::partial_sort(all.begin(), all.begin() + num, all.end());

    std::vector<size_t> result;
    result.reserve(num);
    for (size_t i = 0; i < num; ++i) {
        result.push_back(all[i].second);
    }
    return result;
}

std::vector<size_t> LinearScan::radiusSearch(const Eigen::VectorXd& query, double radius) const {
    checkQuery(query);
    std::vector<std::pair<double, size_t>> inside;
    for (size_t i = 0; i < points_.size(); ++i) {
        double d = distance_(points_[i], query);
        if (d <= radius) {
            inside.emplace_back(d, i);
        }
    }
    std::sort(inside.begin(), inside.end());

    std::vector<size_t> result;
    result.reserve(inside.size());
    for (const auto& item : inside) {
        result.push_back(item.second);
    }
    return result;
}

size_t LinearScan::size() const {
    return points_.size();
}

void LinearScan::clear() {
    points_.clear();
}

int LinearScan::getDimension() const {
    return dimension_;
}
