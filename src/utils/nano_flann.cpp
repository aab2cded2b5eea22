// Copyright 2025 Soheil E.nia

#include "rrt_planning/utils/nano_flann.hpp"


NanoFlann::NanoFlann(int dimension) : dimension_(dimension) {
    if (dimension_ <= 0) {
        throw std::invalid_argument("KDTree dimension must be positive");
    }
    kdtree_ = std::make_unique<NFKDTree>(dimension_, cloud_, nanoflann::KDTreeSingleIndexAdaptorParams(10 /* max leaf */));
}

void NanoFlann::checkQuery(const Eigen::VectorXd& query) const {
    if (query.size() != dimension_) {
        throw std::invalid_argument("Query state dimension does not match KDTree dimension");
    }
}

void NanoFlann::addPoint(const Eigen::VectorXd& value) {
    if (value.size() != dimension_) {
        throw std::invalid_argument("State dimension does not match KDTree dimension");
    }
    cloud_.points.push_back(value);
    size_t idx = cloud_.points.size() - 1;
    kdtree_->addPoints(idx, idx);  // inclusive range
}

size_t NanoFlann::nearest(const Eigen::VectorXd& query) const {
    if (cloud_.points.empty()) {
        throw std::logic_error("nearest() called on an empty KDTree");
    }
    return knnSearch(query, 1).front();
}

std::vector<size_t> NanoFlann::knnSearch(const Eigen::VectorXd& query, int k) const {
    checkQuery(query);
    if (k <= 0 || cloud_.points.empty()) {
        return {};
    }
    size_t num = std::min(static_cast<size_t>(k), cloud_.points.size());

    std::vector<size_t> ret_indexes(num);
    std::vector<double> out_dists_sqr(num);
    nanoflann::KNNResultSet<double, size_t> resultSet(num);
    resultSet.init(ret_indexes.data(), out_dists_sqr.data());
    kdtree_->findNeighbors(resultSet, query.data(), nanoflann::SearchParameters());
    if (resultSet.size() == 0) {
        return {};
    }

    // nanoflann keeps whichever equidistant point it meets first. Collect everything up to the k-th distance
    // so ties at the boundary resolve to the smaller index.
    double kth_dist_sqr = *std::max_element(out_dists_sqr.begin(), out_dists_sqr.begin() + resultSet.size());
    std::vector<nanoflann::ResultItem<size_t, double>> matches;
    nanoflann::RadiusResultSet<double, size_t> radiusSet(
        std::nextafter(kth_dist_sqr, std::numeric_limits<double>::infinity()), matches);
    kdtree_->findNeighbors(radiusSet, query.data(), nanoflann::SearchParameters());

    std::sort(matches.begin(), matches.end(),
              [](const nanoflann::ResultItem<size_t, double>& a, const nanoflann::ResultItem<size_t, double>& b) {
                  return a.second < b.second || (a.second == b.second && a.first < b.first);
              });

    std::vector<size_t> result;
    result.reserve(num);
    for (size_t i = 0; i < matches.size() && i < num; ++i) {
        result.push_back(matches[i].first);
    }
    return result;
}

std::vector<size_t> NanoFlann::radiusSearch(const Eigen::VectorXd& query, double radius) const {
    checkQuery(query);
    if (radius < 0.0 || cloud_.points.empty()) {
        return {};
    }

    // nanoflann works on squared distances and keeps only dist < radius, so bump it one ulp to make it inclusive
    double search_radius = std::nextafter(radius * radius, std::numeric_limits<double>::infinity());
    std::vector<nanoflann::ResultItem<size_t, double>> ret_matches;
    nanoflann::RadiusResultSet<double, size_t> resultSet(search_radius, ret_matches);
    kdtree_->findNeighbors(resultSet, query.data(), nanoflann::SearchParameters());

    std::sort(ret_matches.begin(), ret_matches.end(),
              [](const nanoflann::ResultItem<size_t, double>& a, const nanoflann::ResultItem<size_t, double>& b) {
                  return a.second < b.second || (a.second == b.second && a.first < b.first);
              });

    std::vector<size_t> resultIndices;
    resultIndices.reserve(ret_matches.size());
    for (const auto& match : ret_matches) {
        resultIndices.push_back(match.first);
    }
    return resultIndices;
}

size_t NanoFlann::size() const {
    return cloud_.points.size();
}

void NanoFlann::clear() {
    cloud_.points.clear();
    kdtree_ = std::make_unique<NFKDTree>(dimension_, cloud_, nanoflann::KDTreeSingleIndexAdaptorParams(10 /* max leaf */));
}

int NanoFlann::getDimension() const {
    return dimension_;
}
