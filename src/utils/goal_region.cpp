// Copyright 2025 Soheil E.nia

#include "rrt_planning/utils/goal_region.hpp"

BallGoal::BallGoal(const Eigen::VectorXd& center, double radius) : center_(center), radius_(radius) {
    if (center_.size() == 0 || !center_.allFinite()) {
        throw ConfigurationError("Goal center must be a finite, non empty configuration");
    }
    if (!(radius_ >= 0.0) || !std::isfinite(radius_)) {
        throw ConfigurationError("Goal radius must be finite and non negative");
    }
}

bool BallGoal::contains(const Eigen::VectorXd& state) const {
    if (state.size() != center_.size()) {
        return false;
    }
    return (state - center_).norm() <= radius_;
}

// Uniform in the ball: gaussian direction, radius scaled by u^(1/d)
Eigen::VectorXd BallGoal::sample(std::mt19937& rng) const {
    if (radius_ == 0.0) {
        return center_;
    }
    std::normal_distribution<double> gauss(0.0, 1.0);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    Eigen::VectorXd direction(center_.size());
    double norm = 0.0;
    while (norm < 1e-12) {
        for (Eigen::Index i = 0; i < direction.size(); ++i) {
            direction[i] = gauss(rng);
        }
        norm = direction.norm();
    }
    double r = radius_ * std::pow(unit(rng), 1.0 / static_cast<double>(center_.size()));
    return center_ + direction * (r / norm);
}

std::string BallGoal::toString() const {
    std::ostringstream oss;
    oss << "BallGoal(center=[" << center_.transpose() << "], r=" << radius_ << ")";
    return oss.str();
}


BoxGoal::BoxGoal(const Eigen::VectorXd& lower, const Eigen::VectorXd& upper) : lower_(lower), upper_(upper) {
    if (lower_.size() == 0 || lower_.size() != upper_.size()) {
        throw ConfigurationError("Goal box corners must be non empty and of equal dimension");
    }
    if (!lower_.allFinite() || !upper_.allFinite() || (lower_.array() > upper_.array()).any()) {
        throw ConfigurationError("Goal box needs finite corners with lower <= upper");
    }
}

bool BoxGoal::contains(const Eigen::VectorXd& state) const {
    if (state.size() != lower_.size()) {
        return false;
    }
    return (state.array() >= lower_.array()).all() && (state.array() <= upper_.array()).all();
}

Eigen::VectorXd BoxGoal::sample(std::mt19937& rng) const {
    Eigen::VectorXd values(lower_.size());
    for (Eigen::Index i = 0; i < lower_.size(); ++i) {
        std::uniform_real_distribution<double> dist(lower_[i], upper_[i]);
        values[i] = dist(rng);
    }
    return values;
}

std::string BoxGoal::toString() const {
    std::ostringstream oss;
    oss << "BoxGoal(lower=[" << lower_.transpose() << "], upper=[" << upper_.transpose() << "])";
    return oss.str();
}


MultiGoal::MultiGoal(std::vector<std::shared_ptr<GoalRegion>> goals) : goals_(std::move(goals)) {
    if (goals_.empty()) {
        throw ConfigurationError("MultiGoal needs at least one goal region");
    }
    for (const auto& goal : goals_) {
        if (!goal) {
            throw ConfigurationError("MultiGoal member must not be null");
        }
        if (goal->getDimension() != goals_.front()->getDimension()) {
            throw ConfigurationError("MultiGoal members must share one dimension");
        }
    }
}

bool MultiGoal::contains(const Eigen::VectorXd& state) const {
    for (const auto& goal : goals_) {
        if (goal->contains(state)) {
            return true;
        }
    }
    return false;
}

Eigen::VectorXd MultiGoal::sample(std::mt19937& rng) const {
    std::uniform_int_distribution<size_t> pick(0, goals_.size() - 1);
    return goals_[pick(rng)]->sample(rng);
}

std::string MultiGoal::toString() const {
    std::ostringstream oss;
    oss << "MultiGoal(";
    for (size_t i = 0; i < goals_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << goals_[i]->toString();
    }
    oss << ")";
    return oss.str();
}
