// Copyright 2025 Soheil E.nia

#include "rrt_planning/ds/tree_node.hpp"

TreeNode::TreeNode(const Eigen::VectorXd& state, int index, int parent_index)
    : state_(state), index_(index), parent_index_(parent_index) {
}

const Eigen::VectorXd& TreeNode::getStateValue() const noexcept {
    return state_;
}

int TreeNode::getIndex() const noexcept {
    return index_;
}

void TreeNode::setCost(double cost) noexcept {
    cost_to_root_ = cost;
}

double TreeNode::getCost() const noexcept {
    return cost_to_root_;
}

void TreeNode::setEdgeCost(double cost) noexcept {
    edge_cost_ = cost;
}

double TreeNode::getEdgeCost() const noexcept {
    return edge_cost_;
}

void TreeNode::setParentIndex(int index) noexcept {
    parent_index_ = index;
}

int TreeNode::getParentIndex() const noexcept {
    return parent_index_;
}

void TreeNode::addChildIndex(int index) {
    children_indices_.push_back(index);
}

bool TreeNode::removeChildIndex(int index) {
    auto it = std::find(children_indices_.begin(), children_indices_.end(), index);
    if (it == children_indices_.end()) {
        return false;
    }
    children_indices_.erase(it);
    return true;
}

const std::vector<int>& TreeNode::getChildrenIndices() const noexcept {
    return children_indices_;
}

void TreeNode::setGoal(bool is_goal) noexcept {
    is_goal_ = is_goal;
}

bool TreeNode::isGoal() const noexcept {
    return is_goal_;
}
