// Copyright 2025 Soheil E.nia

#include "rrt_planning/ds/tree.hpp"

Tree::Tree(const Eigen::VectorXd& root_state, std::unique_ptr<SpatialIndex> index)
    : index_(std::move(index)), dimension_(static_cast<int>(root_state.size())) {
    if (!index_) {
        throw ConfigurationError("Tree needs a spatial index");
    }
    if (index_->getDimension() != dimension_) {
        throw ConfigurationError("Root has dimension " + std::to_string(dimension_) +
                                 " but the spatial index has dimension " + std::to_string(index_->getDimension()));
    }
    if (index_->size() != 0) {
        throw ConfigurationError("Tree must start from an empty spatial index");
    }
    if (!root_state.allFinite()) {
        throw ConfigurationError("Root configuration is not finite");
    }

    tree_.push_back(std::make_shared<TreeNode>(root_state, 0));
    tree_.back()->setCost(0.0);
    index_->addPoint(root_state);
}

void Tree::checkIndex(int index, const std::string& what) const {
    if (index < 0 || index >= static_cast<int>(tree_.size())) {
        throw InvariantViolation(what + " " + std::to_string(index) + " is not a node of this tree (size " +
                                 std::to_string(tree_.size()) + ")");
    }
}

void Tree::checkEdgeCost(double edge_cost) const {
    if (!(edge_cost > 0.0) || !std::isfinite(edge_cost)) {
        throw InvariantViolation("Edge cost must be positive and finite, got " + std::to_string(edge_cost));
    }
}

int Tree::addNode(int parent_index, const Eigen::VectorXd& state, double edge_cost) {
    checkIndex(parent_index, "Parent");
    checkEdgeCost(edge_cost);
    if (state.size() != dimension_) {
        throw ConfigurationError("Node has dimension " + std::to_string(state.size()) +
                                 " but the tree has dimension " + std::to_string(dimension_));
    }
    if (!state.allFinite()) {
        throw ConfigurationError("Node configuration is not finite");
    }

    int index = static_cast<int>(tree_.size());
    auto node = std::make_shared<TreeNode>(state, index, parent_index);
    node->setEdgeCost(edge_cost);
    node->setCost(tree_[parent_index]->getCost() + edge_cost);
    tree_.push_back(node);
    tree_[parent_index]->addChildIndex(index);
    index_->addPoint(state);
    return index;
}

bool Tree::isAncestor(int ancestor_index, int node_index) const {
    checkIndex(ancestor_index, "Ancestor");
    checkIndex(node_index, "Node");

    // A well formed chain is never longer than the tree, anything longer is a loop
    size_t steps = 0;
    int current = node_index;
    while (current != -1) {
        if (current == ancestor_index) {
            return true;
        }
        if (++steps > tree_.size()) {
            throw InvariantViolation("Parent chain of node " + std::to_string(node_index) + " does not reach the root");
        }
        current = tree_[current]->getParentIndex();
    }
    return false;
}

void Tree::rewire(int child_index, int new_parent_index, double new_edge_cost) {
    checkIndex(child_index, "Child");
    checkIndex(new_parent_index, "New parent");
    checkEdgeCost(new_edge_cost);
    if (child_index == getRootIndex()) {
        throw InvariantViolation("The root cannot be rewired");
    }
    if (isAncestor(child_index, new_parent_index)) {
        throw InvariantViolation("Rewiring node " + std::to_string(child_index) + " under " +
                                 std::to_string(new_parent_index) + " would create a cycle");
    }

    TreeNode& child = getMutableNode(child_index);
    int old_parent_index = child.getParentIndex();
    if (old_parent_index != new_parent_index) {
        if (!tree_[old_parent_index]->removeChildIndex(child_index)) {
            throw InvariantViolation("Node " + std::to_string(child_index) + " is missing from the children of its parent " +
                                     std::to_string(old_parent_index));
        }
        tree_[new_parent_index]->addChildIndex(child_index);
        child.setParentIndex(new_parent_index);
    }
    child.setEdgeCost(new_edge_cost);
    propagateCost(child_index);
}

// Recompute cost = parent cost + edge cost for the node and its whole subtree. Same thing as shifting every
// descendant by the delta of the rewired node, but it can't accumulate rounding drift.
void Tree::propagateCost(int index) {
    std::vector<int> stack{index};
    while (!stack.empty()) {
        int current = stack.back();
        stack.pop_back();
        auto& node = tree_[current];
        node->setCost(tree_[node->getParentIndex()]->getCost() + node->getEdgeCost());
        for (int child : node->getChildrenIndices()) {
            stack.push_back(child);
        }
    }
}

int Tree::nearest(const Eigen::VectorXd& query) const {
    return static_cast<int>(index_->nearest(query));
}

std::vector<int> Tree::near(const Eigen::VectorXd& query, double radius) const {
    auto found = index_->radiusSearch(query, radius);
    return std::vector<int>(found.begin(), found.end());
}

TreeNode& Tree::getMutableNode(int index) {
    checkIndex(index, "Node");
    return *tree_[index];
}

const TreeNode& Tree::getNode(int index) const {
    checkIndex(index, "Node");
    return *tree_[index];
}

const Eigen::VectorXd& Tree::getStateValue(int index) const {
    return getNode(index).getStateValue();
}

double Tree::getCost(int index) const {
    return getNode(index).getCost();
}

int Tree::getParentIndex(int index) const {
    return getNode(index).getParentIndex();
}

size_t Tree::size() const {
    return tree_.size();
}

void Tree::markGoal(int index) {
    checkIndex(index, "Goal node");
    if (!tree_[index]->isGoal()) {
        tree_[index]->setGoal(true);
        goal_indices_.push_back(index);
    }
}

const std::vector<int>& Tree::getGoalIndices() const {
    return goal_indices_;
}

void Tree::validate(double tolerance) const {
    if (tree_.empty()) {
        throw InvariantViolation("Tree has no root");
    }
    if (index_->size() != tree_.size()) {
        throw InvariantViolation("Spatial index holds " + std::to_string(index_->size()) + " points for " +
                                 std::to_string(tree_.size()) + " nodes");
    }
    const auto& root = tree_[getRootIndex()];
    if (root->getParentIndex() != -1 || root->getCost() != 0.0) {
        throw InvariantViolation("Root must have no parent and zero cost");
    }

    size_t num_children = 0;
    for (size_t i = 0; i < tree_.size(); ++i) {
        const auto& node = tree_[i];
        int idx = static_cast<int>(i);
        if (node->getIndex() != idx) {
            throw InvariantViolation("Node stored at " + std::to_string(i) + " claims index " + std::to_string(node->getIndex()));
        }
        for (int child : node->getChildrenIndices()) {
            checkIndex(child, "Child");
            if (tree_[child]->getParentIndex() != idx) {
                throw InvariantViolation("Node " + std::to_string(child) + " is listed as a child of " + std::to_string(i) +
                                         " but its parent is " + std::to_string(tree_[child]->getParentIndex()));
            }
        }
        num_children += node->getChildrenIndices().size();
        if (idx == getRootIndex()) {
            continue;
        }

        int parent = node->getParentIndex();
        checkIndex(parent, "Parent of node " + std::to_string(i));
        checkEdgeCost(node->getEdgeCost());
        const auto& siblings = tree_[parent]->getChildrenIndices();
        if (std::count(siblings.begin(), siblings.end(), idx) != 1) {
            throw InvariantViolation("Node " + std::to_string(i) + " is not listed exactly once by its parent");
        }
        double expected = tree_[parent]->getCost() + node->getEdgeCost();
        if (std::abs(node->getCost() - expected) > tolerance * (1.0 + std::abs(expected))) {
            throw InvariantViolation("Node " + std::to_string(i) + " has cost " + std::to_string(node->getCost()) +
                                     " but its parent chain sums to " + std::to_string(expected));
        }
    }
    if (num_children != tree_.size() - 1) {
        throw InvariantViolation("Children lists reference " + std::to_string(num_children) + " nodes, expected " +
                                 std::to_string(tree_.size() - 1));
    }

    // Walk down from the root. With consistent child lists, reaching every node means there's no cycle
    std::vector<char> seen(tree_.size(), 0);
    std::vector<int> stack{getRootIndex()};
    size_t visited = 0;
    while (!stack.empty()) {
        int current = stack.back();
        stack.pop_back();
        if (seen[current]) {
            throw InvariantViolation("Node " + std::to_string(current) + " reached twice from the root");
        }
        seen[current] = 1;
        ++visited;
        for (int child : tree_[current]->getChildrenIndices()) {
            stack.push_back(child);
        }
    }
    if (visited != tree_.size()) {
        throw InvariantViolation("Only " + std::to_string(visited) + " of " + std::to_string(tree_.size()) +
                                 " nodes are reachable from the root");
    }

    for (int goal : goal_indices_) {
        checkIndex(goal, "Goal node");
        if (!tree_[goal]->isGoal()) {
            throw InvariantViolation("Goal list and goal flags disagree on node " + std::to_string(goal));
        }
    }
}
