// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/pch.hpp"
#include "rrt_planning/ds/tree_node.hpp"
#include "rrt_planning/utils/spatial_index.hpp"
#include "rrt_planning/utils/errors.hpp"

/*
    Arena of TreeNodes rooted at the start configuration.

    - Node i is tree_[i] and is point i in the spatial index, so both grow in lock step.
    - Nodes are never removed. The only mutation after insertion is rewire(), which moves a node (and with it
      its whole subtree) under another parent.
    - Between two public calls the structure is always a tree: one root, no cycles and
      cost(n) == cost(parent(n)) + edge(n) for every non root node.
*/
class Tree {
 public:
    Tree(const Eigen::VectorXd& root_state, std::unique_ptr<SpatialIndex> index);

    // Returns the index of the new node
    int addNode(int parent_index, const Eigen::VectorXd& state, double edge_cost);

    // Reparent child under new_parent. The cycle check runs before anything is touched, so a throwing call
    // leaves the tree exactly as it was.
    void rewire(int child_index, int new_parent_index, double new_edge_cost);

    // True if ancestor_index is on the parent chain of node_index (a node is its own ancestor)
    bool isAncestor(int ancestor_index, int node_index) const;

    int nearest(const Eigen::VectorXd& query) const;
    std::vector<int> near(const Eigen::VectorXd& query, double radius) const;

    const TreeNode& getNode(int index) const;
    const Eigen::VectorXd& getStateValue(int index) const;
    double getCost(int index) const;
    int getParentIndex(int index) const;
    size_t size() const;
    int getRootIndex() const { return 0; }
    int getDimension() const { return dimension_; }

    void markGoal(int index);
    const std::vector<int>& getGoalIndices() const;

    // Full structural check, throws InvariantViolation describing the first problem found.
    void validate(double tolerance = 1e-9) const;

    const SpatialIndex& getSpatialIndex() const { return *index_; }

 protected:
    TreeNode& getMutableNode(int index);

 private:
    void checkIndex(int index, const std::string& what) const;
    void checkEdgeCost(double edge_cost) const;
    void propagateCost(int index);

    std::vector<std::shared_ptr<TreeNode>> tree_;
    std::unique_ptr<SpatialIndex> index_;
    std::vector<int> goal_indices_;
    int dimension_;
};
