// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/pch.hpp"

// One vertex of the search tree. Nodes live in the Tree's arena and refer to each other by index only,
// the parent index is the truth and the children list is just a cache kept in sync by the Tree.
class TreeNode {
 public:
      explicit TreeNode(const Eigen::VectorXd& state, int index, int parent_index = -1);

      const Eigen::VectorXd& getStateValue() const noexcept;
      int getIndex() const noexcept;

      void setCost(double cost) noexcept;
      double getCost() const noexcept;

      // Cost of the edge parent -> this. Zero only for the root.
      void setEdgeCost(double cost) noexcept;
      double getEdgeCost() const noexcept;

      void setParentIndex(int index) noexcept;
      int getParentIndex() const noexcept;

      void addChildIndex(int index);
      bool removeChildIndex(int index);
      const std::vector<int>& getChildrenIndices() const noexcept;

      void setGoal(bool is_goal) noexcept;
      bool isGoal() const noexcept;

 private:
      const Eigen::VectorXd state_;
      int index_;
      int parent_index_;
      std::vector<int> children_indices_;
      double cost_to_root_ = 0.0;
      double edge_cost_ = 0.0;
      bool is_goal_ = false;
};
