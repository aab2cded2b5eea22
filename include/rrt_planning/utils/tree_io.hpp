// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/ds/tree.hpp"
#include "rrt_planning/state_space/statespace.hpp"

/*
    CSV export of a planning tree:

        node_id,parent_id,cost,x0,...,x{d-1}

    Records are written breadth first from the root and renumbered in that order, so every parent_id points
    to an earlier record and the file can be read back in one pass. The root is record 0 with parent -1.
*/
void dumpTreeToCSV(const Tree& tree, std::ostream& out);
void dumpTreeToCSV(const Tree& tree, const std::string& filename);

// Rebuilds a tree from dumpTreeToCSV output. Each record must name an already read parent, otherwise
// InvariantViolation. If statespace is given, every cost must equal parent cost + distance within tolerance.
std::unique_ptr<Tree> loadTreeFromCSV(std::istream& in, std::unique_ptr<SpatialIndex> index,
                                      const StateSpace* statespace = nullptr, double tolerance = 1e-6);
