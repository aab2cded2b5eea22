// Copyright 2025 Soheil E.nia

#include "rrt_planning/utils/tree_io.hpp"

#include <fstream>

namespace {

std::vector<std::string> splitLine(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    return fields;
}

double parseDouble(const std::string& field, size_t line_number) {
    try {
        size_t used = 0;
        double value = std::stod(field, &used);
        if (used == field.size()) {
            return value;
        }
    } catch (const std::exception&) {
    }
    throw ConfigurationError("Tree CSV line " + std::to_string(line_number) + ": bad number '" + field + "'");
}

int parseInt(const std::string& field, size_t line_number) {
    try {
        size_t used = 0;
        int value = std::stoi(field, &used);
        if (used == field.size()) {
            return value;
        }
    } catch (const std::exception&) {
    }
    throw ConfigurationError("Tree CSV line " + std::to_string(line_number) + ": bad integer '" + field + "'");
}

}  // namespace

void dumpTreeToCSV(const Tree& tree, std::ostream& out) {
    const int dim = tree.getDimension();

    out << "node_id,parent_id,cost";
    for (int d = 0; d < dim; ++d) {
        out << ",x" << d;
    }
    out << "\n";

    // BFS order, new ids assigned on the way
    std::vector<int> new_id(tree.size(), -1);
    std::deque<int> queue;
    queue.push_back(tree.getRootIndex());
    int next_id = 0;
    new_id[tree.getRootIndex()] = next_id++;

    out << std::setprecision(17);
    while (!queue.empty()) {
        int index = queue.front();
        queue.pop_front();
        const TreeNode& node = tree.getNode(index);

        int parent = node.getParentIndex();
        out << new_id[index] << "," << (parent < 0 ? -1 : new_id[parent]) << "," << node.getCost();
        const Eigen::VectorXd& state = node.getStateValue();
        for (int d = 0; d < dim; ++d) {
            out << "," << state[d];
        }
        out << "\n";

        for (int child : node.getChildrenIndices()) {
            new_id[child] = next_id++;
            queue.push_back(child);
        }
    }
}

void dumpTreeToCSV(const Tree& tree, const std::string& filename) {
    std::ofstream fout(filename);
    if (!fout.is_open()) {
        throw std::runtime_error("Failed to open " + filename + " for writing");
    }
    dumpTreeToCSV(tree, fout);
    std::cout << "Tree with " << tree.size() << " nodes dumped to " << filename << "\n";
}

std::unique_ptr<Tree> loadTreeFromCSV(std::istream& in, std::unique_ptr<SpatialIndex> index,
                                      const StateSpace* statespace, double tolerance) {
    std::string line;
    if (!std::getline(in, line)) {
        throw ConfigurationError("Tree CSV is empty");
    }
    std::vector<std::string> header = splitLine(line);
    if (header.size() < 4 || header[0] != "node_id" || header[1] != "parent_id" || header[2] != "cost") {
        throw ConfigurationError("Tree CSV header must start with node_id,parent_id,cost and name coordinates");
    }
    const int dim = static_cast<int>(header.size()) - 3;

    std::unique_ptr<Tree> tree;
    size_t line_number = 1;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        std::vector<std::string> fields = splitLine(line);
        if (static_cast<int>(fields.size()) != dim + 3) {
            throw ConfigurationError("Tree CSV line " + std::to_string(line_number) + ": expected " +
                                     std::to_string(dim + 3) + " fields");
        }
        int id = parseInt(fields[0], line_number);
        int parent = parseInt(fields[1], line_number);
        double cost = parseDouble(fields[2], line_number);
        Eigen::VectorXd state(dim);
        for (int d = 0; d < dim; ++d) {
            state[d] = parseDouble(fields[3 + d], line_number);
        }

        const int expected_id = tree ? static_cast<int>(tree->size()) : 0;
        if (id != expected_id) {
            throw InvariantViolation("Tree CSV line " + std::to_string(line_number) + ": node id " +
                                     std::to_string(id) + " out of order, expected " + std::to_string(expected_id));
        }

        if (!tree) {
            if (parent != -1 || std::abs(cost) > tolerance) {
                throw InvariantViolation("Tree CSV: first record must be the root with parent -1 and cost 0");
            }
            tree = std::make_unique<Tree>(state, std::move(index));
            continue;
        }

        if (parent < 0 || parent >= id) {
            throw InvariantViolation("Tree CSV line " + std::to_string(line_number) + ": parent " +
                                     std::to_string(parent) + " has not been read yet");
        }
        double edge_cost = cost - tree->getCost(parent);
        if (statespace) {
            double expected = statespace->distance(tree->getStateValue(parent), state);
            if (std::abs(edge_cost - expected) > tolerance * (1.0 + cost)) {
                throw InvariantViolation("Tree CSV line " + std::to_string(line_number) + ": cost " +
                                         std::to_string(cost) + " does not match parent cost plus distance");
            }
            edge_cost = expected;
        }
        tree->addNode(parent, state, edge_cost);
    }

    if (!tree) {
        throw ConfigurationError("Tree CSV has a header but no root record");
    }
    return tree;
}
