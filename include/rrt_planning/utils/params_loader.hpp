// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/utils/params.hpp"

namespace YAML { class Node; }

// Flat YAML map -> Params. Scalars are stored as written, sequences of scalars become "a, b, c" so they read
// back with getParam<std::vector<double>>. Nested maps are rejected with ConfigurationError.
Params loadParamsFromYaml(const std::string& file_path);
Params loadParamsFromYamlString(const std::string& text);
Params paramsFromYamlNode(const YAML::Node& root);
