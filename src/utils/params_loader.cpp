// Copyright 2025 Soheil E.nia

#include "rrt_planning/utils/params_loader.hpp"

#include <iostream>

#include <yaml-cpp/yaml.h>

Params paramsFromYamlNode(const YAML::Node& root) {
    Params params;
    if (!root || root.IsNull()) {
        return params;
    }
    if (!root.IsMap()) {
        throw ConfigurationError("Planner parameters must be a YAML map");
    }

    for (const auto& entry : root) {
        const std::string key = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;

        if (value.IsScalar()) {
            params.setParam(key, value.as<std::string>());
        } else if (value.IsSequence()) {
            std::string joined;
            for (size_t i = 0; i < value.size(); ++i) {
                if (!value[i].IsScalar()) {
                    throw ConfigurationError("Parameter '" + key + "' must be a list of scalars");
                }
                if (i > 0) joined += ", ";
                joined += value[i].as<std::string>();
            }
            params.setParam(key, joined);
        } else if (value.IsNull()) {
            std::cerr << "Parameter '" << key << "' has no value, ignoring it" << std::endl;
        } else {
            throw ConfigurationError("Parameter '" + key + "' is a nested map, only flat maps are supported");
        }
    }
    return params;
}

Params loadParamsFromYaml(const std::string& file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(file_path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Could not load parameters from " + file_path + ": " + e.what());
    }
    std::cout << "Loaded planner parameters from " << file_path << std::endl;
    return paramsFromYamlNode(root);
}

Params loadParamsFromYamlString(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Could not parse parameters: ") + e.what());
    }
    return paramsFromYamlNode(root);
}
