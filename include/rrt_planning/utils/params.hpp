// Copyright 2025 Soheil E.nia

#pragma once

#include <unordered_map>
#include <string>
#include <sstream>
#include <vector>
#include <limits>
#include <stdexcept>
#include <type_traits>

#include "rrt_planning/utils/errors.hpp"

class Params {
public:
    template <typename T>
    T getParam(const std::string& key) const {
        auto it = params_.find(key);
        if (it == params_.end()) {
            throw std::runtime_error("Parameter not found: " + key);
        }
        try {
            return convert<T>(it->second);
        } catch (const std::invalid_argument&) {
            throw ConfigurationError("Parameter '" + key + "' has an unreadable value: " + it->second);
        } catch (const std::out_of_range&) {
            throw ConfigurationError("Parameter '" + key + "' is out of range: " + it->second);
        }
    }

    // Get param with default value!
    template<class T>
    T getParam(const std::string& key, const T& default_value) const {
        if (!hasParam(key)) {
            return default_value;
        }
        return getParam<T>(key);
    }

    bool hasParam(const std::string& key) const {
        return params_.find(key) != params_.end();
    }

    void setParam(const std::string& key, const char* value) {
        params_[key] = std::string(value);
    }

    template <typename T>
    void setParam(const std::string& key, const T& value) {
        if constexpr (std::is_same_v<T, std::string>) {
            params_[key] = value;
        } else if constexpr (std::is_same_v<T, bool>) {
            params_[key] = value ? "true" : "false";
        } else if constexpr (std::is_floating_point_v<T>) {
            // std::to_string keeps six decimals only, not enough for a small step or tolerance
            std::ostringstream os;
            os.precision(std::numeric_limits<T>::max_digits10);
            os << value;
            params_[key] = os.str();
        } else {
            params_[key] = std::to_string(value);
        }
    }

    std::vector<std::string> getKeys() const {
        std::vector<std::string> keys;
        keys.reserve(params_.size());
        for (const auto& [key, value] : params_) {
            keys.push_back(key);
        }
        return keys;
    }

private:
    std::unordered_map<std::string, std::string> params_;

    template <typename T>
    T convert(const std::string& value) const;
};

template <>
inline int Params::convert<int>(const std::string& value) const {
    size_t used = 0;
    int result = std::stoi(value, &used);
    if (used != value.size()) {
        throw std::invalid_argument(value);
    }
    return result;
}

template <>
inline unsigned int Params::convert<unsigned int>(const std::string& value) const {
    size_t used = 0;
    unsigned long result = std::stoul(value, &used);
    if (used != value.size() || value.find('-') != std::string::npos ||
        result > std::numeric_limits<unsigned int>::max()) {
        throw std::invalid_argument(value);
    }
    return static_cast<unsigned int>(result);
}

template <>
inline double Params::convert<double>(const std::string& value) const {
    size_t used = 0;
    double result = std::stod(value, &used);
    if (used != value.size()) {
        throw std::invalid_argument(value);
    }
    return result;
}

template <>
inline std::string Params::convert<std::string>(const std::string& value) const {
    return value;
}

template <>
inline bool Params::convert<bool>(const std::string& value) const {
    if (value == "true" || value == "1") {
        return true;
    } else if (value == "false" || value == "0") {
        return false;
    }
    throw std::invalid_argument(value);
}

// "1.0, 2.0 3.0" style lists
template <>
inline std::vector<double> Params::convert<std::vector<double>>(const std::string& value) const {
    std::vector<double> result;
    std::stringstream ss(value);
    double num;
    while (ss >> num) {
        result.push_back(num);
        while (ss.peek() == ',' || ss.peek() == ' ') ss.ignore();
    }
    if (!ss.eof()) {
        throw std::invalid_argument(value);
    }
    return result;
}
