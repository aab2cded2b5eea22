// Copyright 2025 Soheil E.nia

#pragma once

#include <stdexcept>
#include <string>

/*
    Fatal errors of a planning query. Rejected samples and blocked segments are NOT errors, the
    planner just drops that iteration. These two are the only things that abort a query.
*/

// Malformed start / goal / bounds, dimension mismatch, parameter out of range.
class ConfigurationError : public std::invalid_argument {
 public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// Tree structure broken (cycle, dangling parent, non positive edge). Always a bug in the caller.
class InvariantViolation : public std::logic_error {
 public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};
