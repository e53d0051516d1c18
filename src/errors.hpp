#pragma once

#include <stdexcept>
#include <string>

// Duplicate, out-of-order or malformed bar. Rejected before any state changes.
class BarOrderError : public std::runtime_error {
public:
    explicit BarOrderError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Structural invariant broken; always a defect in the detector itself
class InvariantError : public std::runtime_error {
public:
    explicit InvariantError(const std::string& msg) : std::runtime_error(msg) {}
};

class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& msg) : std::runtime_error(msg) {}
};
