// src/worldgen/Errors.hpp
#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace orbis::worldgen {

class Planet;

// Caller-supplied configuration is invalid: unknown algorithm, bad level,
// malformed parameters or config files. Never defaulted silently.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed tile/corner/edge/season index. Indicates a logic defect in the caller.
class IndexOutOfRange : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// Internal invariant broken (e.g. a cycle in the river graph).
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// The seasonal iteration hit its cycle cap without meeting acceptable-delta.
// Carries the best-so-far planet so the caller can accept it, retry or abort.
class NonConvergenceError : public std::runtime_error {
public:
    NonConvergenceError(const std::string& what, double lastDelta, int cycles,
                        std::shared_ptr<const Planet> bestSoFar)
        : std::runtime_error(what)
        , lastDelta_(lastDelta)
        , cycles_(cycles)
        , bestSoFar_(std::move(bestSoFar)) {}

    [[nodiscard]] double last_delta() const noexcept { return lastDelta_; }
    [[nodiscard]] int cycles() const noexcept { return cycles_; }
    [[nodiscard]] const std::shared_ptr<const Planet>& best_so_far() const noexcept { return bestSoFar_; }

private:
    double lastDelta_ = 0.0;
    int    cycles_    = 0;
    std::shared_ptr<const Planet> bestSoFar_;
};

// A progress observer asked the climate run to stop.
class SimulationCancelled : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace orbis::worldgen
