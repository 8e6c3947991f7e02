#pragma once

#include "pepcheck/types.hpp"
#include <stdexcept>
#include <string>

namespace pepcheck {

// Malformed or truncated token stream. Distinct from style diagnostics:
// analysis of the file stops and the caller decides what to do.
class StructuralError : public std::runtime_error {
public:
    StructuralError(const std::string& message, Position position)
        : std::runtime_error(message), position_(position) {}

    auto position() const -> Position { return position_; }

private:
    Position position_;
};

} // namespace pepcheck
