#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace gcx {

// Snapshot or document that cannot be encoded (out-of-grid cells, bad speeds,
// incomplete PDDL documents, out-of-range transition queries).
class EncodingError : public std::runtime_error {
public:
  explicit EncodingError(const std::string& what) : std::runtime_error(what) {}
};

// Planner output line that matches no known action shape.
class PlanParseError : public std::runtime_error {
public:
  PlanParseError(const std::string& what, std::string line)
    : std::runtime_error(what + ": " + line), line_(std::move(line)) {}
  const std::string& line() const { return line_; }
private:
  std::string line_;
};

} // namespace gcx
