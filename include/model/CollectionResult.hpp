#pragma once
#include <string>
#include <utility>
#include <variant>
#include "model/Snapshot.hpp"

namespace hostscope::model {

// Cycle-level failure: which collector gave up and why
struct CollectionError {
  std::string category; // platform | network | hardware | process
  std::string cause;

  [[nodiscard]] std::string describe() const { return category + ": " + cause; }
};

// Outcome of one collection cycle: a complete Snapshot or a failure, never both
class CollectionResult {
public:
  static CollectionResult success(SnapshotPtr snapshot) { return CollectionResult(std::move(snapshot)); }
  static CollectionResult failure(std::string category, std::string cause) {
    return CollectionResult(CollectionError{std::move(category), std::move(cause)});
  }

  [[nodiscard]] bool ok() const { return std::holds_alternative<SnapshotPtr>(value_); }
  explicit operator bool() const { return ok(); }

  // Precondition: ok()
  [[nodiscard]] const SnapshotPtr& snapshot() const { return std::get<SnapshotPtr>(value_); }
  // Precondition: !ok()
  [[nodiscard]] const CollectionError& error() const { return std::get<CollectionError>(value_); }

private:
  explicit CollectionResult(SnapshotPtr s) : value_(std::move(s)) {}
  explicit CollectionResult(CollectionError e) : value_(std::move(e)) {}

  std::variant<SnapshotPtr, CollectionError> value_;
};

} // namespace hostscope::model
