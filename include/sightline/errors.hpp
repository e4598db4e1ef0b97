#pragma once
#include <stdexcept>

namespace sightline {

// Base of the conditions an analysis call can raise. None of them is
// retried internally; "no attackers" is always a value, never an exception.
struct AnalysisError : std::runtime_error { using std::runtime_error::runtime_error; };

// Structural invariant violated (e.g. zero or several kings of one color).
struct MalformedBoard : AnalysisError { using AnalysisError::AnalysisError; };

// Query needs a piece on a square that is empty (or otherwise cannot apply).
struct InvalidQuery : AnalysisError { using AnalysisError::AnalysisError; };

// Move references an empty source square, is tagged illegal by the caller,
// or names a special kind that cannot be applied mechanically.
struct InvalidMove : AnalysisError { using AnalysisError::AnalysisError; };

} // namespace sightline
