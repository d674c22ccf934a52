#pragma once

// cordon/classifier.hpp: Result/Error Classifier.
//
// Pure mapping from a validator or executor result to the ExecutionOutcome
// the caller sees. No retries, no I/O, no engine state.

#include <string>

#include "cordon/types.hpp"

namespace cordon {

// A failing ValidationResult becomes ValidationRejected with its violations
// in order. Callers only classify failing results.
ExecutionOutcome classify(const ValidationResult& validation);

// normal_completion with an artifact -> Success; without one ->
// RuntimeFailure("missing or invalid result"). uncaught_error ->
// RuntimeFailure(message); timed_out -> Timeout.
ExecutionOutcome classify(const RawOutcome& raw);

/**
 * @brief One-line, human-readable summary of an outcome.
 * @details Used as the feedback line for a regeneration attempt and as the
 *          terminal failure message. Carries the error type, message and
 *          line; never host-side detail.
 */
std::string summarize(const ExecutionOutcome& outcome);

}  // namespace cordon
