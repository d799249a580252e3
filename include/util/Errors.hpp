#pragma once
#include <stdexcept>
#include <string>

namespace vigil {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Bad interval or interrupted sampling wait.
class SamplingError : public Error {
public:
  using Error::Error;
};

// A counter source could not be read. Also a SamplingError, so callers
// of DeltaSampler::sample can treat every failed sample uniformly.
class SourceUnavailable : public SamplingError {
public:
  using SamplingError::SamplingError;
};

// Rejected configuration value (never coerced).
class InvalidConfig : public Error {
public:
  using Error::Error;
};

} // namespace vigil
