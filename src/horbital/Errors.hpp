#pragma once
#include <stdexcept>
#include <string>

//! Error kinds reported to the caller. All are deterministic input errors
namespace horbital {

//! Base class: every horbital failure carries a human-readable reason
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &reason) : std::runtime_error(reason) {}
  //! Short name of the error kind, printed in the ERROR banner
  virtual const char *kind() const noexcept { return "Error"; }
};

//! n, l, m outside their allowed domains
class InvalidQuantumNumberError : public Error {
public:
  using Error::Error;
  const char *kind() const noexcept override {
    return "InvalidQuantumNumberError";
  }
};

//! Malformed plane/value/range/resolution
class InvalidSliceSpecError : public Error {
public:
  using Error::Error;
  const char *kind() const noexcept override {
    return "InvalidSliceSpecError";
  }
};

//! Colour scale not valid for the field (e.g., log of a signed field)
class UnsupportedScaleError : public Error {
public:
  using Error::Error;
  const char *kind() const noexcept override {
    return "UnsupportedScaleError";
  }
};

//! Mutually exclusive options requested together
class ConflictingOptionError : public Error {
public:
  using Error::Error;
  const char *kind() const noexcept override {
    return "ConflictingOptionError";
  }
};

//! Unknown name for an enumerated option, or unparsable value
class InvalidOptionError : public Error {
public:
  using Error::Error;
  const char *kind() const noexcept override { return "InvalidOptionError"; }
};

//! A GSL routine reported failure
class NumericalError : public Error {
public:
  using Error::Error;
  const char *kind() const noexcept override { return "NumericalError"; }
};

} // namespace horbital
