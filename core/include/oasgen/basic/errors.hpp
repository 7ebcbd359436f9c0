// oasgen/basic/errors.hpp - Exception types raised by loading and resolution
//
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "oasgen/basic/value.hpp"
#include "oasgen/ref/reference.hpp"

namespace oasgen
{

/**
 * Base class for every error raised by the resolution core.
 */
class Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * A document could not be read or parsed, or its extension is not supported.
 */
class LoadError : public Error
{
public:
  LoadError(std::string path, const std::string & message);

  [[nodiscard]] const std::string & path() const noexcept { return path_; }

private:
  std::string path_;
};

/**
 * A segment path cannot be walked: descending into a scalar, or a
 * non-numeric index into a sequence.
 */
class NavigationError : public Error
{
public:
  NavigationError(Reference reference, const std::string & message);

  [[nodiscard]] const Reference & reference() const noexcept { return reference_; }

private:
  Reference reference_;
};

/**
 * A projection asked for a kind the resolved value does not have.
 */
class TypeMismatchError : public Error
{
public:
  TypeMismatchError(Reference reference, ValueKind expected, ValueKind actual);

  /// Scalar projections: expected names the wanted form ("integer", "number")
  /// and scalars found are described by their sub-kind
  TypeMismatchError(Reference reference, const std::string & expected, const Value & actual);

  [[nodiscard]] const Reference & reference() const noexcept { return reference_; }
  [[nodiscard]] ValueKind expected() const noexcept { return expected_; }
  [[nodiscard]] ValueKind actual() const noexcept { return actual_; }

private:
  Reference reference_;
  ValueKind expected_;
  ValueKind actual_;
};

/**
 * Base class for failures that carry the reference being resolved.
 */
class ResolutionError : public Error
{
public:
  ResolutionError(Reference reference, const std::string & message);

  [[nodiscard]] const Reference & reference() const noexcept { return reference_; }

private:
  Reference reference_;
};

/// A required coordinate has no value.
class NotFoundError : public ResolutionError
{
public:
  explicit NotFoundError(Reference reference);
};

/// An indirection chain revisits a coordinate it already passed through.
class CircularReferenceError : public ResolutionError
{
public:
  CircularReferenceError(Reference reference, std::vector<Reference> chain);

  /// Coordinates on the chain, in the order they were followed
  [[nodiscard]] const std::vector<Reference> & chain() const noexcept { return chain_; }

private:
  std::vector<Reference> chain_;
};

/// An indirection chain is longer than the configured limit.
class ReferenceDepthError : public ResolutionError
{
public:
  ReferenceDepthError(Reference reference, std::size_t max_depth);

  [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }

private:
  std::size_t max_depth_;
};

}  // namespace oasgen
