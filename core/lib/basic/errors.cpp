// oasgen/basic/errors.cpp - Exception types implementation
//
#include "oasgen/basic/errors.hpp"

#include <utility>

namespace oasgen
{

namespace
{

std::string describe_chain(const std::vector<Reference> & chain, const Reference & repeated)
{
  std::string out;
  for (const auto & ref : chain) {
    out += ref.to_string();
    out += " -> ";
  }
  out += repeated.to_string();
  return out;
}

std::string describe(const Value & value)
{
  return value.kind() == ValueKind::Scalar ? to_string(value.scalar_kind())
                                           : to_string(value.kind());
}

std::string mismatch_message(
  const Reference & reference, const std::string & expected, const std::string & actual)
{
  return "reference " + reference.to_string() + " doesn't point to " + expected + " (found " +
         actual + ")";
}

}  // namespace

LoadError::LoadError(std::string path, const std::string & message)
: Error("cannot load document '" + path + "': " + message), path_(std::move(path))
{
}

NavigationError::NavigationError(Reference reference, const std::string & message)
: Error(message + " (reference " + reference.to_string() + ")"), reference_(std::move(reference))
{
}

TypeMismatchError::TypeMismatchError(Reference reference, ValueKind expected, ValueKind actual)
: Error(mismatch_message(reference, to_string(expected), to_string(actual))),
  reference_(std::move(reference)),
  expected_(expected),
  actual_(actual)
{
}

TypeMismatchError::TypeMismatchError(
  Reference reference, const std::string & expected, const Value & actual)
: Error(mismatch_message(reference, expected, describe(actual))),
  reference_(std::move(reference)),
  expected_(ValueKind::Scalar),
  actual_(actual.kind())
{
}

ResolutionError::ResolutionError(Reference reference, const std::string & message)
: Error(message), reference_(std::move(reference))
{
}

NotFoundError::NotFoundError(Reference reference)
: ResolutionError(reference, "reference not found: " + reference.to_string())
{
}

CircularReferenceError::CircularReferenceError(Reference reference, std::vector<Reference> chain)
: ResolutionError(reference, "circular reference detected: " + describe_chain(chain, reference)),
  chain_(std::move(chain))
{
}

ReferenceDepthError::ReferenceDepthError(Reference reference, std::size_t max_depth)
: ResolutionError(
    reference, "reference chain deeper than " + std::to_string(max_depth) + " at " +
                 reference.to_string()),
  max_depth_(max_depth)
{
}

}  // namespace oasgen
