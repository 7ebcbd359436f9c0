// oasgen/ref/reference.hpp - Document coordinates
//
// A Reference names a location inside the document graph: a document path
// plus an ordered list of path segments. It is the identity of a fragment,
// independent of the value stored there.
//
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace oasgen
{

/**
 * Immutable coordinate (document path, segment path).
 *
 * An empty segment path denotes the document root. Two references are equal
 * iff both fields are equal.
 */
class Reference
{
public:
  Reference(std::string document_path, std::vector<std::string> segments)
  : document_path_(std::move(document_path)), segments_(std::move(segments))
  {
  }

  /// Root coordinate of a document
  [[nodiscard]] static Reference root(std::string document_path)
  {
    return Reference(std::move(document_path), {});
  }

  [[nodiscard]] const std::string & document_path() const noexcept { return document_path_; }
  [[nodiscard]] const std::vector<std::string> & segments() const noexcept { return segments_; }

  [[nodiscard]] bool is_root() const noexcept { return segments_.empty(); }

  // ===========================================================================
  // Derivation
  // ===========================================================================

  /// Root coordinate of this reference's document
  [[nodiscard]] Reference root() const { return Reference(document_path_, {}); }

  [[nodiscard]] Reference child(std::string_view segment) const;
  [[nodiscard]] Reference child(const std::vector<std::string> & segments) const;

  /// Drops the last segment; nullopt at the document root
  [[nodiscard]] std::optional<Reference> parent() const;

  /**
   * Resolve a reference string against this coordinate.
   *
   * The string has the form `<path>#<pointer>`; both parts are optional.
   * An empty path targets this document, otherwise the path is resolved
   * against this document path with URI rules. Pointer segments are split
   * on '/', empty ones dropped, and percent-decoded.
   */
  [[nodiscard]] Reference resolve(std::string_view reference) const;

  /// Same document and other's segments strictly extend this one's
  [[nodiscard]] bool is_ancestor_of(const Reference & other) const;

  // ===========================================================================
  // Formatting
  // ===========================================================================

  /// "<document>#/<seg>/<seg>", for diagnostics
  [[nodiscard]] std::string to_string() const;

  /// Pointer form of the segment path, escaped so resolve() reads it back
  [[nodiscard]] std::string to_pointer() const;

  [[nodiscard]] bool operator==(const Reference & other) const
  {
    return document_path_ == other.document_path_ && segments_ == other.segments_;
  }
  [[nodiscard]] bool operator!=(const Reference & other) const { return !(*this == other); }

  [[nodiscard]] std::size_t hash() const noexcept;

private:
  std::string document_path_;
  std::vector<std::string> segments_;
};

std::ostream & operator<<(std::ostream & os, const Reference & reference);

}  // namespace oasgen

namespace std
{
template <>
struct hash<oasgen::Reference>
{
  size_t operator()(const oasgen::Reference & reference) const noexcept
  {
    return reference.hash();
  }
};
}  // namespace std
