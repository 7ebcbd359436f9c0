// oasgen/ref/uri.hpp - URI reference helpers
//
// Minimal RFC 3986 support: resolving a relative reference against a base
// and percent-decoding. Document paths are URI references without a
// fragment component.
//
#pragma once

#include <string>
#include <string_view>

namespace oasgen::uri
{

/**
 * Resolve `reference` against `base` (RFC 3986 section 5.2).
 *
 * Dot segments are removed from the merged path. When the base is a
 * relative path, ".." segments that would climb above it are kept, so
 * resolving "../c.yaml" against "b.yaml" yields "../c.yaml".
 */
[[nodiscard]] std::string resolve(std::string_view base, std::string_view reference);

/// Decode %XX escapes. Malformed escapes are kept verbatim.
[[nodiscard]] std::string percent_decode(std::string_view text);

/// Escape characters that would change the meaning of a pointer segment
[[nodiscard]] std::string percent_encode_segment(std::string_view segment);

}  // namespace oasgen::uri
