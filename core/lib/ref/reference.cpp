// oasgen/ref/reference.cpp - Document coordinate implementation
//
#include "oasgen/ref/reference.hpp"

#include "oasgen/ref/uri.hpp"

namespace oasgen
{

Reference Reference::child(std::string_view segment) const
{
  std::vector<std::string> segments = segments_;
  segments.emplace_back(segment);
  return Reference(document_path_, std::move(segments));
}

Reference Reference::child(const std::vector<std::string> & segments) const
{
  std::vector<std::string> combined = segments_;
  combined.insert(combined.end(), segments.begin(), segments.end());
  return Reference(document_path_, std::move(combined));
}

std::optional<Reference> Reference::parent() const
{
  if (segments_.empty()) {
    return std::nullopt;
  }
  return Reference(
    document_path_, std::vector<std::string>(segments_.begin(), segments_.end() - 1));
}

Reference Reference::resolve(std::string_view reference) const
{
  std::string_view path_part = reference;
  std::string_view pointer = "/";

  const auto hash = reference.find('#');
  if (hash != std::string_view::npos) {
    path_part = reference.substr(0, hash);
    pointer = reference.substr(hash + 1);
  }

  std::string target_document =
    path_part.empty() ? document_path_ : uri::resolve(document_path_, path_part);

  std::vector<std::string> segments;
  while (!pointer.empty()) {
    const auto slash = pointer.find('/');
    const std::string_view segment = pointer.substr(0, slash);
    if (!segment.empty()) {
      segments.push_back(uri::percent_decode(segment));
    }
    if (slash == std::string_view::npos) {
      break;
    }
    pointer.remove_prefix(slash + 1);
  }

  return Reference(std::move(target_document), std::move(segments));
}

bool Reference::is_ancestor_of(const Reference & other) const
{
  if (document_path_ != other.document_path_ || segments_.size() >= other.segments_.size()) {
    return false;
  }
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    if (segments_[i] != other.segments_[i]) {
      return false;
    }
  }
  return true;
}

std::string Reference::to_string() const
{
  std::string out = document_path_;
  out += '#';
  for (const auto & segment : segments_) {
    out += '/';
    out += segment;
  }
  return out;
}

std::string Reference::to_pointer() const
{
  if (segments_.empty()) {
    return "/";
  }
  std::string out;
  for (const auto & segment : segments_) {
    out += '/';
    // '~' is escaped too so the pointer is never read as a JSON Pointer escape
    for (const char c : uri::percent_encode_segment(segment)) {
      if (c == '~') {
        out += "%7E";
      } else {
        out += c;
      }
    }
  }
  return out;
}

std::size_t Reference::hash() const noexcept
{
  // boost::hash_combine mixing
  std::size_t seed = std::hash<std::string>{}(document_path_);
  for (const auto & segment : segments_) {
    seed ^= std::hash<std::string>{}(segment) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
  }
  seed ^= segments_.size() + 0x9e3779b9 + (seed << 6) + (seed >> 2);
  return seed;
}

std::ostream & operator<<(std::ostream & os, const Reference & reference)
{
  return os << reference.to_string();
}

}  // namespace oasgen
