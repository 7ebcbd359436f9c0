// oasgen/ref/uri.cpp - URI reference helpers implementation
//
#include "oasgen/ref/uri.hpp"

#include <cctype>
#include <optional>
#include <vector>

namespace oasgen::uri
{

namespace
{

struct UriParts
{
  std::optional<std::string> scheme;
  std::optional<std::string> authority;
  std::string path;
  std::optional<std::string> query;
};

bool is_scheme_char(char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '+' || c == '-' || c == '.';
}

UriParts split(std::string_view text)
{
  UriParts parts;

  // scheme ":" must precede any '/', '?' to count as a scheme
  const auto colon = text.find(':');
  if (
    colon != std::string_view::npos && colon > 0 &&
    std::isalpha(static_cast<unsigned char>(text[0])) != 0 &&
    text.find_first_of("/?") > colon) {
    bool valid = true;
    for (std::size_t i = 1; i < colon; ++i) {
      if (!is_scheme_char(text[i])) {
        valid = false;
        break;
      }
    }
    if (valid) {
      parts.scheme = std::string(text.substr(0, colon));
      text.remove_prefix(colon + 1);
    }
  }

  if (text.substr(0, 2) == "//") {
    text.remove_prefix(2);
    const auto end = text.find_first_of("/?");
    parts.authority = std::string(text.substr(0, end));
    text.remove_prefix(end == std::string_view::npos ? text.size() : end);
  }

  const auto question = text.find('?');
  if (question != std::string_view::npos) {
    parts.query = std::string(text.substr(question + 1));
    text = text.substr(0, question);
  }

  parts.path = std::string(text);
  return parts;
}

std::string join(const UriParts & parts)
{
  std::string out;
  if (parts.scheme) {
    out += *parts.scheme;
    out += ':';
  }
  if (parts.authority) {
    out += "//";
    out += *parts.authority;
  }
  out += parts.path;
  if (parts.query) {
    out += '?';
    out += *parts.query;
  }
  return out;
}

/// RFC 3986 5.2.3
std::string merge(const UriParts & base, std::string_view reference_path)
{
  if (base.authority && base.path.empty()) {
    return "/" + std::string(reference_path);
  }
  const auto slash = base.path.rfind('/');
  if (slash == std::string::npos) {
    return std::string(reference_path);
  }
  return base.path.substr(0, slash + 1) + std::string(reference_path);
}

/// RFC 3986 5.2.4, keeping unmatched ".." on relative paths
std::string remove_dot_segments(std::string_view path)
{
  if (path.empty()) {
    return {};
  }

  const bool absolute = path.front() == '/';
  if (absolute) {
    path.remove_prefix(1);
  }

  std::vector<std::string_view> segments;
  bool trailing_slash = false;

  while (true) {
    const auto slash = path.find('/');
    const std::string_view segment = path.substr(0, slash);
    const bool last = slash == std::string_view::npos;

    if (segment == ".") {
      trailing_slash = last;
    } else if (segment == "..") {
      if (!segments.empty() && segments.back() != "..") {
        segments.pop_back();
      } else if (!absolute) {
        segments.push_back(segment);
      }
      trailing_slash = last;
    } else {
      segments.push_back(segment);
      trailing_slash = false;
    }

    if (last) {
      break;
    }
    path.remove_prefix(slash + 1);
  }

  std::string out = absolute ? "/" : "";
  for (std::size_t i = 0; i < segments.size(); ++i) {
    if (i > 0) {
      out += '/';
    }
    out += segments[i];
  }
  if (trailing_slash && !segments.empty()) {
    out += '/';
  }
  return out;
}

int hex_value(char c)
{
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string resolve(std::string_view base, std::string_view reference)
{
  const UriParts r = split(reference);
  const UriParts b = split(base);
  UriParts t;

  if (r.scheme) {
    t.scheme = r.scheme;
    t.authority = r.authority;
    t.path = remove_dot_segments(r.path);
    t.query = r.query;
    return join(t);
  }

  t.scheme = b.scheme;
  if (r.authority) {
    t.authority = r.authority;
    t.path = remove_dot_segments(r.path);
    t.query = r.query;
    return join(t);
  }

  t.authority = b.authority;
  if (r.path.empty()) {
    t.path = b.path;
    t.query = r.query ? r.query : b.query;
  } else {
    if (r.path.front() == '/') {
      t.path = remove_dot_segments(r.path);
    } else {
      t.path = remove_dot_segments(merge(b, r.path));
    }
    t.query = r.query;
  }
  return join(t);
}

std::string percent_decode(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      const int hi = hex_value(text[i + 1]);
      const int lo = hex_value(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
        continue;
      }
    }
    out += text[i];
  }
  return out;
}

std::string percent_encode_segment(std::string_view segment)
{
  static constexpr const char * k_hex = "0123456789ABCDEF";

  std::string out;
  out.reserve(segment.size());
  for (const char c : segment) {
    const auto byte = static_cast<unsigned char>(c);
    if (c == '%' || c == '/' || c == '#' || c == '?' || byte < 0x20 || byte == ' ') {
      out += '%';
      out += k_hex[byte >> 4];
      out += k_hex[byte & 0x0F];
    } else {
      out += c;
    }
  }
  return out;
}

}  // namespace oasgen::uri
