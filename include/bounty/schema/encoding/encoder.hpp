#pragma once
#include <bounty/schema/primitives.hpp>
#include <optional>
#include <span>

namespace bounty::schema::encoding {

// Encoding backend is a build-time choice expressed through the tag type.
template <typename Library>
struct encoder {
  template <typename T>
  bounty::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bounty::schema::bytes_t& out);

  template <typename T>
  T decode(const bounty::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bounty::schema::bytes_view_t& bytes);
};

}  // namespace bounty::schema::encoding
