#pragma once
#include <bursar/schema/primitives.hpp>
#include <optional>
#include <span>

namespace bursar::schema::encoding {

// The codec is chosen at build time through the tag; persistent backends
// name the tag they were written against.
template <typename Library>
struct encoder {
  template <typename T>
  bursar::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const bursar::schema::bytes_view_t& bytes);
};

}  // namespace bursar::schema::encoding
