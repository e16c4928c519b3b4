#include <cassert>
#include <cstddef>
#include <cstdint>

#include "bitspan.hpp"

// tests/domain/element_aligned_is_whole_run.cpp
//
// A span starting and ending on element boundaries is a Major domain with no
// head and no tail. In particular (start_bit = 0, bit_count = width) is one
// whole element, not a Minor region.

template <typename T>
static void check() {
  using namespace bitspan;
  constexpr unsigned W = bits_of<T>;
  alignas(8) T elems[5]{};

  // exactly one element
  {
    const domain<T> d = split<T>(reinterpret_cast<std::byte*>(elems), 0, W);
    assert(d.kind == domain_kind::major);
    assert(!d.head);
    assert(!d.tail);
    assert(d.body.data == elems);
    assert(d.body.count == 1);
    assert(d.bit_count() == W);
  }

  // several elements, starting at the second one
  for (std::size_t n = 1; n <= 4; ++n) {
    const domain<T> d = split<T>(reinterpret_cast<std::byte*>(elems + 1), 0, n * W);
    assert(d.is_major());
    assert(!d.head && !d.tail);
    assert(d.body.data == elems + 1);
    assert(d.body.count == n);
  }

  // same through the handle
  auto s = make_span(elems, 5);
  const auto d = s.subspan(W, 2 * W).domain();
  assert(d.is_major() && !d.head && !d.tail);
  assert(d.body.data == elems + 1 && d.body.count == 2);
}

int main() {
  check<std::uint8_t>();
  check<std::uint16_t>();
  check<std::uint32_t>();
  check<std::uint64_t>();
  return 0;
}
