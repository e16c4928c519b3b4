#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>

#include "bitspan.hpp"

// tests/descriptor/roundtrip.cpp
//
// decode(encode(a, s, n)) == (a, s, n) for every start bit and a spread of
// addresses and counts, including the largest representable count.

int main() {
  using namespace bitspan;

  alignas(8) std::array<std::byte, 64> buf{};

  const std::size_t counts[] = {
    0, 1, 2, 7, 8, 9, 63, 64, 65, 1000,
    std::size_t(1) << 20,
    span_descriptor::max_bits - 1u,
    span_descriptor::max_bits
  };

  for (std::size_t off = 0; off < buf.size(); ++off) {
    std::byte* a = buf.data() + off;
    for (unsigned s = 0; s < 8; ++s) {
      for (std::size_t n : counts) {
        const span_descriptor d = encode(a, s, n);
        const decoded_span got = decode(d);
        assert(got.address == a);
        assert(got.start_bit == s);
        assert(got.bit_count == n);
        assert(got == (decoded_span{ a, s, n }));
        assert(!is_empty_sentinel(d));

        // individual projections agree with decode()
        assert(d.address() == a);
        assert(d.start_bit() == s);
        assert(d.bit_count() == n);
      }
    }
  }

  // word layout: address in word 0, (count << 3) | start in word 1
  {
    const span_descriptor d = encode(buf.data() + 3, 5, 42);
    assert(d.word0() == reinterpret_cast<std::uintptr_t>(buf.data() + 3));
    assert(d.word1() == ((std::size_t(42) << 3) | 5u));
  }

  // try_encode agrees with encode on valid input
  {
    auto d = try_encode(buf.data() + 7, 7, 12345);
    assert(d.has_value());
    assert(*d == encode(buf.data() + 7, 7, 12345));
  }

  static_assert(span_descriptor::max_bits == (std::numeric_limits<std::size_t>::max() >> 3));
  return 0;
}
