#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>

#include "bitspan.hpp"
#include "support/ref_model.hpp"

// tests/span/copy_from.cpp
//
// copy_from moves exactly size() bits from a source span of the same element
// type and order. Same-head pairs go element by element through the two
// domains; any other pair goes through field-width chunks, which must keep
// logical bit positions for descending orders too. Bits outside the
// destination stay as they were.

namespace ref = bitspan_test::ref;

template <typename T, typename O>
static void check() {
  using namespace bitspan;
  constexpr unsigned W = bits_of<T>;
  constexpr std::size_t N = 6;
  constexpr std::size_t total = N * W;
  std::uint64_t seed = 0xABCDu + W;

  T src[N];
  T dst[N];
  T before[N];

  const std::size_t lens[] = { 0, 1, W - 1, W, W + 1, 2 * W + 3, 64, 65, 3 * W + 5 };
  for (std::size_t so = 0; so < W + 3; ++so) {
    for (std::size_t dof : { std::size_t(0), std::size_t(1), so, std::size_t(W - 1), std::size_t(W + 2) }) {
      for (std::size_t len : lens) {
        if (so + len > total || dof + len > total) continue;

        for (std::size_t i = 0; i < N; ++i) {
          src[i] = static_cast<T>(ref::splitmix(seed));
          dst[i] = static_cast<T>(ref::splitmix(seed));
        }
        std::memcpy(before, dst, sizeof(dst));

        auto from = make_span<O>(static_cast<T const*>(src), N, so, len);
        auto to = make_span<O>(dst, N, dof, len);
        to.copy_from(from);

        for (std::size_t i = 0; i < total; ++i) {
          const bool inside = i >= dof && i < dof + len;
          const bool want = inside ? ref::read_bit<O>(src, so + (i - dof)) : ref::read_bit<O>(before, i);
          assert(ref::read_bit<O>(dst, i) == want);
        }
      }
    }
  }
}

int main() {
  using namespace bitspan;
  check<std::uint8_t, lsb0>();
  check<std::uint8_t, msb0>();
  check<std::uint16_t, lsb0>();
  check<std::uint16_t, msb0>();
  check<std::uint32_t, lsb0>();
  check<std::uint32_t, msb0>();
  check<std::uint64_t, lsb0>();
  check<std::uint64_t, msb0>();

  // msb0, different heads: logical bit i of the source lands on logical bit
  // i of the destination, not on the mirrored physical position
  {
    const std::uint8_t a[2]{ 0x80, 0x00 };   // logical bit 0 set
    std::uint8_t b[2]{};
    auto from = make_span<msb0>(a, 2, 0, 8);
    auto to = make_span<msb0>(b, 2, 4, 8);
    to.copy_from(from);
    assert(to[0] && to.count_ones() == 1);
    assert(b[0] == 0x08 && b[1] == 0x00);    // logical 4 = physical 3

    const std::uint8_t c[2]{ 0xC1, 0x80 };   // logical 0, 1, 7, 8
    auto from2 = make_span<msb0>(c, 2, 0, 12);
    auto to2 = make_span<msb0>(b, 2, 3, 12);
    to2.copy_from(from2);
    for (std::size_t i = 0; i < 12; ++i) assert(to2[i] == from2[i]);
    assert(b[0] == 0x18 && b[1] == 0x30);    // logical 3, 4, 10, 11
  }

  // mutable source, atomic destination
  {
    std::uint16_t a[2]{ 0x1234u, 0x5678u };
    std::uint16_t b[2]{ 0xFFFFu, 0xFFFFu };
    auto from = make_span(a, 2, 4, 24);
    auto to = make_span<lsb0, atomic_access>(b, 2, 4, 24);
    to.copy_from(from);
    assert(b[0] == 0x123Fu);
    assert(b[1] == 0xF678u);
    assert(to.load_le() == from.load_le());
  }

  return 0;
}
