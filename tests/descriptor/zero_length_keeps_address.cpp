#include <cassert>
#include <cstddef>
#include <cstdint>

#include "bitspan.hpp"

// tests/descriptor/zero_length_keeps_address.cpp
//
// A present zero-length span keeps its address (and start bit), so a zero-length
// view into owned storage is never confused with "no storage".

int main() {
  using namespace bitspan;

  alignas(4) std::uint32_t words[3]{};
  auto s = make_span(words, 3);

  for (std::size_t at = 0; at <= s.size(); at += 13) {
    auto z = s.subspan(at, 0);
    assert(z.empty());
    assert(!z.is_null());

    const std::size_t elem = at / 32u;
    const unsigned head = static_cast<unsigned>(at % 32u);
    if (at < s.size()) {
      assert(z.element_address() == words + elem);
      assert(z.head() == head);
    }

    const decoded_span d = z.descriptor().decode();
    assert(d.bit_count == 0);
    assert(d.start_bit == (head & 7u));
    assert(d.address == reinterpret_cast<std::byte*>(words + elem) + (head >> 3));

    // an empty present span splits to Empty and has no effect on bulk ops
    assert(z.domain().is_empty());
    assert(z.count_ones() == 0);
    z.fill(true);
  }

  for (auto w : words) assert(w == 0u);

  // splitting at either end leaves one present empty half
  auto [lo, hi] = s.split_at(0);
  assert(lo.empty() && !lo.is_null());
  assert(hi.size() == 96);
  auto [lo2, hi2] = s.split_at(96);
  assert(lo2.size() == 96);
  assert(hi2.empty() && !hi2.is_null());

  return 0;
}
