#include <atomic>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "bitspan.hpp"

// tests/contract/layout_and_platform.cpp
//
// API-surface and layout lock-down, mostly compile time:
//  - descriptor and handles are exactly two words and trivially copyable
//  - storage elements are the unsigned 8/16/32/64-bit integers, never bool
//  - the index vocabulary (bit_idx / bit_pos / bit_sel / bit_mask) agrees with
//    the order helpers
//  - atomic access is lock-free and needs only element alignment

namespace contract_layout {

using namespace bitspan;

static_assert(sizeof(span_descriptor) == 2 * sizeof(void*));
static_assert(alignof(span_descriptor) == alignof(void*));
static_assert(std::is_trivially_copyable_v<span_descriptor>);
static_assert(std::is_trivially_copyable_v<bit_span<std::uint32_t, msb0, atomic_access>>);
static_assert(sizeof(bit_cspan<std::uint16_t>) == sizeof(span_descriptor));
static_assert(span_descriptor::max_bits == (SIZE_MAX >> 3));

static_assert(is_storage_v<std::uint8_t>);
static_assert(is_storage_v<std::uint16_t>);
static_assert(is_storage_v<std::uint32_t>);
static_assert(is_storage_v<std::uint64_t> == (sizeof(void*) >= 8));
static_assert(is_storage_v<std::uint32_t const>);
static_assert(!is_storage_v<bool>);
static_assert(!is_storage_v<char8_t>);
static_assert(!is_storage_v<std::int32_t>);
static_assert(!is_storage_v<float>);
static_assert(max_element_bits == 8 * sizeof(void*));

static_assert(is_bit_order_v<lsb0> && is_bit_order_v<msb0>);
static_assert(std::is_same_v<local_bits, lsb0>);
static_assert(!is_bit_order_v<int>);
static_assert(!is_valid_order<int>());

static_assert(is_atomic_access_v<atomic_access>);
static_assert(!is_atomic_access_v<plain_access>);
static_assert(std::is_same_v<bit_span<std::uint8_t>::access_type, plain_access>);
static_assert(std::is_same_v<bit_span<std::uint8_t>::order_type, lsb0>);

// index vocabulary
static_assert(order_traits<lsb0>::at<std::uint8_t>(bit_idx<std::uint8_t>(3)) == bit_pos<std::uint8_t>(3));
static_assert(order_traits<msb0>::at<std::uint8_t>(bit_idx<std::uint8_t>(3)) == bit_pos<std::uint8_t>(4));
static_assert(order_traits<msb0>::select<std::uint16_t>(bit_idx<std::uint16_t>(0)).value() == 0x8000u);
static_assert(order_traits<lsb0>::mask<std::uint8_t>(2, 3).value() == 0b0001'1100u);
static_assert(order_traits<msb0>::mask<std::uint8_t>(2, 3).value() == 0b0011'1000u);
static_assert(order_traits<msb0>::mask<std::uint32_t>(0, 32).value() == 0xFFFF'FFFFu);
static_assert(order_traits<lsb0>::mask<std::uint8_t>(5, 0).value() == 0u);
static_assert(order_traits<msb0>::shift<std::uint8_t>(2, 3) == 3);
static_assert((bit_mask<std::uint8_t>(0x10) | bit_sel<std::uint8_t>(bit_pos<std::uint8_t>(0))).value() == 0x11);
static_assert(bit_mask<std::uint8_t>(0x11).count() == 2);
static_assert(bit_mask<std::uint8_t>(0x11).test(bit_sel<std::uint8_t>(bit_pos<std::uint8_t>(4))));
static_assert(!bit_mask<std::uint8_t>(0x11).test(bit_sel<std::uint8_t>(bit_pos<std::uint8_t>(1))));

static_assert(physical_position<msb0>(0, 64) == 63);
static_assert(logical_index<msb0>(63, 64) == 0);
static_assert(physical_position<lsb0>(5, 16) == 5);

} // namespace contract_layout

int main() {
  using namespace bitspan;

  // atomic_access needs no extra alignment beyond the element's own
  static_assert(std::atomic_ref<std::uint8_t>::is_always_lock_free);
  static_assert(std::atomic_ref<std::uint16_t>::is_always_lock_free);
  static_assert(std::atomic_ref<std::uint32_t>::is_always_lock_free);
  static_assert(std::atomic_ref<std::uint16_t>::required_alignment == alignof(std::uint16_t));
  static_assert(std::atomic_ref<std::uint32_t>::required_alignment == alignof(std::uint32_t));

  // the descriptor's raw words
  alignas(4) std::uint32_t e[2]{};
  const span_descriptor d = encode(reinterpret_cast<std::byte*>(e) + 1, 6, 21);
  assert(d.word0() == reinterpret_cast<std::uintptr_t>(e) + 1u);
  assert(d.word1() == ((std::size_t(21) << 3) | 6u));

  // the handle stores nothing but that descriptor
  const bit_span<std::uint32_t> s(d);
  assert(s.head() == 14);
  assert(s.element_address() == e);
  assert(s.size() == 21);

  return 0;
}
