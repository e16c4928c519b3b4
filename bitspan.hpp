#pragma once
/*
  bitspan.hpp - single-header, non-owning bit-addressable views over byte memory.

  Goal: Treat an arbitrary run of bits (starting mid-byte, spanning many storage
  elements) as an indexable, sliceable, bulk-accessible region, while every real
  memory access still happens at storage-element granularity. A view costs exactly
  two machine words, the same as a (pointer, length) slice.

  Layers, leaves first:
    - bit orders      : logical index <-> physical bit position inside an element
    - span_descriptor : (address, start bit, bit count) packed into two words
    - split / domain  : span -> { head partial, whole-element run, tail partial }
    - field accessor  : load/store of multi-bit integers over a domain
    - bit_span        : typed handle {descriptor} with compile-time element/order/access

  C++20 required (std::atomic_ref, std::popcount, consteval checks).

  SPDX-License-Identifier: MIT
*/
#if __cplusplus < 202002L
#  error "bitspan requires C++20"
#endif
#ifndef BITSPAN_HPP_INCLUDED
#define BITSPAN_HPP_INCLUDED

#include <atomic>
#include <bit>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>

#if defined(_MSC_VER)
  #include <intrin.h>
  #define BITSPAN_FORCEINLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
  #define BITSPAN_FORCEINLINE __attribute__((always_inline)) inline
#else
  #define BITSPAN_FORCEINLINE inline
#endif

#ifndef BITSPAN_ASSERT
  #include <cassert>
  #define BITSPAN_ASSERT(x) assert(x)
#endif

namespace bitspan {

  // Platform assumptions. The descriptor steals the low 3 bits of its length word
  // for a bit-in-byte offset, which only works with 8-bit bytes and word-sized
  // addresses/lengths.
  static_assert(CHAR_BIT == 8, "bitspan requires 8-bit bytes");
  static_assert(sizeof(std::size_t) == sizeof(void*), "bitspan requires size_t to be pointer-sized");
  static_assert(sizeof(std::uintptr_t) == sizeof(void*), "bitspan requires uintptr_t to be pointer-sized");

  //
  // storage elements
  //
  template <typename T>
  inline constexpr unsigned bits_of = static_cast<unsigned>(sizeof(T) * 8u);

  inline constexpr unsigned max_element_bits = bits_of<void*>;

  template <typename T>
  inline constexpr bool is_storage_v =
    std::is_unsigned_v<std::remove_cv_t<T>> &&
    !std::is_same_v<std::remove_cv_t<T>, bool> &&
    !std::is_same_v<std::remove_cv_t<T>, char8_t> &&
    !std::is_same_v<std::remove_cv_t<T>, char16_t> &&
    !std::is_same_v<std::remove_cv_t<T>, char32_t> &&
    !std::is_same_v<std::remove_cv_t<T>, wchar_t> &&
    (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8) &&
    (bits_of<T> <= max_element_bits);

  //
  // internal utilities
  //
  namespace detail {

    template <typename T>
    using elem_t = std::remove_cv_t<T>;

    template <typename T>
    using byte_ptr_for = std::conditional_t<std::is_const_v<T>, std::byte const*, std::byte*>;

    // Shifts that saturate to zero instead of being UB at >= width.
    template <typename U>
    BITSPAN_FORCEINLINE constexpr U shl(U x, unsigned s) noexcept {
      return (s >= bits_of<U>) ? U(0) : static_cast<U>(x << s);
    }

    template <typename U>
    BITSPAN_FORCEINLINE constexpr U shr(U x, unsigned s) noexcept {
      return (s >= bits_of<U>) ? U(0) : static_cast<U>(x >> s);
    }

    template <typename U>
    BITSPAN_FORCEINLINE constexpr U low_mask(unsigned n) noexcept {
      return (n >= bits_of<U>) ? static_cast<U>(~U(0)) : static_cast<U>((U(1) << n) - 1u);
    }

    template <typename T>
    BITSPAN_FORCEINLINE std::uintptr_t uptr(T* p) noexcept {
      return reinterpret_cast<std::uintptr_t>(p);
    }

    [[noreturn]] BITSPAN_FORCEINLINE void trap_now() noexcept {
    #if defined(_MSC_VER)
      __fastfail(0);
    #elif defined(__GNUC__) || defined(__clang__)
      __builtin_trap();
    #else
      std::abort();
    #endif
    }

  } // namespace detail

  //
  // bit index vocabulary
  //
  // bit_idx : logical index inside an element, 0..width
  // bit_pos : physical position inside an element (shift amount), 0..width
  // bit_sel : one-hot selector mask
  // bit_mask: any-bits mask
  //
  template <typename T>
  class bit_idx {
    unsigned v_{};
  public:
    static constexpr unsigned width = bits_of<T>;

    constexpr bit_idx() noexcept = default;
    constexpr explicit bit_idx(unsigned v) noexcept : v_(v) { BITSPAN_ASSERT(v < width); }

    constexpr unsigned value() const noexcept { return v_; }
    friend constexpr bool operator==(bit_idx, bit_idx) noexcept = default;
  };

  template <typename T>
  class bit_pos {
    unsigned v_{};
  public:
    static constexpr unsigned width = bits_of<T>;

    constexpr bit_pos() noexcept = default;
    constexpr explicit bit_pos(unsigned v) noexcept : v_(v) { BITSPAN_ASSERT(v < width); }

    constexpr unsigned value() const noexcept { return v_; }
    friend constexpr bool operator==(bit_pos, bit_pos) noexcept = default;
  };

  template <typename T>
  class bit_sel {
    detail::elem_t<T> m_{};
  public:
    constexpr bit_sel() noexcept = default;
    constexpr explicit bit_sel(bit_pos<T> p) noexcept
      : m_(static_cast<detail::elem_t<T>>(detail::elem_t<T>(1) << p.value())) {}

    constexpr detail::elem_t<T> value() const noexcept { return m_; }
    friend constexpr bool operator==(bit_sel, bit_sel) noexcept = default;
  };

  template <typename T>
  class bit_mask {
    detail::elem_t<T> m_{};
  public:
    constexpr bit_mask() noexcept = default;
    constexpr explicit bit_mask(detail::elem_t<T> m) noexcept : m_(m) {}

    constexpr detail::elem_t<T> value() const noexcept { return m_; }
    constexpr bool test(bit_sel<T> s) const noexcept { return (m_ & s.value()) != 0; }
    constexpr unsigned count() const noexcept { return static_cast<unsigned>(std::popcount(m_)); }

    friend constexpr bit_mask operator|(bit_mask a, bit_sel<T> b) noexcept {
      return bit_mask(static_cast<detail::elem_t<T>>(a.m_ | b.value()));
    }
    friend constexpr bool operator==(bit_mask, bit_mask) noexcept = default;
  };

  //
  // bit orders
  //
  // A bit order is any type with
  //   static constexpr unsigned physical_position(unsigned index, unsigned width);
  //   static constexpr unsigned logical_index(unsigned position, unsigned width);
  // that are mutual inverses over 0..width for every supported width.
  // Optionally `static constexpr bool contiguous = true;` when every logical run
  // maps to a physically contiguous run (required for field access; verified).
  //
  struct lsb0 {
    static constexpr bool contiguous = true;
    static constexpr unsigned physical_position(unsigned index, unsigned width) noexcept {
      (void)width;
      return index;
    }
    static constexpr unsigned logical_index(unsigned position, unsigned width) noexcept {
      (void)width;
      return position;
    }
  };

  struct msb0 {
    static constexpr bool contiguous = true;
    static constexpr unsigned physical_position(unsigned index, unsigned width) noexcept {
      return width - 1u - index;
    }
    static constexpr unsigned logical_index(unsigned position, unsigned width) noexcept {
      return width - 1u - position;
    }
  };

  using local_bits = lsb0;

  namespace detail {

    template <typename O, typename = void>
    struct has_order_fns : std::false_type {};
    template <typename O>
    struct has_order_fns<O, std::void_t<
      decltype(O::physical_position(0u, 8u)),
      decltype(O::logical_index(0u, 8u))
    >> : std::bool_constant<
      std::is_convertible_v<decltype(O::physical_position(0u, 8u)), unsigned> &&
      std::is_convertible_v<decltype(O::logical_index(0u, 8u)), unsigned>
    > {};

    template <typename O, typename = void>
    struct declares_contiguous : std::false_type {};
    template <typename O>
    struct declares_contiguous<O, std::void_t<decltype(O::contiguous)>> : std::bool_constant<O::contiguous> {};

    template <typename O, unsigned W>
    consteval bool order_is_bijective() {
      std::uint64_t seen = 0;
      for (unsigned i = 0; i < W; ++i) {
        const unsigned p = O::physical_position(i, W);
        if (p >= W) return false;
        if ((seen >> p) & 1u) return false;
        seen |= (std::uint64_t(1) << p);
        if (O::logical_index(p, W) != i) return false;
      }
      return true;
    }

    // Every step of +1 in logical index moves one physical position, always in
    // the same direction.
    template <typename O, unsigned W>
    consteval bool order_is_contiguous() {
      if constexpr (W < 2) {
        return true;
      } else {
        const int dir = int(O::physical_position(1, W)) - int(O::physical_position(0, W));
        if (dir != 1 && dir != -1) return false;
        for (unsigned i = 1; i + 1 < W; ++i) {
          if (int(O::physical_position(i + 1, W)) - int(O::physical_position(i, W)) != dir) return false;
        }
        return true;
      }
    }

  } // namespace detail

  template <typename O>
  inline constexpr bool is_bit_order_v = detail::has_order_fns<O>::value;

  // Checks the bijection law at every supported element width.
  template <typename O>
  consteval bool is_valid_order() {
    if constexpr (!is_bit_order_v<O>) {
      return false;
    } else {
      bool ok = detail::order_is_bijective<O, 8>() &&
                detail::order_is_bijective<O, 16>() &&
                detail::order_is_bijective<O, 32>();
      if constexpr (max_element_bits >= 64) ok = ok && detail::order_is_bijective<O, 64>();
      return ok;
    }
  }

  template <typename O>
  BITSPAN_FORCEINLINE constexpr unsigned physical_position(unsigned index, unsigned width) noexcept {
    static_assert(is_bit_order_v<O>, "O is not a bit order");
    return O::physical_position(index, width);
  }

  template <typename O>
  BITSPAN_FORCEINLINE constexpr unsigned logical_index(unsigned position, unsigned width) noexcept {
    static_assert(is_bit_order_v<O>, "O is not a bit order");
    return O::logical_index(position, width);
  }

  template <typename O>
  struct order_traits {
    static_assert(is_bit_order_v<O>, "O is not a bit order");

    template <typename T>
    static constexpr bool valid_for = detail::order_is_bijective<O, bits_of<T>>();

    template <typename T>
    static constexpr bool contiguous_for =
      detail::declares_contiguous<O>::value && detail::order_is_contiguous<O, bits_of<T>>();

    // Contiguous and counting up from physical 0 (lsb0-like). A contiguous order
    // that is not ascending is descending (msb0-like).
    template <typename T>
    static constexpr bool ascending_for =
      contiguous_for<T> && O::physical_position(0u, bits_of<T>) == 0u;

    template <typename T>
    static constexpr bit_pos<T> at(bit_idx<T> i) noexcept {
      return bit_pos<T>(O::physical_position(i.value(), bits_of<T>));
    }

    template <typename T>
    static constexpr bit_sel<T> select(bit_idx<T> i) noexcept {
      return bit_sel<T>(at<T>(i));
    }

    // Lowest physical position of the logical run [head, head+count). Only
    // meaningful for contiguous orders. count >= 1.
    template <typename T>
    static constexpr unsigned shift(unsigned head, unsigned count) noexcept {
      const unsigned a = O::physical_position(head, bits_of<T>);
      const unsigned b = O::physical_position(head + count - 1u, bits_of<T>);
      return a < b ? a : b;
    }

    // Mask of the logical run [head, head+count); head + count <= width.
    template <typename T>
    static constexpr bit_mask<T> mask(unsigned head, unsigned count) noexcept {
      using E = detail::elem_t<T>;
      if (count == 0) return bit_mask<T>();
      if constexpr (contiguous_for<T>) {
        return bit_mask<T>(detail::shl<E>(detail::low_mask<E>(count), shift<T>(head, count)));
      } else {
        bit_mask<T> m;
        for (unsigned i = head; i < head + count; ++i) m = m | select<T>(bit_idx<T>(i));
        return m;
      }
    }
  };

  //
  // element access policies
  //
  // plain_access : ordinary loads/stores. Two spans touching the same element
  //                must not be mutated concurrently.
  // atomic_access: std::atomic_ref masked updates. Disjoint bits of one element
  //                may be mutated concurrently. Relaxed ordering.
  //
  struct plain_access {};
  struct atomic_access {};

  namespace detail {

    template <typename Access>
    struct element_ops;

    template <>
    struct element_ops<plain_access> {
      template <typename U>
      static BITSPAN_FORCEINLINE U load(U const* p) noexcept { return *p; }
      template <typename U>
      static BITSPAN_FORCEINLINE void store(U* p, U v) noexcept { *p = v; }
      template <typename U>
      static BITSPAN_FORCEINLINE void set_bits(U* p, U m) noexcept { *p = static_cast<U>(*p | m); }
      template <typename U>
      static BITSPAN_FORCEINLINE void clear_bits(U* p, U m) noexcept { *p = static_cast<U>(*p & ~m); }
      template <typename U>
      static BITSPAN_FORCEINLINE void flip_bits(U* p, U m) noexcept { *p = static_cast<U>(*p ^ m); }
      // bits of v under m replace the element's bits under m
      template <typename U>
      static BITSPAN_FORCEINLINE void insert(U* p, U m, U v) noexcept {
        *p = static_cast<U>((*p & ~m) | (v & m));
      }
    };

    template <>
    struct element_ops<atomic_access> {
      // atomic_ref needs a non-const referent even for loads; the object is not
      // modified, but it must not be a const object (it may live in read-only
      // pages, where an atomic load can fault). make_span refuses const storage
      // for atomic_access; read-only atomic spans come from as_const().
      template <typename U>
      static BITSPAN_FORCEINLINE U load(U const* p) noexcept {
        return std::atomic_ref<U>(*const_cast<U*>(p)).load(std::memory_order_relaxed);
      }
      template <typename U>
      static BITSPAN_FORCEINLINE void store(U* p, U v) noexcept {
        std::atomic_ref<U>(*p).store(v, std::memory_order_relaxed);
      }
      template <typename U>
      static BITSPAN_FORCEINLINE void set_bits(U* p, U m) noexcept {
        std::atomic_ref<U>(*p).fetch_or(m, std::memory_order_relaxed);
      }
      template <typename U>
      static BITSPAN_FORCEINLINE void clear_bits(U* p, U m) noexcept {
        std::atomic_ref<U>(*p).fetch_and(static_cast<U>(~m), std::memory_order_relaxed);
      }
      template <typename U>
      static BITSPAN_FORCEINLINE void flip_bits(U* p, U m) noexcept {
        std::atomic_ref<U>(*p).fetch_xor(m, std::memory_order_relaxed);
      }
      template <typename U>
      static BITSPAN_FORCEINLINE void insert(U* p, U m, U v) noexcept {
        std::atomic_ref<U> ref(*p);
        U cur = ref.load(std::memory_order_relaxed);
        while (!ref.compare_exchange_weak(cur, static_cast<U>((cur & ~m) | (v & m)),
                                          std::memory_order_relaxed)) {
        }
      }
    };

  } // namespace detail

  template <typename Access>
  inline constexpr bool is_atomic_access_v = std::is_same_v<Access, atomic_access>;

  //
  // span descriptor
  //
  // word 1: address of the byte (inside the first element) holding the first bit
  // word 2: (bit_count << 3) | start_bit
  //
  // All-zero is the "absent" sentinel. encode() never produces it: the address
  // must be non-null, so a present zero-length span still carries its address.
  //
  struct decoded_span {
    std::byte* address{};
    unsigned start_bit{};
    std::size_t bit_count{};

    friend constexpr bool operator==(decoded_span const&, decoded_span const&) noexcept = default;
  };

  class span_descriptor {
    std::uintptr_t addr_{};
    std::size_t meta_{};

    constexpr span_descriptor(std::uintptr_t a, std::size_t m) noexcept : addr_(a), meta_(m) {}
  public:
    static constexpr unsigned start_bits = 3;
    static constexpr std::size_t start_mask = (std::size_t(1) << start_bits) - 1u;
    static constexpr std::size_t max_bits = std::numeric_limits<std::size_t>::max() >> start_bits;

    constexpr span_descriptor() noexcept = default;

    static constexpr span_descriptor none() noexcept { return span_descriptor(); }

    static constexpr bool fits(void const* address, unsigned start_bit, std::size_t bit_count) noexcept {
      return address != nullptr && start_bit < 8u && bit_count <= max_bits;
    }

    static std::optional<span_descriptor> try_encode(void const* address, unsigned start_bit,
                                                     std::size_t bit_count) noexcept {
      if (!fits(address, start_bit, bit_count)) return std::nullopt;
      return span_descriptor(detail::uptr(address), (bit_count << start_bits) | start_bit);
    }

    // Rejects out-of-capacity input through BITSPAN_ASSERT, then traps even when
    // assertions are compiled out.
    static span_descriptor encode(void const* address, unsigned start_bit, std::size_t bit_count) noexcept {
      const bool ok = fits(address, start_bit, bit_count);
      BITSPAN_ASSERT(ok && "span_descriptor::encode: input exceeds descriptor capacity");
      if (!ok) detail::trap_now();
      return span_descriptor(detail::uptr(address), (bit_count << start_bits) | start_bit);
    }

    BITSPAN_FORCEINLINE decoded_span decode() const noexcept {
      return decoded_span{ address(), start_bit(), bit_count() };
    }

    BITSPAN_FORCEINLINE std::byte* address() const noexcept { return reinterpret_cast<std::byte*>(addr_); }
    constexpr unsigned start_bit() const noexcept { return static_cast<unsigned>(meta_ & start_mask); }
    constexpr std::size_t bit_count() const noexcept { return meta_ >> start_bits; }

    constexpr bool is_empty_sentinel() const noexcept { return addr_ == 0u && meta_ == 0u; }

    // raw words, for layout checks
    constexpr std::uintptr_t word0() const noexcept { return addr_; }
    constexpr std::size_t word1() const noexcept { return meta_; }

    friend constexpr bool operator==(span_descriptor const&, span_descriptor const&) noexcept = default;
  };

  static_assert(sizeof(span_descriptor) == 2 * sizeof(void*), "span_descriptor must be two words");
  static_assert(std::is_trivially_copyable_v<span_descriptor>);

  inline span_descriptor encode(void const* address, unsigned start_bit, std::size_t bit_count) noexcept {
    return span_descriptor::encode(address, start_bit, bit_count);
  }

  inline std::optional<span_descriptor> try_encode(void const* address, unsigned start_bit,
                                                   std::size_t bit_count) noexcept {
    return span_descriptor::try_encode(address, start_bit, bit_count);
  }

  inline decoded_span decode(span_descriptor const& d) noexcept { return d.decode(); }

  constexpr bool is_empty_sentinel(span_descriptor const& d) noexcept { return d.is_empty_sentinel(); }

  //
  // domains
  //
  enum class domain_kind : std::uint8_t { empty, minor, major };

  // A partial element: logical bits [head, head + bits) of *element.
  template <typename T>
  struct partial_element {
    T* element{};
    unsigned head{};
    unsigned bits{};

    constexpr unsigned end() const noexcept { return head + bits; }
  };

  template <typename T>
  struct element_run {
    T* data{};
    std::size_t count{};

    constexpr T* begin() const noexcept { return data; }
    constexpr T* end() const noexcept { return data + count; }
  };

  // Non-owning; valid only while the memory behind the source span is.
  template <typename T>
  struct domain {
    domain_kind kind = domain_kind::empty;
    partial_element<T> region{};               // minor only
    std::optional<partial_element<T>> head{};  // major only
    element_run<T> body{};                     // major only
    std::optional<partial_element<T>> tail{};  // major only

    constexpr bool is_empty() const noexcept { return kind == domain_kind::empty; }
    constexpr bool is_minor() const noexcept { return kind == domain_kind::minor; }
    constexpr bool is_major() const noexcept { return kind == domain_kind::major; }

    constexpr std::size_t bit_count() const noexcept {
      switch (kind) {
        case domain_kind::empty: return 0;
        case domain_kind::minor: return region.bits;
        case domain_kind::major: break;
      }
      return (head ? head->bits : 0u) + body.count * bits_of<T> + (tail ? tail->bits : 0u);
    }
  };

  // Decomposes (address, start_bit, bit_count) over elements of type T. The
  // element is recovered by rounding address down to sizeof(T); the in-element
  // head is (address - element) * 8 + start_bit.
  //
  // A span that exactly covers one element is a whole run, not a minor region.
  template <typename T>
  domain<T> split(detail::byte_ptr_for<T> address, unsigned start_bit, std::size_t bit_count) noexcept {
    static_assert(is_storage_v<T>, "T must be an unsigned 8/16/32/64-bit storage element");
    constexpr unsigned W = bits_of<T>;

    domain<T> d{};
    if (bit_count == 0) return d;

    const std::uintptr_t a = detail::uptr(address);
    const std::uintptr_t off = a & (sizeof(T) - 1u);
    T* elem = reinterpret_cast<T*>(a - off);
    const unsigned head = static_cast<unsigned>(off * 8u) + start_bit;
    const unsigned to_end = W - head;

    if (bit_count <= to_end && !(head == 0 && bit_count == W)) {
      d.kind = domain_kind::minor;
      d.region = partial_element<T>{ elem, head, static_cast<unsigned>(bit_count) };
      return d;
    }

    d.kind = domain_kind::major;
    std::size_t remaining = bit_count;
    if (head != 0) {
      d.head = partial_element<T>{ elem, head, to_end };
      remaining -= to_end;
      ++elem;
    }
    d.body = element_run<T>{ elem, remaining / W };
    const unsigned rem = static_cast<unsigned>(remaining % W);
    if (rem != 0) {
      d.tail = partial_element<T>{ elem + d.body.count, 0u, rem };
    }
    return d;
  }

  template <typename T>
  BITSPAN_FORCEINLINE domain<T> split(decoded_span const& s) noexcept {
    return split<T>(s.address, s.start_bit, s.bit_count);
  }

  template <typename T>
  BITSPAN_FORCEINLINE domain<T> split(span_descriptor const& d) noexcept {
    return split<T>(d.address(), d.start_bit(), d.bit_count());
  }

  //
  // field accessor
  //
  // The field width n is the domain's bit count. Values cross the boundary as
  // unsigned bit patterns; store keeps only the low n bits (silent truncation).
  //
  //   *_le: element significance increases with address
  //   *_be: element significance decreases with address
  //
  // Bit placement inside each element follows the bit order independently.
  //
  namespace detail {

    template <typename O, typename Access, typename T>
    BITSPAN_FORCEINLINE elem_t<T> read_region(partial_element<T> const& r) noexcept {
      using E = elem_t<T>;
      const E m = order_traits<O>::template mask<E>(r.head, r.bits).value();
      const unsigned s = order_traits<O>::template shift<E>(r.head, r.bits);
      return static_cast<E>((element_ops<Access>::load(r.element) & m) >> s);
    }

    template <typename O, typename Access, typename T>
    BITSPAN_FORCEINLINE void write_region(partial_element<T> const& r, elem_t<T> value) noexcept {
      using E = elem_t<T>;
      const E m = order_traits<O>::template mask<E>(r.head, r.bits).value();
      const unsigned s = order_traits<O>::template shift<E>(r.head, r.bits);
      element_ops<Access>::insert(r.element, m, shl<E>(value, s));
    }

    template <typename U, typename O, typename T>
    consteval bool field_ok() {
      static_assert(std::is_unsigned_v<U> && !std::is_same_v<U, bool>,
                    "field values are unsigned bit patterns; convert before store / after load");
      static_assert(is_storage_v<T>, "T must be an unsigned 8/16/32/64-bit storage element");
      static_assert(order_traits<O>::template valid_for<elem_t<T>>,
                    "bit order is not a bijection for this element width");
      static_assert(order_traits<O>::template contiguous_for<elem_t<T>>,
                    "field access requires a bit order whose logical runs are physically contiguous");
      return true;
    }

  } // namespace detail

  template <typename U, typename Access = plain_access, typename T, typename O>
  U load_le(domain<T> const& d, O) noexcept {
    static_assert(detail::field_ok<U, O, T>());
    using E = detail::elem_t<T>;
    BITSPAN_ASSERT(d.bit_count() <= bits_of<U>);

    if (d.is_empty()) return U(0);
    if (d.is_minor()) return static_cast<U>(detail::read_region<O, Access>(d.region));

    U acc = 0;
    if (d.tail) acc = static_cast<U>(detail::read_region<O, Access>(*d.tail));
    for (std::size_t i = d.body.count; i-- > 0;) {
      const E e = detail::element_ops<Access>::load(d.body.data + i);
      acc = static_cast<U>(detail::shl<U>(acc, bits_of<E>) | static_cast<U>(e));
    }
    if (d.head) {
      acc = static_cast<U>(detail::shl<U>(acc, d.head->bits) |
                           static_cast<U>(detail::read_region<O, Access>(*d.head)));
    }
    return acc;
  }

  template <typename U, typename Access = plain_access, typename T, typename O>
  U load_be(domain<T> const& d, O) noexcept {
    static_assert(detail::field_ok<U, O, T>());
    using E = detail::elem_t<T>;
    BITSPAN_ASSERT(d.bit_count() <= bits_of<U>);

    if (d.is_empty()) return U(0);
    if (d.is_minor()) return static_cast<U>(detail::read_region<O, Access>(d.region));

    U acc = 0;
    if (d.head) acc = static_cast<U>(detail::read_region<O, Access>(*d.head));
    for (std::size_t i = 0; i < d.body.count; ++i) {
      const E e = detail::element_ops<Access>::load(d.body.data + i);
      acc = static_cast<U>(detail::shl<U>(acc, bits_of<E>) | static_cast<U>(e));
    }
    if (d.tail) {
      acc = static_cast<U>(detail::shl<U>(acc, d.tail->bits) |
                           static_cast<U>(detail::read_region<O, Access>(*d.tail)));
    }
    return acc;
  }

  template <typename Access = plain_access, typename T, typename O, typename U>
  void store_le(domain<T> const& d, O, U value) noexcept {
    static_assert(detail::field_ok<U, O, T>());
    static_assert(!std::is_const_v<T>, "cannot store through a read-only domain");
    using E = detail::elem_t<T>;
    BITSPAN_ASSERT(d.bit_count() <= bits_of<U>);

    if (d.is_empty()) return;
    if (d.is_minor()) {
      detail::write_region<O, Access>(d.region, static_cast<E>(value));
      return;
    }

    if (d.head) {
      detail::write_region<O, Access>(*d.head, static_cast<E>(value));
      value = detail::shr<U>(value, d.head->bits);
    }
    for (std::size_t i = 0; i < d.body.count; ++i) {
      detail::element_ops<Access>::store(d.body.data + i, static_cast<E>(value));
      value = detail::shr<U>(value, bits_of<E>);
    }
    if (d.tail) detail::write_region<O, Access>(*d.tail, static_cast<E>(value));
  }

  template <typename Access = plain_access, typename T, typename O, typename U>
  void store_be(domain<T> const& d, O, U value) noexcept {
    static_assert(detail::field_ok<U, O, T>());
    static_assert(!std::is_const_v<T>, "cannot store through a read-only domain");
    using E = detail::elem_t<T>;
    BITSPAN_ASSERT(d.bit_count() <= bits_of<U>);

    if (d.is_empty()) return;
    if (d.is_minor()) {
      detail::write_region<O, Access>(d.region, static_cast<E>(value));
      return;
    }

    if (d.tail) {
      detail::write_region<O, Access>(*d.tail, static_cast<E>(value));
      value = detail::shr<U>(value, d.tail->bits);
    }
    for (std::size_t i = d.body.count; i-- > 0;) {
      detail::element_ops<Access>::store(d.body.data + i, static_cast<E>(value));
      value = detail::shr<U>(value, bits_of<E>);
    }
    if (d.head) detail::write_region<O, Access>(*d.head, static_cast<E>(value));
  }

  // Two's complement reinterpretation of the low `bits` bits (1..64).
  BITSPAN_FORCEINLINE constexpr std::int64_t sign_extend(std::uint64_t x, unsigned bits) noexcept {
    if (bits == 0) return 0;
    if (bits >= 64) return static_cast<std::int64_t>(x);
    x &= detail::low_mask<std::uint64_t>(bits);
    const std::uint64_t sign = std::uint64_t(1) << (bits - 1u);
    return static_cast<std::int64_t>((x ^ sign) - sign);
  }

  //
  // bulk operations over a domain
  //
  // Edges are masked RMW; the whole-element run uses plain element stores and
  // popcounts. Work for any valid bit order, contiguous or not.
  //
  template <typename Access = plain_access, typename T, typename O>
  void fill(domain<T> const& d, O, bool value) noexcept {
    static_assert(!std::is_const_v<T>, "cannot fill through a read-only domain");
    static_assert(order_traits<O>::template valid_for<T>, "bit order is not a bijection for this element width");
    using E = detail::elem_t<T>;
    using ops = detail::element_ops<Access>;

    auto edge = [value](partial_element<T> const& r) noexcept {
      const E m = order_traits<O>::template mask<E>(r.head, r.bits).value();
      if (value) ops::set_bits(r.element, m);
      else ops::clear_bits(r.element, m);
    };

    if (d.is_empty()) return;
    if (d.is_minor()) {
      edge(d.region);
      return;
    }
    if (d.head) edge(*d.head);
    const E fillv = value ? static_cast<E>(~E(0)) : E(0);
    for (T* p = d.body.begin(); p != d.body.end(); ++p) ops::store(p, fillv);
    if (d.tail) edge(*d.tail);
  }

  template <typename Access = plain_access, typename T, typename O>
  std::size_t count_ones(domain<T> const& d, O) noexcept {
    static_assert(order_traits<O>::template valid_for<detail::elem_t<T>>,
                  "bit order is not a bijection for this element width");
    using E = detail::elem_t<T>;
    using ops = detail::element_ops<Access>;

    auto edge = [](partial_element<T> const& r) noexcept -> std::size_t {
      const E m = order_traits<O>::template mask<E>(r.head, r.bits).value();
      return static_cast<std::size_t>(std::popcount(static_cast<E>(ops::load(r.element) & m)));
    };

    if (d.is_empty()) return 0;
    if (d.is_minor()) return edge(d.region);

    std::size_t n = 0;
    if (d.head) n += edge(*d.head);
    for (T* p = d.body.begin(); p != d.body.end(); ++p) {
      n += static_cast<std::size_t>(std::popcount(ops::load(p)));
    }
    if (d.tail) n += edge(*d.tail);
    return n;
  }

  template <typename Access = plain_access, typename T, typename O>
  void flip(domain<T> const& d, O) noexcept {
    static_assert(!std::is_const_v<T>, "cannot flip through a read-only domain");
    static_assert(order_traits<O>::template valid_for<T>, "bit order is not a bijection for this element width");
    using E = detail::elem_t<T>;
    using ops = detail::element_ops<Access>;

    auto edge = [](partial_element<T> const& r) noexcept {
      ops::flip_bits(r.element, order_traits<O>::template mask<E>(r.head, r.bits).value());
    };

    if (d.is_empty()) return;
    if (d.is_minor()) {
      edge(d.region);
      return;
    }
    if (d.head) edge(*d.head);
    for (T* p = d.body.begin(); p != d.body.end(); ++p) ops::flip_bits(p, static_cast<E>(~E(0)));
    if (d.tail) edge(*d.tail);
  }

  namespace detail {

    // Combination of a destination span with a source span, bit for bit.
    enum class bit_op : std::uint8_t { copy, and_, or_, xor_ };

    template <bit_op Op>
    BITSPAN_FORCEINLINE constexpr std::uint64_t combine(std::uint64_t dst, std::uint64_t src) noexcept {
      if constexpr (Op == bit_op::copy) return src;
      else if constexpr (Op == bit_op::and_) return dst & src;
      else if constexpr (Op == bit_op::or_) return dst | src;
      else return dst ^ src;
    }

    // Applies Op to the bits of *p under m, taking source bits from v (same
    // positions). and/or/xor reduce to a single clear/set/flip of a mask.
    template <bit_op Op, typename Ops, typename U>
    BITSPAN_FORCEINLINE void apply_masked(U* p, U m, U v) noexcept {
      if constexpr (Op == bit_op::copy) Ops::insert(p, m, v);
      else if constexpr (Op == bit_op::and_) Ops::clear_bits(p, static_cast<U>(m & ~v));
      else if constexpr (Op == bit_op::or_) Ops::set_bits(p, static_cast<U>(m & v));
      else Ops::flip_bits(p, static_cast<U>(m & v));
    }

  } // namespace detail

  //
  // span handle
  //
  namespace detail {

    template <typename T, typename O, typename Access, bool Mutable>
    class span_base {
      static_assert(is_storage_v<T> && !std::is_const_v<T>,
                    "T must be a non-const unsigned 8/16/32/64-bit storage element (use bit_cspan for read-only)");
      static_assert(is_bit_order_v<O>, "O is not a bit order");
      static_assert(order_traits<O>::template valid_for<T>, "bit order is not a bijection for this element width");
      static_assert(std::is_same_v<Access, plain_access> || std::is_same_v<Access, atomic_access>,
                    "Access must be plain_access or atomic_access");

      span_descriptor desc_{};

      using ops = element_ops<Access>;
    public:
      using element_type = std::conditional_t<Mutable, T, T const>;
      using order_type = O;
      using access_type = Access;
      using domain_type = bitspan::domain<element_type>;
      static constexpr unsigned element_bits = bits_of<T>;
      static constexpr bool is_mutable = Mutable;

      // Absent (sentinel) span.
      constexpr span_base() noexcept = default;

      // Unchecked: the descriptor is trusted to describe valid, aligned storage.
      constexpr explicit span_base(span_descriptor d) noexcept : desc_(d) {}

      // Unchecked: head < element_bits, elements aligned to sizeof(T).
      span_base(element_type* elements, unsigned head, std::size_t bit_count) noexcept
        : desc_(span_descriptor::encode(reinterpret_cast<byte_ptr_for<element_type>>(elements) + (head >> 3),
                                        head & 7u, bit_count)) {}

      constexpr span_descriptor descriptor() const noexcept { return desc_; }
      constexpr bool is_null() const noexcept { return desc_.is_empty_sentinel(); }
      constexpr std::size_t size() const noexcept { return desc_.bit_count(); }
      constexpr bool empty() const noexcept { return desc_.bit_count() == 0; }

      element_type* element_address() const noexcept {
        const std::uintptr_t a = uptr(desc_.address());
        return reinterpret_cast<element_type*>(a & ~std::uintptr_t(sizeof(T) - 1u));
      }

      unsigned head() const noexcept {
        const std::uintptr_t a = uptr(desc_.address());
        return static_cast<unsigned>((a & (sizeof(T) - 1u)) * 8u) + desc_.start_bit();
      }

      domain_type domain() const noexcept {
        return split<element_type>(reinterpret_cast<byte_ptr_for<element_type>>(desc_.address()),
                                   desc_.start_bit(), desc_.bit_count());
      }

      // single bits

      bool get(std::size_t i) const noexcept {
        BITSPAN_ASSERT(i < size());
        const std::size_t abs = head() + i;
        element_type* e = element_address() + abs / element_bits;
        const auto sel = order_traits<O>::template select<T>(bit_idx<T>(static_cast<unsigned>(abs % element_bits)));
        return (ops::load(e) & sel.value()) != 0;
      }

      bool operator[](std::size_t i) const noexcept { return get(i); }

      void set(std::size_t i, bool value) const noexcept {
        static_assert(Mutable, "attempting to set on a read-only span");
        BITSPAN_ASSERT(i < size());
        const std::size_t abs = head() + i;
        element_type* e = element_address() + abs / element_bits;
        const auto sel = order_traits<O>::template select<T>(bit_idx<T>(static_cast<unsigned>(abs % element_bits)));
        if (value) ops::set_bits(e, sel.value());
        else ops::clear_bits(e, sel.value());
      }

      // reslicing

      // An absent span reslices to itself; it has no address to carry.
      span_base subspan(std::size_t offset, std::size_t count) const noexcept {
        BITSPAN_ASSERT(offset <= size() && count <= size() - offset);
        if (is_null()) return span_base();
        const std::size_t abs = head() + offset;
        return span_base(element_address() + abs / element_bits,
                         static_cast<unsigned>(abs % element_bits), count);
      }

      span_base first(std::size_t n) const noexcept { return subspan(0, n); }
      span_base last(std::size_t n) const noexcept {
        BITSPAN_ASSERT(n <= size());
        return subspan(size() - n, n);
      }

      std::pair<span_base, span_base> split_at(std::size_t mid) const noexcept {
        BITSPAN_ASSERT(mid <= size());
        return { subspan(0, mid), subspan(mid, size() - mid) };
      }

      span_base<T, O, Access, false> as_const() const noexcept {
        return span_base<T, O, Access, false>(desc_);
      }

      // integer fields (width = size(), or the first n bits)

      template <typename U = std::uint64_t>
      U load_le() const noexcept { return bitspan::load_le<U, Access>(domain(), O{}); }

      template <typename U = std::uint64_t>
      U load_be() const noexcept { return bitspan::load_be<U, Access>(domain(), O{}); }

      template <typename U = std::uint64_t>
      U load_le(std::size_t n) const noexcept {
        BITSPAN_ASSERT(n <= size());
        if (n == 0) return U(0);
        return first(n).template load_le<U>();
      }

      template <typename U = std::uint64_t>
      U load_be(std::size_t n) const noexcept {
        BITSPAN_ASSERT(n <= size());
        if (n == 0) return U(0);
        return first(n).template load_be<U>();
      }

      // Any integral value; converted to its unsigned bit pattern, then truncated
      // to size() bits.
      template <typename V>
      void store_le(V value) const noexcept {
        static_assert(Mutable, "attempting to store on a read-only span");
        static_assert(std::is_integral_v<V>, "store_le takes an integral value");
        bitspan::store_le<Access>(domain(), O{}, static_cast<std::uint64_t>(value));
      }

      template <typename V>
      void store_be(V value) const noexcept {
        static_assert(Mutable, "attempting to store on a read-only span");
        static_assert(std::is_integral_v<V>, "store_be takes an integral value");
        bitspan::store_be<Access>(domain(), O{}, static_cast<std::uint64_t>(value));
      }

      template <typename V>
      void store_le(V value, std::size_t n) const noexcept {
        BITSPAN_ASSERT(n <= size());
        if (n == 0) return;
        first(n).store_le(value);
      }

      template <typename V>
      void store_be(V value, std::size_t n) const noexcept {
        BITSPAN_ASSERT(n <= size());
        if (n == 0) return;
        first(n).store_be(value);
      }

      // bulk

      void fill(bool value) const noexcept {
        static_assert(Mutable, "attempting to fill a read-only span");
        bitspan::fill<Access>(domain(), O{}, value);
      }

      void flip() const noexcept {
        static_assert(Mutable, "attempting to flip a read-only span");
        bitspan::flip<Access>(domain(), O{});
      }

      std::size_t count_ones() const noexcept { return bitspan::count_ones<Access>(domain(), O{}); }
      std::size_t count_zeros() const noexcept { return size() - count_ones(); }
      bool any() const noexcept { return count_ones() != 0; }
      bool all() const noexcept { return count_ones() == size(); }

      // Binary operations with a source span of the same element type and bit
      // order. Lengths must match; the two ranges must not partially overlap.

      template <typename T2, typename O2, typename A2, bool M2>
      void copy_from(span_base<T2, O2, A2, M2> const& src) const noexcept {
        static_assert(Mutable, "attempting to copy into a read-only span");
        combine_from<bit_op::copy>(src);
      }

      template <typename T2, typename O2, typename A2, bool M2>
      void bit_and(span_base<T2, O2, A2, M2> const& src) const noexcept {
        static_assert(Mutable, "attempting to modify a read-only span");
        combine_from<bit_op::and_>(src);
      }

      template <typename T2, typename O2, typename A2, bool M2>
      void bit_or(span_base<T2, O2, A2, M2> const& src) const noexcept {
        static_assert(Mutable, "attempting to modify a read-only span");
        combine_from<bit_op::or_>(src);
      }

      template <typename T2, typename O2, typename A2, bool M2>
      void bit_xor(span_base<T2, O2, A2, M2> const& src) const noexcept {
        static_assert(Mutable, "attempting to modify a read-only span");
        combine_from<bit_op::xor_>(src);
      }

    private:
      // Same in-element head: the two domains have the same shape and are
      // combined element by element. Otherwise bits move through 64-bit fields:
      // _le for ascending orders and _be for descending ones, the variant whose
      // value bit k is logical bit k (resp. n-1-k) whatever the split.
      // Non-contiguous orders go bit by bit.
      template <bit_op Op, typename T2, typename O2, typename A2, bool M2>
      void combine_from(span_base<T2, O2, A2, M2> const& src) const noexcept {
        static_assert(std::is_same_v<T, T2>, "copy_from: storage element mismatch");
        static_assert(std::is_same_v<O, O2>, "copy_from: bit order mismatch");
        BITSPAN_ASSERT(src.size() == size());
        using sops = element_ops<A2>;

        if (size() == 0) return;

        if (src.head() == head()) {
          const auto dd = domain();
          const auto sd = src.domain();
          auto edge = [](partial_element<T> const& to, partial_element<T const> const& from) noexcept {
            const T m = order_traits<O>::template mask<T>(to.head, to.bits).value();
            apply_masked<Op, ops>(to.element, m, sops::load(from.element));
          };
          if (dd.is_minor()) {
            edge(dd.region, partial_element<T const>{ sd.region.element, sd.region.head, sd.region.bits });
            return;
          }
          if (dd.head) edge(*dd.head, partial_element<T const>{ sd.head->element, sd.head->head, sd.head->bits });
          for (std::size_t i = 0; i < dd.body.count; ++i) {
            const T v = sops::load(static_cast<T const*>(sd.body.data + i));
            if constexpr (Op == bit_op::copy) ops::store(dd.body.data + i, v);
            else apply_masked<Op, ops>(dd.body.data + i, static_cast<T>(~T(0)), v);
          }
          if (dd.tail) edge(*dd.tail, partial_element<T const>{ sd.tail->element, sd.tail->head, sd.tail->bits });
          return;
        }

        if constexpr (order_traits<O>::template contiguous_for<T>) {
          constexpr std::size_t chunk = 64;
          constexpr bool ascending = order_traits<O>::template ascending_for<T>;
          for (std::size_t off = 0; off < size(); off += chunk) {
            const std::size_t n = (size() - off < chunk) ? (size() - off) : chunk;
            const span_base to = subspan(off, n);
            const auto from = src.subspan(off, n);
            if constexpr (ascending) {
              std::uint64_t v = from.template load_le<std::uint64_t>();
              if constexpr (Op != bit_op::copy) v = combine<Op>(to.template load_le<std::uint64_t>(), v);
              to.store_le(v);
            } else {
              std::uint64_t v = from.template load_be<std::uint64_t>();
              if constexpr (Op != bit_op::copy) v = combine<Op>(to.template load_be<std::uint64_t>(), v);
              to.store_be(v);
            }
          }
        } else {
          for (std::size_t i = 0; i < size(); ++i) {
            set(i, combine<Op>(get(i) ? 1u : 0u, src.get(i) ? 1u : 0u) != 0u);
          }
        }
      }
    };

  } // namespace detail

  template <typename T, typename O = lsb0, typename Access = plain_access>
  using bit_span = detail::span_base<T, O, Access, true>;

  template <typename T, typename O = lsb0, typename Access = plain_access>
  using bit_cspan = detail::span_base<T, O, Access, false>;

  static_assert(sizeof(bit_span<std::uint8_t>) == 2 * sizeof(void*), "bit_span must be two words");
  static_assert(sizeof(bit_cspan<std::uint64_t, msb0>) == 2 * sizeof(void*), "bit_cspan must be two words");

  //
  // safe construction helpers
  //
  namespace detail {
    template <typename T>
    BITSPAN_FORCEINLINE void check_storage(T const* elements, std::size_t count, std::size_t bit_offset,
                                           std::size_t bit_count) noexcept {
      BITSPAN_ASSERT(elements != nullptr);
      BITSPAN_ASSERT((uptr(elements) & (sizeof(T) - 1u)) == 0u);
      BITSPAN_ASSERT(count <= span_descriptor::max_bits / bits_of<T>);
      BITSPAN_ASSERT(bit_offset <= count * bits_of<T>);
      BITSPAN_ASSERT(bit_count <= count * bits_of<T> - bit_offset);
    }
  } // namespace detail

  template <typename O = lsb0, typename Access = plain_access, typename T>
  BITSPAN_FORCEINLINE bit_cspan<T, O, Access> make_span(T const* elements, std::size_t count) noexcept {
    static_assert(!is_atomic_access_v<Access>,
                  "atomic_access needs non-const storage; build from a mutable pointer and call as_const()");
    detail::check_storage(elements, count, 0, count * bits_of<T>);
    return bit_cspan<T, O, Access>(elements, 0u, count * bits_of<T>);
  }

  template <typename O = lsb0, typename Access = plain_access, typename T>
  BITSPAN_FORCEINLINE bit_span<T, O, Access> make_span(T* elements, std::size_t count) noexcept {
    detail::check_storage(elements, count, 0, count * bits_of<T>);
    return bit_span<T, O, Access>(elements, 0u, count * bits_of<T>);
  }

  template <typename O = lsb0, typename Access = plain_access, typename T>
  BITSPAN_FORCEINLINE bit_cspan<T, O, Access> make_span(T const* elements, std::size_t count,
                                                        std::size_t bit_offset, std::size_t bit_count) noexcept {
    static_assert(!is_atomic_access_v<Access>,
                  "atomic_access needs non-const storage; build from a mutable pointer and call as_const()");
    detail::check_storage(elements, count, bit_offset, bit_count);
    return bit_cspan<T, O, Access>(elements + bit_offset / bits_of<T>,
                                   static_cast<unsigned>(bit_offset % bits_of<T>), bit_count);
  }

  template <typename O = lsb0, typename Access = plain_access, typename T>
  BITSPAN_FORCEINLINE bit_span<T, O, Access> make_span(T* elements, std::size_t count,
                                                       std::size_t bit_offset, std::size_t bit_count) noexcept {
    detail::check_storage(elements, count, bit_offset, bit_count);
    return bit_span<T, O, Access>(elements + bit_offset / bits_of<T>,
                                  static_cast<unsigned>(bit_offset % bits_of<T>), bit_count);
  }

  //
  // aliasing model
  //
  // Every mutation is a read-modify-write of a whole element. Two spans that
  // touch different elements may be mutated concurrently. Two spans that touch a
  // common element (even through disjoint bits) race unless both use
  // atomic_access.
  //
  namespace detail {
    template <typename S>
    BITSPAN_FORCEINLINE std::pair<std::uintptr_t, std::uintptr_t> element_byte_range(S const& s) noexcept {
      using E = std::remove_const_t<typename S::element_type>;
      const std::size_t last = s.head() + s.size() - 1u;
      const std::uintptr_t first_elem = uptr(s.element_address());
      const std::uintptr_t last_elem = first_elem + (last / bits_of<E>) * sizeof(E);
      return { first_elem, last_elem + sizeof(E) };
    }
  } // namespace detail

  template <typename A, typename B>
  bool shares_element(A const& a, B const& b) noexcept {
    if (a.is_null() || b.is_null() || a.empty() || b.empty()) return false;
    const auto ra = detail::element_byte_range(a);
    const auto rb = detail::element_byte_range(b);
    return ra.first < rb.second && rb.first < ra.second;
  }

  template <typename A, typename B>
  bool may_race(A const& a, B const& b) noexcept {
    constexpr bool both_atomic =
      is_atomic_access_v<typename A::access_type> && is_atomic_access_v<typename B::access_type>;
    if constexpr (both_atomic) {
      // Atomic RMW on a shared element is only race-free when both sides use
      // the same element width.
      using EA = std::remove_const_t<typename A::element_type>;
      using EB = std::remove_const_t<typename B::element_type>;
      if constexpr (std::is_same_v<EA, EB>) {
        (void)a; (void)b;
        return false;
      } else {
        return shares_element(a, b);
      }
    } else {
      return shares_element(a, b);
    }
  }

} // namespace bitspan

#endif // BITSPAN_HPP_INCLUDED
