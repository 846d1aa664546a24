/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>
#include <scale/scale.hpp>

#include "common/buffer.hpp"
#include "common/hexutil.hpp"

/// Declares a strongly typed blob which does not convert into another blob of
/// the same size implicitly
#define QBRIDGE_BLOB_STRICT_TYPEDEF(space_name, class_name, blob_size)         \
  namespace space_name {                                                       \
    struct class_name : public ::qbridge::common::Blob<blob_size> {            \
      using Base = ::qbridge::common::Blob<blob_size>;                         \
                                                                               \
      class_name() = default;                                                  \
      explicit class_name(const Base &blob) : Base{blob} {}                    \
                                                                               \
      static ::outcome::result<class_name> fromHex(std::string_view hex) {     \
        OUTCOME_TRY(blob, Base::fromHex(hex));                                 \
        return class_name{blob};                                               \
      }                                                                        \
                                                                               \
      static ::outcome::result<class_name> fromSpan(                           \
          ::qbridge::common::BufferView span) {                                \
        OUTCOME_TRY(blob, Base::fromSpan(span));                               \
        return class_name{blob};                                               \
      }                                                                        \
                                                                               \
      friend inline ::scale::ScaleEncoderStream &operator<<(                   \
          ::scale::ScaleEncoderStream &s, const class_name &data) {            \
        return s << static_cast<const Base &>(data);                           \
      }                                                                        \
                                                                               \
      friend inline ::scale::ScaleDecoderStream &operator>>(                   \
          ::scale::ScaleDecoderStream &s, class_name &data) {                  \
        return s >> static_cast<Base &>(data);                                 \
      }                                                                        \
    };                                                                         \
  }                                                                            \
                                                                               \
  template <>                                                                  \
  struct std::hash<space_name::class_name> {                                   \
    auto operator()(const space_name::class_name &key) const {                 \
      /* NOLINTNEXTLINE */                                                     \
      return boost::hash_range(key.cbegin(), key.cend());                      \
    }                                                                          \
  };                                                                           \
                                                                               \
  template <>                                                                  \
  struct fmt::formatter<space_name::class_name>                                \
      : fmt::formatter<space_name::class_name::Base> {                         \
    template <typename FormatCtx>                                              \
    auto format(const space_name::class_name &blob, FormatCtx &ctx) const      \
        -> decltype(ctx.out()) {                                               \
      return fmt::formatter<space_name::class_name::Base>::format(blob, ctx);  \
    }                                                                          \
  };

namespace qbridge::common {

  enum class BlobError { INCORRECT_LENGTH = 1 };

  /**
   * Fixed size byte string. Hashes, keys and signatures are kept in it.
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
    using Array = std::array<uint8_t, size_>;

   public:
    // Required by the scale-codec
    static constexpr bool is_static_collection = true;

    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &l) : Array{l} {}

    static constexpr size_t size() {
      return size_;
    }

    std::string toHex() const {
      return hex_lower({this->data(), size_});
    }

    BufferView view() const {
      return {this->data(), size_};
    }

    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(res, unhex(hex));
      return fromSpan(res);
    }

    static outcome::result<Blob<size_>> fromSpan(BufferView span) {
      if (span.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }
      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }
  };

  extern template class Blob<32ul>;
  extern template class Blob<64ul>;

  using Hash256 = Blob<32>;
  using Hash512 = Blob<64>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace qbridge::common

template <size_t N>
struct std::hash<qbridge::common::Blob<N>> {
  auto operator()(const qbridge::common::Blob<N> &blob) const {
    return boost::hash_range(blob.data(), blob.data() + N);  // NOLINT
  }
};

template <size_t N>
struct fmt::formatter<qbridge::common::Blob<N>> {
  // 's' prints the first and the last two bytes, 'l' prints everything
  char presentation = N > 4 ? 's' : 'l';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const qbridge::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (presentation == 's') {
      return fmt::format_to(
          ctx.out(),
          "0x{:02x}{:02x}…{:02x}{:02x}",
          blob[0],
          blob[1],
          blob[N - 2],
          blob[N - 1]);
    }
    return fmt::format_to(ctx.out(), "0x{}", blob.toHex());
  }
};

OUTCOME_HPP_DECLARE_ERROR(qbridge::common, BlobError);
