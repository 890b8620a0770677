/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <vector>

#include <boost/any.hpp>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace ic::codec::cbor {
  /// Error and result types must not be held by `Value`
  template <typename T>
  struct IsOutcomeType : std::false_type {};
  template <typename T>
  struct IsOutcomeType<BOOST_OUTCOME_V2_NAMESPACE::success_type<T>>
      : std::true_type {};
  template <typename EC, typename E>
  struct IsOutcomeType<BOOST_OUTCOME_V2_NAMESPACE::failure_type<EC, E>>
      : std::true_type {};

  template <typename T>
  constexpr bool kIsValueCompatible{
      !std::is_same_v<T, std::error_code> && !std::is_error_code_enum_v<T>
      && !IsOutcomeType<T>::value
      && !BOOST_OUTCOME_V2_NAMESPACE::is_basic_result_v<T>};

  /**
   * Dynamically typed value to be encoded or produced by decoding.
   * Holds copy of any copyable type, integers are kept as `uint64_t` or
   * `int64_t`, floating point as `double`, character strings as `std::string`.
   */
  class Value {
   public:
    Value() = default;

    template <typename T,
              typename = std::enable_if_t<
                  !std::is_same_v<std::decay_t<T>, Value>
                  && kIsValueCompatible<std::decay_t<T>>>>
    Value(T &&value)  // NOLINT(google-explicit-constructor)
        : value_{normalize(std::forward<T>(value))} {}

    /** Checks if nothing is held */
    bool empty() const {
      return value_.empty();
    }

    const std::type_info &type() const {
      return value_.type();
    }

    /** Checks if held value is exactly of type T */
    template <typename T>
    bool is() const {
      return value_.type() == typeid(T);
    }

    /** Returns held value or nullptr if it has other type */
    template <typename T>
    const T *get() const {
      return boost::any_cast<T>(&value_);
    }

    template <typename T>
    T *get() {
      return boost::any_cast<T>(&value_);
    }

   private:
    template <typename T>
    static auto normalize(T &&value) {
      using U = std::decay_t<T>;
      if constexpr (std::is_same_v<U, bool>) {
        return value;
      } else if constexpr (std::is_integral_v<U> && std::is_signed_v<U>) {
        return static_cast<int64_t>(value);
      } else if constexpr (std::is_integral_v<U>) {
        return static_cast<uint64_t>(value);
      } else if constexpr (std::is_floating_point_v<U>) {
        return static_cast<double>(value);
      } else if constexpr (std::is_same_v<U, const char *>
                           || std::is_same_v<U, char *>
                           || std::is_same_v<U, std::string_view>) {
        return std::string{value};
      } else {
        return U(std::forward<T>(value));
      }
    }

    boost::any value_;
  };

  using ValueList = std::vector<Value>;

  /** String keyed map of values with respect for insertion order */
  struct ValueMap : public std::vector<std::pair<std::string, Value>> {
    /** Returns value of own key or nullptr */
    const Value *find(std::string_view key) const;
    Value *find(std::string_view key);

    bool has(std::string_view key) const {
      return find(key) != nullptr;
    }

    /** Replaces value in place or appends new key */
    Value &operator[](std::string_view key);
  };

  /** Tagged item without known decoding rule */
  struct CborTagged {
    uint64_t tag{};
    Value value;
  };

  /**
   * Renders value tree for logs, unknown types are rendered by type name.
   */
  std::string dumpValue(const Value &value);
}  // namespace ic::codec::cbor
