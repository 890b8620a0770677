/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_encoder_registry.hpp"

#include <algorithm>

#include "codec/cbor/cbor_common.hpp"

namespace ic::codec::cbor {
  namespace {
    /// Base encoder of single held type
    template <typename T>
    class BaseEncoder : public TypedValueEncoder<T> {
     public:
      explicit BaseEncoder(std::string_view name) : name_{name} {}

      std::string_view name() const override {
        return name_;
      }

      int priority() const override {
        return kDefaultEncoderPriority;
      }

     protected:
      CborEncodeStream encodeTyped(
          const T &value, const EncoderRegistry &registry) const override {
        CborEncodeStream s;
        if constexpr (std::is_same_v<T, ValueList>) {
          auto l{CborEncodeStream::list()};
          for (const auto &item : value) {
            l << registry.encodeItem(item);
          }
          s << l;
        } else if constexpr (std::is_same_v<T, ValueMap>) {
          auto m{CborEncodeStream::orderedMap()};
          for (const auto &[key, item] : value) {
            m[key] = registry.encodeItem(item);
          }
          s << m;
        } else if constexpr (std::is_same_v<T, CborTagged>) {
          s.tag(value.tag);
          s << registry.encodeItem(value.value);
        } else {
          s << value;
        }
        return s;
      }

     private:
      std::string_view name_;
    };

    template <typename T>
    EncoderRegistry::EncoderPtr makeBase(std::string_view name) {
      return std::make_shared<BaseEncoder<T>>(name);
    }
  }  // namespace

  EncoderRegistry::EncoderRegistry()
      : logger_{common::createLogger("cbor_encoder")} {}

  EncoderRegistry EncoderRegistry::withDefaultEncoders() {
    EncoderRegistry registry;
    registry.addEncoder(makeBase<std::nullptr_t>("null"));
    registry.addEncoder(makeBase<CborUndefined>("undefined"));
    registry.addEncoder(makeBase<bool>("bool"));
    registry.addEncoder(makeBase<uint64_t>("uint"));
    registry.addEncoder(makeBase<int64_t>("int"));
    registry.addEncoder(makeBase<double>("number"));
    registry.addEncoder(makeBase<std::string>("string"));
    registry.addEncoder(makeBase<ValueList>("array"));
    registry.addEncoder(makeBase<ValueMap>("object"));
    registry.addEncoder(makeBase<CborTagged>("tagged"));
    return registry;
  }

  void EncoderRegistry::addEncoder(EncoderPtr encoder) {
    logger_->debug("add encoder {} with priority {}",
                   encoder->name(),
                   encoder->priority());
    encoders_.push_back(std::move(encoder));
  }

  bool EncoderRegistry::removeEncoder(std::string_view name) {
    const auto size{encoders_.size()};
    encoders_.erase(std::remove_if(encoders_.begin(),
                                   encoders_.end(),
                                   [&](const EncoderPtr &encoder) {
                                     return encoder->name() == name;
                                   }),
                    encoders_.end());
    return encoders_.size() != size;
  }

  outcome::result<EncoderRegistry::EncoderPtr> EncoderRegistry::encoderFor(
      const Value &value) const {
    EncoderPtr best;
    for (const auto &encoder : encoders_) {
      if ((!best || encoder->priority() < best->priority())
          && encoder->match(value)) {
        best = encoder;
      }
    }
    if (!best) {
      logger_->debug("no encoder for type {}", value.type().name());
      return CborEncodeError::kNoEncoderForType;
    }
    return best;
  }

  CborEncodeStream EncoderRegistry::encodeItem(const Value &value) const {
    auto encoder{encoderFor(value)};
    if (!encoder) {
      outcome::raise(encoder.error());
    }
    return encoder.value()->encode(value, *this);
  }

  outcome::result<Bytes> EncoderRegistry::encode(const Value &value) const {
    return outcome::catchRaised([&] { return encodeItem(value).data(); });
  }

  outcome::result<Bytes> EncoderRegistry::serialize(const Value &value) const {
    return outcome::catchRaised([&] {
      CborEncodeStream s;
      s.tag(kTagSelfDescribe);
      s << encodeItem(value);
      return s.data();
    });
  }

  const std::vector<EncoderRegistry::EncoderPtr> &EncoderRegistry::encoders()
      const {
    return encoders_;
  }
}  // namespace ic::codec::cbor
