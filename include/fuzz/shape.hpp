// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "codec/byte_sink.hpp"
#include "fuzz/constraints.hpp"
#include "fuzz/mutator.hpp"
#include "fuzz/traits.hpp"
#include "fuzz/weighted_selector.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace shapefuzz {
namespace fuzz {

class ShapeRegistry;

enum class ShapeKind : uint8_t {
  Struct,
  Enum,
  Variant,
};

inline const char *ShapeKindName(ShapeKind kind) {
  switch (kind) {
  case ShapeKind::Struct:
    return "struct";
  case ShapeKind::Enum:
    return "enum";
  case ShapeKind::Variant:
    return "variant";
  }
  return "unknown";
}

/**
 * ShapeBase - type-erased registry entry
 *
 * Shapes are mutable builders until the owning registry freezes them.
 * Freeze() validates declarations and precomputes selectors; afterwards
 * the shape is read-only and safe to share between threads.
 */
class ShapeBase {
public:
  ShapeBase(std::string name, ShapeKind kind) : name_(std::move(name)), kind_(kind) {}
  virtual ~ShapeBase() = default;

  ShapeBase(const ShapeBase &) = delete;
  ShapeBase &operator=(const ShapeBase &) = delete;

  const std::string &name() const { return name_; }
  ShapeKind kind() const { return kind_; }
  bool frozen() const { return frozen_; }

  /**
   * Validate declarations and build selectors. Throws
   * std::invalid_argument on a bad declaration.
   */
  virtual void Freeze(const ShapeRegistry &registry) = 0;

  void MarkFrozen() { frozen_ = true; }

protected:
  void RequireMutable() const {
    if (frozen_) {
      throw std::logic_error("shape '" + name_ + "' modified after registry freeze");
    }
  }

  void RequireFrozen() const {
    if (!frozen_) {
      throw std::logic_error("shape '" + name_ + "' used before registry freeze");
    }
  }

private:
  std::string name_;
  ShapeKind kind_;
  bool frozen_{false};
};

// ============================================================================
// Structs
// ============================================================================

/**
 * One declared field of struct T, type-erased over the field type
 */
template <typename T> class FieldDescriptorBase {
public:
  explicit FieldDescriptorBase(std::string name) : name_(std::move(name)) {}
  virtual ~FieldDescriptorBase() = default;

  const std::string &name() const { return name_; }

  virtual bool ignored() const = 0;
  virtual void Validate() const = 0;

  // Generate into record within budget; returns the produced size
  virtual size_t Generate(T &record, Mutator &mutator,
                          const std::optional<size_t> &budget) const = 0;
  virtual void Mutate(T &record, Mutator &mutator) const = 0;
  virtual void Fixup(T &record, Mutator &mutator) const = 0;
  virtual void OnSuccess(const T &record, const ShapeRegistry &registry) const = 0;

  virtual size_t SerializedSize(const T &record, const ShapeRegistry &registry) const = 0;
  virtual size_t MinNonzeroElementsSize(const ShapeRegistry &registry) const = 0;
  virtual bool IsFixedSize(const ShapeRegistry &registry) const = 0;
  virtual void BinarySerialize(const T &record, codec::ByteSink &sink,
                               const ShapeRegistry &registry) const = 0;

private:
  std::string name_;
};

/**
 * Field of type F reached through a member pointer
 *
 * Builder calls mirror the per-field annotations: bounds, weighting,
 * ignore and a fixed initializer. Bounds apply to FuzzTraits<F>::RangeType,
 * i.e. the value for numbers and the element count for sequences.
 */
template <typename T, typename F> class FieldDescriptor : public FieldDescriptorBase<T> {
public:
  using Traits = FuzzTraits<F>;
  using RangeType = typename Traits::RangeType;

  FieldDescriptor(std::string name, F T::*member)
      : FieldDescriptorBase<T>(std::move(name)), member_(member) {}

  FieldDescriptor &Min(RangeType value) {
    constraints_.min = value;
    return *this;
  }

  FieldDescriptor &Max(RangeType value) {
    constraints_.max = value;
    return *this;
  }

  FieldDescriptor &Bias(Weighted weighted) {
    constraints_.weighted = weighted;
    return *this;
  }

  // Never generated or mutated; holds F{}
  FieldDescriptor &Ignore() {
    ignore_ = true;
    return *this;
  }

  // Generation takes this value instead of a fuzzed one
  FieldDescriptor &Initializer(std::function<F()> initializer) {
    initializer_ = std::move(initializer);
    return *this;
  }

  const Constraints<RangeType> &constraints() const { return constraints_; }

  bool ignored() const override { return ignore_; }

  void Validate() const override { constraints_.Validate(); }

  size_t Generate(T &record, Mutator &mutator, const std::optional<size_t> &budget) const override {
    F value{};
    if (ignore_) {
      // default already in place
    } else if (initializer_) {
      value = initializer_();
    } else {
      Constraints<RangeType> derived = constraints_;
      derived.max_size = budget;
      const bool constrained = derived.has_bounds() || derived.max_size.has_value();
      value = Traits::NewFuzzed(mutator, constrained ? &derived : nullptr);
    }

    const size_t produced = Traits::SerializedSize(value, mutator.registry());
    record.*member_ = std::move(value);
    return produced;
  }

  void Mutate(T &record, Mutator &mutator) const override {
    if (ignore_) {
      return;
    }
    Traits::Mutate(record.*member_, mutator, constraints_.has_bounds() ? &constraints_ : nullptr);
  }

  void Fixup(T &record, Mutator &mutator) const override { Traits::Fixup(record.*member_, mutator); }

  void OnSuccess(const T &record, const ShapeRegistry &registry) const override {
    Traits::OnSuccess(record.*member_, registry);
  }

  size_t SerializedSize(const T &record, const ShapeRegistry &registry) const override {
    return Traits::SerializedSize(record.*member_, registry);
  }

  size_t MinNonzeroElementsSize(const ShapeRegistry &registry) const override {
    return Traits::MinNonzeroElementsSize(registry);
  }

  bool IsFixedSize(const ShapeRegistry &registry) const override {
    return Traits::IsFixedSize(registry);
  }

  void BinarySerialize(const T &record, codec::ByteSink &sink,
                       const ShapeRegistry &registry) const override {
    Traits::BinarySerialize(record.*member_, sink, registry);
  }

private:
  F T::*member_;
  Constraints<RangeType> constraints_;
  bool ignore_{false};
  std::function<F()> initializer_;
};

/**
 * StructShape - declared fields of a record type, in declaration order
 *
 * Generation assigns fields into a value-initialized T. Variable-size
 * structs visit their fields in a random permutation so that no field is
 * always first in line for the byte budget; fixed-size structs use
 * declaration order. Serialization always follows declaration order.
 *
 * Each field's MinNonzeroElementsSize() is held back from the budget
 * until that field is visited, so an early text or sequence field cannot
 * starve the fixed-size fields that come after it.
 */
template <typename T> class StructShape : public ShapeBase {
  static_assert(std::is_default_constructible_v<T>, "registered structs must be default constructible");

public:
  using FixupHook = std::function<void(T &, Mutator &)>;
  using SuccessHook = std::function<void(const T &)>;

  explicit StructShape(std::string name) : ShapeBase(std::move(name), ShapeKind::Struct) {}

  template <typename F> FieldDescriptor<T, F> &Field(std::string name, F T::*member) {
    RequireMutable();
    auto field = std::make_unique<FieldDescriptor<T, F>>(std::move(name), member);
    FieldDescriptor<T, F> &ref = *field;
    fields_.push_back(std::move(field));
    return ref;
  }

  // Cross-field repair, run after the per-field fixups
  StructShape &OnFixup(FixupHook hook) {
    RequireMutable();
    fixup_hook_ = std::move(hook);
    return *this;
  }

  StructShape &OnSuccess(SuccessHook hook) {
    RequireMutable();
    success_hook_ = std::move(hook);
    return *this;
  }

  size_t field_count() const { return fields_.size(); }

  void Freeze(const ShapeRegistry &registry) override {
    std::unordered_set<std::string> seen;
    for (const auto &field : fields_) {
      if (!seen.insert(field->name()).second) {
        throw std::invalid_argument("struct '" + name() + "' declares field '" + field->name() +
                                    "' twice");
      }
      try {
        field->Validate();
      } catch (const std::invalid_argument &e) {
        throw std::invalid_argument("struct '" + name() + "' field '" + field->name() +
                                    "': " + e.what());
      }
    }
    fixed_size_ = ComputeFixedSize(registry);
    min_nonzero_ = ComputeMinNonzero(registry);
    reserves_.clear();
    for (const auto &field : fields_) {
      reserves_.push_back(field->MinNonzeroElementsSize(registry));
    }
    LOG_REG_DEBUG("struct '{}': {} fields, fixed size {}", name(), fields_.size(), *fixed_size_);
  }

  T Generate(Mutator &mutator, const Constraints<size_t> *constraints) const {
    RequireFrozen();
    std::optional<size_t> budget = constraints ? constraints->max_size : std::nullopt;
    size_t pending = 0;
    for (size_t reserve : reserves_) {
      pending += reserve;
    }

    T record{};
    auto generate_field = [&](size_t index) {
      pending -= reserves_[index];
      std::optional<size_t> field_budget = budget;
      if (field_budget) {
        *field_budget = *field_budget > pending ? *field_budget - pending : 0;
      }
      const size_t produced = fields_[index]->Generate(record, mutator, field_budget);
      if (ConsumeBudget(budget, produced)) {
        LOG_GEN_TRACE("struct '{}': field '{}' overran the remaining budget", name(),
                      fields_[index]->name());
      }
    };

    if (*fixed_size_) {
      for (size_t index = 0; index < fields_.size(); ++index) {
        generate_field(index);
      }
    } else {
      for (size_t index : mutator.Permutation(fields_.size())) {
        generate_field(index);
      }
    }

    if (mutator.ShouldFixup()) {
      Fixup(record, mutator);
    }
    return record;
  }

  void Mutate(T &record, Mutator &mutator) const {
    RequireFrozen();
    for (const auto &field : fields_) {
      field->Mutate(record, mutator);

      if (mutator.ShouldEarlyBailMutation()) {
        LOG_MUT_TRACE("struct '{}': early bail after field '{}'", name(), field->name());
        // Only the field stopped on is repaired; later fields stay as they were
        if (mutator.ShouldFixup()) {
          field->Fixup(record, mutator);
          if (fixup_hook_) {
            fixup_hook_(record, mutator);
          }
        }
        OnSuccess(record, mutator.registry());
        return;
      }
    }

    if (mutator.ShouldFixup()) {
      Fixup(record, mutator);
    }
    OnSuccess(record, mutator.registry());
  }

  void Fixup(T &record, Mutator &mutator) const {
    for (const auto &field : fields_) {
      field->Fixup(record, mutator);
    }
    if (fixup_hook_) {
      fixup_hook_(record, mutator);
    }
  }

  void OnSuccess(const T &record, const ShapeRegistry &registry) const {
    for (const auto &field : fields_) {
      field->OnSuccess(record, registry);
    }
    if (success_hook_) {
      success_hook_(record);
    }
  }

  size_t SerializedSize(const T &record, const ShapeRegistry &registry) const {
    size_t total = 0;
    for (const auto &field : fields_) {
      total += field->SerializedSize(record, registry);
    }
    return total;
  }

  void BinarySerialize(const T &record, codec::ByteSink &sink, const ShapeRegistry &registry) const {
    for (const auto &field : fields_) {
      field->BinarySerialize(record, sink, registry);
    }
  }

  // Also answers while the registry is still freezing
  bool IsFixedSize(const ShapeRegistry &registry) const {
    return fixed_size_ ? *fixed_size_ : ComputeFixedSize(registry);
  }

  size_t MinNonzeroElementsSize(const ShapeRegistry &registry) const {
    return min_nonzero_ ? *min_nonzero_ : ComputeMinNonzero(registry);
  }

private:
  bool ComputeFixedSize(const ShapeRegistry &registry) const {
    return std::all_of(fields_.begin(), fields_.end(),
                       [&](const auto &field) { return field->IsFixedSize(registry); });
  }

  // Bytes every encoding carries: the sum of the fixed-size fields
  size_t ComputeMinNonzero(const ShapeRegistry &registry) const {
    size_t total = 0;
    for (const auto &field : fields_) {
      if (field->IsFixedSize(registry)) {
        total += field->MinNonzeroElementsSize(registry);
      }
    }
    return total;
  }

  std::vector<std::unique_ptr<FieldDescriptorBase<T>>> fields_;
  FixupHook fixup_hook_;
  SuccessHook success_hook_;
  std::optional<bool> fixed_size_;
  std::optional<size_t> min_nonzero_;
  std::vector<size_t> reserves_; // per field, declaration order
};

// ============================================================================
// Unit enums
// ============================================================================

/**
 * EnumShape - declared variants of a unit enumeration
 *
 * Variants default to weight 1. Weight() and Ignore() apply to the most
 * recently declared variant. Ignored variants are still "declared" (a
 * PossiblyInvalid never produces them as invalid values) but are never
 * drawn.
 */
template <typename E> class EnumShape : public ShapeBase {
  static_assert(std::is_enum_v<E>, "EnumShape requires an enumeration type");

public:
  struct VariantInfo {
    E value;
    std::string name;
    uint64_t weight{1};
    bool ignore{false};
  };

  explicit EnumShape(std::string name) : ShapeBase(std::move(name), ShapeKind::Enum) {}

  EnumShape &Variant(E value, std::string name) {
    RequireMutable();
    variants_.push_back(VariantInfo{value, std::move(name)});
    return *this;
  }

  EnumShape &Weight(uint64_t weight) {
    Last().weight = weight;
    return *this;
  }

  EnumShape &Ignore() {
    Last().ignore = true;
    return *this;
  }

  const std::vector<VariantInfo> &variants() const { return variants_; }

  bool IsDeclared(E value) const {
    return std::any_of(variants_.begin(), variants_.end(),
                       [&](const VariantInfo &v) { return v.value == value; });
  }

  std::string VariantName(E value) const {
    for (const auto &v : variants_) {
      if (v.value == value) {
        return v.name;
      }
    }
    return "<undeclared>";
  }

  void Freeze(const ShapeRegistry &) override {
    std::vector<std::pair<uint64_t, E>> choices;
    for (size_t i = 0; i < variants_.size(); ++i) {
      for (size_t j = 0; j < i; ++j) {
        if (variants_[j].value == variants_[i].value) {
          throw std::invalid_argument("enum '" + name() + "' declares value of '" +
                                      variants_[i].name + "' twice");
        }
      }
      if (!variants_[i].ignore) {
        choices.emplace_back(variants_[i].weight, variants_[i].value);
      }
    }
    try {
      selector_.emplace(std::move(choices));
    } catch (const std::invalid_argument &e) {
      throw std::invalid_argument("enum '" + name() + "': " + e.what());
    }
    LOG_REG_DEBUG("enum '{}': {} variants, {} drawable", name(), variants_.size(), selector_->size());
  }

  E Generate(Mutator &mutator) const {
    RequireFrozen();
    return selector_->Sample(mutator.rng());
  }

private:
  VariantInfo &Last() {
    RequireMutable();
    if (variants_.empty()) {
      throw std::logic_error("enum '" + name() + "': no variant declared yet");
    }
    return variants_.back();
  }

  std::vector<VariantInfo> variants_;
  std::optional<WeightedSelector<E>> selector_;
};

// ============================================================================
// Payload variants
// ============================================================================

template <typename V> class VariantShape;

/**
 * VariantShape - weighted alternatives of a std::variant
 *
 * Generation draws an alternative index and recurses into that
 * alternative only. Under a byte budget, a fixed-size alternative that
 * does not fit is redrawn among the ones that do; if none fits, the
 * smallest drawable alternative is used. Mutation keeps the active
 * alternative and mutates its payload, unless the variant also has a unit
 * (std::monostate) alternative, in which case it is regenerated like a
 * unit enum.
 */
template <typename... Ts> class VariantShape<std::variant<Ts...>> : public ShapeBase {
public:
  using VariantType = std::variant<Ts...>;
  static constexpr size_t kAlternatives = sizeof...(Ts);
  static constexpr bool kHasUnitAlternative = (std::is_same_v<Ts, std::monostate> || ...);

  explicit VariantShape(std::string name) : ShapeBase(std::move(name), ShapeKind::Variant) {
    for (size_t i = 0; i < kAlternatives; ++i) {
      names_[i] = "alt" + std::to_string(i);
    }
  }

  VariantShape &Name(size_t index, std::string name) {
    RequireMutable();
    names_.at(CheckIndex(index)) = std::move(name);
    return *this;
  }

  VariantShape &Weight(size_t index, uint64_t weight) {
    RequireMutable();
    weights_.at(CheckIndex(index)) = weight;
    return *this;
  }

  VariantShape &Ignore(size_t index) {
    RequireMutable();
    ignored_.at(CheckIndex(index)) = true;
    return *this;
  }

  const std::string &AlternativeName(size_t index) const { return names_.at(CheckIndex(index)); }

  void Freeze(const ShapeRegistry &registry) override {
    fixed_sizes_ = {FixedSizeOf<Ts>(registry)...};
    std::vector<std::pair<uint64_t, size_t>> choices;
    for (size_t i = 0; i < kAlternatives; ++i) {
      if (!ignored_[i]) {
        choices.emplace_back(weights_[i], i);
      }
    }
    try {
      selector_.emplace(std::move(choices));
    } catch (const std::invalid_argument &e) {
      throw std::invalid_argument("variant '" + name() + "': " + e.what());
    }
    LOG_REG_DEBUG("variant '{}': {} alternatives, {} drawable", name(), kAlternatives,
                  selector_->size());
  }

  VariantType Generate(Mutator &mutator, const Constraints<size_t> *constraints) const {
    RequireFrozen();
    size_t index = selector_->Sample(mutator.rng());
    if (index < kAlternatives && constraints && constraints->max_size &&
        !Fits(index, *constraints->max_size)) {
      index = SampleWithin(mutator, *constraints->max_size);
    }
    if (index >= kAlternatives) {
      throw std::logic_error("variant '" + name() + "': selector index out of range");
    }
    return Generators()[index](mutator, constraints);
  }

  void Mutate(VariantType &value, Mutator &mutator) const {
    RequireFrozen();
    if constexpr (kHasUnitAlternative) {
      value = Generate(mutator, nullptr);
    } else {
      std::visit(
          [&](auto &alternative) {
            using Alt = std::decay_t<decltype(alternative)>;
            FuzzTraits<Alt>::Mutate(alternative, mutator, nullptr);
          },
          value);
    }
  }

  // Every non-ignored alternative is fixed-size and they all agree
  bool IsFixedSize(const ShapeRegistry &registry) const {
    const std::array<std::optional<size_t>, kAlternatives> sizes{FixedSizeOf<Ts>(registry)...};
    std::optional<size_t> common;
    for (size_t i = 0; i < kAlternatives; ++i) {
      if (ignored_[i]) {
        continue;
      }
      if (!sizes[i] || (common && *common != *sizes[i])) {
        return false;
      }
      common = sizes[i];
    }
    return common.has_value();
  }

  // Smallest nonzero size among the fixed-size alternatives, 0 if none
  size_t MinNonzeroElementsSize(const ShapeRegistry &registry) const {
    const std::array<std::optional<size_t>, kAlternatives> sizes{FixedSizeOf<Ts>(registry)...};
    size_t best = 0;
    for (size_t i = 0; i < kAlternatives; ++i) {
      if (ignored_[i] || !sizes[i]) {
        continue;
      }
      if (*sizes[i] > 0 && (best == 0 || *sizes[i] < best)) {
        best = *sizes[i];
      }
    }
    return best;
  }

private:
  template <typename Alt> static std::optional<size_t> FixedSizeOf(const ShapeRegistry &registry) {
    if (!FuzzTraits<Alt>::IsFixedSize(registry)) {
      return std::nullopt;
    }
    return FuzzTraits<Alt>::MinNonzeroElementsSize(registry);
  }

  // Variable-size alternatives shrink to the budget on their own
  bool Fits(size_t index, size_t budget) const {
    return !fixed_sizes_[index] || *fixed_sizes_[index] <= budget;
  }

  bool Drawable(size_t index) const { return !ignored_[index] && weights_[index] > 0; }

  size_t SampleWithin(Mutator &mutator, size_t budget) const {
    uint64_t total = 0;
    for (size_t i = 0; i < kAlternatives; ++i) {
      if (Drawable(i) && Fits(i, budget)) {
        total += weights_[i];
      }
    }
    if (total > 0) {
      std::uniform_int_distribution<uint64_t> dist(0, total - 1);
      uint64_t point = dist(mutator.rng());
      for (size_t i = 0; i < kAlternatives; ++i) {
        if (!Drawable(i) || !Fits(i, budget)) {
          continue;
        }
        if (point < weights_[i]) {
          return i;
        }
        point -= weights_[i];
      }
    }

    // Nothing fits: every drawable alternative is fixed and too large
    size_t smallest = kAlternatives;
    for (size_t i = 0; i < kAlternatives; ++i) {
      if (Drawable(i) && (smallest == kAlternatives || *fixed_sizes_[i] < *fixed_sizes_[smallest])) {
        smallest = i;
      }
    }
    return smallest;
  }

  using Generator = VariantType (*)(Mutator &, const Constraints<size_t> *);

  template <size_t I>
  static VariantType GenerateAlternative(Mutator &mutator, const Constraints<size_t> *constraints) {
    using Traits = FuzzTraits<std::variant_alternative_t<I, VariantType>>;
    if (constraints && constraints->max_size) {
      Constraints<typename Traits::RangeType> child;
      child.max_size = constraints->max_size;
      return VariantType(std::in_place_index<I>, Traits::NewFuzzed(mutator, &child));
    }
    return VariantType(std::in_place_index<I>, Traits::NewFuzzed(mutator, nullptr));
  }

  template <size_t... Is>
  static constexpr std::array<Generator, kAlternatives> MakeGenerators(std::index_sequence<Is...>) {
    return {&GenerateAlternative<Is>...};
  }

  static const std::array<Generator, kAlternatives> &Generators() {
    static constexpr auto table = MakeGenerators(std::index_sequence_for<Ts...>{});
    return table;
  }

  size_t CheckIndex(size_t index) const {
    if (index >= kAlternatives) {
      throw std::logic_error("variant '" + name() + "': alternative " + std::to_string(index) +
                             " does not exist");
    }
    return index;
  }

  std::array<std::string, kAlternatives> names_;
  std::array<uint64_t, kAlternatives> weights_ = [] {
    std::array<uint64_t, kAlternatives> w{};
    w.fill(1);
    return w;
  }();
  std::array<bool, kAlternatives> ignored_{};
  std::array<std::optional<size_t>, kAlternatives> fixed_sizes_{};
  std::optional<WeightedSelector<size_t>> selector_;
};

} // namespace fuzz
} // namespace shapefuzz
