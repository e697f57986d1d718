// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "fuzz/shape.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <variant>
#include <vector>

namespace shapefuzz {
namespace fuzz {

/**
 * ShapeRegistry - runtime description of every structured type
 *
 * Populated once at startup through the Define* builders, then frozen.
 * Freeze() validates every declaration (bounds, weights, duplicates) and
 * builds the per-shape weighted selectors, so configuration errors
 * surface there rather than in the middle of a draw.
 *
 * Thread-safety: not synchronized while building. A frozen registry is
 * immutable and may be shared by any number of Mutators on any threads.
 */
class ShapeRegistry {
public:
  ShapeRegistry() = default;

  ShapeRegistry(const ShapeRegistry &) = delete;
  ShapeRegistry &operator=(const ShapeRegistry &) = delete;

  template <typename T> StructShape<T> &DefineStruct(std::string name) {
    static_assert(std::is_class_v<T>, "DefineStruct requires a class type");
    return Define<StructShape<T>, T>(std::move(name));
  }

  template <typename E> EnumShape<E> &DefineEnum(std::string name) {
    return Define<EnumShape<E>, E>(std::move(name));
  }

  template <typename V> VariantShape<V> &DefineVariant(std::string name) {
    return Define<VariantShape<V>, V>(std::move(name));
  }

  template <typename T> const StructShape<T> &GetStruct() const {
    return Get<StructShape<T>>(typeid(T));
  }

  template <typename E> const EnumShape<E> &GetEnum() const { return Get<EnumShape<E>>(typeid(E)); }

  template <typename V> const VariantShape<V> &GetVariant() const {
    return Get<VariantShape<V>>(typeid(V));
  }

  template <typename T> bool Contains() const { return shapes_.count(typeid(T)) != 0; }

  /**
   * Validate and seal every shape. Throws std::invalid_argument on a bad
   * declaration and std::logic_error if already frozen.
   */
  void Freeze();

  bool frozen() const { return frozen_; }
  size_t size() const { return shapes_.size(); }

  // Registered names in definition order
  std::vector<std::string> TypeNames() const;

private:
  template <typename Shape, typename T> Shape &Define(std::string name) {
    RequireMutable(name);
    const std::type_index key(typeid(T));
    if (shapes_.count(key) != 0) {
      throw std::logic_error("type '" + name + "' registered twice (already registered as '" +
                             shapes_.at(key)->name() + "')");
    }
    auto shape = std::make_unique<Shape>(std::move(name));
    Shape &ref = *shape;
    shapes_.emplace(key, std::move(shape));
    order_.push_back(key);
    return ref;
  }

  template <typename Shape> const Shape &Get(const std::type_info &type) const {
    const auto *shape = dynamic_cast<const Shape *>(Find(type));
    if (shape == nullptr) {
      throw std::logic_error(std::string("type '") + type.name() +
                             "' is registered with a different kind");
    }
    return *shape;
  }

  // Throws std::logic_error if unknown or the registry is not frozen
  const ShapeBase *Find(const std::type_info &type) const;

  void RequireMutable(const std::string &name) const;

  std::unordered_map<std::type_index, std::unique_ptr<ShapeBase>> shapes_;
  std::vector<std::type_index> order_;
  bool frozen_{false};
  bool freezing_{false};
};

} // namespace fuzz
} // namespace shapefuzz
