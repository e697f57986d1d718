// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "fuzz/registry.hpp"
#include "util/logging.hpp"

namespace shapefuzz {
namespace fuzz {

namespace {

// Clears the in-progress flag however Freeze() exits
class FreezingScope {
public:
  explicit FreezingScope(bool &flag) : flag_(flag) { flag_ = true; }
  ~FreezingScope() { flag_ = false; }

  FreezingScope(const FreezingScope &) = delete;
  FreezingScope &operator=(const FreezingScope &) = delete;

private:
  bool &flag_;
};

} // namespace

void ShapeRegistry::Freeze() {
  if (frozen_) {
    throw std::logic_error("ShapeRegistry already frozen");
  }

  {
    // Shapes may look each other up (fixed-size checks) while freezing
    FreezingScope scope(freezing_);
    for (const auto &key : order_) {
      ShapeBase &shape = *shapes_.at(key);
      try {
        shape.Freeze(*this);
      } catch (const std::exception &e) {
        LOG_REG_ERROR("failed to freeze {} '{}': {}", ShapeKindName(shape.kind()), shape.name(),
                      e.what());
        throw;
      }
    }
  }

  for (auto &[key, shape] : shapes_) {
    shape->MarkFrozen();
  }
  frozen_ = true;
  LOG_REG_DEBUG("registry frozen with {} shapes", shapes_.size());
}

std::vector<std::string> ShapeRegistry::TypeNames() const {
  std::vector<std::string> names;
  names.reserve(order_.size());
  for (const auto &key : order_) {
    names.push_back(shapes_.at(key)->name());
  }
  return names;
}

const ShapeBase *ShapeRegistry::Find(const std::type_info &type) const {
  if (!frozen_ && !freezing_) {
    throw std::logic_error("ShapeRegistry used before Freeze()");
  }
  auto it = shapes_.find(std::type_index(type));
  if (it == shapes_.end()) {
    throw std::logic_error(std::string("type '") + type.name() + "' is not registered");
  }
  return it->second.get();
}

void ShapeRegistry::RequireMutable(const std::string &name) const {
  if (frozen_) {
    throw std::logic_error("cannot register '" + name + "' after ShapeRegistry::Freeze()");
  }
}

} // namespace fuzz
} // namespace shapefuzz
