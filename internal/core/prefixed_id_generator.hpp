#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "internal/core/number_format.hpp"
#include "internal/core/segment_allocator.hpp"

namespace prefixid::core {

struct GeneratedId {
  std::string segment_key;
  int64_t     value = 0;
  std::string identifier;  // "<prefix>-<formatted value>"
};

/*
  PrefixedIdGenerator

  Turns a grouping prefix ("INV") into the next identifier of its
  series ("INV-00001"). The counter segment is discriminator + prefix;
  generators with the same discriminator and table share counters.
*/
class PrefixedIdGenerator {
 public:
  PrefixedIdGenerator(std::string name, std::string discriminator, std::shared_ptr<SegmentedCounterAllocator> allocator,
                      NumberFormat number_format);

  // Throws util::InvalidSegmentKey for an empty prefix, plus anything
  // SegmentedCounterAllocator::Allocate raises.
  GeneratedId Generate(const std::string& grouping_prefix);

  const std::string& Name() const {
    return name_;
  }
  const std::string& Discriminator() const {
    return discriminator_;
  }
  const NumberFormat& Format() const {
    return number_format_;
  }
  SegmentedCounterAllocator& Allocator() const {
    return *allocator_;
  }

 private:
  std::string                                name_;
  std::string                                discriminator_;
  std::shared_ptr<SegmentedCounterAllocator> allocator_;
  NumberFormat                               number_format_;
};

// Supplies the grouping prefix of an entity.
template <typename Entity>
using GroupingKeyProvider = std::function<std::string(const Entity&)>;

// Binds a GroupingKeyProvider to a generator for one entity kind.
template <typename Entity>
class EntityIdGenerator {
 public:
  EntityIdGenerator(std::shared_ptr<PrefixedIdGenerator> generator, GroupingKeyProvider<Entity> provider)
      : generator_(std::move(generator)), provider_(std::move(provider)) {
  }

  std::string Generate(const Entity& entity) {
    return generator_->Generate(provider_(entity)).identifier;
  }

 private:
  std::shared_ptr<PrefixedIdGenerator> generator_;
  GroupingKeyProvider<Entity>          provider_;
};

} // namespace prefixid::core
