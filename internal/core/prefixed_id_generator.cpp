#include "internal/core/prefixed_id_generator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace prefixid::core {

using observability::IntField;
using observability::StringField;

PrefixedIdGenerator::PrefixedIdGenerator(std::string name, std::string discriminator,
                                         std::shared_ptr<SegmentedCounterAllocator> allocator, NumberFormat number_format)
    : name_(std::move(name)),
      discriminator_(std::move(discriminator)),
      allocator_(std::move(allocator)),
      number_format_(std::move(number_format)) {
  if (!allocator_) {
    throw util::ConfigurationError("generator '" + name_ + "': allocator is required");
  }
}

GeneratedId PrefixedIdGenerator::Generate(const std::string& grouping_prefix) {
  if (grouping_prefix.empty()) {
    throw util::InvalidSegmentKey("generator '" + name_ + "': grouping prefix must not be empty");
  }

  GeneratedId id;
  id.segment_key = discriminator_ + grouping_prefix;
  id.value       = allocator_->Allocate(id.segment_key);
  id.identifier  = number_format_.Render(grouping_prefix, id.value);

  PREFIXID_LOG_DEBUG("identifier generated", {StringField("generator", name_), StringField("segment", id.segment_key),
                                              IntField("value", id.value), StringField("id", id.identifier)});
  return id;
}

} // namespace prefixid::core
