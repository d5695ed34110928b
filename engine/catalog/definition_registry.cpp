#include "catalog/definition_registry.hpp"

#include <exception>

#include "utils/status_utils.hpp"

namespace vecschema {
namespace engine {
namespace meta {

std::shared_ptr<DefinitionRegistry::Entry> DefinitionRegistry::FindEntry(const std::type_index& type) const {
  std::shared_lock<std::shared_mutex> lock(entries_mutex_);
  auto it = entries_.find(type);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<DefinitionRegistry::Entry> DefinitionRegistry::FindOrInsertEntry(const std::type_index& type) {
  auto entry = FindEntry(type);
  if (entry != nullptr) {
    return entry;
  }
  std::unique_lock<std::shared_mutex> lock(entries_mutex_);
  auto& slot = entries_[type];
  if (slot == nullptr) {
    slot = std::make_shared<Entry>();
  }
  return slot;
}

Status DefinitionRegistry::GetOrCreate(const std::type_index& type,
                                       const std::string& type_name,
                                       const BuildFunction& build,
                                       CollectionDefinitionPtr& response) {
  auto entry = FindOrInsertEntry(type);
  if (entry->state_.load(std::memory_order_acquire) == DefinitionState::READY) {
    response = entry->definition_;
    return entry->status_;
  }

  std::lock_guard<std::mutex> lock(entry->build_mutex_);
  // Another caller may have committed while we waited.
  if (entry->state_.load(std::memory_order_acquire) != DefinitionState::READY) {
    entry->state_.store(DefinitionState::BUILDING, std::memory_order_release);

    CollectionDefinitionPtr definition;
    Status status;
    try {
      status = build(definition);
    } catch (const std::exception& e) {
      status = ExceptionToStatus(e, UNEXPECTED_ERROR, "Build function failed");
    } catch (...) {
      status = Status(UNEXPECTED_ERROR, "Build function failed: unknown exception");
    }
    build_count_.fetch_add(1, std::memory_order_acq_rel);

    if (status.ok() && definition == nullptr) {
      status = Status(UNEXPECTED_ERROR, "Build function returned no collection definition.");
    }
    if (status.ok()) {
      logger_.Info("Registered collection definition '" + definition->Name() + "' with " +
                   std::to_string(definition->Fields().size()) + " fields.");
    } else {
      definition = nullptr;
      logger_.Warning("Failed to build collection definition for '" +
                      (type_name.empty() ? std::string(type.name()) : type_name) + "': " + status.ToString());
    }
    entry->definition_ = definition;
    entry->status_ = status;
    entry->state_.store(DefinitionState::READY, std::memory_order_release);
  }

  response = entry->definition_;
  return entry->status_;
}

Status DefinitionRegistry::Register(const std::type_index& type, const CollectionDefinitionPtr& definition) {
  if (definition == nullptr) {
    return Status(UNEXPECTED_ERROR, "Cannot register an empty collection definition.");
  }
  auto entry = FindOrInsertEntry(type);
  std::lock_guard<std::mutex> lock(entry->build_mutex_);
  if (entry->state_.load(std::memory_order_acquire) != DefinitionState::UNSEEN) {
    return Status(DEFINITION_ALREADY_EXISTS, "Collection definition already exists for type: " + std::string(type.name()));
  }
  entry->definition_ = definition;
  entry->status_ = Status::OK();
  entry->state_.store(DefinitionState::READY, std::memory_order_release);
  logger_.Info("Registered collection definition '" + definition->Name() + "' with " +
               std::to_string(definition->Fields().size()) + " fields.");
  return Status::OK();
}

DefinitionState DefinitionRegistry::GetState(const std::type_index& type) const {
  auto entry = FindEntry(type);
  if (entry == nullptr) {
    return DefinitionState::UNSEEN;
  }
  return entry->state_.load(std::memory_order_acquire);
}

size_t DefinitionRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(entries_mutex_);
  size_t ready = 0;
  for (const auto& [type, entry] : entries_) {
    if (entry->state_.load(std::memory_order_acquire) == DefinitionState::READY && entry->definition_ != nullptr) {
      ++ready;
    }
  }
  return ready;
}

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
