#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>

#include "catalog/collection_definition.hpp"
#include "catalog/collection_definition_builder.hpp"
#include "catalog/schema_extractor.hpp"
#include "logger/logger.hpp"
#include "utils/status.hpp"

namespace vecschema {
namespace engine {
namespace meta {

enum class DefinitionState {
  UNSEEN = 0,
  BUILDING = 1,
  READY = 2,
};

/**
 * @brief Memoizes one collection definition per record type.
 *
 * Each type moves UNSEEN -> BUILDING -> READY exactly once. The first caller
 * builds while holding the entry's build mutex; concurrent callers for the same
 * type block on that mutex and then read the committed result, so the build
 * runs once and every caller receives the same pointer. A READY entry is read
 * after a single acquire load of its state. Failed builds, including build
 * functions that throw, are committed too:
 * the definition is static per type, so a retry could not succeed.
 *
 * Entries live as long as the registry. Registries are independent of each
 * other; nothing is cached globally.
 */
class DefinitionRegistry {
 public:
  using BuildFunction = std::function<Status(CollectionDefinitionPtr& response)>;

  DefinitionRegistry() = default;
  explicit DefinitionRegistry(const ValidationOptions& options) : options_(options) {}

  DefinitionRegistry(const DefinitionRegistry&) = delete;
  DefinitionRegistry& operator=(const DefinitionRegistry&) = delete;

  // Builds from Record::DescribeFields() on first use.
  template <typename Record>
  Status Get(CollectionDefinitionPtr& response) {
    auto options = options_;
    return GetOrCreate(std::type_index(typeid(Record)), "",
                       [options](CollectionDefinitionPtr& definition) {
                         return SchemaExtractor::Extract<Record>(options, definition);
                       },
                       response);
  }

  // Generic path, e.g. for table types whose definition comes from a builder.
  // type_name only labels log lines; empty falls back to the type's name.
  Status GetOrCreate(const std::type_index& type,
                     const std::string& type_name,
                     const BuildFunction& build,
                     CollectionDefinitionPtr& response);

  // Commits a prebuilt definition; fails if the type was already requested.
  Status Register(const std::type_index& type, const CollectionDefinitionPtr& definition);

  template <typename Record>
  Status Register(const CollectionDefinitionPtr& definition) {
    return Register(std::type_index(typeid(Record)), definition);
  }

  DefinitionState GetState(const std::type_index& type) const;

  // Number of types with a committed definition; cached failures are not counted.
  size_t Size() const;

  // Number of build functions run so far.
  size_t BuildCount() const { return build_count_.load(std::memory_order_acquire); }

  const ValidationOptions& GetValidationOptions() const { return options_; }

 private:
  struct Entry {
    std::mutex build_mutex_;
    std::atomic<DefinitionState> state_{DefinitionState::UNSEEN};
    // Written once under build_mutex_ before state_ is released as READY.
    Status status_;
    CollectionDefinitionPtr definition_;
  };

  std::shared_ptr<Entry> FindEntry(const std::type_index& type) const;

  std::shared_ptr<Entry> FindOrInsertEntry(const std::type_index& type);

  ValidationOptions options_;
  mutable std::shared_mutex entries_mutex_;
  std::unordered_map<std::type_index, std::shared_ptr<Entry>> entries_;
  std::atomic<size_t> build_count_{0};
  Logger logger_{"registry"};
};

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
