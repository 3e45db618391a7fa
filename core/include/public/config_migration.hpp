#pragma once
#include <functional>
#include <map>

#include <nlohmann/json.hpp>

namespace basil {

/**
 * @brief Explicit, versioned migrations of persisted campaign configs.
 *
 * Each step turns a document of schema N into schema N + 1. migrate() chains
 * steps until the current schema is reached.
 */
class ConfigMigrator {
public:
  using Step = std::function<nlohmann::json(const nlohmann::json &)>;

  explicit ConfigMigrator(int current_schema) : _current(current_schema) {}

  /// Migrator preloaded with every step this build knows about.
  static ConfigMigrator standard();

  void register_step(int from_schema, Step step);

  /**
   * @brief Bring @p doc to the current schema.
   *
   * @param doc Parsed config document. A missing "schema" key means schema 1.
   * @param steps_applied Set to the number of migration steps run.
   * @throws IncompatibleSchemaError if the schema is newer than current or
   * no chain of steps reaches it.
   */
  nlohmann::json migrate(const nlohmann::json &doc, int &steps_applied) const;

  int current_schema() const { return _current; }

private:
  int _current;
  std::map<int, Step> _steps;
};

/// Schema 1 (flat "type"/"bounds"/"targets" layout) to schema 2.
nlohmann::json migrate_schema_1_to_2(const nlohmann::json &doc);

} // namespace basil
