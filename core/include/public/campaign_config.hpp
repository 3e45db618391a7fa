#pragma once
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include <public/objective_spec.hpp>
#include <public/parameter_space.hpp>

namespace basil {

/**
 * @brief Editable part of a campaign, as supplied by the UI collaborator.
 */
struct CampaignSpec {
  std::string name;
  std::string description;
  ParameterSpace parameters;
  ObjectiveSpec objectives;
  nlohmann::json settings = nlohmann::json::object();
};

/**
 * @brief Versioned, serializable definition of one campaign.
 *
 * version counts structural revisions: any change to parameters, objectives
 * or settings bumps it. Name and description edits do not.
 */
class CampaignConfig {
public:
  static const int kSchemaVersion = 2;

  CampaignConfig() = default;

  /// @throws ValidationError propagated from the parameter or objective spec.
  static CampaignConfig create(const std::string &name,
                               ParameterSpace parameters,
                               ObjectiveSpec objectives,
                               nlohmann::json settings = nlohmann::json::object());
  static CampaignConfig create(const CampaignSpec &spec);

  /**
   * @brief Replace the editable part of the config.
   *
   * @return true if the edit was structural (version bumped).
   * @throws ValidationError, leaving the config unchanged.
   */
  bool edit(const CampaignSpec &spec);

  /// Content hash over parameters, objectives and settings.
  std::string config_hash() const;

  /// Validate a spec the way create() and edit() do.
  static void validate_spec(const CampaignSpec &spec);

  nlohmann::json to_json() const;
  std::string serialize() const;

  /**
   * @brief Parse a persisted config, migrating older schemas.
   *
   * A migrated document comes back with its version bumped by one.
   *
   * @param migrated Optional, set to whether a migration ran.
   * @throws IncompatibleSchemaError, ValidationError
   */
  static CampaignConfig from_json(const nlohmann::json &j,
                                  bool *migrated = nullptr);
  static CampaignConfig deserialize(const std::string &text,
                                    bool *migrated = nullptr);

  const std::string &id() const { return _id; }
  const std::string &name() const { return _name; }
  const std::string &description() const { return _description; }
  const ParameterSpace &parameters() const { return _parameters; }
  const ObjectiveSpec &objectives() const { return _objectives; }
  const nlohmann::json &settings() const { return _settings; }
  int version() const { return _version; }
  int64_t created_at() const { return _created_at; }
  int64_t updated_at() const { return _updated_at; }

  CampaignSpec spec() const;

  bool operator==(const CampaignConfig &o) const;
  bool operator!=(const CampaignConfig &o) const { return !(*this == o); }

private:
  std::string _id;
  std::string _name;
  std::string _description;
  ParameterSpace _parameters;
  ObjectiveSpec _objectives;
  nlohmann::json _settings = nlohmann::json::object();
  int _version = 0;
  int64_t _created_at = 0;
  int64_t _updated_at = 0;
};

} // namespace basil
