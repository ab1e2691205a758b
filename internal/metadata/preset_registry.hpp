#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace usagestat::metadata {

// Caller-supplied metadata that wins over auto-generated tags and
// descriptions during registration.
struct MetadataPreset {
  std::vector<std::string> tags;
  std::string              short_description;
};

/*
  Thread-safe name -> preset map.
*/
class PresetRegistry {
 public:
  void Put(const std::string& name, MetadataPreset preset);

  std::optional<MetadataPreset> Get(const std::string& name) const;

 private:
  mutable std::shared_mutex                       mutex_;
  std::unordered_map<std::string, MetadataPreset> presets_;
};

} // namespace usagestat::metadata
