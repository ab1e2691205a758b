#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/metadata/preset_registry.hpp"
#include "internal/model/kind.hpp"

namespace usagestat::metadata {

/*
  Closed input for SyncMetadata(): everything the synchronizer stores for
  one entity. Tags are normalized on write.
*/
struct EntityDescriptor {
  std::string              name;
  std::string              description;
  std::vector<std::string> tags;
  std::string              short_description;
};

// What a server knows about a registered tool, prompt or resource.
struct RegisteredEntity {
  std::string name;
  std::string description;
};

/*
  Registration -> descriptor.

  With a preset: preset tags (normalized) and preset short description,
  falling back to one derived from the description.

  Without a preset:
    tool      tags = name + name split on '_'/'-', stopwords dropped
    prompt    tags = [name, "prompt"]
    resource  tags = [name, "resource"]

  An empty tag list falls back to the lowercased name.
*/
EntityDescriptor BuildDescriptor(const RegisteredEntity& entity, model::Kind kind, const std::optional<MetadataPreset>& preset);

// name split on '_' and '-' plus the full name, normalized, stopwords dropped
std::vector<std::string> AutoToolTags(const std::string& name);

} // namespace usagestat::metadata
