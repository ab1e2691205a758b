#include "entity_metadata.hpp"

#include "internal/util/text.hpp"

namespace usagestat::metadata {

std::vector<std::string> AutoToolTags(const std::string& name) {
  std::vector<std::string> raw{name};

  std::string current;
  for (char c : name) {
    if (c == '_' || c == '-' || c == ' ') {
      if (!current.empty()) raw.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  if (!current.empty()) raw.push_back(std::move(current));

  return util::NormalizeTags(raw, true);
}

EntityDescriptor BuildDescriptor(const RegisteredEntity& entity, model::Kind kind, const std::optional<MetadataPreset>& preset) {
  EntityDescriptor out;
  out.name        = entity.name;
  out.description = entity.description;

  if (preset) {
    out.tags              = util::NormalizeTags(preset->tags);
    out.short_description = preset->short_description.empty()
                                ? util::DeriveShortDescription(entity.description, entity.name)
                                : preset->short_description;
  } else {
    if (kind == model::Kind::kTool) {
      out.tags = AutoToolTags(entity.name);
    } else {
      out.tags = util::NormalizeTags({entity.name, std::string(model::ToString(kind))}, true);
    }
    out.short_description = util::DeriveShortDescription(entity.description, entity.name);
  }

  if (out.tags.empty()) {
    out.tags = {util::ToLower(entity.name)};
  }

  return out;
}

} // namespace usagestat::metadata
