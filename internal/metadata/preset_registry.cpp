#include "preset_registry.hpp"

#include <mutex>

namespace usagestat::metadata {

void PresetRegistry::Put(const std::string& name, MetadataPreset preset) {
    std::unique_lock lock(mutex_);
    presets_[name] = std::move(preset);
}

std::optional<MetadataPreset> PresetRegistry::Get(const std::string& name) const {
    std::shared_lock lock(mutex_);

    auto it = presets_.find(name);
    if (it == presets_.end())
        return std::nullopt;

    return it->second;
}

} // namespace usagestat::metadata
