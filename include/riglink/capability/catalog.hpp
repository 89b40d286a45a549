#pragma once

#include "riglink/capability/capabilities.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace riglink::capability {

// Read-only model catalog. Loaded once at startup and shared by every session.
class CapabilityCatalog {
public:
    CapabilityCatalog() = default;

    static CapabilityCatalog load_file(const std::filesystem::path& path);
    static CapabilityCatalog load_string(const std::string& yaml);

    // Returns nullptr for unknown models.
    CapabilitiesPtr lookup(const std::string& model) const;

    std::vector<std::string> models() const;
    std::size_t size() const noexcept { return models_.size(); }

    void add(RadioCapabilities caps);

private:
    std::map<std::string, CapabilitiesPtr> models_;
};

}  // namespace riglink::capability
