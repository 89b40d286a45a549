#pragma once

#include "riglink/config/types.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace riglink::config {

class ConfigManager {
public:
    explicit ConfigManager(std::filesystem::path path);

    const Config& current() const;
    const std::filesystem::path& path() const noexcept { return path_; }
    void reload();

    // Relative catalog paths are resolved against `base_dir`.
    static Config load_string(const std::string& yaml,
                              const std::filesystem::path& base_dir = {});

private:
    Config loadFromFile(const std::filesystem::path& path) const;

    std::filesystem::path path_;
    Config config_;
    mutable std::mutex mutex_;
};

}  // namespace riglink::config
