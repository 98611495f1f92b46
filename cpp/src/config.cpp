#include "config.h"
#include <yaml-cpp/yaml.h>
#include <iostream>
#include <algorithm>
#include <cstdlib>
#include <vector>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#elif defined(_WIN32)
#include <windows.h>
#elif defined(__linux__)
#include <unistd.h>
#include <limits.h>
#endif

namespace fs = std::filesystem;

namespace roithumb {

namespace {

// Get directory containing the executable
fs::path getExecutableDir() {
#ifdef __APPLE__
    char path[PATH_MAX];
    uint32_t size = sizeof(path);
    if (_NSGetExecutablePath(path, &size) == 0) {
        return fs::path(path).parent_path();
    }
#elif defined(_WIN32)
    char path[MAX_PATH];
    if (GetModuleFileNameA(NULL, path, MAX_PATH) != 0) {
        return fs::path(path).parent_path();
    }
#elif defined(__linux__)
    char path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
    if (len != -1) {
        path[len] = '\0';
        return fs::path(path).parent_path();
    }
#endif
    return fs::current_path();
}

// Environment variable naming a config file, checked before the search path
constexpr const char* kConfigEnvVar = "ROITHUMB_CONFIG";

fs::path findConfigFile() {
    if (const char* env = std::getenv(kConfigEnvVar)) {
        const fs::path path(env);
        if (fs::exists(path)) {
            return path;
        }
        std::cerr << kConfigEnvVar << " points to missing file " << path << ", searching defaults" << std::endl;
    }

    const fs::path searchDirs[] = {getExecutableDir(), fs::current_path()};
    for (const auto& dir : searchDirs) {
        for (const char* name : {"roithumb.yaml", "roithumb.yml"}) {
            const fs::path path = dir / name;
            if (fs::exists(path)) {
                return path;
            }
        }
    }

    return {};
}

template<typename T>
T getOrDefault(const YAML::Node& node, const std::string& key, const T& defaultVal) {
    if (node[key]) {
        try {
            return node[key].as<T>();
        } catch (const YAML::Exception& e) {
            std::cerr << "Invalid value for '" << key << "': " << e.what() << std::endl;
            return defaultVal;
        }
    }
    return defaultVal;
}

fs::path resolvePath(const fs::path& path, const fs::path& baseDir) {
    if (path.empty() || path.is_absolute()) {
        return path;
    }
    return fs::weakly_canonical(baseDir / path);
}

// Out-of-range values fall back to the defaults
void sanitize(Config& cfg) {
    const Config defaults;
    if (cfg.upsampleFactor < 1) {
        std::cerr << "upsample_factor must be >= 1, using " << defaults.upsampleFactor << std::endl;
        cfg.upsampleFactor = defaults.upsampleFactor;
    }
    if (cfg.minFrameCount < 0) {
        std::cerr << "min_frame_count must be >= 0, using " << defaults.minFrameCount << std::endl;
        cfg.minFrameCount = defaults.minFrameCount;
    }
    if (cfg.lineWidth < 1) {
        cfg.lineWidth = defaults.lineWidth;
    }
    if (cfg.cacheFrames < 0) {
        cfg.cacheFrames = defaults.cacheFrames;
    }
    for (int& c : cfg.lineColor) {
        c = std::max(0, std::min(255, c));
    }
}

} // anonymous namespace

Config Config::load() {
    fs::path configPath = findConfigFile();
    if (configPath.empty()) {
        std::cout << "No config file found, using defaults" << std::endl;
        return Config();
    }
    return loadFrom(configPath);
}

Config Config::loadFrom(const fs::path& path) {
    Config cfg;

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        if (root["thumbnail"]) {
            auto thumb = root["thumbnail"];

            cfg.upsampleFactor = getOrDefault(thumb, "upsample_factor", cfg.upsampleFactor);
            cfg.minFrameCount = getOrDefault(thumb, "min_frame_count", cfg.minFrameCount);
            cfg.lineWidth = getOrDefault(thumb, "line_width", cfg.lineWidth);

            const auto color = getOrDefault(thumb, "line_color", std::vector<int>());
            if (color.size() >= 3) {
                std::copy_n(color.begin(), 3, cfg.lineColor.begin());
            } else if (!color.empty()) {
                std::cerr << "line_color needs 3 components, keeping default" << std::endl;
            }
        }

        if (root["image_stack"]) {
            auto stack = root["image_stack"];
            if (stack["path"]) {
                cfg.imageStackPath = stack["path"].as<std::string>();
            }
            cfg.cacheFrames = getOrDefault(stack, "cache_frames", cfg.cacheFrames);
        }

        if (root["rois"]) {
            auto rois = root["rois"];
            if (rois["path"]) {
                cfg.roiPath = rois["path"].as<std::string>();
            }
        }

        std::cout << "Loaded config from: " << path << std::endl;

        fs::path baseDir = path.parent_path();
        if (baseDir.empty()) {
            baseDir = getExecutableDir();
        }

        cfg.imageStackPath = resolvePath(cfg.imageStackPath, baseDir);
        cfg.roiPath = resolvePath(cfg.roiPath, baseDir);

    } catch (const YAML::Exception& e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        std::cerr << "Using default configuration" << std::endl;
        return Config();
    }

    sanitize(cfg);
    return cfg;
}

} // namespace roithumb
