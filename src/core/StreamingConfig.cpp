/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/StreamingConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <stdexcept>

namespace RiverForge {

namespace {

void readNumber(const JsonValue& section, const std::string& sectionName,
                const char* key, double& target, double minValue) {
    if (!section.hasKey(key)) {
        return;
    }
    const auto value = section[key].tryAsNumber();
    if (!value) {
        CONFIG_WARN(sectionName + "." + key + " is not a number, keeping " +
                    std::to_string(target));
        return;
    }
    if (*value < minValue) {
        CONFIG_WARN(sectionName + "." + key + " = " + std::to_string(*value) +
                    " is below " + std::to_string(minValue) + ", keeping " +
                    std::to_string(target));
        return;
    }
    target = *value;
}

template <typename Int>
void readInt(const JsonValue& section, const std::string& sectionName,
             const char* key, Int& target, long long minValue) {
    double value = static_cast<double>(target);
    readNumber(section, sectionName, key, value, static_cast<double>(minValue));
    target = static_cast<Int>(value);
}

void readBool(const JsonValue& section, const std::string& sectionName,
              const char* key, bool& target) {
    if (!section.hasKey(key)) {
        return;
    }
    const auto value = section[key].tryAsBool();
    if (!value) {
        CONFIG_WARN(sectionName + "." + key + " is not a boolean, keeping default");
        return;
    }
    target = *value;
}

const JsonValue* section(const JsonValue& root, const char* name) {
    if (!root.hasKey(name)) {
        return nullptr;
    }
    const JsonValue& value = root[name];
    if (!value.isObject()) {
        CONFIG_WARN(std::string("Section '") + name + "' is not an object, skipping");
        return nullptr;
    }
    return &value;
}

} // namespace

bool StreamingConfig::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        CONFIG_ERROR("Failed to load streaming config from file: " + path + " - " +
                     reader.getLastError());
        return false;
    }
    if (!apply(reader.getRoot())) {
        CONFIG_ERROR("Streaming config root is not a JSON object: " + path);
        return false;
    }
    CONFIG_INFO("Loaded streaming config from file: " + path);
    return true;
}

bool StreamingConfig::apply(const JsonValue& root) {
    if (!root.isObject()) {
        return false;
    }

    if (const JsonValue* s = section(root, "streaming")) {
        const std::string name = "streaming";
        readNumber(*s, name, "chunkSize", chunkSize, 1.0);
        readNumber(*s, name, "chunkWidth", chunkWidth, 1.0);
        readInt(*s, name, "resolutionX", resolutionX, 1);
        readInt(*s, name, "resolutionZ", resolutionZ, 1);
        readInt(*s, name, "meshRowsPerStep", meshRowsPerStep, 1);
        readInt(*s, name, "renderDistance", renderDistance, 0);
        readInt(*s, name, "maxConcurrentLoads", maxConcurrentLoads, 1);
        readNumber(*s, name, "cleanupMargin", cleanupMargin, 0.0);
        readInt(*s, name, "maxConstructionRetries", maxConstructionRetries, 0);
        readBool(*s, name, "designerMode", designerMode);
        readNumber(*s, name, "visibilityRadius", visibilityRadius, 0.0);
        readInt(*s, name, "worldSeed", worldSeed, 0);
    }

    if (const JsonValue* s = section(root, "collision")) {
        const std::string name = "collision";
        readNumber(*s, name, "radius", collision.radius, 1.0);
        readNumber(*s, name, "step", collision.step, 0.01);
        readNumber(*s, name, "updateStep", collision.updateStep, 0.01);
    }

    if (const JsonValue* s = section(root, "decoration")) {
        const std::string name = "decoration";
        readInt(*s, name, "seedAttempts", decoration.seedAttempts, 0);
        readInt(*s, name, "maxK", decoration.maxK, 1);
        readNumber(*s, name, "cellSize", decorationCellSize, 0.01);
    }

    if (const JsonValue* s = section(root, "biomes")) {
        const std::string name = "biomes";
        readInt(*s, name, "seed", biomes.seed, 0);
        readNumber(*s, name, "transitionWidth", biomes.transitionWidth, 0.0);
        if (s->hasKey("fixedBiome")) {
            const JsonValue& fixed = (*s)["fixedBiome"];
            if (fixed.isNull()) {
                biomes.fixedBiome.reset();
            } else if (const auto typeName = fixed.tryAsString()) {
                if (const auto type = biomeTypeFromString(*typeName)) {
                    biomes.fixedBiome = *type;
                } else {
                    CONFIG_WARN("Unknown biome '" + *typeName + "' in biomes.fixedBiome");
                }
            } else {
                CONFIG_WARN("biomes.fixedBiome must be a biome name or null");
            }
        }
    }

    return true;
}

void StreamingConfig::validate() const {
    if (!(chunkSize > 0.0)) {
        throw std::invalid_argument("chunkSize must be positive");
    }
    if (!(chunkWidth > 0.0)) {
        throw std::invalid_argument("chunkWidth must be positive");
    }
    if (resolutionX < 1 || resolutionZ < 1 || meshRowsPerStep < 1) {
        throw std::invalid_argument("mesh resolution and rows per step must be at least 1");
    }
    if (renderDistance < 0) {
        throw std::invalid_argument("renderDistance must not be negative");
    }
    if (maxConcurrentLoads < 1) {
        throw std::invalid_argument("maxConcurrentLoads must be at least 1");
    }
    if (maxConstructionRetries < 0) {
        throw std::invalid_argument("maxConstructionRetries must not be negative");
    }
    if (!(decorationCellSize > 0.0)) {
        throw std::invalid_argument("decoration cell size must be positive");
    }
}

} // namespace RiverForge
