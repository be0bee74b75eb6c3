/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/NavConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>

namespace Nightfall {

namespace {

using FieldRef = std::variant<float*, int*>;
using FieldTable = std::unordered_map<std::string, FieldRef>;

void requirePositive(float value, const char* name) {
    if (!(value > 0.0f)) {
        throw std::invalid_argument(std::string("NavConfig: ") + name +
                                    " must be positive, got " + std::to_string(value));
    }
}

void requireNonNegative(float value, const char* name) {
    if (value < 0.0f) {
        throw std::invalid_argument(std::string("NavConfig: ") + name +
                                    " must be non-negative, got " + std::to_string(value));
    }
}

bool applyCategory(const std::string& categoryName, const JsonValue& category,
                   const FieldTable& fields) {
    if (!category.isObject()) {
        CONFIG_WARN("Category '" + categoryName + "' is not an object, skipping");
        return true;
    }

    for (const auto& [key, value] : category.asObject()) {
        auto it = fields.find(key);
        if (it == fields.end()) {
            CONFIG_WARN("Unknown setting '" + categoryName + "." + key + "', skipping");
            continue;
        }
        if (!value.isNumber()) {
            CONFIG_ERROR("Setting '" + categoryName + "." + key + "' is not a number");
            return false;
        }

        const double number = value.asNumber();
        if (auto* f = std::get_if<float*>(&it->second)) {
            if (std::fabs(number) > std::numeric_limits<float>::max()) {
                CONFIG_ERROR("Setting '" + categoryName + "." + key + "' is out of range");
                return false;
            }
            **f = static_cast<float>(number);
        } else {
            if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
                CONFIG_ERROR("Setting '" + categoryName + "." + key + "' is out of range");
                return false;
            }
            *std::get<int*>(it->second) = static_cast<int>(number);
        }
    }
    return true;
}

} // namespace

void NavConfig::validate() const {
    requirePositive(grid.cellSize, "grid.cellSize");
    if (grid.expandCells < 0) {
        throw std::invalid_argument("NavConfig: grid.expandCells must be non-negative, got " +
                                    std::to_string(grid.expandCells));
    }
    if (pathfinder.maxExpansions <= 0) {
        throw std::invalid_argument("NavConfig: pathfinder.maxExpansions must be positive, got " +
                                    std::to_string(pathfinder.maxExpansions));
    }

    requirePositive(steering.maxSpeed, "steering.maxSpeed");
    requirePositive(steering.acceleration, "steering.acceleration");
    requireNonNegative(steering.separationRadius, "steering.separationRadius");
    requireNonNegative(steering.separationForce, "steering.separationForce");
    requireNonNegative(steering.avoidForce, "steering.avoidForce");
    requireNonNegative(steering.avoidRadiusMin, "steering.avoidRadiusMin");
    requireNonNegative(steering.avoidRadiusCellFactor, "steering.avoidRadiusCellFactor");
    requirePositive(steering.waypointRadiusMin, "steering.waypointRadiusMin");
    requireNonNegative(steering.waypointRadiusCellFactor, "steering.waypointRadiusCellFactor");
    requireNonNegative(steering.collisionPushCellFactor, "steering.collisionPushCellFactor");
    requireNonNegative(steering.collisionDamping, "steering.collisionDamping");

    requirePositive(timing.recalcInterval, "timing.recalcInterval");
    requireNonNegative(timing.despawnDelay, "timing.despawnDelay");

    requirePositive(dayNight.dayLength, "dayNight.dayLength");
    requirePositive(dayNight.nightLength, "dayNight.nightLength");
    requireNonNegative(dayNight.haltWindow, "dayNight.haltWindow");
    if (dayNight.haltWindow > dayNight.nightLength) {
        throw std::invalid_argument("NavConfig: dayNight.haltWindow exceeds dayNight.nightLength");
    }
}

bool applyNavConfig(const JsonValue& root, NavConfig& config) {
    if (!root.isObject()) {
        CONFIG_ERROR("Navigation config root is not a JSON object");
        return false;
    }

    NavConfig merged = config;

    const std::unordered_map<std::string, FieldTable> categories = {
        {"grid", {{"cellSize", &merged.grid.cellSize},
                  {"expandCells", &merged.grid.expandCells}}},
        {"pathfinder", {{"maxExpansions", &merged.pathfinder.maxExpansions}}},
        {"steering", {{"maxSpeed", &merged.steering.maxSpeed},
                      {"acceleration", &merged.steering.acceleration},
                      {"separationRadius", &merged.steering.separationRadius},
                      {"separationForce", &merged.steering.separationForce},
                      {"avoidForce", &merged.steering.avoidForce},
                      {"avoidRadiusMin", &merged.steering.avoidRadiusMin},
                      {"avoidRadiusCellFactor", &merged.steering.avoidRadiusCellFactor},
                      {"waypointRadiusMin", &merged.steering.waypointRadiusMin},
                      {"waypointRadiusCellFactor", &merged.steering.waypointRadiusCellFactor},
                      {"collisionPushCellFactor", &merged.steering.collisionPushCellFactor},
                      {"collisionDamping", &merged.steering.collisionDamping},
                      {"contactRebound", &merged.steering.contactRebound}}},
        {"timing", {{"recalcInterval", &merged.timing.recalcInterval},
                    {"despawnDelay", &merged.timing.despawnDelay}}},
        {"dayNight", {{"dayLength", &merged.dayNight.dayLength},
                      {"nightLength", &merged.dayNight.nightLength},
                      {"haltWindow", &merged.dayNight.haltWindow}}},
    };

    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        auto it = categories.find(categoryName);
        if (it == categories.end()) {
            // Other sections (round layout) are read elsewhere
            continue;
        }
        if (!applyCategory(categoryName, categoryValue, it->second)) {
            return false;
        }
    }

    try {
        merged.validate();
    } catch (const std::invalid_argument& e) {
        CONFIG_ERROR(std::string("Rejected navigation config: ") + e.what());
        return false;
    }

    config = merged;
    return true;
}

bool loadNavConfig(const std::string& filepath, NavConfig& config) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        CONFIG_ERROR("Failed to load navigation config from file: " + filepath + " - " +
                     reader.getLastError());
        return false;
    }

    if (!applyNavConfig(reader.getRoot(), config)) {
        CONFIG_ERROR("Navigation config left at previous values: " + filepath);
        return false;
    }

    CONFIG_INFO("Loaded navigation config from file: " + filepath);
    return true;
}

} // namespace Nightfall
