/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/RoundSetup.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cstdint>
#include <stdexcept>

namespace Nightfall {

namespace {

float requireNumber(const JsonValue& obj, const std::string& key, const std::string& where) {
    auto value = obj[key].tryAsNumber();
    if (!value) {
        throw std::invalid_argument(where + " is missing number '" + key + "'");
    }
    return static_cast<float>(*value);
}

Vector2D requirePosition(const JsonValue& obj, const std::string& where) {
    return Vector2D(requireNumber(obj, "x", where), requireNumber(obj, "y", where));
}

bool insideWorld(const Vector2D& p, float w, float h) {
    return p.getX() >= 0.0f && p.getX() <= w && p.getY() >= 0.0f && p.getY() <= h;
}

} // namespace

void RoundSetup::validate() const {
    if (!(worldWidth > 0.0f) || !(worldHeight > 0.0f)) {
        throw std::invalid_argument("RoundSetup: world size must be positive, got " +
                                    std::to_string(worldWidth) + "x" + std::to_string(worldHeight));
    }
    if (!insideWorld(playerStart, worldWidth, worldHeight)) {
        throw std::invalid_argument("RoundSetup: player start lies outside the world");
    }
    for (size_t i = 0; i < enemies.size(); ++i) {
        if (!insideWorld(enemies[i].position, worldWidth, worldHeight)) {
            throw std::invalid_argument("RoundSetup: enemy spawn " + std::to_string(i) +
                                        " lies outside the world");
        }
    }
}

CollisionShape parseCollisionShape(const JsonValue& value) {
    auto kind = value["kind"].tryAsString();
    if (!kind) {
        throw std::invalid_argument("Collision shape has no 'kind'");
    }

    if (*kind == "box") {
        return CollisionShape::box(requireNumber(value, "halfWidth", "box shape"),
                                   requireNumber(value, "halfHeight", "box shape"));
    }
    if (*kind == "circle") {
        return CollisionShape::circle(requireNumber(value, "radius", "circle shape"));
    }
    if (*kind == "mask") {
        const JsonArray* rows = value["rows"].tryAsArray();
        if (!rows || rows->empty()) {
            throw std::invalid_argument("Mask shape needs a non-empty 'rows' array");
        }
        const int height = static_cast<int>(rows->size());
        int width = -1;
        std::vector<uint8_t> pixels;
        for (const auto& row : *rows) {
            auto text = row.tryAsString();
            if (!text) {
                throw std::invalid_argument("Mask shape rows must be strings");
            }
            if (width < 0) {
                width = static_cast<int>(text->size());
            } else if (static_cast<int>(text->size()) != width) {
                throw std::invalid_argument("Mask shape rows differ in length");
            }
            for (char c : *text) {
                pixels.push_back(c == '#' ? 1 : 0);
            }
        }
        return CollisionShape::mask(width, height, std::move(pixels));
    }

    throw std::invalid_argument("Unknown collision shape kind: " + *kind);
}

bool applyRoundSetup(const JsonValue& root, RoundSetup& setup) {
    const JsonValue& round = root["round"];
    if (!round.isObject()) {
        ROUND_ERROR("Config has no 'round' object");
        return false;
    }

    RoundSetup parsed;
    try {
        if (round.hasKey("worldWidth")) {
            parsed.worldWidth = requireNumber(round, "worldWidth", "round");
        }
        if (round.hasKey("worldHeight")) {
            parsed.worldHeight = requireNumber(round, "worldHeight", "round");
        }

        const JsonValue& player = round["player"];
        if (player.isObject()) {
            parsed.playerStart = requirePosition(player, "player");
            if (player.hasKey("shape")) {
                parsed.playerShape = parseCollisionShape(player["shape"]);
            }
        }

        if (const JsonArray* obstacles = round["obstacles"].tryAsArray()) {
            parsed.obstacles.reserve(obstacles->size());
            for (const auto& entry : *obstacles) {
                AABB rect = AABB::fromRect(requireNumber(entry, "x", "obstacle"),
                                           requireNumber(entry, "y", "obstacle"),
                                           requireNumber(entry, "width", "obstacle"),
                                           requireNumber(entry, "height", "obstacle"));
                if (entry.hasKey("shape")) {
                    parsed.obstacles.emplace_back(rect, parseCollisionShape(entry["shape"]));
                } else {
                    parsed.obstacles.push_back(Obstacle::solid(rect));
                }
            }
        }

        if (const JsonArray* enemies = round["enemies"].tryAsArray()) {
            parsed.enemies.reserve(enemies->size());
            for (const auto& entry : *enemies) {
                EnemySpawn spawn;
                spawn.position = requirePosition(entry, "enemy");
                if (entry.hasKey("shape")) {
                    spawn.shape = parseCollisionShape(entry["shape"]);
                }
                parsed.enemies.push_back(std::move(spawn));
            }
        }

        parsed.validate();
    } catch (const std::invalid_argument& e) {
        ROUND_ERROR(std::string("Rejected round setup: ") + e.what());
        return false;
    }

    setup = std::move(parsed);
    return true;
}

bool loadRoundSetup(const std::string& filepath, RoundSetup& setup) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        ROUND_ERROR("Failed to load round setup from file: " + filepath + " - " +
                    reader.getLastError());
        return false;
    }
    if (!applyRoundSetup(reader.getRoot(), setup)) {
        return false;
    }

    ROUND_INFO("Loaded round setup from " + filepath + ": " +
               std::to_string(setup.obstacles.size()) + " obstacles, " +
               std::to_string(setup.enemies.size()) + " enemies");
    return true;
}

} // namespace Nightfall
