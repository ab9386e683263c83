/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "animation_value.hpp"

#include <cassert>
#include <nlohmann/json.hpp>

namespace twl::tween {

    std::string_view valueTypeName(const ValueType type) {
        switch (type) {
        case ValueType::Bool:
            return "bool";
        case ValueType::Int:
            return "int";
        case ValueType::Float:
            return "float";
        case ValueType::Vec2:
            return "vec2";
        case ValueType::Vec3:
            return "vec3";
        case ValueType::Vec4:
            return "vec4";
        case ValueType::Quat:
            return "quat";
        case ValueType::Mat4:
            return "mat4";
        }
        return "float";
    }

    AnimationValue interpolateValue(const AnimationValue& a, const AnimationValue& b, float t) {
        assert(a.index() == b.index() && "Cannot interpolate different value types");

        return std::visit(
            [&b, t](auto&& from) -> AnimationValue {
                using T = std::decay_t<decltype(from)>;
                const auto& to = std::get<T>(b);

                if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int>) {
                    return t >= 0.5f ? to : from;
                } else if constexpr (std::is_same_v<T, float>) {
                    return from + (to - from) * t;
                } else if constexpr (std::is_same_v<T, glm::vec2> || std::is_same_v<T, glm::vec3> ||
                                     std::is_same_v<T, glm::vec4>) {
                    return glm::mix(from, to, t);
                } else if constexpr (std::is_same_v<T, glm::quat>) {
                    return glm::slerp(from, to, t);
                } else if constexpr (std::is_same_v<T, glm::mat4>) {
                    glm::mat4 result;
                    for (int i = 0; i < 4; ++i) {
                        result[i] = glm::mix(from[i], to[i], t);
                    }
                    return result;
                } else {
                    return from;
                }
            },
            a);
    }

    nlohmann::json valueToJson(const AnimationValue& value) {
        return std::visit(
            [](auto&& v) -> nlohmann::json {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int> || std::is_same_v<T, float>) {
                    return v;
                } else if constexpr (std::is_same_v<T, glm::vec2>) {
                    return nlohmann::json::array({v.x, v.y});
                } else if constexpr (std::is_same_v<T, glm::vec3>) {
                    return nlohmann::json::array({v.x, v.y, v.z});
                } else if constexpr (std::is_same_v<T, glm::vec4>) {
                    return nlohmann::json::array({v.x, v.y, v.z, v.w});
                } else if constexpr (std::is_same_v<T, glm::quat>) {
                    return nlohmann::json::array({v.w, v.x, v.y, v.z});
                } else if constexpr (std::is_same_v<T, glm::mat4>) {
                    nlohmann::json arr = nlohmann::json::array();
                    for (int i = 0; i < 4; ++i) {
                        for (int j = 0; j < 4; ++j) {
                            arr.push_back(v[i][j]);
                        }
                    }
                    return arr;
                }
                return nullptr;
            },
            value);
    }

} // namespace twl::tween
