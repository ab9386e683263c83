/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <cstdint>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string_view>
#include <variant>

namespace twl::tween {

    enum class ValueType : uint8_t { Bool,
                                     Int,
                                     Float,
                                     Vec2,
                                     Vec3,
                                     Vec4,
                                     Quat,
                                     Mat4 };

    using AnimationValue = std::variant<bool, int, float, glm::vec2, glm::vec3, glm::vec4, glm::quat, glm::mat4>;

    [[nodiscard]] inline ValueType getValueType(const AnimationValue& value) {
        return static_cast<ValueType>(value.index());
    }

    [[nodiscard]] TWL_TWEEN_API std::string_view valueTypeName(ValueType type);

    // Both values must hold the same alternative
    [[nodiscard]] TWL_TWEEN_API AnimationValue interpolateValue(const AnimationValue& a, const AnimationValue& b, float t);

    [[nodiscard]] TWL_TWEEN_API nlohmann::json valueToJson(const AnimationValue& value);

} // namespace twl::tween
