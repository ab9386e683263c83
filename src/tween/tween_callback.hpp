/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <functional>

namespace twl::tween {

    class TimedUnit;

    // Bit flags; a callback registered with a mask receives every event in it
    enum class EventType : uint16_t {
        BEGIN = 0x01,         // right after the delay
        START = 0x02,         // at each iteration beginning
        END = 0x04,           // at each iteration ending, before the repeat delay
        COMPLETE = 0x08,      // at last END event
        BACK_BEGIN = 0x10,    // at the beginning of the first backward iteration
        BACK_START = 0x20,    // at each backward iteration beginning, after the repeat delay
        BACK_END = 0x40,      // at each backward iteration ending
        BACK_COMPLETE = 0x80, // at last BACK_END event
        ANY_FORWARD = 0x0F,
        ANY_BACKWARD = 0xF0,
        ANY = 0xFF,
    };

    [[nodiscard]] constexpr EventType operator|(const EventType a, const EventType b) {
        return static_cast<EventType>(static_cast<uint16_t>(a) | static_cast<uint16_t>(b));
    }

    [[nodiscard]] constexpr bool hasEvent(const EventType mask, const EventType event) {
        return (static_cast<uint16_t>(mask) & static_cast<uint16_t>(event)) != 0;
    }

    using TweenCallback = std::function<void(EventType, TimedUnit&)>;

} // namespace twl::tween
