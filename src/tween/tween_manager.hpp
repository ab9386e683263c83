/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace twl::tween {

    class TimedUnit;
    class Tweenable;

    /**
     * Drives a set of root units once per frame. Finished roots (with auto-remove
     * enabled) and killed roots are freed back to their pools at the start of
     * the next update.
     *
     * Not thread-safe: every call on one manager must come from the same thread.
     */
    class TWL_TWEEN_API TweenManager {
    public:
        static constexpr size_t DEFAULT_CAPACITY = 20;

        // Capacity reserved by managers constructed without an explicit one
        static void setDefaultCapacity(size_t capacity);
        [[nodiscard]] static size_t defaultCapacity();

        explicit TweenManager(size_t capacity = defaultCapacity());
        ~TweenManager();

        TweenManager(const TweenManager&) = delete;
        TweenManager& operator=(const TweenManager&) = delete;

        // Starts the unit if needed; adding the same unit twice is a no-op
        TweenManager& add(TimedUnit& unit);

        void update(int delta_millis);

        void killAll();
        void killTarget(const Tweenable* target);
        void killTarget(const Tweenable* target, int tween_type);

        [[nodiscard]] bool containsTarget(const Tweenable* target) const;
        [[nodiscard]] bool containsTarget(const Tweenable* target, int tween_type) const;

        void pause() { is_paused_ = true; }
        void resume() { is_paused_ = false; }
        [[nodiscard]] bool isPaused() const { return is_paused_; }

        void ensureCapacity(size_t min_capacity);

        [[nodiscard]] size_t size() const { return objects_.size(); }
        [[nodiscard]] std::span<TimedUnit* const> getObjects() const { return objects_; }

        [[nodiscard]] int getRunningTweensCount() const;
        [[nodiscard]] int getRunningTimelinesCount() const;

    private:
        void removeFinished();

        std::vector<TimedUnit*> objects_;
        bool is_paused_ = false;
    };

} // namespace twl::tween
