/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include "pool.hpp"
#include "tween_callback.hpp"

#include <any>
#include <nlohmann/json_fwd.hpp>
#include <utility>
#include <vector>

namespace twl::tween {

    class TweenManager;
    class Tweenable;

    /**
     * Shared timing and lifecycle contract of leaf tweens and timelines.
     *
     * Time is counted in integer milliseconds. Iterations are numbered so that
     * even values are play passes and odd values are the repeat delays between
     * them; -1 is "before the first pass" and repeatCount*2+1 is "after the last".
     *
     * update() walks the delta through those boundaries one segment at a time and
     * hands every segment spent inside a pass to computeOverride().
     */
    class TWL_TWEEN_API TimedUnit {
    public:
        virtual ~TimedUnit() = default;

        TimedUnit(const TimedUnit&) = delete;
        TimedUnit& operator=(const TimedUnit&) = delete;

        virtual TimedUnit& build() { return *this; }
        virtual TimedUnit& start();
        virtual TimedUnit& start(TweenManager& manager);

        TimedUnit& delay(int millis);
        TimedUnit& repeat(int count, int delay_millis);
        TimedUnit& repeatYoyo(int count, int delay_millis);
        TimedUnit& addCallback(EventType mask, TweenCallback callback);
        TimedUnit& setUserData(std::any data);

        void update(int delta_millis);

        void kill() { is_killed_ = true; }
        void pause() { is_paused_ = true; }
        void resume() { is_paused_ = false; }

        // Returns the unit to its pool; the caller must not touch it afterwards
        virtual void free() = 0;

        void forceToStart();
        void forceToEnd(int millis);

        [[nodiscard]] bool isIterationYoyo(int iteration) const;

        // -1 when repeating forever
        [[nodiscard]] int getFullDuration() const;

        [[nodiscard]] int getDelay() const { return delay_; }
        [[nodiscard]] int getDuration() const { return duration_; }
        [[nodiscard]] int getRepeatCount() const { return repeat_count_; }
        [[nodiscard]] int getRepeatDelay() const { return repeat_delay_; }
        [[nodiscard]] bool isYoyo() const { return is_yoyo_; }
        [[nodiscard]] int getCurrentTime() const { return current_time_; }
        [[nodiscard]] int getIteration() const { return iteration_; }
        [[nodiscard]] bool isStarted() const { return is_started_; }
        [[nodiscard]] bool isInitialized() const { return is_initialized_; }
        [[nodiscard]] bool isFinished() const { return is_finished_ || is_killed_; }
        [[nodiscard]] bool isKilled() const { return is_killed_; }
        [[nodiscard]] bool isPaused() const { return is_paused_; }
        [[nodiscard]] bool isPooled() const { return is_pooled_; }
        [[nodiscard]] const std::any& getUserData() const { return user_data_; }

        [[nodiscard]] bool isAutoRemoveEnabled() const { return is_auto_remove_enabled_; }
        void setAutoRemove(const bool enabled) { is_auto_remove_enabled_ = enabled; }

        [[nodiscard]] virtual int getChildrenCount() const = 0;
        [[nodiscard]] virtual bool containsTarget(const Tweenable* target) const = 0;
        [[nodiscard]] virtual bool containsTarget(const Tweenable* target, int tween_type) const = 0;

        // All or nothing: the whole unit is killed when any part of it matches
        void killTarget(const Tweenable* target);
        void killTarget(const Tweenable* target, int tween_type);

        [[nodiscard]] virtual nlohmann::json toJson() const;

        [[nodiscard]] PoolHandle poolHandle() const { return pool_handle_; }
        void setPoolHandle(const PoolHandle handle) { pool_handle_ = handle; }

    protected:
        TimedUnit() = default;

        virtual void reset();

        virtual void initializeOverride() {}
        virtual void computeOverride(int iteration, int last_iteration, int delta_millis) = 0;
        virtual void forceStartValues(int iteration) = 0;
        virtual void forceEndValues(int iteration) = 0;

        // Direction of the update currently being processed
        [[nodiscard]] bool isMovingForward() const { return is_moving_forward_; }

        int delay_ = 0;
        int duration_ = 0;
        int current_time_ = 0;
        bool is_pooled_ = false;

    private:
        void initialize();
        void testRelaunch();
        void updateIteration();
        void testCompletion();
        void callCallback(EventType event);

        [[nodiscard]] bool isValid(int iteration) const;
        [[nodiscard]] bool isDegenerateLoop() const;

        int repeat_count_ = 0;
        int repeat_delay_ = 0;
        bool is_yoyo_ = false;

        int iteration_ = -2;
        int pending_delta_ = 0;
        bool is_iteration_step_ = false;
        bool is_moving_forward_ = true;

        bool is_started_ = false;
        bool is_initialized_ = false;
        bool is_finished_ = false;
        bool is_killed_ = false;
        bool is_paused_ = false;
        bool is_auto_remove_enabled_ = true;

        std::vector<std::pair<EventType, TweenCallback>> callbacks_;
        std::any user_data_;
        PoolHandle pool_handle_;
    };

} // namespace twl::tween
