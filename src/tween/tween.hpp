/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include "animation_value.hpp"
#include "interpolation.hpp"
#include "timed_unit.hpp"

#include <optional>

namespace twl::tween {

    // Object whose properties can be animated. Each tween type selects one property.
    class TWL_TWEEN_API Tweenable {
    public:
        virtual ~Tweenable() = default;

        [[nodiscard]] virtual AnimationValue getTweenValue(int tween_type) const = 0;
        virtual void setTweenValue(int tween_type, const AnimationValue& value) = 0;
    };

    /**
     * Leaf unit: interpolates one property of one target from the value it holds
     * when the tween initializes to the value given with target().
     */
    class TWL_TWEEN_API Tween final : public TimedUnit {
    public:
        static Tween& to(Tweenable& target, int tween_type, int duration_millis);
        static Tween& from(Tweenable& target, int tween_type, int duration_millis);
        static Tween& set(Tweenable& target, int tween_type);
        static Tween& call(TweenCallback callback);

        // No target and no duration; used for pauses and pure callbacks
        static Tween& mark();

        static void setPoolingEnabled(bool enabled);
        [[nodiscard]] static bool isPoolingEnabled();
        [[nodiscard]] static size_t getPoolSize();
        static void ensurePoolCapacity(size_t min_capacity);
        [[nodiscard]] static Tween* resolve(PoolHandle handle);

        Tween& target(const AnimationValue& value);
        Tween& ease(EasingType easing);

        Tween& start() override;
        Tween& start(TweenManager& manager) override;

        Tween& delay(int millis);
        Tween& repeat(int count, int delay_millis);
        Tween& repeatYoyo(int count, int delay_millis);
        Tween& addCallback(EventType mask, TweenCallback callback);
        Tween& setUserData(std::any data);

        [[nodiscard]] Tweenable* getTarget() const { return target_; }
        [[nodiscard]] int getType() const { return type_; }
        [[nodiscard]] EasingType getEasing() const { return easing_; }
        [[nodiscard]] const std::optional<AnimationValue>& getTargetValue() const { return target_value_; }
        [[nodiscard]] const std::optional<AnimationValue>& getStartValue() const { return start_value_; }

        void free() override;

        [[nodiscard]] int getChildrenCount() const override { return 0; }
        [[nodiscard]] bool containsTarget(const Tweenable* target) const override;
        [[nodiscard]] bool containsTarget(const Tweenable* target, int tween_type) const override;

        [[nodiscard]] nlohmann::json toJson() const override;

    protected:
        void reset() override;

        void initializeOverride() override;
        void computeOverride(int iteration, int last_iteration, int delta_millis) override;
        void forceStartValues(int iteration) override;
        void forceEndValues(int iteration) override;

    private:
        Tween() = default;

        static Pool<Tween>& pool();
        static Tween& setup(Tweenable* target, int tween_type, int duration_millis);

        [[nodiscard]] bool canApply() const;
        void apply(float t);
        void applyValue(const AnimationValue& value);

        Tweenable* target_ = nullptr;
        int type_ = -1;
        EasingType easing_ = EasingType::EASE_IN_OUT;
        bool is_from_ = false;
        bool has_mismatch_ = false;
        std::optional<AnimationValue> start_value_;
        std::optional<AnimationValue> target_value_;
    };

} // namespace twl::tween
