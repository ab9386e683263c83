/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include "timed_unit.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace twl::tween {

    class Tween;

    /**
     * Composite unit made of tweens and nested timelines.
     *
     * Children of a sequence are delayed by build() so that each one starts after
     * the previous one ends; children of a parallel timeline all start at once.
     * The builder methods always act on the innermost open group:
     *
     *   Timeline::createSequence()
     *       .push(Tween::set(sprite, OPACITY).target(0.0f))
     *       .beginParallel()
     *           .push(Tween::to(sprite, OPACITY, 500).target(1.0f))
     *           .push(Tween::to(sprite, SCALE, 500).target(glm::vec2(1.0f)))
     *       .end()
     *       .pushPause(1000)
     *       .push(Tween::to(sprite, ROTATION, 500).target(360.0f))
     *       .repeat(5, 500)
     *       .start(manager);
     *
     * Structural edits are rejected once build() has run.
     */
    class TWL_TWEEN_API Timeline final : public TimedUnit {
    public:
        enum class Mode : uint8_t { SEQUENCE,
                                    PARALLEL };

        static Timeline& createSequence();
        static Timeline& createParallel();

        [[nodiscard]] static size_t getPoolSize();
        static void ensurePoolCapacity(size_t min_capacity);
        [[nodiscard]] static Timeline* resolve(PoolHandle handle);

        // ========== Builder ==========
        Timeline& push(Tween& tween);
        Timeline& push(Timeline& timeline);
        Timeline& pushPause(int millis);
        Timeline& beginSequence();
        Timeline& beginParallel();
        Timeline& end();

        // Children of the innermost open group
        [[nodiscard]] std::span<TimedUnit* const> getChildren() const;
        [[nodiscard]] std::vector<TimedUnit*>& getMutableChildren();

        [[nodiscard]] Mode mode() const { return mode_; }
        [[nodiscard]] bool isBuilt() const { return is_built_; }
        [[nodiscard]] bool isClosed() const { return open_groups_.empty(); }

        // ========== TimedUnit ==========
        Timeline& build() override;
        Timeline& start() override;
        Timeline& start(TweenManager& manager) override;

        Timeline& delay(int millis);
        Timeline& repeat(int count, int delay_millis);
        Timeline& repeatYoyo(int count, int delay_millis);
        Timeline& addCallback(EventType mask, TweenCallback callback);
        Timeline& setUserData(std::any data);

        void free() override;

        [[nodiscard]] int getChildrenCount() const override;
        // Leaf tweens and timelines in the whole subtree, open groups included
        [[nodiscard]] int getTweensCount() const;
        [[nodiscard]] int getTimelinesCount() const;
        [[nodiscard]] bool containsTarget(const Tweenable* target) const override;
        [[nodiscard]] bool containsTarget(const Tweenable* target, int tween_type) const override;

        [[nodiscard]] nlohmann::json toJson() const override;

    protected:
        void reset() override;

        void computeOverride(int iteration, int last_iteration, int delta_millis) override;
        void forceStartValues(int iteration) override;
        void forceEndValues(int iteration) override;

    private:
        Timeline() = default;

        static Pool<Timeline>& pool();
        static Timeline& setup(Mode mode);

        [[nodiscard]] Timeline& current();
        [[nodiscard]] const Timeline& current() const;
        void checkNotBuilt() const;
        Timeline& beginGroup(Mode mode);
        void validateRepeats() const;
        void buildTree();

        std::vector<TimedUnit*> children_;
        // Open nested groups, innermost last. Only the root of a tree uses it.
        std::vector<Timeline*> open_groups_;
        Mode mode_ = Mode::SEQUENCE;
        bool is_built_ = false;
    };

} // namespace twl::tween
