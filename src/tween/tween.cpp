/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "tween.hpp"
#include "tween_manager.hpp"

#include "core/logger.hpp"

#include <atomic>
#include <nlohmann/json.hpp>

namespace twl::tween {

    namespace {
        constexpr size_t DEFAULT_POOL_CAPACITY = 20;

        std::atomic<bool> g_pooling_enabled{true};
    } // namespace

    Pool<Tween>& Tween::pool() {
        static Pool<Tween> instance(
            DEFAULT_POOL_CAPACITY,
            [] { return std::unique_ptr<Tween>(new Tween()); },
            Pool<Tween>::Callbacks{
                .on_pool = [](Tween& obj) { obj.reset(); },
                .on_unpool = [](Tween& obj) {
                    obj.reset();
                    obj.is_pooled_ = isPoolingEnabled();
                },
            });
        return instance;
    }

    void Tween::setPoolingEnabled(const bool enabled) {
        g_pooling_enabled.store(enabled);
    }

    bool Tween::isPoolingEnabled() {
        return g_pooling_enabled.load();
    }

    size_t Tween::getPoolSize() {
        return pool().size();
    }

    void Tween::ensurePoolCapacity(const size_t min_capacity) {
        pool().ensureCapacity(min_capacity);
    }

    Tween* Tween::resolve(const PoolHandle handle) {
        return pool().resolve(handle);
    }

    // ========== Factories ==========

    Tween& Tween::setup(Tweenable* target, const int tween_type, const int duration_millis) {
        Tween& tween = pool().get();
        tween.target_ = target;
        tween.type_ = tween_type;
        tween.duration_ = duration_millis;
        return tween;
    }

    Tween& Tween::to(Tweenable& target, const int tween_type, const int duration_millis) {
        return setup(&target, tween_type, duration_millis);
    }

    Tween& Tween::from(Tweenable& target, const int tween_type, const int duration_millis) {
        Tween& tween = setup(&target, tween_type, duration_millis);
        tween.is_from_ = true;
        return tween;
    }

    Tween& Tween::set(Tweenable& target, const int tween_type) {
        return setup(&target, tween_type, 0);
    }

    Tween& Tween::call(TweenCallback callback) {
        Tween& tween = setup(nullptr, -1, 0);
        tween.addCallback(EventType::START, std::move(callback));
        return tween;
    }

    Tween& Tween::mark() {
        return setup(nullptr, -1, 0);
    }

    // ========== Fluent setters ==========

    Tween& Tween::target(const AnimationValue& value) {
        target_value_ = value;
        return *this;
    }

    Tween& Tween::ease(const EasingType easing) {
        easing_ = easing;
        return *this;
    }

    Tween& Tween::start() {
        TimedUnit::start();
        return *this;
    }

    Tween& Tween::start(TweenManager& manager) {
        manager.add(*this);
        return *this;
    }

    Tween& Tween::delay(const int millis) {
        TimedUnit::delay(millis);
        return *this;
    }

    Tween& Tween::repeat(const int count, const int delay_millis) {
        TimedUnit::repeat(count, delay_millis);
        return *this;
    }

    Tween& Tween::repeatYoyo(const int count, const int delay_millis) {
        TimedUnit::repeatYoyo(count, delay_millis);
        return *this;
    }

    Tween& Tween::addCallback(const EventType mask, TweenCallback callback) {
        TimedUnit::addCallback(mask, std::move(callback));
        return *this;
    }

    Tween& Tween::setUserData(std::any data) {
        TimedUnit::setUserData(std::move(data));
        return *this;
    }

    // ========== Lifecycle ==========

    void Tween::reset() {
        TimedUnit::reset();
        target_ = nullptr;
        type_ = -1;
        easing_ = EasingType::EASE_IN_OUT;
        is_from_ = false;
        has_mismatch_ = false;
        start_value_.reset();
        target_value_.reset();
    }

    void Tween::free() {
        if (is_pooled_) {
            pool().free(*this);
        } else {
            pool().release(*this);
        }
    }

    void Tween::initializeOverride() {
        if (!target_ || !target_value_) {
            return;
        }

        start_value_ = target_->getTweenValue(type_);
        if (start_value_->index() != target_value_->index()) {
            LOG_ERROR("Tween type {}: target holds a {} value but the tween targets a {} value",
                      type_, valueTypeName(getValueType(*start_value_)),
                      valueTypeName(getValueType(*target_value_)));
            has_mismatch_ = true;
            return;
        }

        if (is_from_) {
            std::swap(*start_value_, *target_value_);
        }
    }

    void Tween::computeOverride(const int iteration, int /*last_iteration*/, int /*delta_millis*/) {
        if (!canApply()) {
            return;
        }

        float t;
        if (duration_ > 0) {
            t = static_cast<float>(current_time_) / static_cast<float>(duration_);
        } else {
            t = isMovingForward() ? 1.0f : 0.0f;
        }
        if (isIterationYoyo(iteration)) {
            t = 1.0f - t;
        }
        apply(t);
    }

    void Tween::forceStartValues(const int iteration) {
        if (!canApply()) {
            return;
        }
        applyValue(isIterationYoyo(iteration) ? *target_value_ : *start_value_);
    }

    void Tween::forceEndValues(const int iteration) {
        if (!canApply()) {
            return;
        }
        applyValue(isIterationYoyo(iteration) ? *start_value_ : *target_value_);
    }

    bool Tween::canApply() const {
        return target_ && start_value_ && target_value_ && !has_mismatch_;
    }

    void Tween::apply(const float t) {
        // Pass boundaries snap to the exact endpoint values
        if (t <= 0.0f) {
            applyValue(*start_value_);
        } else if (t >= 1.0f) {
            applyValue(*target_value_);
        } else {
            applyValue(interpolateValue(*start_value_, *target_value_, applyEasing(t, easing_)));
        }
    }

    void Tween::applyValue(const AnimationValue& value) {
        target_->setTweenValue(type_, value);
    }

    // ========== Queries ==========

    bool Tween::containsTarget(const Tweenable* target) const {
        return target_ != nullptr && target_ == target;
    }

    bool Tween::containsTarget(const Tweenable* target, const int tween_type) const {
        return containsTarget(target) && type_ == tween_type;
    }

    nlohmann::json Tween::toJson() const {
        nlohmann::json j = TimedUnit::toJson();
        j["kind"] = "tween";
        j["tween_type"] = type_;
        j["easing"] = std::string(easingTypeName(easing_));
        j["from"] = is_from_;
        if (target_value_) {
            j["target"] = valueToJson(*target_value_);
        }
        return j;
    }

} // namespace twl::tween
