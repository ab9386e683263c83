/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "tween_manager.hpp"
#include "timeline.hpp"
#include "tween.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <atomic>

namespace twl::tween {

    namespace {
        std::atomic<size_t> g_default_capacity{TweenManager::DEFAULT_CAPACITY};
    } // namespace

    void TweenManager::setDefaultCapacity(const size_t capacity) {
        g_default_capacity.store(capacity);
    }

    size_t TweenManager::defaultCapacity() {
        return g_default_capacity.load();
    }

    TweenManager::TweenManager(const size_t capacity) {
        objects_.reserve(capacity);
    }

    TweenManager::~TweenManager() {
        for (TimedUnit* unit : objects_) {
            unit->free();
        }
    }

    TweenManager& TweenManager::add(TimedUnit& unit) {
        if (std::ranges::find(objects_, &unit) == objects_.end()) {
            objects_.push_back(&unit);
            LOG_DEBUG("TweenManager: registered unit ({} running)", objects_.size());
        }
        if (!unit.isStarted()) {
            unit.start();
        }
        return *this;
    }

    void TweenManager::removeFinished() {
        for (size_t i = objects_.size(); i-- > 0;) {
            TimedUnit* const unit = objects_[i];
            if ((unit->isFinished() && unit->isAutoRemoveEnabled()) || unit->isKilled()) {
                objects_.erase(objects_.begin() + static_cast<ptrdiff_t>(i));
                unit->free();
            }
        }
    }

    void TweenManager::update(const int delta_millis) {
        removeFinished();

        if (is_paused_) {
            return;
        }

        if (delta_millis >= 0) {
            for (TimedUnit* unit : objects_) {
                unit->update(delta_millis);
            }
        } else {
            for (auto it = objects_.rbegin(); it != objects_.rend(); ++it) {
                (*it)->update(delta_millis);
            }
        }
    }

    void TweenManager::killAll() {
        for (TimedUnit* unit : objects_) {
            unit->kill();
        }
    }

    void TweenManager::killTarget(const Tweenable* target) {
        for (TimedUnit* unit : objects_) {
            unit->killTarget(target);
        }
    }

    void TweenManager::killTarget(const Tweenable* target, const int tween_type) {
        for (TimedUnit* unit : objects_) {
            unit->killTarget(target, tween_type);
        }
    }

    bool TweenManager::containsTarget(const Tweenable* target) const {
        return std::ranges::any_of(objects_, [target](const TimedUnit* unit) {
            return unit->containsTarget(target);
        });
    }

    bool TweenManager::containsTarget(const Tweenable* target, const int tween_type) const {
        return std::ranges::any_of(objects_, [target, tween_type](const TimedUnit* unit) {
            return unit->containsTarget(target, tween_type);
        });
    }

    void TweenManager::ensureCapacity(const size_t min_capacity) {
        objects_.reserve(min_capacity);
    }

    int TweenManager::getRunningTweensCount() const {
        int count = 0;
        for (const TimedUnit* unit : objects_) {
            const auto* timeline = dynamic_cast<const Timeline*>(unit);
            count += timeline ? timeline->getTweensCount() : 1;
        }
        return count;
    }

    int TweenManager::getRunningTimelinesCount() const {
        int count = 0;
        for (const TimedUnit* unit : objects_) {
            if (const auto* timeline = dynamic_cast<const Timeline*>(unit)) {
                count += timeline->getTimelinesCount();
            }
        }
        return count;
    }

} // namespace twl::tween
