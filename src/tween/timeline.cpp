/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "timeline.hpp"
#include "tween.hpp"
#include "tween_error.hpp"
#include "tween_manager.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <limits>
#include <nlohmann/json.hpp>

namespace twl::tween {

    namespace {
        constexpr size_t DEFAULT_POOL_CAPACITY = 10;

        const char* modeName(const Timeline::Mode mode) {
            return mode == Timeline::Mode::SEQUENCE ? "sequence" : "parallel";
        }
    } // namespace

    // ========== Pool ==========

    Pool<Timeline>& Timeline::pool() {
        static Pool<Timeline> instance(
            DEFAULT_POOL_CAPACITY,
            [] { return std::unique_ptr<Timeline>(new Timeline()); },
            Pool<Timeline>::Callbacks{
                .on_pool = [](Timeline& obj) { obj.reset(); },
                .on_unpool = [](Timeline& obj) { obj.is_pooled_ = Tween::isPoolingEnabled(); },
            });
        return instance;
    }

    size_t Timeline::getPoolSize() {
        return pool().size();
    }

    void Timeline::ensurePoolCapacity(const size_t min_capacity) {
        pool().ensureCapacity(min_capacity);
    }

    Timeline* Timeline::resolve(const PoolHandle handle) {
        return pool().resolve(handle);
    }

    Timeline& Timeline::setup(const Mode mode) {
        Timeline& timeline = pool().get();
        timeline.mode_ = mode;
        return timeline;
    }

    Timeline& Timeline::createSequence() {
        return setup(Mode::SEQUENCE);
    }

    Timeline& Timeline::createParallel() {
        return setup(Mode::PARALLEL);
    }

    void Timeline::reset() {
        TimedUnit::reset();
        children_.clear();
        open_groups_.clear();
        mode_ = Mode::SEQUENCE;
        is_built_ = false;
    }

    // ========== Builder ==========

    Timeline& Timeline::current() {
        return open_groups_.empty() ? *this : *open_groups_.back();
    }

    const Timeline& Timeline::current() const {
        return open_groups_.empty() ? *this : *open_groups_.back();
    }

    void Timeline::checkNotBuilt() const {
        if (is_built_) {
            throw TweenError(TweenErrorCode::StructuralMutationAfterBuild,
                             "You can't push anything to a timeline once it is started");
        }
    }

    Timeline& Timeline::push(Tween& tween) {
        checkNotBuilt();
        current().children_.push_back(&tween);
        return *this;
    }

    Timeline& Timeline::push(Timeline& timeline) {
        checkNotBuilt();
        if (!timeline.isClosed()) {
            throw TweenError(TweenErrorCode::UnclosedNestedTree,
                             std::format("You forgot to call {} 'end()' statement(s) in your pushed timeline",
                                         timeline.open_groups_.size()));
        }
        current().children_.push_back(&timeline);
        return *this;
    }

    Timeline& Timeline::pushPause(const int millis) {
        checkNotBuilt();
        current().children_.push_back(&Tween::mark().delay(millis));
        return *this;
    }

    Timeline& Timeline::beginGroup(const Mode mode) {
        checkNotBuilt();
        Timeline& group = setup(mode);
        current().children_.push_back(&group);
        open_groups_.push_back(&group);
        return *this;
    }

    Timeline& Timeline::beginSequence() {
        return beginGroup(Mode::SEQUENCE);
    }

    Timeline& Timeline::beginParallel() {
        return beginGroup(Mode::PARALLEL);
    }

    Timeline& Timeline::end() {
        checkNotBuilt();
        if (open_groups_.empty()) {
            throw TweenError(TweenErrorCode::DanglingOpenGroup, "Nothing to end...");
        }
        open_groups_.pop_back();
        return *this;
    }

    std::span<TimedUnit* const> Timeline::getChildren() const {
        return current().children_;
    }

    std::vector<TimedUnit*>& Timeline::getMutableChildren() {
        checkNotBuilt();
        return current().children_;
    }

    // ========== Build ==========

    Timeline& Timeline::build() {
        if (is_built_) {
            return *this;
        }

        // Rejects the whole tree before any delay is rewritten
        validateRepeats();

        if (!open_groups_.empty()) {
            LOG_WARN("Building a timeline with {} unclosed nested group(s)", open_groups_.size());
        }

        buildTree();
        return *this;
    }

    void Timeline::validateRepeats() const {
        for (const TimedUnit* child : children_) {
            if (child->getRepeatCount() < 0) {
                throw TweenError(TweenErrorCode::InfiniteRepeatInComposite,
                                 "You can't push an object with infinite repetitions in a timeline");
            }
            if (const auto* nested = dynamic_cast<const Timeline*>(child); nested && !nested->is_built_) {
                nested->validateRepeats();
            }
        }
    }

    void Timeline::buildTree() {
        constexpr int64_t MAX_DURATION = std::numeric_limits<int>::max();
        int64_t duration = 0;

        for (TimedUnit* child : children_) {
            child->build();

            switch (mode_) {
            case Mode::SEQUENCE: {
                const auto offset = static_cast<int>(duration);
                duration = std::min(duration + child->getFullDuration(), MAX_DURATION);
                child->delay(offset);
                break;
            }
            case Mode::PARALLEL:
                duration = std::max<int64_t>(duration, child->getFullDuration());
                break;
            }
        }
        duration_ = static_cast<int>(duration);

        is_built_ = true;
        LOG_DEBUG("Built {} timeline: {} children, duration {} ms", modeName(mode_), children_.size(), duration_);
    }

    // ========== Lifecycle ==========

    Timeline& Timeline::start() {
        TimedUnit::start();
        for (TimedUnit* child : children_) {
            child->start();
        }
        return *this;
    }

    Timeline& Timeline::start(TweenManager& manager) {
        manager.add(*this);
        return *this;
    }

    Timeline& Timeline::delay(const int millis) {
        TimedUnit::delay(millis);
        return *this;
    }

    Timeline& Timeline::repeat(const int count, const int delay_millis) {
        TimedUnit::repeat(count, delay_millis);
        return *this;
    }

    Timeline& Timeline::repeatYoyo(const int count, const int delay_millis) {
        TimedUnit::repeatYoyo(count, delay_millis);
        return *this;
    }

    Timeline& Timeline::addCallback(const EventType mask, TweenCallback callback) {
        TimedUnit::addCallback(mask, std::move(callback));
        return *this;
    }

    Timeline& Timeline::setUserData(std::any data) {
        TimedUnit::setUserData(std::move(data));
        return *this;
    }

    void Timeline::free() {
        while (!children_.empty()) {
            TimedUnit* const child = children_.back();
            children_.pop_back();
            child->free();
        }

        if (is_pooled_) {
            pool().free(*this);
        } else {
            pool().release(*this);
        }
    }

    // ========== Update engine ==========

    void Timeline::computeOverride(const int iteration, const int last_iteration, const int delta_millis) {
        int millis;

        if (iteration > last_iteration) {
            forceStartValues(iteration);
            millis = isIterationYoyo(iteration) ? -current_time_ : current_time_;

        } else if (iteration < last_iteration) {
            forceEndValues(iteration);
            millis = isIterationYoyo(iteration) ? duration_ - current_time_ : current_time_ - duration_;

        } else {
            millis = isIterationYoyo(iteration) ? -delta_millis : delta_millis;
        }

        if (millis >= 0) {
            for (TimedUnit* child : children_) {
                child->update(millis);
            }
        } else {
            for (auto it = children_.rbegin(); it != children_.rend(); ++it) {
                (*it)->update(millis);
            }
        }
    }

    // A reversed pass plays its children end to start, so under yoyo the
    // start state of the pass is every child's end state.
    void Timeline::forceStartValues(const int iteration) {
        if (isIterationYoyo(iteration)) {
            for (TimedUnit* child : children_) {
                child->forceToEnd(duration_);
            }
        } else {
            for (auto it = children_.rbegin(); it != children_.rend(); ++it) {
                (*it)->forceToStart();
            }
        }
    }

    void Timeline::forceEndValues(const int iteration) {
        if (isIterationYoyo(iteration)) {
            for (auto it = children_.rbegin(); it != children_.rend(); ++it) {
                (*it)->forceToStart();
            }
        } else {
            for (TimedUnit* child : children_) {
                child->forceToEnd(duration_);
            }
        }
    }

    // ========== Queries ==========

    int Timeline::getChildrenCount() const {
        int count = 0;
        for (const TimedUnit* child : children_) {
            count += 1 + child->getChildrenCount();
        }
        return count;
    }

    int Timeline::getTweensCount() const {
        int count = 0;
        for (const TimedUnit* child : children_) {
            if (const auto* nested = dynamic_cast<const Timeline*>(child)) {
                count += nested->getTweensCount();
            } else {
                count += 1;
            }
        }
        return count;
    }

    int Timeline::getTimelinesCount() const {
        int count = 1;
        for (const TimedUnit* child : children_) {
            if (const auto* nested = dynamic_cast<const Timeline*>(child)) {
                count += nested->getTimelinesCount();
            }
        }
        return count;
    }

    bool Timeline::containsTarget(const Tweenable* target) const {
        return std::ranges::any_of(children_, [target](const TimedUnit* child) {
            return child->containsTarget(target);
        });
    }

    bool Timeline::containsTarget(const Tweenable* target, const int tween_type) const {
        return std::ranges::any_of(children_, [target, tween_type](const TimedUnit* child) {
            return child->containsTarget(target, tween_type);
        });
    }

    nlohmann::json Timeline::toJson() const {
        nlohmann::json j = TimedUnit::toJson();
        j["kind"] = "timeline";
        j["mode"] = modeName(mode_);
        j["built"] = is_built_;
        j["children"] = nlohmann::json::array();
        for (const TimedUnit* child : children_) {
            j["children"].push_back(child->toJson());
        }
        return j;
    }

} // namespace twl::tween
