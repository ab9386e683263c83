/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "timed_unit.hpp"
#include "tween_error.hpp"
#include "tween_manager.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <nlohmann/json.hpp>

namespace twl::tween {

    namespace {
        const char* eventName(const EventType event) {
            switch (event) {
            case EventType::BEGIN:
                return "BEGIN";
            case EventType::START:
                return "START";
            case EventType::END:
                return "END";
            case EventType::COMPLETE:
                return "COMPLETE";
            case EventType::BACK_BEGIN:
                return "BACK_BEGIN";
            case EventType::BACK_START:
                return "BACK_START";
            case EventType::BACK_END:
                return "BACK_END";
            case EventType::BACK_COMPLETE:
                return "BACK_COMPLETE";
            default:
                return "MASK";
            }
        }
    } // namespace

    TimedUnit& TimedUnit::start() {
        build();
        current_time_ = 0;
        iteration_ = -2;
        pending_delta_ = 0;
        is_iteration_step_ = false;
        is_initialized_ = false;
        is_finished_ = false;
        is_started_ = true;
        return *this;
    }

    TimedUnit& TimedUnit::start(TweenManager& manager) {
        manager.add(*this);
        return *this;
    }

    TimedUnit& TimedUnit::delay(const int millis) {
        delay_ += millis;
        return *this;
    }

    TimedUnit& TimedUnit::repeat(const int count, const int delay_millis) {
        if (is_started_) {
            throw TweenError(TweenErrorCode::RepeatAfterStart,
                             "You can't change the repetitions of a tween or timeline once it is started");
        }
        repeat_count_ = count;
        repeat_delay_ = std::max(delay_millis, 0);
        is_yoyo_ = false;
        return *this;
    }

    TimedUnit& TimedUnit::repeatYoyo(const int count, const int delay_millis) {
        repeat(count, delay_millis);
        is_yoyo_ = true;
        return *this;
    }

    TimedUnit& TimedUnit::addCallback(const EventType mask, TweenCallback callback) {
        callbacks_.emplace_back(mask, std::move(callback));
        return *this;
    }

    TimedUnit& TimedUnit::setUserData(std::any data) {
        user_data_ = std::move(data);
        return *this;
    }

    void TimedUnit::reset() {
        delay_ = 0;
        duration_ = 0;
        current_time_ = 0;
        is_pooled_ = false;

        repeat_count_ = 0;
        repeat_delay_ = 0;
        is_yoyo_ = false;

        iteration_ = -2;
        pending_delta_ = 0;
        is_iteration_step_ = false;
        is_moving_forward_ = true;

        is_started_ = false;
        is_initialized_ = false;
        is_finished_ = false;
        is_killed_ = false;
        is_paused_ = false;
        is_auto_remove_enabled_ = true;

        callbacks_.clear();
        user_data_.reset();
    }

    // ========== Update engine ==========

    void TimedUnit::update(const int delta_millis) {
        if (!is_started_ || is_paused_ || is_killed_) {
            return;
        }

        pending_delta_ = delta_millis;
        is_moving_forward_ = delta_millis >= 0;

        if (!is_initialized_) {
            initialize();
        }

        if (is_initialized_) {
            testRelaunch();
            updateIteration();
            testCompletion();
        }

        current_time_ += pending_delta_;
        pending_delta_ = 0;
    }

    void TimedUnit::initialize() {
        if (!is_moving_forward_ || current_time_ + pending_delta_ < delay_) {
            return;
        }

        initializeOverride();
        is_initialized_ = true;
        is_iteration_step_ = true;
        iteration_ = 0;
        pending_delta_ -= delay_ - current_time_;
        current_time_ = 0;
        callCallback(EventType::BEGIN);
        callCallback(EventType::START);
    }

    void TimedUnit::testRelaunch() {
        if (is_iteration_step_ || repeat_count_ < 0) {
            return;
        }

        if (iteration_ < 0 && is_moving_forward_ && current_time_ + pending_delta_ >= 0) {
            is_iteration_step_ = true;
            iteration_ = 0;
            const int consumed = -current_time_;
            pending_delta_ -= consumed;
            current_time_ = 0;
            callCallback(EventType::BEGIN);
            callCallback(EventType::START);
            computeOverride(iteration_, iteration_ - 1, consumed);

        } else if (iteration_ > repeat_count_ * 2 && !is_moving_forward_ && current_time_ + pending_delta_ <= 0) {
            is_iteration_step_ = true;
            iteration_ = repeat_count_ * 2;
            const int consumed = -current_time_;
            pending_delta_ -= consumed;
            current_time_ = duration_;
            callCallback(EventType::BACK_BEGIN);
            callCallback(EventType::BACK_START);
            computeOverride(iteration_, iteration_ + 1, consumed);
        }
    }

    void TimedUnit::updateIteration() {
        while (isValid(iteration_)) {
            if (!is_iteration_step_ && !is_moving_forward_ && current_time_ + pending_delta_ <= 0) {
                // Back through the repeat delay into the end of the previous pass
                is_iteration_step_ = true;
                iteration_ -= 1;
                const int consumed = -current_time_;
                pending_delta_ -= consumed;
                current_time_ = duration_;
                callCallback(EventType::BACK_START);
                computeOverride(iteration_, iteration_ + 1, consumed);
                if (isDegenerateLoop()) {
                    break;
                }

            } else if (!is_iteration_step_ && is_moving_forward_ && current_time_ + pending_delta_ >= repeat_delay_) {
                // Through the repeat delay into the beginning of the next pass
                is_iteration_step_ = true;
                iteration_ += 1;
                const int consumed = repeat_delay_ - current_time_;
                pending_delta_ -= consumed;
                current_time_ = 0;
                callCallback(EventType::START);
                computeOverride(iteration_, iteration_ - 1, consumed);
                if (isDegenerateLoop()) {
                    break;
                }

            } else if (is_iteration_step_ && !is_moving_forward_ && current_time_ + pending_delta_ <= 0) {
                const int consumed = -current_time_;
                pending_delta_ -= consumed;
                current_time_ = 0;
                computeOverride(iteration_, iteration_, consumed);

                is_iteration_step_ = false;
                iteration_ -= 1;
                callCallback(EventType::BACK_END);

                if (iteration_ < 0 && repeat_count_ >= 0) {
                    callCallback(EventType::BACK_COMPLETE);
                } else {
                    current_time_ = repeat_delay_;
                }

            } else if (is_iteration_step_ && is_moving_forward_ && current_time_ + pending_delta_ >= duration_) {
                const int consumed = duration_ - current_time_;
                pending_delta_ -= consumed;
                current_time_ = duration_;
                computeOverride(iteration_, iteration_, consumed);

                is_iteration_step_ = false;
                iteration_ += 1;
                callCallback(EventType::END);

                if (iteration_ > repeat_count_ * 2 && repeat_count_ >= 0) {
                    callCallback(EventType::COMPLETE);
                }
                current_time_ = 0;

            } else if (is_iteration_step_) {
                const int consumed = pending_delta_;
                pending_delta_ = 0;
                current_time_ += consumed;
                computeOverride(iteration_, iteration_, consumed);
                break;

            } else {
                current_time_ += pending_delta_;
                pending_delta_ = 0;
                break;
            }
        }
    }

    void TimedUnit::testCompletion() {
        is_finished_ = repeat_count_ >= 0 && (iteration_ > repeat_count_ * 2 || iteration_ < 0);
    }

    void TimedUnit::callCallback(const EventType event) {
        std::vector<TweenCallback> matching;
        for (const auto& [mask, callback] : callbacks_) {
            if (hasEvent(mask, event)) {
                matching.push_back(callback);
            }
        }

        for (const auto& callback : matching) {
            try {
                callback(event, *this);
            } catch (const std::exception& e) {
                LOG_ERROR("Tween callback failed on {}: {}", eventName(event), e.what());
            }
        }
    }

    // ========== Forced states ==========

    void TimedUnit::forceToStart() {
        if (!is_initialized_) {
            initializeOverride();
            is_initialized_ = true;
        }
        current_time_ = -delay_;
        iteration_ = -1;
        is_iteration_step_ = false;
        forceStartValues(0);
    }

    void TimedUnit::forceToEnd(const int millis) {
        if (!is_initialized_) {
            initializeOverride();
            is_initialized_ = true;
        }
        current_time_ = millis - getFullDuration();
        iteration_ = repeat_count_ * 2 + 1;
        is_iteration_step_ = false;
        forceEndValues(repeat_count_ * 2);
    }

    // ========== Queries ==========

    bool TimedUnit::isIterationYoyo(const int iteration) const {
        return is_yoyo_ && std::abs(iteration % 4) == 2;
    }

    bool TimedUnit::isValid(const int iteration) const {
        return (iteration >= 0 && iteration <= repeat_count_ * 2) || repeat_count_ < 0;
    }

    bool TimedUnit::isDegenerateLoop() const {
        return repeat_count_ < 0 && duration_ <= 0 && repeat_delay_ <= 0;
    }

    int TimedUnit::getFullDuration() const {
        if (repeat_count_ < 0) {
            return -1;
        }
        // Saturates instead of wrapping for huge repeat counts
        const int64_t full = static_cast<int64_t>(delay_) + duration_ +
                             (static_cast<int64_t>(repeat_delay_) + duration_) * repeat_count_;
        return static_cast<int>(std::min<int64_t>(full, std::numeric_limits<int>::max()));
    }

    void TimedUnit::killTarget(const Tweenable* target) {
        if (containsTarget(target)) {
            kill();
        }
    }

    void TimedUnit::killTarget(const Tweenable* target, const int tween_type) {
        if (containsTarget(target, tween_type)) {
            kill();
        }
    }

    nlohmann::json TimedUnit::toJson() const {
        nlohmann::json j;
        j["delay"] = delay_;
        j["duration"] = duration_;
        j["full_duration"] = getFullDuration();
        j["repeat_count"] = repeat_count_;
        j["repeat_delay"] = repeat_delay_;
        j["yoyo"] = is_yoyo_;
        return j;
    }

} // namespace twl::tween
