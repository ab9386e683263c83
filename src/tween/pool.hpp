/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <format>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace twl::tween {

    struct PoolHandle {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t index = INVALID_INDEX;
        uint32_t generation = 0;

        [[nodiscard]] bool isNull() const { return index == INVALID_INDEX; }
        [[nodiscard]] bool operator==(const PoolHandle&) const = default;
    };

    // Arena of heap-stable objects addressed by generation-checked handles.
    // T must expose setPoolHandle(PoolHandle) and poolHandle().
    template <typename T>
    class Pool {
    public:
        using Factory = std::function<std::unique_ptr<T>()>;

        struct Callbacks {
            std::function<void(T&)> on_pool;   // object is about to wait for reuse
            std::function<void(T&)> on_unpool; // object is handed to a caller
        };

        Pool(const size_t initial_capacity, Factory factory, Callbacks callbacks = {})
            : factory_(std::move(factory)),
              callbacks_(std::move(callbacks)) {
            ensureCapacity(initial_capacity);
        }

        Pool(const Pool&) = delete;
        Pool& operator=(const Pool&) = delete;

        T& get() {
            std::lock_guard lock(mutex_);

            uint32_t index;
            if (!recycled_.empty()) {
                index = recycled_.back();
                recycled_.pop_back();
            } else if (!empty_slots_.empty()) {
                index = empty_slots_.back();
                empty_slots_.pop_back();
            } else {
                index = static_cast<uint32_t>(slots_.size());
                slots_.emplace_back();
            }

            Slot& slot = slots_[index];
            if (!slot.object) {
                slot.object = factory_();
            }
            slot.live = true;

            T& obj = *slot.object;
            obj.setPoolHandle(PoolHandle{index, slot.generation});
            if (callbacks_.on_unpool) {
                callbacks_.on_unpool(obj);
            }
            LOG_TRACE("Pool: acquired slot {} (generation {})", index, slot.generation);
            return obj;
        }

        // Keeps the object for reuse. Handles issued before this call go stale.
        void free(T& obj) {
            std::lock_guard lock(mutex_);
            Slot& slot = checkedSlot(obj);
            const uint32_t index = obj.poolHandle().index;

            slot.live = false;
            ++slot.generation;
            if (callbacks_.on_pool) {
                callbacks_.on_pool(obj);
            }
            recycled_.push_back(index);
            LOG_TRACE("Pool: recycled slot {}", index);
        }

        // Destroys the object. Handles issued before this call go stale.
        void release(T& obj) {
            std::lock_guard lock(mutex_);
            Slot& slot = checkedSlot(obj);
            const uint32_t index = obj.poolHandle().index;

            slot.live = false;
            ++slot.generation;
            slot.object.reset();
            empty_slots_.push_back(index);
            LOG_TRACE("Pool: released slot {}", index);
        }

        [[nodiscard]] T* resolve(const PoolHandle handle) const {
            std::lock_guard lock(mutex_);
            if (handle.index >= slots_.size()) {
                return nullptr;
            }
            const Slot& slot = slots_[handle.index];
            if (!slot.live || slot.generation != handle.generation) {
                return nullptr;
            }
            return slot.object.get();
        }

        [[nodiscard]] bool isValid(const PoolHandle handle) const { return resolve(handle) != nullptr; }

        // Objects waiting for reuse
        [[nodiscard]] size_t size() const {
            std::lock_guard lock(mutex_);
            return recycled_.size();
        }

        [[nodiscard]] size_t liveCount() const {
            std::lock_guard lock(mutex_);
            return slots_.size() - recycled_.size() - empty_slots_.size();
        }

        void ensureCapacity(const size_t min_capacity) {
            std::lock_guard lock(mutex_);
            slots_.reserve(min_capacity);
            recycled_.reserve(min_capacity);
        }

    private:
        struct Slot {
            std::unique_ptr<T> object;
            uint32_t generation = 0;
            bool live = false;
        };

        Slot& checkedSlot(const T& obj) {
            const PoolHandle handle = obj.poolHandle();
            if (handle.index >= slots_.size() || !slots_[handle.index].live ||
                slots_[handle.index].generation != handle.generation ||
                slots_[handle.index].object.get() != &obj) {
                throw std::runtime_error(std::format(
                    "Pool: object is not live in this pool (slot {}, generation {})",
                    handle.index, handle.generation));
            }
            return slots_[handle.index];
        }

        std::vector<Slot> slots_;
        std::vector<uint32_t> recycled_;
        std::vector<uint32_t> empty_slots_;
        Factory factory_;
        Callbacks callbacks_;
        mutable std::mutex mutex_;
    };

} // namespace twl::tween
