/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace twl::tween {

    enum class TweenErrorCode : uint8_t {
        StructuralMutationAfterBuild,
        UnclosedNestedTree,
        DanglingOpenGroup,
        InfiniteRepeatInComposite,
        RepeatAfterStart,
    };

    // Caller-contract violation. Thrown before anything is mutated.
    class TweenError : public std::runtime_error {
    public:
        TweenError(const TweenErrorCode code, const std::string& message)
            : std::runtime_error(message),
              code_(code) {}

        [[nodiscard]] TweenErrorCode code() const { return code_; }

    private:
        TweenErrorCode code_;
    };

} // namespace twl::tween
