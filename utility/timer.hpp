// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 OtterStax

#pragma once

#include <chrono>
#include <cstdint>

class Timer {
public:
    Timer() { restart(); }

    void restart() { start_point_ = std::chrono::steady_clock::now(); }

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                     start_point_);
    }

    int64_t elapsed_ms() const { return elapsed().count(); }

private:
    std::chrono::steady_clock::time_point start_point_;
};
