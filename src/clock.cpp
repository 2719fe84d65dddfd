// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <bit-uuid/clock.h>

using namespace buuid;

auto system_clock_source::now() const noexcept -> time_point {
    return std::chrono::time_point_cast<duration>(std::chrono::system_clock::now());
}

auto clock_source::system() noexcept -> const clock_source & {
    static system_clock_source instance;
    return instance;
}
