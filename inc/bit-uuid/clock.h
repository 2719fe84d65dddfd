// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_BIT_UUID_CLOCK_H_INCLUDED
#define HEADER_BIT_UUID_CLOCK_H_INCLUDED

#include <bit-uuid/threading.h>

#include <chrono>


namespace buuid {

    /**
     * Source of wall-clock time for time-based UUIDs.
     *
     * Implementations must be safe to call concurrently. The reported time
     * is nanoseconds since the Unix epoch and may be negative.
     */
    class BUUID_EXPORTED clock_source {
    public:
        using duration = std::chrono::nanoseconds;
        using time_point = std::chrono::time_point<std::chrono::system_clock, duration>;

        virtual auto now() const noexcept -> time_point = 0;

        /// The process-wide system clock source
        static auto system() noexcept -> const clock_source &;

    protected:
        clock_source() noexcept = default;
        ~clock_source() noexcept = default;
        clock_source(const clock_source &) noexcept = default;
        clock_source & operator=(const clock_source &) noexcept = default;
    };

    /// Clock source backed by std::chrono::system_clock
    class BUUID_EXPORTED system_clock_source final : public clock_source {
    public:
        auto now() const noexcept -> time_point override;
    };

    /**
     * Clock source that only moves when told to.
     *
     * Useful for tests and for replaying a known sequence of times.
     */
    class BUUID_EXPORTED manual_clock_source final : public clock_source {
    public:
        manual_clock_source() noexcept = default;
        explicit manual_clock_source(time_point start) noexcept:
            m_nanos(start.time_since_epoch().count())
        {}

        auto now() const noexcept -> time_point override
            { return time_point(duration(this->m_nanos.load())); }

        void set(time_point val) noexcept
            { this->m_nanos.store(val.time_since_epoch().count()); }

        void advance(duration by) noexcept
            { this->m_nanos.fetch_add(by.count()); }
    private:
        impl::atomic_if_multithreaded<int64_t> m_nanos{0};
    };
}

#endif
