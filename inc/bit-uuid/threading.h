// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_BIT_UUID_THREADING_H_INCLUDED
#define HEADER_BIT_UUID_THREADING_H_INCLUDED

#include <bit-uuid/common.h>

#if BUUID_MULTITHREADED
    #include <atomic>
#endif


namespace buuid::impl {

    #if BUUID_MULTITHREADED

        template<class T>
        class atomic_if_multithreaded {
        public:
            atomic_if_multithreaded(): m_value{T{}} {}
            atomic_if_multithreaded(T value): m_value{value} {}

            T load(std::memory_order order = std::memory_order_acquire) const noexcept
                { return this->m_value.load(order); }
            void store(T val, std::memory_order order = std::memory_order_release) noexcept
                { this->m_value.store(val, order); }
            bool compare_exchange_weak(T & expected, T desired,
                                       std::memory_order success = std::memory_order_acq_rel,
                                       std::memory_order failure = std::memory_order_acquire) noexcept
                { return this->m_value.compare_exchange_weak(expected, desired, success, failure); }
            T fetch_add(T arg, std::memory_order order = std::memory_order_acq_rel) noexcept
                { return this->m_value.fetch_add(arg, order); }
        private:
            std::atomic<T> m_value;
        };

    #else

        template<class T>
        class atomic_if_multithreaded {
        public:
            atomic_if_multithreaded(): m_value{T{}} {}
            atomic_if_multithreaded(T value): m_value{value} {}

            T load(int = 0) const noexcept
                { return this->m_value; }
            void store(T val, int = 0) noexcept
                { this->m_value = val; }
            bool compare_exchange_weak(T & expected, T desired, int = 0, int = 0) noexcept {
                if (this->m_value != expected) {
                    expected = this->m_value;
                    return false;
                }
                this->m_value = desired;
                return true;
            }
            T fetch_add(T arg, int = 0) noexcept {
                T ret = this->m_value;
                this->m_value += arg;
                return ret;
            }
        private:
            T m_value;
        };

    #endif
}

#endif
