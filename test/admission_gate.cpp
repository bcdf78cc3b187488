//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>

#include <boost/chrono.hpp>

#include "admission_gate.hpp"

using kiln::admission_gate;
using kiln::admission_slot;
using boost::chrono::milliseconds;

TEST(admission_gate, zero_capacity_is_invalid) {
    EXPECT_THROW(admission_gate(0), std::invalid_argument);
}

TEST(admission_gate, acquire_up_to_capacity) {
    admission_gate gate(2);

    EXPECT_TRUE(gate.try_acquire_for(milliseconds(0)));
    EXPECT_TRUE(gate.try_acquire_for(milliseconds(0)));
    EXPECT_FALSE(gate.try_acquire_for(milliseconds(20)));
    EXPECT_EQ(gate.in_use(), 2u);

    gate.release();
    EXPECT_EQ(gate.in_use(), 1u);
    EXPECT_TRUE(gate.try_acquire_for(milliseconds(0)));
}

TEST(admission_gate, waiter_gets_released_slot) {
    admission_gate gate(1);
    ASSERT_TRUE(gate.try_acquire_for(milliseconds(0)));

    std::thread releaser([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        gate.release();
    });

    EXPECT_TRUE(gate.try_acquire_for(milliseconds(5000)));
    releaser.join();
    EXPECT_EQ(gate.in_use(), 1u);
}

TEST(admission_gate, slot_releases_on_scope_exit) {
    admission_gate gate(1);
    {
        admission_slot slot(gate, milliseconds(0));
        EXPECT_TRUE(static_cast<bool>(slot));
        EXPECT_EQ(gate.in_use(), 1u);

        admission_slot rejected(gate, milliseconds(10));
        EXPECT_FALSE(static_cast<bool>(rejected));
    }
    EXPECT_EQ(gate.in_use(), 0u);
}

TEST(admission_gate, extra_release_is_harmless) {
    admission_gate gate(1);
    gate.release();
    EXPECT_EQ(gate.in_use(), 0u);
    EXPECT_EQ(gate.capacity(), 1u);
}
