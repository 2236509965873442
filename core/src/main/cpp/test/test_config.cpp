/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <gtest/gtest.h>
#include "config.h"
#include "grove.h"

using namespace grove;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(GROVE_BUFFER_INIT_SIZE, 32);
    EXPECT_EQ(GROVE_MARKER_STACK_INIT_SIZE, 8);
    EXPECT_EQ(GROVE_VALIDATE_ON_ADOPT, 1);
}

TEST_F(ConfigTest, BufferStartsWithDefaultCapacity) {
    GroveBuffer<int64_t> buf;
    EXPECT_GE(buf.capacity(), static_cast<size_t>(GROVE_BUFFER_INIT_SIZE));
    EXPECT_EQ(buf.size(), 0u);
}

TEST_F(ConfigTest, ExplicitCapacity) {
    GroveBuffer<int64_t> buf(1000);
    EXPECT_GE(buf.capacity(), 1000u);
    for (int64_t i = 0; i < 1000; ++i) {
        buf.pushLeaf(i);
    }
    EXPECT_GE(buf.capacity(), 1000u);
    buf.reserve(5000);
    EXPECT_GE(buf.capacity(), 5000u);
    EXPECT_EQ(buf.size(), 1000u);
}

TEST_F(ConfigTest, AdoptValidatesWhenEnabled) {
    std::vector<NodeRecord<int64_t>> broken;
    broken.emplace_back(1, 2);
#if GROVE_VALIDATE_ON_ADOPT
    EXPECT_THROW(GroveBuffer<int64_t>::adopt(broken), ContractViolation);
#else
    EXPECT_NO_THROW(GroveBuffer<int64_t>::adopt(broken));
#endif
}
