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
#include <map>
#include <string>
#include <type_traits>
#include <vector>
#include "test_helpers.h"

using namespace grove;
using namespace grove::test;

class GroveIterTest : public ::testing::Test {
protected:
    void SetUp() override {
        build_numbered_tree(numbers);
        build_color_grove(colors);
    }

    GroveBuffer<int64_t> numbers;
    GroveBuffer<std::string> colors;
};

// ============= RootIterator =============

TEST_F(GroveIterTest, RootIteratorLastTreeFirst) {
    RootIterator<std::string> iter = colors.view().roots();
    ASSERT_TRUE(iter.hasNext());
    EXPECT_EQ(iter.remaining(), 7u);

    const std::string* v = iter.nextValue();
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(*v, "direction");
    EXPECT_EQ(iter.remaining(), 4u);

    v = iter.nextValue();
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(*v, "primary color");

    EXPECT_FALSE(iter.hasNext());
    EXPECT_EQ(iter.nextValue(), nullptr);
    size_t p = 12345;
    EXPECT_FALSE(iter.next(p));
    EXPECT_EQ(p, 12345u);
}

TEST_F(GroveIterTest, RootIteratorIsSinglePass) {
    ForestView<std::string> view = colors.view();
    RootIterator<std::string> iter = view.roots();
    EXPECT_EQ(collect(iter).size(), 2u);

    size_t p;
    RootIterator<std::string> drained = view.roots();
    while (drained.next(p)) {
    }
    EXPECT_FALSE(drained.next(p));

    // a fresh iterator starts over
    EXPECT_EQ(collect(view.roots()).size(), 2u);
}

TEST_F(GroveIterTest, SingleTreeHasOneRoot) {
    EXPECT_EQ(collect(numbers.view().roots()), (std::vector<size_t>{15}));
}

// ============= ChildIterator =============

TEST_F(GroveIterTest, ChildIteratorRightmostFirst) {
    ForestView<int64_t> view = numbers.view();
    ChildIterator<int64_t> iter = view.childrenOf(15);
    EXPECT_EQ(iter.parent(), 15u);
    // children of 16 are 7, 8 and 15 (values), at positions 6, 7 and 14
    EXPECT_EQ(collect(iter), (std::vector<size_t>{14, 7, 6}));
    EXPECT_EQ(view.childrenInOrder(15), (std::vector<size_t>{6, 7, 14}));
}

TEST_F(GroveIterTest, ChildIteratorSkipsWholeSubtrees) {
    ForestView<int64_t> view = numbers.view();
    ChildIterator<int64_t> iter = view.childrenOf(15);
    size_t p;
    ASSERT_TRUE(iter.next(p));
    EXPECT_EQ(view.valueAt(p), 15);
    // one step jumped over the seven records of the rightmost child
    EXPECT_EQ(iter.remaining(), 8u);
}

TEST_F(GroveIterTest, ChildIteratorBoundsCheckedAtConstruction) {
    ForestView<int64_t> view = numbers.view();
    EXPECT_THROW(view.childrenOf(16), OutOfBounds);
    ForestView<int64_t> left = view.treeAt(6);
    EXPECT_THROW(left.childrenOf(15), OutOfBounds);
    EXPECT_NO_THROW(left.childrenOf(6));
}

TEST_F(GroveIterTest, NodeIteratorsOnlyComeFromViews) {
    typedef std::vector<NodeRecord<int64_t>> Records;
    EXPECT_FALSE((std::is_constructible<ChildIterator<int64_t>, const Records*, size_t>::value));
    EXPECT_FALSE((std::is_constructible<DescendantIterator<int64_t>, const Records*, size_t>::value));
    EXPECT_TRUE((std::is_copy_constructible<ChildIterator<int64_t>>::value));
}

// ============= DescendantIterator =============

TEST_F(GroveIterTest, DescendantIteratorStorageOrder) {
    ForestView<int64_t> view = numbers.view();
    DescendantIterator<int64_t> iter = view.descendantsOf(6);
    EXPECT_EQ(iter.ancestor(), 6u);
    EXPECT_EQ(iter.remaining(), 6u);

    std::vector<int64_t> values;
    while (const int64_t* v = iter.nextValue()) {
        values.push_back(*v);
    }
    EXPECT_EQ(values, (std::vector<int64_t>{1, 2, 3, 4, 5, 6}));
    EXPECT_FALSE(iter.hasNext());
}

TEST_F(GroveIterTest, DescendantIteratorBoundsCheckedAtConstruction) {
    EXPECT_THROW(numbers.view().descendantsOf(16), OutOfBounds);
    EXPECT_THROW(numbers.view().descendantView(15).descendantsOf(15), OutOfBounds);
}

TEST_F(GroveIterTest, BottomUpFoldSeesDescendantsFirst) {
    // sum of values in every subtree, folded left to right
    ForestView<int64_t> view = numbers.view();
    std::map<size_t, int64_t> subtreeSum;
    SpanIterator<int64_t, StorageOrder> iter = view.nodes<StorageOrder>();
    size_t p;
    while (iter.next(p)) {
        int64_t sum = view.valueAt(p);
        for (size_t c : collect(view.childrenOf(p))) {
            ASSERT_TRUE(subtreeSum.count(c)) << "child " << c << " not folded before " << p;
            sum += subtreeSum[c];
        }
        subtreeSum[p] = sum;
    }
    EXPECT_EQ(subtreeSum[15], 136);    // 1 + 2 + ... + 16
    EXPECT_EQ(subtreeSum[6], 28);      // 1 + ... + 7
    EXPECT_EQ(subtreeSum[2], 6);       // 1 + 2 + 3
}

// ============= Whole-span node order =============

TEST_F(GroveIterTest, ReverseStorageOrderVisitsParentsFirst) {
    std::vector<int64_t> values;
    SpanIterator<int64_t, ReverseStorageOrder> iter = numbers.view().nodes<ReverseStorageOrder>();
    EXPECT_EQ(iter.remaining(), 16u);
    while (const int64_t* v = iter.nextValue()) {
        values.push_back(*v);
    }
    EXPECT_EQ(values, (std::vector<int64_t>{16, 15, 14, 13, 12, 11, 10, 9, 8, 7, 6, 5, 4, 3, 2, 1}));
}

TEST_F(GroveIterTest, NodesOfSubviewStayInsideIt) {
    ForestView<std::string> dir = colors.view().treeAt(6);
    EXPECT_EQ(collect(dir.nodes<StorageOrder>()), (std::vector<size_t>{4, 5, 6}));
    EXPECT_EQ(collect(dir.nodes<ReverseStorageOrder>()), (std::vector<size_t>{6, 5, 4}));
}

// ============= TreeIterator =============

TEST_F(GroveIterTest, TreesInStorageOrder) {
    ForestView<std::string> view = colors.view();
    TreeIterator<std::string, StorageOrder> iter = view.trees<StorageOrder>();
    EXPECT_EQ(iter.remaining(), 7u);

    std::vector<RecordRange> ranges;
    ForestView<std::string> tree;
    while (iter.next(tree)) {
        EXPECT_EQ(tree.rootCount(), 1u);
        EXPECT_EQ(tree.nthRootFromEnd(0), tree.hi() - 1);
        ranges.push_back(tree.range());
    }
    std::vector<RecordRange> expected = {
        {0, 1}, {1, 2}, {2, 3}, {0, 4}, {4, 5}, {5, 6}, {4, 7}
    };
    EXPECT_EQ(ranges, expected);
    EXPECT_FALSE(iter.hasNext());
}

TEST_F(GroveIterTest, TreesInReverseStorageOrder) {
    ForestView<int64_t> view = numbers.view();
    TreeIterator<int64_t, ReverseStorageOrder> iter = view.trees<ReverseStorageOrder>();
    ForestView<int64_t> tree;
    ASSERT_TRUE(iter.next(tree));
    EXPECT_EQ(tree, view);
    ASSERT_TRUE(iter.next(tree));
    EXPECT_EQ(tree.range(), (RecordRange{8, 15}));
    EXPECT_EQ(tree.valueAt(14), 15);
}

TEST_F(GroveIterTest, TreesOfEmptyView) {
    GroveBuffer<int64_t> empty;
    TreeIterator<int64_t, StorageOrder> iter = empty.view().trees<StorageOrder>();
    ForestView<int64_t> tree;
    EXPECT_FALSE(iter.next(tree));
}

TEST_F(GroveIterTest, EmptyGroveIteratorsAreExhausted) {
    GroveBuffer<std::string> empty;
    ForestView<std::string> view = empty.view();
    EXPECT_TRUE(collect(view.roots()).empty());
    EXPECT_TRUE(collect(view.nodes<StorageOrder>()).empty());
    EXPECT_TRUE(collect(view.nodes<ReverseStorageOrder>()).empty());
    EXPECT_EQ(view.roots().nextValue(), nullptr);
}
