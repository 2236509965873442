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

#pragma once

#include "pch.h"

namespace grove {

    /**
     * The stored unit of a grove: a value plus the number of nodes in the
     * subtree it roots (itself included). Descendants always sit directly
     * before their root, so the subtree of the record at position p is
     * [p - subtreeSize + 1, p].
     */
    template< class ValueType >
    struct NodeRecord {
        typedef ValueType value_type;

        NodeRecord(const ValueType& v, size_t s) : value(v), subtreeSize(s) {}
        NodeRecord(ValueType&& v, size_t s) : value(std::move(v)), subtreeSize(s) {}

        bool isLeaf() const { return subtreeSize == 1; }

        // position of the first descendant, or p itself for a leaf
        size_t spanStart(size_t p) const { return p + 1 - subtreeSize; }

        ValueType value;
        size_t subtreeSize;
    };

    template< class ValueType >
    inline bool operator==(const NodeRecord<ValueType>& a, const NodeRecord<ValueType>& b) {
        return a.subtreeSize == b.subtreeSize && a.value == b.value;
    }

    template< class ValueType >
    inline bool operator!=(const NodeRecord<ValueType>& a, const NodeRecord<ValueType>& b) {
        return !(a == b);
    }

    /**
     * Half-open span [lo, hi) of absolute buffer positions.
     */
    struct RecordRange {
        size_t lo;
        size_t hi;

        size_t size() const { return hi - lo; }
        bool empty() const { return hi == lo; }
        bool contains(size_t p) const { return p >= lo && p < hi; }
    };

    inline bool operator==(const RecordRange& a, const RecordRange& b) {
        return a.lo == b.lo && a.hi == b.hi;
    }

    inline ostream& operator<<(ostream& os, const RecordRange& r) {
        os << "[" << r.lo << ", " << r.hi << ")";
        return os;
    }
}
