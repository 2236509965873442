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
#include "node_record.h"

namespace grove {

    template< class ValueType > class ForestView;

    /**
     * Traversal orders for SpanIterator. Storage order puts every node after
     * all of its descendants (children before parent); the reverse order puts
     * every node before its descendants and visits siblings right to left.
     */
    struct StorageOrder {
        static bool advance(size_t& lo, size_t& hi, size_t& out) {
            if(lo >= hi) return false;
            out = lo++;
            return true;
        }
    };

    struct ReverseStorageOrder {
        static bool advance(size_t& lo, size_t& hi, size_t& out) {
            if(lo >= hi) return false;
            out = --hi;
            return true;
        }
    };

    /**
     * Walks a span of root runs from its tail: the last record of the span is
     * a root, and subtracting its subtree size from the end boundary lands on
     * the end of the previous run. Each step is O(1) and nothing besides two
     * positions is kept.
     *
     * Iterators are single pass. Bounds are checked by the ForestView that
     * hands them out, so next() itself never fails.
     */
    template< class ValueType >
    class BackwardSkipIterator {
    public:
        typedef NodeRecord<ValueType> Record;
        typedef std::vector<Record> RecordVector;

        BackwardSkipIterator(const RecordVector* records, size_t lo, size_t hi)
            : _records(records), _lo(lo), _end(hi) {}

        /**
         * Stores the position of the next root in out.
         * @return false once the span is exhausted
         */
        inline bool next(size_t& out) {
            if(_end <= _lo)
                return false;
            out = _end - 1;
            _end -= (*_records)[out].subtreeSize;
            return true;
        }

        /**
         * @return the next root's value, or nullptr once exhausted
         */
        inline const ValueType* nextValue() {
            size_t p;
            if(!next(p))
                return nullptr;
            return &(*_records)[p].value;
        }

        bool hasNext() const { return _end > _lo; }

        // records between the span start and the next root still to be visited
        size_t remaining() const { return _end - _lo; }

    protected:
        const RecordVector* _records;
        size_t _lo;
        size_t _end;
    };

    /**
     * Roots of a view, last tree first.
     */
    template< class ValueType >
    class RootIterator : public BackwardSkipIterator<ValueType> {
    public:
        typedef typename BackwardSkipIterator<ValueType>::RecordVector RecordVector;

        RootIterator(const RecordVector* records, size_t lo, size_t hi)
            : BackwardSkipIterator<ValueType>(records, lo, hi) {}
    };

    /**
     * Direct children of one node, rightmost child first. The children of the
     * node at p are the root runs of [p - subtreeSize + 1, p).
     */
    template< class ValueType >
    class ChildIterator : public BackwardSkipIterator<ValueType> {
    public:
        typedef typename BackwardSkipIterator<ValueType>::RecordVector RecordVector;

        size_t parent() const { return _parent; }

    private:
        template< class V > friend class ForestView;

        // parent is bounds checked by the view
        ChildIterator(const RecordVector* records, size_t parent)
            : BackwardSkipIterator<ValueType>(records,
                                              (*records)[parent].spanStart(parent),
                                              parent),
              _parent(parent) {}

        size_t _parent;
    };

    /**
     * Every record of a span, one position at a time, in the given Order.
     */
    template< class ValueType, typename Order >
    class SpanIterator {
    public:
        typedef NodeRecord<ValueType> Record;
        typedef std::vector<Record> RecordVector;

        SpanIterator(const RecordVector* records, size_t lo, size_t hi)
            : _records(records), _lo(lo), _hi(hi) {}

        inline bool next(size_t& out) {
            return Order::advance(_lo, _hi, out);
        }

        inline const ValueType* nextValue() {
            size_t p;
            if(!next(p))
                return nullptr;
            return &(*_records)[p].value;
        }

        bool hasNext() const { return _lo < _hi; }
        size_t remaining() const { return _hi - _lo; }

    protected:
        const RecordVector* _records;
        size_t _lo;
        size_t _hi;
    };

    /**
     * Strict descendants of one node in storage order. A left-to-right fold
     * over this sequence has seen all of a record's descendants by the time
     * it reaches the record.
     */
    template< class ValueType >
    class DescendantIterator : public SpanIterator<ValueType, StorageOrder> {
    public:
        typedef typename SpanIterator<ValueType, StorageOrder>::RecordVector RecordVector;

        size_t ancestor() const { return _ancestor; }

    private:
        template< class V > friend class ForestView;

        DescendantIterator(const RecordVector* records, size_t ancestor)
            : SpanIterator<ValueType, StorageOrder>(records,
                                                    (*records)[ancestor].spanStart(ancestor),
                                                    ancestor),
              _ancestor(ancestor) {}

        size_t _ancestor;
    };
}
