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
#include "grove_errors.h"
#include "node_record.h"
#include "groveiter.h"

namespace grove {

    template< class ValueType > class GroveBuffer;
    template< class ValueType, typename Order > class TreeIterator;

    /**
     * ForestView
     *
     * Read-only interpretation of a half-open record range [lo, hi) of one
     * GroveBuffer as a grove. All navigation is derived from positions and
     * subtree sizes; the view itself holds nothing but the range.
     *
     * Positions taken and returned by a view are absolute buffer positions,
     * so a position obtained from a sub-view can be used with the view of the
     * whole buffer. A view keeps referring to the buffer's record vector and
     * therefore survives later appends, but it only ever covers [lo, hi) and
     * must not outlive the buffer.
     *
     * Views are only created by GroveBuffer and by other views, and every
     * range they cover is a sequence of complete root runs.
     */
    template< class ValueType >
    class ForestView {
        typedef ForestView<ValueType> _SelfType;

    public:
        typedef NodeRecord<ValueType> Record;
        typedef std::vector<Record> RecordVector;

        // the empty grove
        ForestView() : _records(nullptr), _lo(0), _hi(0) {}

        size_t size() const { return _hi - _lo; }
        bool empty() const { return _hi == _lo; }
        size_t lo() const { return _lo; }
        size_t hi() const { return _hi; }
        RecordRange range() const { RecordRange r = { _lo, _hi }; return r; }
        bool contains(size_t p) const { return p >= _lo && p < _hi; }

        //////////////////////////
        //        Roots         //
        //////////////////////////

        /**
         * Number of trees, found by skipping backward from the tail one root
         * run at a time.
         */
        size_t rootCount() const;

        /**
         * Position of the n-th root counted from the end (n = 0 is the last
         * tree). Throws NotFound when n >= rootCount().
         */
        size_t nthRootFromEnd(size_t n) const;

        /**
         * Non-throwing form of nthRootFromEnd.
         * @return false when fewer than n + 1 trees exist
         */
        bool findNthRootFromEnd(size_t n, size_t& out) const;

        RootIterator<ValueType> roots() const {
            return RootIterator<ValueType>(_records, _lo, _hi);
        }

        // first tree first; collected from the backward walk and reversed
        std::vector<size_t> rootsInStorageOrder() const;

        /**
         * Roots first tree first, from a single forward pass. A record closes
         * every pending subtree whose root lies inside its span, so the
         * records still pending once the scan ends are the roots.
         */
        std::vector<size_t> forwardRootScan() const;

        //////////////////////////
        //     Node queries     //
        //////////////////////////

        /**
         * Direct children of p, rightmost first.
         */
        ChildIterator<ValueType> childrenOf(size_t p) const {
            _checkIndex(p);
            return ChildIterator<ValueType>(_records, p);
        }

        /**
         * Direct children of p, leftmost first.
         */
        std::vector<size_t> childrenInOrder(size_t p) const;

        size_t childCount(size_t p) const;

        /**
         * Strict descendants of p in storage order.
         */
        DescendantIterator<ValueType> descendantsOf(size_t p) const {
            _checkIndex(p);
            return DescendantIterator<ValueType>(_records, p);
        }

        RecordRange descendantRange(size_t p) const {
            const Record& r = recordAt(p);
            RecordRange range = { r.spanStart(p), p };
            return range;
        }

        const Record& recordAt(size_t p) const {
            _checkIndex(p);
            return (*_records)[p];
        }

        const ValueType& valueAt(size_t p) const { return recordAt(p).value; }
        size_t subtreeSizeAt(size_t p) const { return recordAt(p).subtreeSize; }

        //////////////////////////
        //      Sub-views       //
        //////////////////////////

        /**
         * The tree rooted at p: [p - subtreeSize + 1, p + 1).
         */
        _SelfType treeAt(size_t p) const {
            const Record& r = recordAt(p);
            return _SelfType(_records, r.spanStart(p), p + 1);
        }

        /**
         * The strict descendants of p as a grove of their own; its roots are
         * exactly p's children.
         */
        _SelfType descendantView(size_t p) const {
            const Record& r = recordAt(p);
            return _SelfType(_records, r.spanStart(p), p);
        }

        /**
         * Every node of the view in the given order (StorageOrder or
         * ReverseStorageOrder).
         */
        template< typename Order >
        SpanIterator<ValueType, Order> nodes() const {
            return SpanIterator<ValueType, Order>(_records, _lo, _hi);
        }

        /**
         * Every subtree of the view as a view of its own, visited in the
         * given order of the subtree roots.
         */
        template< typename Order >
        TreeIterator<ValueType, Order> trees() const;

        /**
         * Throws ContractViolation unless the range tiles into complete root
         * runs whose subtree sizes nest exactly.
         */
        void validate() const;

        template< class V > friend class GroveBuffer;
        template< class V > friend class ForestView;

    private:
        ForestView(const RecordVector* records, size_t lo, size_t hi)
            : _records(records), _lo(lo), _hi(hi) {}

        void _checkIndex(size_t p) const {
            // the buffer may have been replaced under a stale view
            if(!contains(p) || p >= _records->size())
                throw OutOfBounds(p, _lo, _hi);
        }

        const RecordVector* _records;
        size_t _lo;
        size_t _hi;
    };

    /**
     * Walks the nodes of a view and yields the tree rooted at each one.
     */
    template< class ValueType, typename Order >
    class TreeIterator {
    public:
        explicit TreeIterator(const ForestView<ValueType>& view)
            : _view(view), _nodes(view.template nodes<Order>()) {}

        bool next(ForestView<ValueType>& out) {
            size_t p;
            if(!_nodes.next(p))
                return false;
            out = _view.treeAt(p);
            return true;
        }

        bool hasNext() const { return _nodes.hasNext(); }
        size_t remaining() const { return _nodes.remaining(); }

    private:
        ForestView<ValueType> _view;
        SpanIterator<ValueType, Order> _nodes;
    };

    /**
     * Structural equality: same subtree sizes and values in the same order,
     * wherever the two ranges sit in their buffers.
     */
    template< class ValueType >
    bool operator==(const ForestView<ValueType>& a, const ForestView<ValueType>& b);

    template< class ValueType >
    bool operator!=(const ForestView<ValueType>& a, const ForestView<ValueType>& b) {
        return !(a == b);
    }
}
