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

#include "forest_view.h"
#include "util/log.h"

namespace grove {

    template< class ValueType >
    size_t ForestView<ValueType>::rootCount() const {
        size_t count = 0;
        size_t end = _hi;
        while(end > _lo) {
            end -= (*_records)[end-1].subtreeSize;
            ++count;
        }
        return count;
    }

    template< class ValueType >
    bool ForestView<ValueType>::findNthRootFromEnd(size_t n, size_t& out) const {
        size_t end = _hi;
        for(size_t i = 0; end > _lo; ++i) {
            if(i == n) {
                out = end - 1;
                return true;
            }
            end -= (*_records)[end-1].subtreeSize;
        }
        return false;
    }

    template< class ValueType >
    size_t ForestView<ValueType>::nthRootFromEnd(size_t n) const {
        size_t p;
        if(!findNthRootFromEnd(n, p)) {
            ostringstream oss;
            oss << "no root " << n << " from the end in " << range()
                << " (" << rootCount() << " trees)";
            throw NotFound(oss.str());
        }
        return p;
    }

    template< class ValueType >
    std::vector<size_t> ForestView<ValueType>::rootsInStorageOrder() const {
        std::vector<size_t> out;
        RootIterator<ValueType> iter = roots();
        size_t p;
        while(iter.next(p))
            out.push_back(p);
        std::reverse(out.begin(), out.end());
        return out;
    }

    template< class ValueType >
    std::vector<size_t> ForestView<ValueType>::forwardRootScan() const {
        std::vector<size_t> pending;
        for(size_t i = _lo; i < _hi; ++i) {
            size_t start = (*_records)[i].spanStart(i);
            while(!pending.empty() && pending.back() >= start)
                pending.pop_back();
            pending.push_back(i);
        }
        return pending;
    }

    template< class ValueType >
    std::vector<size_t> ForestView<ValueType>::childrenInOrder(size_t p) const {
        std::vector<size_t> out;
        ChildIterator<ValueType> iter = childrenOf(p);
        size_t c;
        while(iter.next(c))
            out.push_back(c);
        std::reverse(out.begin(), out.end());
        return out;
    }

    template< class ValueType >
    size_t ForestView<ValueType>::childCount(size_t p) const {
        ChildIterator<ValueType> iter = childrenOf(p);
        size_t count = 0;
        size_t c;
        while(iter.next(c))
            ++count;
        return count;
    }

    /**
     * Completed subtrees waiting for a parent are kept on a stack. A record
     * at i whose span starts at s must adopt exactly the subtrees tiling
     * [s, i), taken from the top of the stack; anything else means its size
     * cuts through a sibling or reaches below the view.
     */
    template< class ValueType >
    void ForestView<ValueType>::validate() const {
        std::vector<size_t> pending;
        for(size_t i = _lo; i < _hi; ++i) {
            const Record& r = (*_records)[i];
            ostringstream oss;
            if(r.subtreeSize == 0) {
                oss << "record " << i << " has subtree size 0";
            } else if(r.subtreeSize > i - _lo + 1) {
                oss << "record " << i << " has subtree size " << r.subtreeSize
                    << " reaching below " << _lo;
            } else {
                size_t start = r.spanStart(i);
                size_t expected = i;
                while(expected > start && !pending.empty() && pending.back() == expected - 1) {
                    expected = (*_records)[pending.back()].spanStart(pending.back());
                    pending.pop_back();
                }
                if(expected != start) {
                    oss << "record " << i << " with subtree size " << r.subtreeSize
                        << " does not cover whole subtrees";
                } else {
                    pending.push_back(i);
                    continue;
                }
            }
            error() << "malformed grove in " << range() << ": " << oss.str();
            throw ContractViolation(oss.str());
        }
    }

    template< class ValueType >
    template< typename Order >
    TreeIterator<ValueType, Order> ForestView<ValueType>::trees() const {
        return TreeIterator<ValueType, Order>(*this);
    }

    template< class ValueType >
    bool operator==(const ForestView<ValueType>& a, const ForestView<ValueType>& b) {
        if(a.size() != b.size())
            return false;
        for(size_t i = 0; i < a.size(); ++i) {
            if(a.recordAt(a.lo() + i) != b.recordAt(b.lo() + i))
                return false;
        }
        return true;
    }
}
