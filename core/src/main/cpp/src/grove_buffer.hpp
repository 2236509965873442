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

#include "grove_buffer.h"
#include "forest_view.hpp"
#include "util/log.h"

namespace grove {

    template< class ValueType >
    template< class V >
    size_t GroveBuffer<ValueType>::_emplace(V&& value, size_t start) {
        if(_records.size() == _records.capacity())
            trace() << "growing record buffer past " << _records.capacity() << " records";
        size_t p = _records.size();
        _records.emplace_back(std::forward<V>(value), p - start + 1);
        return p;
    }

    template< class ValueType >
    void GroveBuffer<ValueType>::_violation(const string& msg) const {
        error() << msg;
        throw ContractViolation(msg);
    }

    template< class ValueType >
    void GroveBuffer<ValueType>::_checkMarker(const SubtreeMarker& marker, const char* op) const {
        ostringstream oss;
        if(_openMarkers.empty()) {
            oss << op << ": no open subtree";
        } else if(marker.position > _records.size()) {
            oss << op << ": marker position " << marker.position
                << " is past the end of the buffer (" << _records.size() << ")";
        } else if(marker.depth != _openMarkers.size() || marker.position != _openMarkers.back()) {
            oss << op << ": marker (position " << marker.position << ", depth " << marker.depth
                << ") is not the deepest open subtree (position " << _openMarkers.back()
                << ", depth " << _openMarkers.size() << ")";
        } else {
            return;
        }
        _violation(oss.str());
    }

    template< class ValueType >
    SubtreeMarker GroveBuffer<ValueType>::_deepestMarker(const char* op) const {
        if(_openMarkers.empty())
            _violation(string(op) + ": no open subtree");
        SubtreeMarker m = { _openMarkers.back(), _openMarkers.size() };
        return m;
    }

    template< class ValueType >
    SubtreeMarker GroveBuffer<ValueType>::beginSubtree() {
        _openMarkers.push_back(_records.size());
        SubtreeMarker m = { _records.size(), _openMarkers.size() };
        return m;
    }

    template< class ValueType >
    size_t GroveBuffer<ValueType>::sealSubtree(const ValueType& value, const SubtreeMarker& marker) {
        _checkMarker(marker, "sealSubtree");
        size_t p = _emplace(value, marker.position);
        _openMarkers.pop_back();
        return p;
    }

    template< class ValueType >
    size_t GroveBuffer<ValueType>::sealSubtree(ValueType&& value, const SubtreeMarker& marker) {
        _checkMarker(marker, "sealSubtree");
        size_t p = _emplace(std::move(value), marker.position);
        _openMarkers.pop_back();
        return p;
    }

    template< class ValueType >
    void GroveBuffer<ValueType>::abandonSubtree(const SubtreeMarker& marker) {
        _checkMarker(marker, "abandonSubtree");
        debug() << "abandoning subtree opened at " << marker.position
                << " (" << _records.size() - marker.position << " records left as trees)";
        _openMarkers.pop_back();
    }

    template< class ValueType >
    void GroveBuffer<ValueType>::_abandonDownTo(size_t depth) noexcept {
        while(_openMarkers.size() > depth)
            _openMarkers.pop_back();
    }

    /**
     * Start of the last childCount root runs. Runs are only counted above the
     * deepest open marker; records below it belong to an enclosing level.
     */
    template< class ValueType >
    size_t GroveBuffer<ValueType>::_rootRunsStart(size_t childCount) const {
        size_t floor = _openMarkers.empty() ? 0 : _openMarkers.back();
        size_t start = _records.size();
        for(size_t i = 0; i < childCount; ++i) {
            if(start <= floor) {
                ostringstream oss;
                oss << "pushRoot: asked for " << childCount << " children but only " << i
                    << " trees follow position " << floor;
                _violation(oss.str());
            }
            start -= _records[start-1].subtreeSize;
        }
        return start;
    }

    template< class ValueType >
    size_t GroveBuffer<ValueType>::pushRoot(const ValueType& value, size_t childCount) {
        return _emplace(value, _rootRunsStart(childCount));
    }

    template< class ValueType >
    size_t GroveBuffer<ValueType>::pushRoot(ValueType&& value, size_t childCount) {
        return _emplace(std::move(value), _rootRunsStart(childCount));
    }

    /**
     * Appends [first, last) as a unit: if constructing any record throws,
     * the records already appended are dropped again so the buffer never
     * ends in a partial root run.
     */
    template< class ValueType >
    template< class Iter >
    RecordRange GroveBuffer<ValueType>::_appendRecords(Iter first, Iter last) {
        size_t lo = _records.size();
        size_t need = lo + static_cast<size_t>(std::distance(first, last));
        if(need > _records.capacity())
            _records.reserve(std::max(need, 2 * _records.capacity()));
        try {
            for(; first != last; ++first)
                _records.push_back(*first);
        } catch(...) {
            _records.erase(_records.begin() + lo, _records.end());
            throw;
        }
        RecordRange r = { lo, _records.size() };
        return r;
    }

    template< class ValueType >
    RecordRange GroveBuffer<ValueType>::appendTree(const View& other) {
        if(other.empty()) {
            RecordRange r = { _records.size(), _records.size() };
            return r;
        }
        debug() << "appending " << other.size() << " records " << other.range()
                << " at " << _records.size();
        if(other._records == &_records) {
            // reserve() would invalidate the source range
            RecordVector copy(_records.begin() + other.lo(), _records.begin() + other.hi());
            return _appendRecords(std::make_move_iterator(copy.begin()),
                                  std::make_move_iterator(copy.end()));
        }
        return _appendRecords(other._records->begin() + other.lo(),
                              other._records->begin() + other.hi());
    }

    template< class ValueType >
    RecordRange GroveBuffer<ValueType>::appendTree(const GroveBuffer& other) {
        if(!other.isSealed()) {
            ostringstream oss;
            oss << "appendTree: source grove still has " << other.openDepth() << " open subtree(s)";
            _violation(oss.str());
        }
        return appendTree(other.view());
    }

    template< class ValueType >
    RecordRange GroveBuffer<ValueType>::appendTree(GroveBuffer&& other) {
        if(&other == this)
            _violation("appendTree: cannot move a grove into itself");
        if(!other.isSealed()) {
            ostringstream oss;
            oss << "appendTree: source grove still has " << other.openDepth() << " open subtree(s)";
            _violation(oss.str());
        }
        debug() << "moving " << other.size() << " records in at " << _records.size();
        return _appendRecords(std::make_move_iterator(other._records.begin()),
                              std::make_move_iterator(other._records.end()));
    }

    template< class ValueType >
    GroveBuffer<ValueType> GroveBuffer<ValueType>::adopt(RecordVector records) {
        GroveBuffer<ValueType> buffer(0);
        buffer._records = std::move(records);
#if GROVE_VALIDATE_ON_ADOPT
        buffer.view().validate();
#endif
        debug() << "adopted " << buffer.size() << " records";
        return buffer;
    }
}
