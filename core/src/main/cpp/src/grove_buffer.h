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
#include "config.h"
#include "grove_errors.h"
#include "node_record.h"
#include "forest_view.h"

namespace grove {

    template< class ValueType > class GroveBuilder;

    /**
     * Start boundary of a subtree under construction. position is the
     * buffer length when the subtree was opened, depth the number of open
     * subtrees once it was (1 for the outermost).
     */
    struct SubtreeMarker {
        size_t position;
        size_t depth;
    };

    /**
     * GroveBuffer
     *
     * Owns a grove as one growable vector of NodeRecords in children-before-
     * parent order. Records are only ever appended; once written a record's
     * position and subtree size never change, so every position handed out
     * stays valid for the life of the buffer.
     *
     * Subtrees are built by pushing their nodes between beginSubtree() and
     * sealSubtree(). Open subtrees form a stack and must be sealed (or
     * abandoned) deepest first; any other order is rejected before a record
     * is written.
     *
     * One writer at a time. Appends may reallocate the vector, so no reader
     * may run while a writer appends.
     */
    template< class ValueType >
    class GroveBuffer {
    public:
        typedef NodeRecord<ValueType> Record;
        typedef std::vector<Record> RecordVector;
        typedef ForestView<ValueType> View;

        explicit GroveBuffer(size_t initialCapacity = GROVE_BUFFER_INIT_SIZE) {
            _records.reserve(initialCapacity);
            _openMarkers.reserve(GROVE_MARKER_STACK_INIT_SIZE);
        }

        size_t size() const { return _records.size(); }
        bool empty() const { return _records.empty(); }
        size_t capacity() const { return _records.capacity(); }
        void reserve(size_t n) { _records.reserve(n); }

        size_t openDepth() const { return _openMarkers.size(); }
        bool isSealed() const { return _openMarkers.empty(); }

        //////////////////////////
        //     Construction     //
        //////////////////////////

        /**
         * Appends a leaf.
         * @return the leaf's position
         */
        size_t pushLeaf(const ValueType& value) { return _emplace(value, _records.size()); }
        size_t pushLeaf(ValueType&& value) { return _emplace(std::move(value), _records.size()); }

        /**
         * Opens a subtree at the current end of the buffer. Nothing is
         * written until the matching sealSubtree().
         */
        SubtreeMarker beginSubtree();

        /**
         * Writes the root of the subtree opened by marker. Everything pushed
         * since the marker was taken becomes its descendants.
         * @return the root's position
         */
        size_t sealSubtree(const ValueType& value, const SubtreeMarker& marker);
        size_t sealSubtree(ValueType&& value, const SubtreeMarker& marker);

        // seals the deepest open subtree
        size_t sealSubtree(const ValueType& value) { return sealSubtree(value, _deepestMarker("sealSubtree")); }
        size_t sealSubtree(ValueType&& value) { return sealSubtree(std::move(value), _deepestMarker("sealSubtree")); }

        /**
         * Closes the deepest open subtree without writing a root. The nodes
         * pushed inside it stay where they are as independent trees of the
         * enclosing level.
         */
        void abandonSubtree(const SubtreeMarker& marker);

        /**
         * Appends a root adopting the last childCount trees of the current
         * level as its children.
         * @return the root's position
         */
        size_t pushRoot(const ValueType& value, size_t childCount);
        size_t pushRoot(ValueType&& value, size_t childCount);

        /**
         * Concatenates a grove built elsewhere (or a range of this buffer)
         * as additional trees. Subtree sizes do not depend on position, so
         * the records are copied verbatim.
         * @return the range now holding the appended records
         */
        RecordRange appendTree(const View& other);
        RecordRange appendTree(const GroveBuffer& other);

        /**
         * Moves the values out of other. other keeps its length and subtree
         * sizes, so its views stay valid, but its values are left moved-from.
         */
        RecordRange appendTree(GroveBuffer&& other);

        /**
         * Takes over a raw record sequence, e.g. one read back by a
         * persistence layer. Throws ContractViolation if the records do not
         * form a grove.
         */
        static GroveBuffer adopt(RecordVector records);

        //////////////////////////
        //        Access        //
        //////////////////////////

        View view() const { return View(&_records, 0, _records.size()); }

        const Record& recordAt(size_t p) const {
            if(p >= _records.size())
                throw OutOfBounds(p, 0, _records.size());
            return _records[p];
        }

        const RecordVector& records() const { return _records; }

        friend class GroveBuilder<ValueType>;

    private:
        template< class V >
        size_t _emplace(V&& value, size_t start);

        template< class Iter >
        RecordRange _appendRecords(Iter first, Iter last);

        void _checkMarker(const SubtreeMarker& marker, const char* op) const;
        SubtreeMarker _deepestMarker(const char* op) const;
        size_t _rootRunsStart(size_t childCount) const;
        void _abandonDownTo(size_t depth) noexcept;
        void _violation(const string& msg) const;

        RecordVector _records;
        std::vector<size_t> _openMarkers;   // start positions of open subtrees
    };

    template< class ValueType >
    bool operator==(const GroveBuffer<ValueType>& a, const GroveBuffer<ValueType>& b) {
        return a.view() == b.view();
    }

    template< class ValueType >
    bool operator!=(const GroveBuffer<ValueType>& a, const GroveBuffer<ValueType>& b) {
        return !(a == b);
    }
}
