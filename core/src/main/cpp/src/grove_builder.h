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
#include "grove_buffer.hpp"
#include "util/log.h"

namespace grove {

    /**
     * GroveBuilder
     *
     * Describes nesting on top of a GroveBuffer's construction surface:
     *
     *     GroveBuilder<string>(buf)
     *         .open().push("red").push("yellow").push("blue").close("primary color")
     *         .open().push("left").push("right").close("direction")
     *         .build();
     *
     * Every open() must be matched by a close() before build(). A builder
     * that goes away with subtrees still open abandons them, which leaves
     * their nodes in place as trees of the enclosing level.
     */
    template< class ValueType >
    class GroveBuilder {
    public:
        explicit GroveBuilder(GroveBuffer<ValueType>& buffer)
            : _buffer(buffer), _baseDepth(buffer.openDepth()) {
            _markers.reserve(GROVE_MARKER_STACK_INIT_SIZE);
        }

        ~GroveBuilder() {
            if(!_markers.empty()) {
                warning() << "builder released with " << _markers.size()
                          << " open subtree(s); abandoning them";
                _buffer._abandonDownTo(_baseDepth);
            }
        }

        GroveBuilder(const GroveBuilder&) = delete;
        GroveBuilder& operator=(const GroveBuilder&) = delete;

        GroveBuilder& push(const ValueType& value) {
            _buffer.pushLeaf(value);
            return *this;
        }

        GroveBuilder& push(ValueType&& value) {
            _buffer.pushLeaf(std::move(value));
            return *this;
        }

        GroveBuilder& open() {
            _markers.push_back(_buffer.beginSubtree());
            return *this;
        }

        GroveBuilder& close(const ValueType& value) {
            _buffer.sealSubtree(value, _top("close"));
            _markers.pop_back();
            return *this;
        }

        GroveBuilder& close(ValueType&& value) {
            _buffer.sealSubtree(std::move(value), _top("close"));
            _markers.pop_back();
            return *this;
        }

        // splices a whole grove in at the current depth
        GroveBuilder& append(const ForestView<ValueType>& grove) {
            _buffer.appendTree(grove);
            return *this;
        }

        size_t depth() const { return _markers.size(); }

        GroveBuffer<ValueType>& build() {
            if(!_markers.empty()) {
                ostringstream oss;
                oss << "build: " << _markers.size() << " subtree(s) still open";
                error() << oss.str();
                throw ContractViolation(oss.str());
            }
            return _buffer;
        }

    private:
        const SubtreeMarker& _top(const char* op) const {
            if(_markers.empty()) {
                string msg = string(op) + ": no open subtree in this builder";
                error() << msg;
                throw ContractViolation(msg);
            }
            return _markers.back();
        }

        GroveBuffer<ValueType>& _buffer;
        std::vector<SubtreeMarker> _markers;
        size_t _baseDepth;
    };
}
