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
     * Builder misuse or a malformed record sequence. Raised at the offending
     * call before anything is written to the buffer.
     */
    class ContractViolation : public std::logic_error {
    public:
        explicit ContractViolation(const string& what) : std::logic_error(what) {}
    };

    /**
     * A node index outside the buffer or outside the span a view covers.
     */
    class OutOfBounds : public std::out_of_range {
    public:
        OutOfBounds(size_t index, size_t lo, size_t hi)
            : std::out_of_range(_describe(index, lo, hi)), _index(index), _lo(lo), _hi(hi) {}

        size_t index() const { return _index; }
        size_t lo() const { return _lo; }
        size_t hi() const { return _hi; }

    private:
        static string _describe(size_t index, size_t lo, size_t hi) {
            ostringstream oss;
            oss << "node index " << index << " outside [" << lo << ", " << hi << ")";
            return oss.str();
        }

        size_t _index;
        size_t _lo;
        size_t _hi;
    };

    // lookup past the available elements
    class NotFound : public std::runtime_error {
    public:
        explicit NotFound(const string& what) : std::runtime_error(what) {}
    };
}
