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

#include "grove.h"

namespace grove {

// Explicit template instantiations for the value types the library ships
// with, so every member is compiled once here.
template struct NodeRecord<std::string>;
template class ForestView<std::string>;
template class GroveBuffer<std::string>;
template class GroveBuilder<std::string>;

template struct NodeRecord<int64_t>;
template class ForestView<int64_t>;
template class GroveBuffer<int64_t>;
template class GroveBuilder<int64_t>;

} // namespace grove
