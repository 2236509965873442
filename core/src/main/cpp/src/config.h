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

namespace grove {
#ifndef GROVE_BUFFER_INIT_SIZE
#define GROVE_BUFFER_INIT_SIZE 32
#endif

#ifndef GROVE_MARKER_STACK_INIT_SIZE
#define GROVE_MARKER_STACK_INIT_SIZE 8
#endif

// adopted record sequences are checked before the buffer takes them over
#ifndef GROVE_VALIDATE_ON_ADOPT
#define GROVE_VALIDATE_ON_ADOPT 1
#endif

}
