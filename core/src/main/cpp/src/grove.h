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

// grove.h : public surface of the grove library

#pragma once

#include "config.h"
#include "grove_errors.h"
#include "node_record.h"
#include "groveiter.h"
#include "forest_view.h"
#include "forest_view.hpp"
#include "grove_buffer.h"
#include "grove_buffer.hpp"
#include "grove_builder.h"
#include "util/log.h"
