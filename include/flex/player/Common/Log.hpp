/*
*  This file is part of flexplayer project.
*  Copyright (C) 2025 flexplayer contributors
*
*  flexplayer is free software: you can redistribute it and/or modify
*  it under the terms of the GNU General Public License as published by
*  the Free Software Foundation; either version 3 of the License, or
*  (at your option) any later version.

*  flexplayer is distributed in the hope that it will be useful,
*  but WITHOUT ANY WARRANTY; without even the implied warranty of
*  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
*  GNU General Public License for more details.
*
*  You should have received a copy of the GNU General Public License
*  along with flexplayer. If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <boost/log/trivial.hpp>

// Call sites tag each line with their component, e.g. "[PlaybackEngine] "
#define FLEX_LOG(severity) BOOST_LOG_TRIVIAL(severity)
