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

#include <flex/player/Analysis/VisualizationBuffer.hpp>

namespace flex::player::analysis {

VisualizationBuffer::VisualizationBuffer() : generation_(0) { bins_.fill(0.0f); }

bool VisualizationBuffer::publish(const Spectrum &spectrum, uint64_t generation) {
  std::lock_guard<decltype(mutex_)> lock(mutex_);
  if (generation != generation_)
    return false;

  bins_ = spectrum;
  return true;
}

Spectrum VisualizationBuffer::snapshot() const {
  std::lock_guard<decltype(mutex_)> lock(mutex_);
  return bins_;
}

void VisualizationBuffer::clear() {
  std::lock_guard<decltype(mutex_)> lock(mutex_);
  bins_.fill(0.0f);
  ++generation_;
}

uint64_t VisualizationBuffer::generation() const {
  std::lock_guard<decltype(mutex_)> lock(mutex_);
  return generation_;
}

} // namespace flex::player::analysis
