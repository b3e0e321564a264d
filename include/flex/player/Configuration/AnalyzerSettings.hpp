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

#include <cstdint>

namespace flex::player::configuration {

struct AnalyzerSettings {
  uint32_t fftSize = 2048;
  float smoothing = 0.3f;
  float releaseFactor = 0.88f;
  float baseline = 1e-3f;
  float noiseThreshold = 0.1f;
  float silenceFloor = 1e-3f;
  float bassBoost = 2.0f;
  float beatThreshold = 0.6f;
  float beatBoost = 1.2f;
  uint32_t queueTimeoutMs = 100;
};

} // namespace flex::player::configuration
