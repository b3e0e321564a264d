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

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace flex
{
  namespace player
  {
    namespace analysis
    {

      constexpr size_t cVisualizationBins = 50;
      constexpr size_t cBassBins = 15;
      constexpr size_t cMidBins = 15;

      using Spectrum = std::array<float, cVisualizationBins>;

      /**
       * @brief 50-band magnitude vector shared between the analyzer and renderers
       *
       * Index 0-14 bass, 15-29 mid, 30-49 high. Readers always receive a copy.
       * Every clear() starts a new generation; a publish tagged with an older
       * generation is discarded so a cleared buffer stays zero.
       */
      class VisualizationBuffer
      {
      public:
        VisualizationBuffer();

        bool publish(const Spectrum &spectrum, uint64_t generation);
        Spectrum snapshot() const;
        void clear();
        uint64_t generation() const;

      private:
        mutable std::mutex mutex_;
        Spectrum bins_;
        uint64_t generation_;
      };

    } // namespace analysis
  } // namespace player
} // namespace flex
