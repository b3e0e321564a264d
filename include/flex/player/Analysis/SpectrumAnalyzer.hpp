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

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <vector>
#include <fftw3.h>
#include <flex/player/Analysis/AnalysisQueue.hpp>
#include <flex/player/Analysis/VisualizationBuffer.hpp>
#include <flex/player/Configuration/AnalyzerSettings.hpp>

namespace flex
{
  namespace player
  {
    namespace analysis
    {

      /**
       * @brief Turns mono sample chunks into a smoothed 50-band spectrum
       *
       * Owns the analysis queue fed by the output callback and the visualization
       * buffer it publishes into. The worker thread is optional: processChunk()
       * runs one analysis step on the calling thread.
       */
      class SpectrumAnalyzer
      {
      public:
        explicit SpectrumAnalyzer(const configuration::AnalyzerSettings &settings);
        ~SpectrumAnalyzer();

        SpectrumAnalyzer(const SpectrumAnalyzer &) = delete;
        SpectrumAnalyzer &operator=(const SpectrumAnalyzer &) = delete;

        void start();
        void stop();
        bool isRunning() const;

        /**
         * @brief Analyze one chunk and publish the result
         *
         * Must not be called concurrently with the worker thread.
         * @return The spectrum that was published
         */
        Spectrum processChunk(const float *samples, size_t count);

        /**
         * @brief Zero the visualization and discard chunks queued before the call
         *
         * Normalization state is kept. Anything the worker is analyzing at the
         * time of the call is never published.
         */
        void reset();

        ChunkQueue &queue();
        Spectrum snapshot() const;

        float persistentMax() const;
        size_t fftSize() const;

      private:
        void run();
        void dropStaleChunks();
        Spectrum analyze(const float *samples, size_t count);
        void pickBins(Spectrum &bins) const;
        void normalize(Spectrum &bins);

        configuration::AnalyzerSettings settings_;
        size_t fftSize_;
        ChunkQueue queue_;
        VisualizationBuffer visualization_;

        float *fftInput_;
        fftwf_complex *fftOutput_;
        fftwf_plan plan_;
        std::vector<size_t> binIndices_;

        // Normalization state, touched only by the analysis step
        float persistentMax_;
        Spectrum lastSpectrum_;

        // Last visualization generation the worker drained the queue for
        uint64_t consumedGeneration_;

        std::atomic<bool> stopRequested_;
        std::thread worker_;
      };

    } // namespace analysis
  } // namespace player
} // namespace flex
