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

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <flex/player/Analysis/SpectrumAnalyzer.hpp>
#include <flex/player/Common/Log.hpp>

namespace flex
{
  namespace player
  {
    namespace analysis
    {

      namespace
      {
        constexpr size_t cBeatBins = 10;
      }

      SpectrumAnalyzer::SpectrumAnalyzer(const configuration::AnalyzerSettings &settings)
          : settings_(settings), fftSize_(settings.fftSize), queue_(settings.fftSize),
            fftInput_(nullptr), fftOutput_(nullptr), plan_(nullptr), persistentMax_(0.0f),
            consumedGeneration_(0), stopRequested_(false)
      {
        if (fftSize_ < 2 * cVisualizationBins)
        {
          throw std::invalid_argument("FFT size must be at least twice the number of visualization bins");
        }

        fftInput_ = fftwf_alloc_real(fftSize_);
        fftOutput_ = fftwf_alloc_complex(fftSize_ / 2 + 1);
        if (fftInput_ && fftOutput_)
        {
          plan_ = fftwf_plan_dft_r2c_1d(static_cast<int>(fftSize_), fftInput_, fftOutput_, FFTW_ESTIMATE);
        }

        if (!plan_)
        {
          fftwf_free(fftInput_);
          fftwf_free(fftOutput_);
          throw std::runtime_error("Failed to create FFTW plan");
        }

        // Evenly spaced picks across the half spectrum, rounded to the nearest bin
        const size_t lastBin = fftSize_ / 2 - 1;
        binIndices_.resize(cVisualizationBins);
        for (size_t i = 0; i < cVisualizationBins; ++i)
        {
          const double position = static_cast<double>(i) * static_cast<double>(lastBin) /
                                  static_cast<double>(cVisualizationBins - 1);
          binIndices_[i] = static_cast<size_t>(std::lround(position));
        }

        lastSpectrum_.fill(0.0f);

        FLEX_LOG(info) << "[SpectrumAnalyzer] FFT size " << fftSize_ << ", "
                       << cVisualizationBins << " bins";
      }

      SpectrumAnalyzer::~SpectrumAnalyzer()
      {
        this->stop();
        fftwf_destroy_plan(plan_);
        fftwf_free(fftInput_);
        fftwf_free(fftOutput_);
      }

      void SpectrumAnalyzer::start()
      {
        if (worker_.joinable())
          return;

        stopRequested_.store(false, std::memory_order_release);
        worker_ = std::thread(&SpectrumAnalyzer::run, this);
        FLEX_LOG(info) << "[SpectrumAnalyzer] Analysis thread started";
      }

      void SpectrumAnalyzer::stop()
      {
        stopRequested_.store(true, std::memory_order_release);
        if (worker_.joinable())
        {
          worker_.join();
          FLEX_LOG(debug) << "[SpectrumAnalyzer] Analysis thread stopped, "
                          << queue_.dropped() << " chunks dropped";
        }
      }

      bool SpectrumAnalyzer::isRunning() const
      {
        return worker_.joinable() && !stopRequested_.load(std::memory_order_acquire);
      }

      void SpectrumAnalyzer::run()
      {
        std::vector<float> chunk;
        chunk.reserve(fftSize_);
        const std::chrono::milliseconds timeout(settings_.queueTimeoutMs);

        while (!stopRequested_.load(std::memory_order_acquire))
        {
          this->dropStaleChunks();

          if (!queue_.pop(chunk, timeout))
            continue;

          // A reset while waiting makes the popped chunk stale as well
          const uint64_t generation = visualization_.generation();
          if (generation != consumedGeneration_)
            continue;

          visualization_.publish(this->analyze(chunk.data(), chunk.size()), generation);
        }
      }

      void SpectrumAnalyzer::dropStaleChunks()
      {
        const uint64_t generation = visualization_.generation();
        if (generation == consumedGeneration_)
          return;

        queue_.clear();
        consumedGeneration_ = generation;
      }

      void SpectrumAnalyzer::reset()
      {
        visualization_.clear();
      }

      Spectrum SpectrumAnalyzer::processChunk(const float *samples, size_t count)
      {
        const uint64_t generation = visualization_.generation();
        const Spectrum spectrum = this->analyze(samples, count);
        visualization_.publish(spectrum, generation);
        return spectrum;
      }

      Spectrum SpectrumAnalyzer::analyze(const float *samples, size_t count)
      {
        const size_t toCopy = samples ? std::min(count, fftSize_) : 0;
        std::copy_n(samples, toCopy, fftInput_);
        std::fill(fftInput_ + toCopy, fftInput_ + fftSize_, 0.0f);

        fftwf_execute(plan_);

        Spectrum bins;
        this->pickBins(bins);
        this->normalize(bins);

        Spectrum smoothed;
        for (size_t i = 0; i < cVisualizationBins; ++i)
        {
          float value = bins[i] * settings_.smoothing + lastSpectrum_[i] * (1.0f - settings_.smoothing);
          if (value < settings_.silenceFloor)
            value = 0.0f;
          smoothed[i] = value;
        }
        lastSpectrum_ = smoothed;

        for (size_t i = 0; i < cBassBins; ++i)
        {
          smoothed[i] *= settings_.bassBoost;
        }

        // Crude onset accent: loud low end lifts the whole display
        const float lowMean = std::accumulate(smoothed.begin(), smoothed.begin() + cBeatBins, 0.0f) /
                              static_cast<float>(cBeatBins);
        if (lowMean > settings_.beatThreshold)
        {
          for (auto &value : smoothed)
            value *= settings_.beatBoost;
        }

        return smoothed;
      }

      void SpectrumAnalyzer::pickBins(Spectrum &bins) const
      {
        for (size_t i = 0; i < cVisualizationBins; ++i)
        {
          const auto &bin = fftOutput_[binIndices_[i]];
          const float magnitude = std::hypot(bin[0], bin[1]);
          bins[i] = std::isfinite(magnitude) ? magnitude : 0.0f;
        }
      }

      void SpectrumAnalyzer::normalize(Spectrum &bins)
      {
        const float currentMax = *std::max_element(bins.begin(), bins.end());

        if (currentMax > persistentMax_)
        {
          persistentMax_ = currentMax;
        }
        else
        {
          persistentMax_ = settings_.releaseFactor * persistentMax_ +
                           (1.0f - settings_.releaseFactor) * currentMax;
        }

        const float effectiveMax = std::max(persistentMax_, settings_.baseline);
        if (effectiveMax > settings_.noiseThreshold)
        {
          for (auto &value : bins)
            value /= effectiveMax;
        }
        else
        {
          bins.fill(0.0f);
        }
      }

      ChunkQueue &SpectrumAnalyzer::queue() { return queue_; }

      Spectrum SpectrumAnalyzer::snapshot() const { return visualization_.snapshot(); }

      float SpectrumAnalyzer::persistentMax() const { return persistentMax_; }

      size_t SpectrumAnalyzer::fftSize() const { return fftSize_; }

    } // namespace analysis
  } // namespace player
} // namespace flex
