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

#include <cmath>
#include <cstring>
#include <limits>
#include <flex/player/Codec/SampleFormatCodec.hpp>

namespace flex::player::codec {

namespace {

// 24-bit samples are upconverted by moving them into the top 24 bits.
constexpr double cInt24ToInt32Scale = 256.0;

template <typename T> T saturate(double value) {
  if (std::isnan(value)) {
    return 0;
  }
  if (value >= static_cast<double>(std::numeric_limits<T>::max())) {
    return std::numeric_limits<T>::max();
  }
  if (value <= static_cast<double>(std::numeric_limits<T>::min())) {
    return std::numeric_limits<T>::min();
  }
  return static_cast<T>(value);
}

template <typename T>
void widen(const uint8_t *data, size_t count, std::vector<float> &out) {
  for (size_t i = 0; i < count; ++i) {
    T sample;
    std::memcpy(&sample, data + i * sizeof(T), sizeof(T));
    out[i] = static_cast<float>(sample);
  }
}

template <typename T>
size_t narrow(const float *samples, size_t count, double scale,
              uint8_t *output) {
  for (size_t i = 0; i < count; ++i) {
    const T sample = saturate<T>(static_cast<double>(samples[i]) * scale);
    std::memcpy(output + i * sizeof(T), &sample, sizeof(T));
  }
  return count * sizeof(T);
}

} // namespace

SampleWidth SampleFormatCodec::resolveWidth(uint32_t bytes) {
  switch (bytes) {
  case 1:
    return SampleWidth::INT8;
  case 2:
    return SampleWidth::INT16;
  case 3:
    return SampleWidth::INT24;
  case 4:
    return SampleWidth::INT32;
  default:
    return SampleWidth::INT16;
  }
}

uint32_t SampleFormatCodec::outputWidth(uint32_t sourceBytes) {
  const auto width = resolveWidth(sourceBytes);
  if (width == SampleWidth::INT24) {
    return static_cast<uint32_t>(SampleWidth::INT32);
  }
  return static_cast<uint32_t>(width);
}

int32_t SampleFormatCodec::decodeInt24(const uint8_t *sample) {
  uint8_t word[4];
  word[0] = sample[0];
  word[1] = sample[1];
  word[2] = sample[2];
  word[3] = (sample[2] & 0x80) != 0 ? 0xFF : 0x00;

  int32_t value;
  std::memcpy(&value, word, sizeof(value));
  return value;
}

std::vector<float> SampleFormatCodec::bytesToFloat(const uint8_t *data,
                                                   size_t size,
                                                   uint32_t width) {
  const auto resolved = resolveWidth(width);
  const size_t bytesPerSample = static_cast<size_t>(resolved);
  const size_t count = data != nullptr ? size / bytesPerSample : 0;
  std::vector<float> samples(count);

  switch (resolved) {
  case SampleWidth::INT8:
    widen<int8_t>(data, count, samples);
    break;
  case SampleWidth::INT16:
    widen<int16_t>(data, count, samples);
    break;
  case SampleWidth::INT24:
    for (size_t i = 0; i < count; ++i) {
      samples[i] = static_cast<float>(decodeInt24(data + i * 3));
    }
    break;
  case SampleWidth::INT32:
    widen<int32_t>(data, count, samples);
    break;
  }

  return samples;
}

std::vector<float>
SampleFormatCodec::bytesToFloat(const std::vector<uint8_t> &data,
                                uint32_t width) {
  return bytesToFloat(data.data(), data.size(), width);
}

size_t SampleFormatCodec::floatToBytes(const float *samples, size_t count,
                                       uint32_t width, uint8_t *output) {
  switch (resolveWidth(width)) {
  case SampleWidth::INT8:
    return narrow<int8_t>(samples, count, 1.0, output);
  case SampleWidth::INT24:
    return narrow<int32_t>(samples, count, cInt24ToInt32Scale, output);
  case SampleWidth::INT32:
    return narrow<int32_t>(samples, count, 1.0, output);
  case SampleWidth::INT16:
  default:
    return narrow<int16_t>(samples, count, 1.0, output);
  }
}

std::vector<uint8_t>
SampleFormatCodec::floatToBytes(const std::vector<float> &samples,
                                uint32_t width) {
  std::vector<uint8_t> bytes(samples.size() * outputWidth(width));
  floatToBytes(samples.data(), samples.size(), width, bytes.data());
  return bytes;
}

} // namespace flex::player::codec
