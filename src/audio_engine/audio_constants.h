/**
 * @file audio_constants.h
 * @brief Constants shared by producers, processors, flows and consumers.
 */
#ifndef AIRLIFT_AUDIO_CONSTANTS_H
#define AIRLIFT_AUDIO_CONSTANTS_H

#include <cstdint>

namespace airlift {
/**
 * @namespace audio
 * @brief The main namespace for the airlift pipeline engine.
 */
namespace audio {

/** @brief Upper bound on channels accepted by any component. */
constexpr int MAX_CHANNELS = 8;

/** @brief Frames carry 100 ms of audio: sample_rate / FRAME_QUANTUM_DIVISOR frames per channel. */
constexpr int FRAME_QUANTUM_DIVISOR = 10;

/** @brief All PCM moving through the pipeline is signed 16-bit. */
constexpr int PCM_BIT_DEPTH = 16;

constexpr int DEFAULT_SAMPLE_RATE = 48000;
constexpr int DEFAULT_CHANNELS = 2;

constexpr int16_t SAMPLE_MAX = 32767;
constexpr int16_t SAMPLE_MIN = -32768;

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_AUDIO_CONSTANTS_H
