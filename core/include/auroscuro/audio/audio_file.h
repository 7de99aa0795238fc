#pragma once

/**
 * @file audio_file.h
 * @brief Decode audio files into a mono analysis buffer
 *
 * Any format miniaudio can decode (WAV, MP3, FLAC). Channels are downmixed to
 * mono; the file's sample rate is kept.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace auroscuro::audio {

/// @brief Fully decoded mono audio
struct DecodedAudio {
    std::vector<float> samples;   ///< Mono float samples [-1.0, 1.0]
    uint32_t sampleRate = 0;      ///< Hz
    uint32_t sourceChannels = 0;  ///< Channel count before downmix

    bool valid() const { return sampleRate > 0 && !samples.empty(); }
    uint64_t frameCount() const { return samples.size(); }

    /// @brief Duration in seconds
    double duration() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }
};

/**
 * @brief Decode a file
 * @return Decoded audio, or an invalid DecodedAudio on failure
 */
DecodedAudio loadAudioFile(const std::string& path);

/// @brief Decode an encoded in-memory file
DecodedAudio decodeAudioMemory(const void* data, size_t size);

} // namespace auroscuro::audio
