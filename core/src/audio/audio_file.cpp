// Prevent Windows.h from defining min/max macros (must be before miniaudio.h)
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

#include <auroscuro/audio/audio_file.h>
#include <iostream>

namespace auroscuro::audio {

static constexpr ma_uint64 READ_CHUNK_FRAMES = 4096;

static DecodedAudio drain(ma_decoder& decoder, const std::string& label) {
    DecodedAudio result;

    ma_uint64 total = 0;
    if (ma_decoder_get_length_in_pcm_frames(&decoder, &total) == MA_SUCCESS && total > 0) {
        result.samples.reserve(static_cast<size_t>(total));
    }

    float chunk[READ_CHUNK_FRAMES];
    for (;;) {
        ma_uint64 framesRead = 0;
        ma_result r = ma_decoder_read_pcm_frames(&decoder, chunk, READ_CHUNK_FRAMES, &framesRead);
        result.samples.insert(result.samples.end(), chunk, chunk + framesRead);

        if (r == MA_AT_END || framesRead < READ_CHUNK_FRAMES) {
            break;
        }
        if (r != MA_SUCCESS) {
            std::cerr << "[AudioFile] Decode error in " << label
                      << ": " << ma_result_description(r) << std::endl;
            return {};
        }
    }

    result.sampleRate = decoder.outputSampleRate;

    ma_format format;
    ma_uint32 channels = 0;
    ma_uint32 rate = 0;
    if (ma_data_source_get_data_format(decoder.pBackend, &format, &channels, &rate, nullptr, 0) == MA_SUCCESS) {
        result.sourceChannels = channels;
    }

    if (!result.valid()) {
        std::cerr << "[AudioFile] No audio frames in: " << label << std::endl;
        return {};
    }

    std::cout << "[AudioFile] Loaded: " << label
              << " (" << result.frameCount() << " frames, "
              << result.sampleRate << " Hz, "
              << result.duration() << "s)" << std::endl;
    return result;
}

DecodedAudio loadAudioFile(const std::string& path) {
    // Mono float at the native rate (sampleRate 0 keeps the file's rate)
    ma_decoder_config config = ma_decoder_config_init(ma_format_f32, 1, 0);

    ma_decoder decoder;
    ma_result r = ma_decoder_init_file(path.c_str(), &config, &decoder);
    if (r != MA_SUCCESS) {
        std::cerr << "[AudioFile] Failed to open: " << path
                  << " (" << ma_result_description(r) << ")" << std::endl;
        return {};
    }

    DecodedAudio result = drain(decoder, path);
    ma_decoder_uninit(&decoder);
    return result;
}

DecodedAudio decodeAudioMemory(const void* data, size_t size) {
    if (!data || size == 0) {
        return {};
    }

    ma_decoder_config config = ma_decoder_config_init(ma_format_f32, 1, 0);

    ma_decoder decoder;
    ma_result r = ma_decoder_init_memory(data, size, &config, &decoder);
    if (r != MA_SUCCESS) {
        std::cerr << "[AudioFile] Failed to decode memory buffer ("
                  << ma_result_description(r) << ")" << std::endl;
        return {};
    }

    DecodedAudio result = drain(decoder, "<memory>");
    ma_decoder_uninit(&decoder);
    return result;
}

} // namespace auroscuro::audio
