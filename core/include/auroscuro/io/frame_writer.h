#pragma once

/**
 * @file frame_writer.h
 * @brief Destinations for captured frames
 */

#include <auroscuro/io/image_loader.h>
#include <cstdint>
#include <string>

namespace auroscuro::io {

/// @brief Receives captured RGBA8 frames in order
class FrameSink {
public:
    virtual ~FrameSink() = default;

    /**
     * @brief Consume one frame
     * @param frame RGBA8 pixels
     * @param index Zero-based frame number
     * @return false if the frame could not be stored
     */
    virtual bool writeFrame(const ImageData& frame, uint64_t index) = 0;
};

/**
 * @brief Writes frames as `<directory>/<prefix>_000000.png`, ...
 *
 * The directory is created on first write.
 */
class PngSequenceWriter : public FrameSink {
public:
    explicit PngSequenceWriter(std::string directory, std::string prefix = "frame");

    bool writeFrame(const ImageData& frame, uint64_t index) override;

    /// @brief Path a given frame index is written to
    std::string pathFor(uint64_t index) const;

    uint64_t framesWritten() const { return m_written; }

private:
    std::string m_directory;
    std::string m_prefix;
    bool m_directoryReady = false;
    uint64_t m_written = 0;
};

} // namespace auroscuro::io
