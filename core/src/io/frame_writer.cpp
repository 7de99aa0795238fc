#include <auroscuro/io/frame_writer.h>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace auroscuro::io {

PngSequenceWriter::PngSequenceWriter(std::string directory, std::string prefix)
    : m_directory(std::move(directory))
    , m_prefix(std::move(prefix)) {
}

std::string PngSequenceWriter::pathFor(uint64_t index) const {
    std::ostringstream name;
    name << m_prefix << "_" << std::setw(6) << std::setfill('0') << index << ".png";
    return (fs::path(m_directory) / name.str()).string();
}

bool PngSequenceWriter::writeFrame(const ImageData& frame, uint64_t index) {
    if (!m_directoryReady) {
        std::error_code ec;
        fs::create_directories(m_directory, ec);
        if (ec) {
            std::cerr << "[PngSequenceWriter] Cannot create " << m_directory
                      << ": " << ec.message() << std::endl;
            return false;
        }
        m_directoryReady = true;
    }

    if (!writePNG(pathFor(index), frame)) {
        return false;
    }
    m_written++;
    return true;
}

} // namespace auroscuro::io
