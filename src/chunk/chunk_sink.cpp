#include "chunk/chunk_sink.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace mysql2pg {

FileChunkSink::FileChunkSink(Config config)
    : config_(std::move(config)) {
    std::error_code ec;
    std::filesystem::create_directories(config_.output_dir, ec);
    if (ec) {
        throw std::runtime_error(std::format("Failed to create output directory {}: {}",
                                             config_.output_dir, ec.message()));
    }
}

FileChunkSink::~FileChunkSink() {
    if (file_.is_open()) {
        file_.close();
    }
}

std::string FileChunkSink::chunk_file_name(std::string_view prefix, uint32_t sequence) {
    return std::format("{}_part_{:03d}.sql", prefix, sequence);
}

std::string FileChunkSink::session_header(uint32_t sequence) {
    return std::format("-- mysql2pg INSERT statements - Part {}\n"
                       "-- Load the schema before this file.\n"
                       "--\n\n{}", sequence, kSessionSettings);
}

std::string FileChunkSink::open_chunk(uint32_t sequence) {
    current_path_ = (std::filesystem::path(config_.output_dir) /
                     chunk_file_name(config_.prefix, sequence)).string();

    file_.open(current_path_, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open chunk file: " + current_path_);
    }
    if (config_.session_settings) {
        const auto header = session_header(sequence);
        file_.write(header.data(), static_cast<std::streamsize>(header.size()));
    }
    return current_path_;
}

bool FileChunkSink::append(std::string_view text) {
    file_.write(text.data(), static_cast<std::streamsize>(text.size()));
    return file_.good();
}

void FileChunkSink::close_chunk() {
    if (config_.session_settings) {
        file_.write(kSessionFooter.data(), static_cast<std::streamsize>(kSessionFooter.size()));
    }
    file_.flush();
    const bool ok = file_.good();
    file_.close();
    if (!ok) {
        throw std::runtime_error("Failed to write chunk file: " + current_path_);
    }
}

} // namespace mysql2pg
