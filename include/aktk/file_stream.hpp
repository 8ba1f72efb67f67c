#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace aktk::filestream {

constexpr std::size_t kDefaultChunkSize = 65536;  // 64KB chunks

// Buffered file writer with an in-object chunk buffer. Parent directories
// are never created here.
template<std::size_t ChunkSize = kDefaultChunkSize>
class BufferedFileWriter {
public:
    explicit BufferedFileWriter(const std::filesystem::path& path)
        : path_(path), output_(path, std::ios::binary | std::ios::trunc) {
        if (!output_) {
            throw std::runtime_error("Failed to open file for writing: " + path.string());
        }
    }

    BufferedFileWriter(const BufferedFileWriter&) = delete;
    BufferedFileWriter& operator=(const BufferedFileWriter&) = delete;

    void Write(const std::uint8_t* data, std::size_t size) {
        std::size_t offset = 0;
        while (offset < size) {
            std::size_t available = chunk_.size() - buffer_pos_;
            std::size_t to_copy = std::min(available, size - offset);

            std::memcpy(chunk_.data() + buffer_pos_, data + offset, to_copy);
            buffer_pos_ += to_copy;
            offset += to_copy;

            if (buffer_pos_ == chunk_.size()) {
                FlushBuffer();
            }
        }
    }

    void Write(const std::vector<std::uint8_t>& data) {
        Write(data.data(), data.size());
    }

    // Must be called before destruction; the destructor does not report write errors.
    void Close() {
        FlushBuffer();
        output_.flush();
        output_.close();
        if (output_.fail()) {
            throw std::runtime_error("Failed to finish writing file: " + path_.string());
        }
    }

private:
    void FlushBuffer() {
        if (buffer_pos_ > 0 && output_) {
            output_.write(reinterpret_cast<const char*>(chunk_.data()),
                          static_cast<std::streamsize>(buffer_pos_));
            if (!output_) {
                throw std::runtime_error("Failed to write to file: " + path_.string());
            }
            buffer_pos_ = 0;
        }
    }

    std::filesystem::path path_;
    std::ofstream output_;
    std::array<std::uint8_t, ChunkSize> chunk_;
    std::size_t buffer_pos_ = 0;
};

std::vector<std::uint8_t> ReadFile(const std::filesystem::path& path);
void WriteFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);

}  // namespace aktk::filestream
