#include "io/sink.hpp"
#include <algorithm>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace encstream {
namespace io {

//==============================================
// MEMORY SINK
//==============================================

std::size_t MemorySink::write(const uint8_t* data, std::size_t size) {
  const uint64_t end = position_ + size;
  if (end > data_.size()) {
    data_.resize(static_cast<std::size_t>(end));
  }
  std::copy(data, data + size, data_.begin() + static_cast<std::ptrdiff_t>(position_));
  position_ = end;
  return size;
}

void MemorySink::seek(uint64_t position) {
  // Seeking past the end zero-fills on the next write, like a file
  position_ = position;
}

void MemorySink::truncate(uint64_t size) {
  if (size < data_.size()) {
    data_.resize(static_cast<std::size_t>(size));
  }
}

//==============================================
// FILE SINK
//==============================================

FileSink::FileSink(const std::filesystem::path& path)
  : path_(path)
  , file_(path, std::ios::binary | std::ios::out | std::ios::trunc) {
  if (!file_.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "Sink: Failed to create file: " << path_.string();
    throw IoError("Sink: Failed to create file: " + path_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Sink: Opened file: " << path_.string();
}

std::size_t FileSink::write(const uint8_t* data, std::size_t size) {
  if (!file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Sink: Failed to write " << size << " bytes to " << path_.string();
    throw IoError("Sink: Failed to write to output file");
  }
  position_ += size;
  return size;
}

void FileSink::seek(uint64_t position) {
  if (!file_.seekp(static_cast<std::streamoff>(position), std::ios::beg)) {
    BOOST_LOG_TRIVIAL(error) << "Sink: Failed to seek to " << position << " in " << path_.string();
    throw IoError("Sink: Failed to seek output file");
  }
  position_ = position;
}

void FileSink::truncate(uint64_t size) {
  // Push buffered bytes out first so they cannot land after the cut
  flush();

  std::error_code ec;
  std::filesystem::resize_file(path_, size, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Sink: Failed to truncate " << path_.string() << ": " << ec.message();
    throw IoError("Sink: Failed to truncate output file: " + ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "Sink: Truncated " << path_.string() << " to " << size << " bytes";
}

void FileSink::flush() {
  if (!file_.flush()) {
    BOOST_LOG_TRIVIAL(error) << "Sink: Failed to flush " << path_.string();
    throw IoError("Sink: Failed to flush output file");
  }
}

} // namespace io
} // namespace encstream
