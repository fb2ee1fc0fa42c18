#include "io/source.hpp"
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace encstream {
namespace io {

//==============================================
// CONSTRUCTOR
//==============================================

StreamSource::StreamSource(std::unique_ptr<std::istream> stream)
  : stream_(std::move(stream)) {
  if (!stream_ || !stream_->good()) {
    BOOST_LOG_TRIVIAL(error) << "Source: Invalid input stream state";
    throw IoError("Source: Invalid input stream");
  }
}

//==============================================
// SOURCE OPERATIONS
//==============================================

uint64_t StreamSource::seek(int64_t offset, Whence whence) {
  std::ios_base::seekdir dir = std::ios::beg;
  switch (whence) {
    case Whence::Set:     dir = std::ios::beg; break;
    case Whence::Current: dir = std::ios::cur; break;
    case Whence::End:     dir = std::ios::end; break;
  }

  // Clear eof left behind by a short read at the end
  stream_->clear();
  if (whence == Whence::Current) {
    stream_->seekg(static_cast<std::streamoff>(position_) + offset, std::ios::beg);
  } else {
    stream_->seekg(static_cast<std::streamoff>(offset), dir);
  }

  const std::streampos pos = stream_->tellg();
  if (!stream_->good() || pos < 0) {
    BOOST_LOG_TRIVIAL(error) << "Source: Failed to seek to offset " << offset;
    throw IoError("Source: Failed to seek input stream");
  }

  position_ = static_cast<uint64_t>(pos);
  return position_;
}

uint64_t StreamSource::tell() const {
  return position_;
}

std::size_t StreamSource::read(uint8_t* buffer, std::size_t size) {
  if (size == 0) {
    return 0;
  }

  stream_->read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(size));
  const auto bytes_read = static_cast<std::size_t>(stream_->gcount());

  if (stream_->bad() || (bytes_read < size && !stream_->eof())) {
    BOOST_LOG_TRIVIAL(error) << "Source: Failed to read from input stream";
    throw IoError("Source: Failed to read from input stream");
  }

  position_ += bytes_read;
  return bytes_read;
}

//==============================================
// FACTORIES
//==============================================

std::unique_ptr<Source> open_file_source(const std::filesystem::path& path) {
  auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!file->is_open()) {
    BOOST_LOG_TRIVIAL(error) << "Source: Failed to open file: " << path.string();
    throw IoError("Source: Failed to open file: " + path.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Source: Opened file: " << path.string();
  return std::make_unique<StreamSource>(std::move(file));
}

std::unique_ptr<Source> make_memory_source(const std::string& data) {
  return std::make_unique<StreamSource>(std::make_unique<std::istringstream>(data));
}

} // namespace io
} // namespace encstream
