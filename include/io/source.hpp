#ifndef ENCSTREAM_IO_SOURCE_HPP
#define ENCSTREAM_IO_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <stdexcept>
#include <string>

namespace encstream {
namespace io {

class IoError : public std::runtime_error {
public:
  explicit IoError(const std::string& message) : std::runtime_error(message) {}
};

// Seek origin, as in POSIX lseek
enum class Whence {
  Set,
  Current,
  End
};

// Seekable, fixed-length byte source
class Source {
public:
  virtual ~Source() = default;

  // Moves the read cursor and returns the new absolute position
  virtual uint64_t seek(int64_t offset, Whence whence = Whence::Set) = 0;
  virtual uint64_t tell() const = 0;
  // Reads up to size bytes, fewer only at the end of the source
  virtual std::size_t read(uint8_t* buffer, std::size_t size) = 0;
};

// Source over an owned std::istream (file, string stream, ...)
class StreamSource : public Source {
public:
  // ---- CONSTRUCTOR ----
  explicit StreamSource(std::unique_ptr<std::istream> stream);


  // ---- SOURCE OPERATIONS ----
  uint64_t seek(int64_t offset, Whence whence = Whence::Set) override;
  uint64_t tell() const override;
  std::size_t read(uint8_t* buffer, std::size_t size) override;

private:
  // ---- PARAMETERS ----
  std::unique_ptr<std::istream> stream_;
  // Tracked here since tellg() is not const and fails once eof is set
  uint64_t position_{0};
};

// Opens a file for binary reading, throws IoError if it cannot be opened
std::unique_ptr<Source> open_file_source(const std::filesystem::path& path);

// Source over an in-memory copy of data
std::unique_ptr<Source> make_memory_source(const std::string& data);

} // namespace io
} // namespace encstream

#endif // ENCSTREAM_IO_SOURCE_HPP
