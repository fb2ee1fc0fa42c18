#ifndef ENCSTREAM_IO_SINK_HPP
#define ENCSTREAM_IO_SINK_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "io/source.hpp"

namespace encstream {
namespace io {

// Append-style byte sink that can be rewound and truncated
class Sink {
public:
  virtual ~Sink() = default;

  // Writes all size bytes at the cursor and returns size
  virtual std::size_t write(const uint8_t* data, std::size_t size) = 0;
  virtual uint64_t tell() const = 0;
  virtual void seek(uint64_t position) = 0;
  // Cuts the sink to size bytes, the cursor is left where it was
  virtual void truncate(uint64_t size) = 0;
  virtual void flush() = 0;
};

class MemorySink : public Sink {
public:
  // ---- SINK OPERATIONS ----
  std::size_t write(const uint8_t* data, std::size_t size) override;
  uint64_t tell() const override { return position_; }
  void seek(uint64_t position) override;
  void truncate(uint64_t size) override;
  void flush() override {}


  // ---- GETTERS ----
  const std::vector<uint8_t>& data() const { return data_; }
  std::string str() const { return std::string(data_.begin(), data_.end()); }

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> data_;
  uint64_t position_{0};
};

class FileSink : public Sink {
public:
  // ---- CONSTRUCTOR ----
  // Creates or truncates the file at path
  explicit FileSink(const std::filesystem::path& path);


  // ---- SINK OPERATIONS ----
  std::size_t write(const uint8_t* data, std::size_t size) override;
  uint64_t tell() const override { return position_; }
  void seek(uint64_t position) override;
  void truncate(uint64_t size) override;
  void flush() override;


  // ---- GETTERS ----
  const std::filesystem::path& path() const { return path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  std::ofstream file_;
  uint64_t position_{0};
};

} // namespace io
} // namespace encstream

#endif // ENCSTREAM_IO_SINK_HPP
