#include "output_file.h"

#include <cerrno>
#include <iostream>
#include <memory>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

namespace io = boost::iostreams;

OutputFile::OutputFile(boost::filesystem::path p)
    : path_(std::move(p))
    , out_(std::make_unique<io::filtering_ostream>())
{
  auto mode = std::ios_base::out | std::ios_base::trunc | std::ios_base::binary;
  if (path_.extension() == ".gz") {
    out_->push(io::gzip_compressor(io::gzip::best_speed));
  }
  errno = 0;
  out_->push(io::file_sink(path_.string(), mode));

  if (!out_->component<io::file_sink>(static_cast<int>(out_->size() - 1))->is_open()) {
    auto error = errno;
    out_.reset();
    throw fmt::system_error(error, "Can't create {}", path_.string());
  }
}

OutputFile::~OutputFile() {
  if (!out_) {
    return;
  }
  try {
    out_->reset();
  } catch (const std::exception& e) {
    // the file is incomplete anyway and will be generated again
    fmt::print(std::cerr, "Error while dropping {}: {}\n", path_.string(), e.what());
  }
}

void OutputFile::Write(const char* data, size_t size) {
  if (!out_) {
    throw std::logic_error(fmt::format("{} is already closed", path_.string()));
  }
  errno = 0;
  out_->write(data, static_cast<std::streamsize>(size));
  if (!*out_) {
    throw fmt::system_error(errno, "Can't write to {}", path_.string());
  }
}

void OutputFile::Close() {
  if (!out_) {
    return;
  }
  errno = 0;
  out_->flush();
  if (!*out_) {
    auto error = errno;
    out_.reset();
    throw fmt::system_error(error, "Can't flush {}", path_.string());
  }

  // the chain is closed by reset, failures there are reported with exceptions
  auto out = std::move(out_);
  out->reset();
}
