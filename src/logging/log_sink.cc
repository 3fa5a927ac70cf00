#include "duplex/logging/log_sink.h"

#include <filesystem>

#include <fmt/format.h>

namespace duplex {
namespace logging {

void StdioSink::log(const LogMessage& msg) {
  std::string line = formatter_->format(msg);
  std::lock_guard<std::mutex> lock(mutex_);
  fmt::print(stream(), "{}\n", line);
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::fflush(stream());
}

namespace {

std::string backupName(const std::string& base, size_t index) {
  return fmt::format("{}.{}", base, index);
}

}  // namespace

RotatingFileSink::RotatingFileSink(const Config& config) : config_(config) {
  openFile();
}

RotatingFileSink::~RotatingFileSink() { closeFile(); }

void RotatingFileSink::log(const LogMessage& msg) {
  std::string line = formatter_->format(msg);
  line += '\n';

  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    // The directory may have appeared since the last attempt
    openFile();
  }
  if (!file_.is_open()) {
    return;
  }
  if (config_.max_file_size != 0 &&
      current_size_ + line.size() > config_.max_file_size) {
    rotate();
    if (!file_.is_open()) {
      return;
    }
  }

  file_.write(line.data(), static_cast<std::streamsize>(line.size()));
  current_size_ += line.size();
  if (config_.auto_flush) {
    file_.flush();
  }
}

void RotatingFileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  }
}

void RotatingFileSink::openFile() {
  file_.open(config_.base_filename, std::ios::out | std::ios::app);
  current_size_ = 0;
  std::error_code ec;
  auto existing = std::filesystem::file_size(config_.base_filename, ec);
  if (!ec) {
    current_size_ = static_cast<size_t>(existing);
  }
}

void RotatingFileSink::closeFile() {
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

// duplex.log -> duplex.log.1 -> ... -> duplex.log.<max_files>, oldest dropped
void RotatingFileSink::rotate() {
  closeFile();

  const std::string& base = config_.base_filename;
  std::error_code ec;
  if (config_.max_files == 0) {
    std::filesystem::remove(base, ec);
  } else {
    std::filesystem::remove(backupName(base, config_.max_files), ec);
    for (size_t index = config_.max_files; index > 1; --index) {
      std::filesystem::rename(backupName(base, index - 1),
                              backupName(base, index), ec);
    }
    std::filesystem::rename(base, backupName(base, 1), ec);
  }

  openFile();
}

std::unique_ptr<LogSink> SinkFactory::createFileSink(
    const std::string& filename) {
  RotatingFileSink::Config config;
  config.base_filename = filename;
  return std::make_unique<RotatingFileSink>(config);
}

std::unique_ptr<LogSink> SinkFactory::createStdioSink(bool use_stderr) {
  return std::make_unique<StdioSink>(use_stderr ? StdioSink::Stderr
                                                : StdioSink::Stdout);
}

std::unique_ptr<LogSink> SinkFactory::createNullSink() {
  return std::make_unique<NullSink>();
}

std::unique_ptr<LogSink> SinkFactory::createExternalSink(
    ExternalSink::LogCallback callback) {
  return std::make_unique<ExternalSink>(std::move(callback));
}

}  // namespace logging
}  // namespace duplex
