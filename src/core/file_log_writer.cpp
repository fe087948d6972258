#include "core/file_log_writer.h"
#include <filesystem>
#include <stdexcept>
#include <system_error>

FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles) {
  if (fileName_.empty()) {
    throw std::invalid_argument("Log file name cannot be empty");
  }
  if (maxBackupFiles_ < 1) {
    throw std::invalid_argument("maxBackupFiles must be at least 1");
  }
  file_.open(fileName_, std::ios::app);
}

bool FileLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!file_.is_open())
    return false;

  checkAndRotate();
  if (!file_.is_open())
    return false;

  file_ << formattedMessage << '\n';
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

// Rotation is size based: once the active file reaches maxFileSize_ it is
// renamed to <name>.1, older backups shift up by one and the oldest is
// removed. Filesystem errors leave the current file in place rather than
// dropping log output.
void FileLogWriter::checkAndRotate() {
  file_.flush();

  std::error_code ec;
  auto fileSize = std::filesystem::file_size(fileName_, ec);
  if (!ec && fileSize >= maxFileSize_) {
    rotate();
  }
}

void FileLogWriter::rotate() {
  file_.close();

  std::error_code ec;
  std::string oldest = fileName_ + "." + std::to_string(maxBackupFiles_);
  std::filesystem::remove(oldest, ec);

  for (int i = maxBackupFiles_ - 1; i > 0; --i) {
    std::string from = fileName_ + "." + std::to_string(i);
    std::string to = fileName_ + "." + std::to_string(i + 1);
    if (std::filesystem::exists(from, ec)) {
      std::filesystem::rename(from, to, ec);
    }
  }

  std::filesystem::rename(fileName_, fileName_ + ".1", ec);
  file_.open(fileName_, std::ios::app);
}
