#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/log_writer.h"
#include <fstream>
#include <mutex>
#include <string>

class FileLogWriter : public ILogWriter {
private:
  std::ofstream file_;
  std::string fileName_;
  size_t maxFileSize_;
  int maxBackupFiles_;
  mutable std::mutex mutex_;

public:
  static constexpr size_t DEFAULT_MAX_FILE_SIZE = 10 * 1024 * 1024;
  static constexpr int DEFAULT_MAX_BACKUP_FILES = 5;

  explicit FileLogWriter(const std::string &fileName,
                         size_t maxFileSize = DEFAULT_MAX_FILE_SIZE,
                         int maxBackupFiles = DEFAULT_MAX_BACKUP_FILES);
  ~FileLogWriter() override { close(); }

  FileLogWriter(const FileLogWriter &) = delete;
  FileLogWriter &operator=(const FileLogWriter &) = delete;

  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;
  const std::string &fileName() const { return fileName_; }

private:
  void checkAndRotate();
  void rotate();
};

#endif
