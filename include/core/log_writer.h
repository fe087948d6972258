#ifndef LOG_WRITER_H
#define LOG_WRITER_H

#include <string>

// Sink for formatted log lines. Logger serializes calls, so a writer only
// has to guard state it shares with other threads itself. write() returns
// false when the line was not stored; Logger then echoes warnings and
// errors to stderr.
class ILogWriter {
public:
  virtual ~ILogWriter() = default;

  virtual bool write(const std::string &line) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

#endif
