// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <sstream>

#include <stdio.h>
#include <unistd.h>

#include <glibmm/datetime.h>

#include <aeat/StringConv.h>

#include "Logger.h"

namespace Aeat {

  // Messages of these levels pass root logger unless changed
  static const LogLevel root_threshold = WARNING;

  // Logger which did not set own threshold asks its parent
  static const LogLevel inherit_threshold = (LogLevel)0;

  std::string level_to_string(LogLevel level) {
    static const char *names[] = { "DEBUG", "VERBOSE", "INFO", "WARNING", "ERROR", "FATAL" };
    int n = 0;
    for (int l = DEBUG; l <= FATAL; l <<= 1, ++n) {
      if (l == level) return names[n];
    }
    return "";
  }

  LogMessage::LogMessage(LogLevel level, const IString& message)
    : time(Glib::DateTime::create_now_local().format("%Y-%m-%d %H:%M:%S").raw()),
      level(level),
      domain("---"),
      identifier(tostring(getpid())),
      message(message) {}

  LogLevel LogMessage::getLevel() const {
    return level;
  }

  std::string LogMessage::getMessage() const {
    return message.str();
  }

  LogDestination::LogDestination()
    : format(LongFormat),
      threshold(DEBUG) {}

  void LogDestination::setFormat(const LogFormat& newformat) {
    format = newformat;
  }

  LogFormat LogDestination::getFormat() const {
    return format;
  }

  void LogDestination::setThreshold(LogLevel newthreshold) {
    threshold = newthreshold;
  }

  LogLevel LogDestination::getThreshold() const {
    return threshold;
  }

  void LogDestination::format_message(std::ostream& os, const LogMessage& message) const {
    if (format == LongFormat) {
      os << "[" << message.time << "] [" << message.domain << "] ["
         << level_to_string(message.level) << "] [" << message.identifier << "] ";
    } else if (format == ShortFormat) {
      os << level_to_string(message.level) << ": ";
    }
    os << message.message;
  }

  LogStream::LogStream(std::ostream& destination)
    : destination(destination) {}

  void LogStream::log(const LogMessage& message) {
    if (message.getLevel() < threshold) return;
    Glib::Mutex::Lock lock(mutex);
    format_message(destination, message);
    destination << std::endl;
  }

  LogFile::LogFile(const std::string& path)
    : path(path),
      maxsize(-1),
      backups(-1) {
    if (!path.empty()) destination.open(path.c_str(), std::ios::out | std::ios::app);
  }

  LogFile::~LogFile() {
    Glib::Mutex::Lock lock(mutex);
    destination.close();
  }

  void LogFile::setMaxSize(int newsize) {
    maxsize = newsize;
  }

  void LogFile::setBackups(int newbackups) {
    backups = newbackups;
  }

  LogFile::operator bool(void) {
    Glib::Mutex::Lock lock(mutex);
    return destination.is_open();
  }

  bool LogFile::operator!(void) {
    Glib::Mutex::Lock lock(mutex);
    return !destination.is_open();
  }

  void LogFile::log(const LogMessage& message) {
    if (message.getLevel() < threshold) return;
    std::ostringstream line;
    format_message(line, message);
    line << std::endl;
    Glib::Mutex::Lock lock(mutex);
    // File is reopened after failed write
    if (!destination.is_open() && !path.empty())
      destination.open(path.c_str(), std::ios::out | std::ios::app);
    if (!destination.is_open()) return;
    destination << line.str();
    destination.flush();
    if (!destination) {
      destination.close();
      return;
    }
    rotate();
  }

  void LogFile::rotate(void) {
    if ((maxsize <= 0) || (destination.tellp() < (std::streampos)maxsize)) return;
    destination.close();
    if (backups > 0) {
      // Renaming replaces oldest backup
      for (int n = backups; n > 0; --n) {
        std::string from = (n == 1) ? path : (path + "." + tostring(n - 1));
        std::string to = path + "." + tostring(n);
        ::rename(from.c_str(), to.c_str());
      }
    } else {
      ::unlink(path.c_str());
    }
    destination.open(path.c_str(), std::ios::out | std::ios::app);
  }

  Logger* Logger::rootLogger = NULL;

  Logger& Logger::getRootLogger(void) {
    if (!rootLogger) rootLogger = new Logger();
    return *rootLogger;
  }

  Logger::Logger()
    : parent(NULL),
      domain("Aeat"),
      threshold(root_threshold) {}

  Logger::Logger(Logger& parent, const std::string& subdomain)
    : parent(&parent),
      domain(parent.getDomain() + "." + subdomain),
      threshold(inherit_threshold) {}

  Logger::Logger(Logger& parent, const std::string& subdomain, LogLevel threshold)
    : parent(&parent),
      domain(parent.getDomain() + "." + subdomain),
      threshold(threshold) {}

  Logger::~Logger() {}

  void Logger::addDestination(LogDestination& destination) {
    Glib::Mutex::Lock lock(mutex);
    destinations.push_back(&destination);
  }

  void Logger::removeDestinations(void) {
    Glib::Mutex::Lock lock(mutex);
    destinations.clear();
  }

  void Logger::setThreshold(LogLevel threshold) {
    Glib::Mutex::Lock lock(mutex);
    this->threshold = threshold;
  }

  LogLevel Logger::getThreshold() const {
    LogLevel own;
    {
      Glib::Mutex::Lock lock(mutex);
      own = threshold;
    }
    if ((own == inherit_threshold) && parent) return parent->getThreshold();
    return own;
  }

  const std::string& Logger::getDomain() const {
    return domain;
  }

  void Logger::msg(LogMessage message) {
    if (message.getLevel() < getThreshold()) return;
    message.domain = domain;
    log(message);
  }

  void Logger::log(const LogMessage& message) {
    {
      Glib::Mutex::Lock lock(mutex);
      for (std::list<LogDestination*>::iterator dest = destinations.begin();
           dest != destinations.end(); ++dest)
        (*dest)->log(message);
    }
    if (parent) parent->log(message);
  }

} // namespace Aeat
