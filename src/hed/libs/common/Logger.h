// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_LOGGER__
#define __AEAT_LOGGER__

#include <string>
#include <list>
#include <iostream>
#include <fstream>

#include <glibmm/thread.h>

#include <aeat/IString.h>

namespace Aeat {

  /** \addtogroup common
   *  @{ */
  /// Logging levels for tagging and filtering log messages.
  enum LogLevel {
    DEBUG = 1,   ///< Fine-grained events useful only while debugging.
    VERBOSE = 2, ///< Additional information about the progress of a send.
    INFO = 4,    ///< Coarse-grained progress of the application.
    WARNING = 8, ///< Potentially harmful situations.
    ERROR = 16,  ///< Errors which end the current operation.
    FATAL = 32   ///< Errors after which the application can not continue.
  };

  /// Output formats. Defines prefix for each message.
  enum LogFormat {
    LongFormat,  ///< [time] [domain] [level] [pid] message
    ShortFormat, ///< level: message
    EmptyFormat  ///< message only
  };

  /// Name of level as used in log output, empty for unknown value.
  std::string level_to_string(LogLevel level);

  /// A class for log messages.
  /** It contains the time the message was created, its level, from which
     domain it was sent, an identifier and the message text itself.
     \headerfile Logger.h aeat/Logger.h
   */
  class LogMessage {
  public:
    /// Creates a LogMessage with the specified level and message text.
    /** The time is set automatically, the domain is set by the Logger
       to which the LogMessage is sent and the identifier is the
       process ID.
     */
    LogMessage(LogLevel level, const IString& message);

    /// Returns the level of the LogMessage.
    LogLevel getLevel() const;

    /// Returns the formatted message text without any prefix.
    std::string getMessage() const;

  private:
    std::string time;
    LogLevel level;
    std::string domain;
    std::string identifier;
    IString message;

    friend class Logger;
    friend class LogDestination;
  };

  /// A base class for log destinations.
  /** LogDestination objects contain synchronization mechanisms and
     should therefore never be copied.
     \headerfile Logger.h aeat/Logger.h
   */
  class LogDestination {
  public:
    /// Logs a LogMessage to this LogDestination.
    virtual void log(const LogMessage& message) = 0;

    virtual ~LogDestination() {}

    /// Set format for this log destination.
    void setFormat(const LogFormat& newformat);

    /// Returns currently assigned format
    LogFormat getFormat() const;

    /// Set minimal level of messages accepted by this destination.
    /** Messages below this level are silently dropped. Default accepts all. */
    void setThreshold(LogLevel newthreshold);

    /// Returns minimal level of messages accepted by this destination.
    LogLevel getThreshold() const;

  protected:
    LogDestination();

    /// Writes prefix and text of message according to format.
    void format_message(std::ostream& os, const LogMessage& message) const;

    LogFormat format;
    LogLevel threshold;

  private:
    LogDestination(const LogDestination& unique);
    void operator=(const LogDestination& unique);
  };

  /// A class for logging to ostreams.
  /** It provides synchronization in order to prevent different
     LogMessages to appear mixed with each other in the stream. It is
     important to keep a LogStream object as long as the Logger to which
     it has been registered.
     \headerfile Logger.h aeat/Logger.h
   */
  class LogStream
    : public LogDestination {
  public:
    /// Creates a LogStream connected to an ostream.
    LogStream(std::ostream& destination);

    /// Writes a LogMessage to the stream.
    virtual void log(const LogMessage& message);

  private:
    LogStream(const LogStream& unique);
    void operator=(const LogStream& unique);

    std::ostream& destination;
    Glib::Mutex mutex;
  };

  /// A class for logging to files.
  /** It is possible to limit size of created file. Whenever
     specified size is exceeded file is moved to backup and new one is
     created. Backups have names same as initial file with
     additional number suffix - similar to those found in /var/log
     of many Unix-like systems.
     \headerfile Logger.h aeat/Logger.h
   */
  class LogFile
    : public LogDestination {
  public:
    /// Creates a LogFile connected to a file.
    /** If file does not exist it will be created.
       @param path The path to file to which to write LogMessages.
     */
    LogFile(const std::string& path);

    ~LogFile();

    /// Set maximal allowed size of file.
    /** Specified size may be exceeded by amount of one LogMessage.
       To disable limit specify -1.
     */
    void setMaxSize(int newsize);

    /// Set number of backups to store.
    /** When file size exceeds one specified with setMaxSize() file is
       renamed to path.1, former path.1 to path.2 and so on. The oldest
       one above newbackup is lost. With no backups file is just
       truncated.
     */
    void setBackups(int newbackup);

    /// Returns true if this instance is valid.
    operator bool(void);

    /// Returns true if this instance is invalid.
    bool operator!(void);

    /// Writes a LogMessage to the file.
    virtual void log(const LogMessage& message);

  private:
    LogFile(void);
    LogFile(const LogFile& unique);
    void operator=(const LogFile& unique);
    void rotate(void);
    std::string path;
    std::ofstream destination;
    int maxsize;
    int backups;
    Glib::Mutex mutex;
  };

  /// A logger class.
  /** Every Logger (except for the root logger) has a parent Logger. The
     domain of a Logger is composed by adding a subdomain to the domain
     of its parent Logger.

     Every LogMessage that has a level greater than or equal to the
     threshold is forwarded to any LogDestination connected to this
     Logger as well as to the parent Logger.

     Typical usage is to declare a global Logger object for each
     library or component:
     @code
  Aeat::LogStream logcerr(std::cerr);
  logcerr.setFormat(Aeat::ShortFormat);
  Aeat::Logger::getRootLogger().addDestination(logcerr);
  Aeat::Logger::getRootLogger().setThreshold(Aeat::WARNING);

  Aeat::Logger logger(Aeat::Logger::getRootLogger(), "main");
  logger.msg(Aeat::ERROR, "Oops, an error occurred when i was %i", i);
     @endcode
   */
  class Logger {
  public:
    /// The root Logger. It is an ancestor of any other Logger.
    static Logger& getRootLogger();

    /// Creates a logger. The threshold is inherited from its parent Logger.
    Logger(Logger& parent,
           const std::string& subdomain);

    /// Creates a logger with own threshold.
    Logger(Logger& parent,
           const std::string& subdomain,
           LogLevel threshold);

    ~Logger();

    /// Adds a LogDestination.
    /** A pointer to destination is kept, hence the LogDestination must
       exist at least as long as the Logger itself.
     */
    void addDestination(LogDestination& destination);

    /// Removes all LogDestinations.
    void removeDestinations(void);

    /// Sets the logging threshold.
    void setThreshold(LogLevel threshold);

    /// Returns the threshold of this logger.
    LogLevel getThreshold() const;

    /// Returns the domain.
    const std::string& getDomain() const;

    /// Sends a LogMessage.
    void msg(LogMessage message);

    /// Logs a message text.
    /** It is possible to use msg() with multiple arguments and
       printf-style string formatting, for example
       @code
       logger.msg(INFO, "Attempt %i failed: %s", number, reason);
       @endcode
     */
    void msg(LogLevel level, const std::string& str) {
      msg(LogMessage(level, IString(str)));
    }

    template<class T0>
    void msg(LogLevel level, const std::string& str,
             const T0& t0) {
      msg(LogMessage(level, IString(str, t0)));
    }

    template<class T0, class T1>
    void msg(LogLevel level, const std::string& str,
             const T0& t0, const T1& t1) {
      msg(LogMessage(level, IString(str, t0, t1)));
    }

    template<class T0, class T1, class T2>
    void msg(LogLevel level, const std::string& str,
             const T0& t0, const T1& t1, const T2& t2) {
      msg(LogMessage(level, IString(str, t0, t1, t2)));
    }

    template<class T0, class T1, class T2, class T3>
    void msg(LogLevel level, const std::string& str,
             const T0& t0, const T1& t1, const T2& t2, const T3& t3) {
      msg(LogMessage(level, IString(str, t0, t1, t2, t3)));
    }

    template<class T0, class T1, class T2, class T3, class T4>
    void msg(LogLevel level, const std::string& str,
             const T0& t0, const T1& t1, const T2& t2, const T3& t3,
             const T4& t4) {
      msg(LogMessage(level, IString(str, t0, t1, t2, t3, t4)));
    }

  private:
    Logger();
    Logger(const Logger& unique);
    void operator=(const Logger& unique);

    void log(const LogMessage& message);

    Logger *parent;
    std::string domain;
    std::list<LogDestination*> destinations;
    LogLevel threshold;
    mutable Glib::Mutex mutex;

    static Logger *rootLogger;
  };

  /** @} */

} // namespace Aeat

#endif // __AEAT_LOGGER__
