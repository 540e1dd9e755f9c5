#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cerrno>
#include <clocale>
#include <iostream>
#include <list>
#include <string>

#include <glibmm/fileutils.h>
#include <glibmm/miscutils.h>

#include <aeat/FileUtils.h>
#include <aeat/IString.h>
#include <aeat/Logger.h>
#include <aeat/OptionParser.h>
#include <aeat/SenderError.h>
#include <aeat/UserConfig.h>
#include <aeat/Utils.h>
#include <aeat/client/Dispatcher.h>
#include <aeat/credential/CredentialBridge.h>

// Exit codes
#define EXIT_ARGUMENT_ERROR 1
#define EXIT_CONFIG_ERROR 2
#define EXIT_FILE_ERROR 3
#define EXIT_COMMUNICATION_ERROR 4
#define EXIT_AEAT_ERROR 5

#define LOG_DIR "logs"
#define LOG_FILE "aeat_sender.log"
#define LOG_MAX_SIZE (10*1024*1024)
#define LOG_BACKUPS 5

static Aeat::Logger logger(Aeat::Logger::getRootLogger(), "aeatsend");

static int exit_code(const Aeat::OperationResult& result) {
  switch(result.getCause()) {
    case Aeat::NoError: return EXIT_SUCCESS;
    case Aeat::ConfigurationError: return EXIT_CONFIG_ERROR;
    case Aeat::PayloadFormatError: return EXIT_FILE_ERROR;
    case Aeat::FunctionalError: return EXIT_AEAT_ERROR;
    case Aeat::CertificateFormatError:
    case Aeat::CommunicationError:
    case Aeat::EnvelopeParseError:
      break;
  }
  return EXIT_COMMUNICATION_ERROR;
}

static std::string default_config(const char* argv0) {
  std::string conffile = Glib::build_filename(Glib::path_get_dirname(argv0), "config.json");
  if(Glib::file_test(conffile, Glib::FILE_TEST_IS_REGULAR)) return conffile;
  return "config.json";
}

static bool write_response(const std::string& path, const std::string& content) {
  std::string dir = Glib::path_get_dirname(path);
  if(!Aeat::DirCreate(dir, S_IRWXU|S_IRGRP|S_IXGRP|S_IROTH|S_IXOTH, true)) {
    logger.msg(Aeat::ERROR, "Failed to create directory %s: %s", dir, Aeat::StrError(errno));
    return false;
  }
  if(!Aeat::FileCreate(path, content)) {
    logger.msg(Aeat::ERROR, "Failed to write file %s: %s", path, Aeat::StrError(errno));
    return false;
  }
  return true;
}

int main(int argc, char** argv) {

  setlocale(LC_ALL, "");

  Aeat::LogStream logcerr(std::cerr);
  logcerr.setFormat(Aeat::ShortFormat);
  Aeat::Logger::getRootLogger().addDestination(logcerr);
  Aeat::Logger::getRootLogger().setThreshold(Aeat::INFO);

  Aeat::OptionParser options("",
                             istring("The aeatsend command sends an XML document to "
                                     "the SOAP web services of AEAT (SII or VeriFactu)."),
                             istring("Exit codes:\n"
                                     "  0 - response received and stored\n"
                                     "  1 - wrong arguments\n"
                                     "  2 - configuration error\n"
                                     "  3 - input or output file error\n"
                                     "  4 - certificate or communication error\n"
                                     "  5 - request rejected by AEAT (SOAP Fault)"));

  std::string system;
  options.AddOption('s', "sistema", istring("system to use: SII or VERIFACTU"),
                    istring("system"), system);

  std::string environment;
  options.AddOption('e', "entorno", istring("environment to use: pruebas or produccion"),
                    istring("environment"), environment);

  std::string input;
  options.AddOption('i', "input", istring("XML file to send"),
                    istring("filename"), input);

  std::string output;
  options.AddOption('o', "output", istring("file to store response in"),
                    istring("filename"), output);

  std::string conffile;
  options.AddOption('c', "config",
                    istring("configuration file (default config.json next to executable)"),
                    istring("filename"), conffile);

  bool debug = false;
  options.AddOption('d', "debug", istring("enable DEBUG logging"), debug);

  bool version = false;
  options.AddOption('v', "version", istring("print version information"), version);

  std::list<std::string> args;
  if (!options.Parse(argc, argv, args)) return EXIT_ARGUMENT_ERROR;
  if (options.HelpRequested()) return EXIT_SUCCESS;

  if (version) {
    std::cout << Aeat::IString("%s version %s", "aeatsend", VERSION) << std::endl;
    return EXIT_SUCCESS;
  }

  if (!args.empty()) {
    logger.msg(Aeat::ERROR, "Unexpected arguments");
    return EXIT_ARGUMENT_ERROR;
  }
  if (system.empty() || environment.empty() || input.empty() || output.empty()) {
    logger.msg(Aeat::ERROR, "Options --sistema, --entorno, --input and --output are required");
    return EXIT_ARGUMENT_ERROR;
  }
  if (Aeat::UserConfig::CanonicalSystem(system).empty()) {
    logger.msg(Aeat::ERROR, "Unknown system %s, expected SII or VERIFACTU", system);
    return EXIT_ARGUMENT_ERROR;
  }
  if ((environment != "pruebas") && (environment != "produccion")) {
    logger.msg(Aeat::ERROR, "Unknown environment %s, expected pruebas or produccion", environment);
    return EXIT_ARGUMENT_ERROR;
  }

  Aeat::LogLevel level = debug ? Aeat::DEBUG : Aeat::INFO;
  Aeat::Logger::getRootLogger().setThreshold(level);

  // Log file failure is not fatal, messages still go to stderr
  Aeat::LogFile* logfile = NULL;
  if (Aeat::DirCreate(LOG_DIR, S_IRWXU|S_IRGRP|S_IXGRP|S_IROTH|S_IXOTH, true)) {
    logfile = new Aeat::LogFile(Glib::build_filename(LOG_DIR, LOG_FILE));
    if (*logfile) {
      logfile->setMaxSize(LOG_MAX_SIZE);
      logfile->setBackups(LOG_BACKUPS);
      Aeat::Logger::getRootLogger().addDestination(*logfile);
    } else {
      logger.msg(Aeat::WARNING, "Can not open log file %s", Glib::build_filename(LOG_DIR, LOG_FILE));
    }
  } else {
    logger.msg(Aeat::WARNING, "Can not create log directory %s: %s", LOG_DIR, Aeat::StrError(errno));
  }
  Aeat::AutoPointer<Aeat::LogFile> logfile_holder(logfile);

  // Interrupted run must not leave unencrypted key behind
  if (!Aeat::CredentialBridge::RemoveOnSignals()) {
    logger.msg(Aeat::WARNING, "Temporary key files may be left behind if interrupted");
  }

  int ret = EXIT_SUCCESS;
  for (;;) {
    logger.msg(Aeat::INFO, "Starting aeatsend %s", VERSION);
    logger.msg(Aeat::INFO, "System: %s", Aeat::UserConfig::CanonicalSystem(system));
    logger.msg(Aeat::INFO, "Environment: %s", environment);
    logger.msg(Aeat::INFO, "Input: %s", input);
    logger.msg(Aeat::INFO, "Output: %s", output);

    if (conffile.empty()) conffile = default_config(argv[0]);
    Aeat::UserConfig usercfg;
    try {
      usercfg.LoadConfigurationFile(conffile);
    } catch (Aeat::ConfigError& e) {
      logger.msg(Aeat::ERROR, "Failed to load configuration: %s", e.what());
      ret = EXIT_CONFIG_ERROR;
      break;
    }
    logger.msg(Aeat::INFO, "Configuration loaded from %s", conffile);

    std::string payload;
    if (!Aeat::FileRead(input, payload)) {
      logger.msg(Aeat::ERROR, "Failed to read input file %s: %s", input, Aeat::StrError(errno));
      ret = EXIT_FILE_ERROR;
      break;
    }
    logger.msg(Aeat::INFO, "Input XML read (%d bytes)", (int)payload.length());

    Aeat::Dispatcher dispatcher(usercfg);
    Aeat::OperationResult result = dispatcher.DispatchOnce(system, environment, payload);
    if (!result) {
      if (result.getKind() == Aeat::RESULT_FUNCTIONAL_FAILURE) {
        logger.msg(Aeat::ERROR, "Request rejected by AEAT: %s", result.getExplanation());
      } else {
        logger.msg(Aeat::ERROR, "%s: %s", Aeat::ErrorKindString(result.getCause()),
                   result.getExplanation());
      }
      ret = exit_code(result);
      break;
    }
    logger.msg(Aeat::INFO, "Response received (%d bytes)", (int)result.getResponse().length());

    if (!write_response(output, result.getResponse())) {
      ret = EXIT_FILE_ERROR;
      break;
    }
    logger.msg(Aeat::INFO, "Response stored in %s", output);
    logger.msg(Aeat::INFO, "Completed successfully");
    break;
  }

  Aeat::Logger::getRootLogger().removeDestinations();
  return ret;
}
