// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_OPTIONPARSER_H__
#define __AEAT_OPTIONPARSER_H__

#include <list>
#include <string>

namespace Aeat {

  class OptionBase;

  /// Command line option parser used by command line tools.
  /**
   * Each option is bound with AddOption() to a variable of caller which
   * receives its value when Parse() is called with arguments of main().
   * Option -h/--help is always present and makes Parse() print generated
   * help text instead of storing values. Parser never terminates process,
   * so caller decides about exit code.
   * \ingroup common
   * \headerfile OptionParser.h aeat/OptionParser.h
   */
  class OptionParser {

  public:
    /**
     * @param arguments Description of positional arguments
     * @param summary Text shown above options in help
     * @param description Text shown below options in help
     */
    OptionParser(const std::string& arguments = "",
                 const std::string& summary = "",
                 const std::string& description = "");

    ~OptionParser();

    /// Add option without value
    void AddOption(const char shortOpt,
                   const std::string& longOpt,
                   const std::string& optDesc,
                   bool& val);

    /// Add option taking string value
    /** If option is repeated last value is stored. */
    void AddOption(const char shortOpt,
                   const std::string& longOpt,
                   const std::string& optDesc,
                   const std::string& argDesc,
                   std::string& val);

    /// Parse command line.
    /** Arguments which are not options are returned in params. Returns
       false and prints reason to stderr if command line is not valid. */
    bool Parse(int argc, char **argv, std::list<std::string>& params);

    /// True if last Parse() printed help.
    bool HelpRequested() const { return help; }

  private:
    OptionParser(const OptionParser&);
    OptionParser& operator=(const OptionParser&);
    std::string arguments;
    std::string summary;
    std::string description;
    std::list<OptionBase*> options;
    bool help;
  };

} // namespace Aeat

#endif // __AEAT_OPTIONPARSER_H__
