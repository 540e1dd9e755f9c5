// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <iostream>

#include <glibmm/optioncontext.h>

#include <aeat/IString.h>

#include "OptionParser.h"

namespace Aeat {

  // Binds entry of option group to variable of caller
  class OptionBase {
  public:
    OptionBase(char short_name, const std::string& long_name,
               const std::string& description, const std::string& arg_description) {
      entry.set_short_name(short_name);
      entry.set_long_name(long_name);
      entry.set_description(description);
      if (!arg_description.empty()) entry.set_arg_description(arg_description);
    }
    virtual ~OptionBase() {}
    virtual void Register(Glib::OptionGroup& group) = 0;
    virtual void Store() {}

  protected:
    Glib::OptionEntry entry;
  };

  class FlagOption
    : public OptionBase {
  public:
    FlagOption(char short_name, const std::string& long_name,
               const std::string& description, bool& flag)
      : OptionBase(short_name, long_name, description, ""),
        flag(flag) {}
    void Register(Glib::OptionGroup& group) {
      group.add_entry(entry, flag);
    }

  private:
    bool& flag;
  };

  class ValueOption
    : public OptionBase {
  public:
    ValueOption(char short_name, const std::string& long_name,
                const std::string& description, const std::string& arg_description,
                std::string& value)
      : OptionBase(short_name, long_name, description, arg_description),
        value(value) {}
    void Register(Glib::OptionGroup& group) {
      group.add_entry(entry, parsed);
    }
    // Value of caller is kept if option was not given
    void Store() {
      if (!parsed.empty()) value = parsed.raw();
    }

  private:
    std::string& value;
    Glib::ustring parsed;
  };

  OptionParser::OptionParser(const std::string& arguments,
                             const std::string& summary,
                             const std::string& description)
    : arguments(arguments),
      summary(summary),
      description(description),
      help(false) {}

  OptionParser::~OptionParser() {
    for (std::list<OptionBase*>::iterator it = options.begin(); it != options.end(); ++it)
      delete *it;
  }

  void OptionParser::AddOption(const char shortOpt, const std::string& longOpt,
                               const std::string& optDesc, bool& val) {
    options.push_back(new FlagOption(shortOpt, longOpt, optDesc, val));
  }

  void OptionParser::AddOption(const char shortOpt, const std::string& longOpt,
                               const std::string& optDesc, const std::string& argDesc,
                               std::string& val) {
    options.push_back(new ValueOption(shortOpt, longOpt, optDesc, argDesc, val));
  }

  bool OptionParser::Parse(int argc, char **argv, std::list<std::string>& params) {
    params.clear();
    help = false;

    Glib::OptionContext ctx(arguments);
    if (!summary.empty()) ctx.set_summary(summary);
    if (!description.empty()) ctx.set_description(description);
    // Built-in help would call exit()
    ctx.set_help_enabled(false);

    FlagOption help_option('h', "help", IString("show help options").str(), help);
    // Context takes ownership of the underlying group
    Glib::OptionGroup *group = new Glib::OptionGroup("main", "Main Group");
    help_option.Register(*group);
    for (std::list<OptionBase*>::iterator it = options.begin(); it != options.end(); ++it)
      (*it)->Register(*group);
    ctx.set_main_group(*group);

    try {
      ctx.parse(argc, argv);
    } catch (const Glib::OptionError& err) {
      std::cerr << err.what() << std::endl;
      std::cerr << IString("Use -h to get usage description") << std::endl;
      return false;
    }
    if (help) {
      std::cout << ctx.get_help(false).raw() << std::endl;
      return true;
    }
    for (std::list<OptionBase*>::iterator it = options.begin(); it != options.end(); ++it)
      (*it)->Store();
    // Parsed options were removed from argv
    for (int n = 1; n < argc; ++n) params.push_back(argv[n]);
    return true;
  }

} // namespace Aeat
