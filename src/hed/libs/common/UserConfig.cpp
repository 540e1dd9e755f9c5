// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <errno.h>

#include <aeat/FileUtils.h>
#include <aeat/JSON.h>
#include <aeat/Logger.h>
#include <aeat/SenderError.h>
#include <aeat/StringConv.h>
#include <aeat/Utils.h>
#include <aeat/XMLNode.h>

#include "UserConfig.h"

namespace Aeat {

  static Logger logger(Logger::getRootLogger(), "UserConfig");

  static const char* SII_OPERATION = "SuministroLRFacturasEmitidas";
  static const char* SII_NAMESPACE =
    "https://www2.agenciatributaria.gob.es/static_files/common/internet/dep/aplicaciones/es/aeat/ssii/fact/ws/SuministroLR.xsd";
  static const char* VERIFACTU_OPERATION = "RegFactuSistemaFacturacion";
  static const char* VERIFACTU_NAMESPACE =
    "https://www2.agenciatributaria.gob.es/static_files/common/internet/dep/aplicaciones/es/aeat/tike/cont/ws/SuministroLR.xsd";

  UserConfig::UserConfig()
    : connect_timeout(DefaultConnectTimeout),
      read_timeout(DefaultReadTimeout),
      retry_attempts(DefaultRetryAttempts),
      retry_backoff(DefaultRetryBackoff) {}

  std::string UserConfig::CanonicalSystem(const std::string& system) {
    std::string s = upper(trim(system));
    if ((s == "SII") || (s == "VERIFACTU")) return s;
    return "";
  }

  std::string UserConfig::CanonicalEnvironment(const std::string& environment) {
    std::string e = lower(trim(environment));
    if ((e == "pruebas") || (e == "test")) return "pruebas";
    if ((e == "produccion") || (e == "production")) return "produccion";
    return "";
  }

  void UserConfig::LoadConfigurationFile(const std::string& conffile) {
    std::string content;
    if (!FileRead(conffile, content)) {
      throw ConfigError(IString("Configuration file %s can not be read: %s",
                                conffile, StrError(errno)).str());
    }
    LoadConfiguration(content, conffile);
    logger.msg(VERBOSE, "Configuration loaded from %s", conffile);
  }

  void UserConfig::ParseInt(XMLNode node, const std::string& name, int& value,
                            int minimum, const std::string& source) {
    if (!node) return;
    std::string str = trim((std::string)node);
    int v = 0;
    if (!stringto(str, v) || (v < minimum)) {
      throw ConfigError(IString("Invalid value '%s' of %s in %s",
                                str, name, source).str());
    }
    value = v;
  }

  void UserConfig::ParseSystem(XMLNode node, const std::string& name,
                               const std::string& source) {
    if (!node) {
      throw ConfigError(IString("Configuration of system '%s' is missing in 'entornos' of %s",
                                name, source).str());
    }
    if ((!node["pruebas"]) || (!node["produccion"])) {
      throw ConfigError(IString("Configuration of '%s' must include 'pruebas' and 'produccion' in %s",
                                name, source).str());
    }
    SystemConfig sys;
    sys.test_url = trim((std::string)node["pruebas"]);
    sys.production_url = trim((std::string)node["produccion"]);
    if (name == "SII") {
      sys.operation = SII_OPERATION;
      sys.op_namespace = SII_NAMESPACE;
    } else {
      sys.operation = VERIFACTU_OPERATION;
      sys.op_namespace = VERIFACTU_NAMESPACE;
    }
    // Empty operation means payload is placed directly into Body
    if (node["operation"]) sys.operation = trim((std::string)node["operation"]);
    if (node["namespace"]) sys.op_namespace = trim((std::string)node["namespace"]);
    if (node["soap_action"]) sys.soap_action = (std::string)node["soap_action"];
    systems[name] = sys;
  }

  void UserConfig::LoadConfiguration(const std::string& content, const std::string& source_) {
    std::string source = source_.empty() ? std::string("configuration") : source_;
    XMLNode cfg(NS(), "config");
    if (!JSON::Parse(cfg, content.c_str())) {
      throw ConfigError(IString("Failed to parse JSON in %s", source).str());
    }
    const char* required[] = { "cert_path", "cert_password", "entornos", NULL };
    for (int n = 0; required[n]; ++n) {
      if (!cfg[required[n]]) {
        throw ConfigError(IString("Mandatory field %s is missing in %s",
                                  required[n], source).str());
      }
    }
    XMLNode entornos = cfg["entornos"];
    if (entornos.Size() == 0) {
      throw ConfigError(IString("Field 'entornos' of %s must be a JSON object", source).str());
    }

    std::map<std::string, SystemConfig> old_systems;
    old_systems.swap(systems);
    try {
      ParseSystem(entornos["SII"], "SII", source);
      ParseSystem(entornos["VERIFACTU"], "VERIFACTU", source);

      int ct = DefaultConnectTimeout;
      int rt = DefaultReadTimeout;
      ParseInt(cfg["timeouts"]["connect"], "timeouts.connect", ct, 1, source);
      ParseInt(cfg["timeouts"]["read"], "timeouts.read", rt, 1, source);
      int ra = DefaultRetryAttempts;
      int rb = DefaultRetryBackoff;
      ParseInt(cfg["retry"]["attempts"], "retry.attempts", ra, 1, source);
      ParseInt(cfg["retry"]["backoff"], "retry.backoff", rb, 0, source);
      connect_timeout = ct;
      read_timeout = rt;
      retry_attempts = ra;
      retry_backoff = rb;
    } catch (const ConfigError&) {
      systems.swap(old_systems);
      throw;
    }

    cert_path = (std::string)cfg["cert_path"];
    cert_password = (std::string)cfg["cert_password"];
    struct stat st;
    if (!FileStat(cert_path, &st, true)) {
      // Reported again when certificate is actually needed
      logger.msg(WARNING, "Certificate file %s does not exist", cert_path);
    }
    logger.msg(DEBUG, "Timeouts: connect %d s, read %d s", connect_timeout, read_timeout);
  }

  const SystemConfig& UserConfig::System(const std::string& system) const {
    std::map<std::string, SystemConfig>::const_iterator s = systems.find(CanonicalSystem(system));
    if (s == systems.end()) {
      throw ConfigError(IString("System is not configured: %s", system).str());
    }
    return s->second;
  }

  TargetEndpoint UserConfig::Resolve(const std::string& system,
                                     const std::string& environment) const {
    const SystemConfig& sys = System(system);
    TargetEndpoint endpoint;
    endpoint.system = CanonicalSystem(system);
    endpoint.environment = CanonicalEnvironment(environment);
    std::string url;
    if (endpoint.environment == "pruebas") {
      url = sys.test_url;
    } else if (endpoint.environment == "produccion") {
      url = sys.production_url;
    } else {
      throw ConfigError(IString("Invalid environment: %s", environment).str());
    }
    endpoint.url = URL(url);
    if (!endpoint.url || (endpoint.url.Protocol() != "https")) {
      throw ConfigError(IString("Endpoint of %s %s is not a valid https URL: %s",
                                endpoint.system, endpoint.environment, url).str());
    }
    endpoint.connect_timeout = connect_timeout;
    endpoint.read_timeout = read_timeout;
    endpoint.retry_attempts = retry_attempts;
    endpoint.retry_backoff = retry_backoff;
    endpoint.operation = sys.operation;
    endpoint.op_namespace = sys.op_namespace;
    endpoint.soap_action = sys.soap_action;
    logger.msg(VERBOSE, "Endpoint for %s %s: %s", endpoint.system, endpoint.environment, endpoint.url.str());
    return endpoint;
  }

} // namespace Aeat
