// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_USERCONFIG_H__
#define __AEAT_USERCONFIG_H__

#include <map>
#include <string>

#include <aeat/URL.h>

namespace Aeat {

  /** \addtogroup common
   *  @{ */

  class XMLNode;

  /// Default timeout for establishing connection, in seconds.
  const int DefaultConnectTimeout = 10;
  /// Default timeout for waiting for response, in seconds.
  const int DefaultReadTimeout = 60;
  /// Default number of connection attempts.
  const int DefaultRetryAttempts = 3;
  /// Default delay before second connection attempt, in seconds.
  const int DefaultRetryBackoff = 1;

  /// Everything needed to reach one SOAP service.
  /** Resolved from configuration for one (system, environment) pair and
     not changed afterwards.
     \headerfile UserConfig.h aeat/UserConfig.h */
  class TargetEndpoint {
  public:
    TargetEndpoint()
      : connect_timeout(DefaultConnectTimeout),
        read_timeout(DefaultReadTimeout),
        retry_attempts(DefaultRetryAttempts),
        retry_backoff(DefaultRetryBackoff) {}
    /// Canonical system name: SII or VERIFACTU.
    std::string system;
    /// Canonical environment name: pruebas or produccion.
    std::string environment;
    URL url;
    int connect_timeout;
    int read_timeout;
    /// Total number of connection attempts, at least 1.
    int retry_attempts;
    /// Delay before second attempt. Doubled before every next one.
    int retry_backoff;
    /// Name of wrapping element of payload.
    std::string operation;
    /// Namespace of wrapping element.
    std::string op_namespace;
    /// Value of SOAPAction HTTP header.
    std::string soap_action;
  };

  /// Endpoints and operation of one system as read from configuration.
  class SystemConfig {
  public:
    std::string test_url;
    std::string production_url;
    std::string operation;
    std::string op_namespace;
    std::string soap_action;
  };

  /// Configuration of sender.
  /** Holds certificate location and passphrase, service endpoints per
     system and environment and network parameters. It is normally loaded
     from JSON file of following layout:
     @code
     {
       "cert_path": "certificado.p12",
       "cert_password": "secret",
       "entornos": {
         "SII": { "pruebas": "https://...", "produccion": "https://..." },
         "VERIFACTU": { "pruebas": "https://...", "produccion": "https://..." }
       },
       "timeouts": { "connect": 10, "read": 60 },
       "retry": { "attempts": 3, "backoff": 1 }
     }
     @endcode
     Systems may also define "operation", "namespace" and "soap_action".
     Loading methods throw ConfigError if document is not usable.
     The passphrase is never written to log.
     \headerfile UserConfig.h aeat/UserConfig.h */
  class UserConfig {
  public:
    UserConfig();

    /// Read and validate configuration file.
    void LoadConfigurationFile(const std::string& conffile);

    /// Validate configuration passed as JSON text.
    /** source is only used in messages. */
    void LoadConfiguration(const std::string& content, const std::string& source = "");

    const std::string& CertificatePath() const { return cert_path; }
    const std::string& CertificatePassword() const { return cert_password; }
    int ConnectTimeout() const { return connect_timeout; }
    int ReadTimeout() const { return read_timeout; }
    int RetryAttempts() const { return retry_attempts; }
    int RetryBackoff() const { return retry_backoff; }

    /// Returns configuration of system or throws ConfigError.
    /** System name is case-insensitive. */
    const SystemConfig& System(const std::string& system) const;

    /// Select endpoint for system and environment.
    /** Throws ConfigError if system or environment is unknown or if
       configured URL is not usable https URL. */
    TargetEndpoint Resolve(const std::string& system, const std::string& environment) const;

    /// Returns SII or VERIFACTU for any case of these names, empty string otherwise.
    static std::string CanonicalSystem(const std::string& system);

    /// Returns pruebas or produccion, also for test and production. Empty string otherwise.
    static std::string CanonicalEnvironment(const std::string& environment);

  private:
    void ParseSystem(XMLNode node, const std::string& name, const std::string& source);
    void ParseInt(XMLNode node, const std::string& name, int& value, int minimum, const std::string& source);

    std::string cert_path;
    std::string cert_password;
    int connect_timeout;
    int read_timeout;
    int retry_attempts;
    int retry_backoff;
    std::map<std::string, SystemConfig> systems;
  };

  /** @} */

} // namespace Aeat

#endif // __AEAT_USERCONFIG_H__
