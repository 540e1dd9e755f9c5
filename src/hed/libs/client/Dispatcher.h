// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_DISPATCHER_H__
#define __AEAT_DISPATCHER_H__

#include <string>

#include <aeat/UserConfig.h>
#include <aeat/message/OperationResult.h>

namespace Aeat {

  class Logger;
  class Connector;
  class CredentialBridge;
  class CredentialBundle;

  /// Phases of one send operation in order they are passed.
  enum DispatchState {
    DISPATCH_IDLE = 0,
    DISPATCH_CREDENTIALS_ACQUIRED,
    DISPATCH_ENVELOPE_BUILT,
    DISPATCH_SENT,
    DISPATCH_PARSED,
    DISPATCH_CREDENTIALS_RELEASED
  };

  std::string string(DispatchState state);

  /// Sends one payload to one service and classifies outcome.
  /** Combines CredentialBridge, EnvelopeCodec and ClientSOAP. Every
     failure is turned into OperationResult, nothing is thrown out of
     DispatchOnce(). Temporary key material is removed before
     DispatchOnce() returns, whatever the outcome. Nothing is repeated
     at this level. */
  class Dispatcher {
  public:
    /// Creates dispatcher for configuration.
    /** Connector and bridge are for replacing network and temporary
       location. If NULL, defaults are used. Passed objects must outlive
       dispatcher. */
    Dispatcher(const UserConfig& config, Connector* connector = NULL,
               CredentialBridge* bridge = NULL);
    ~Dispatcher();

    /// Sends payload using certificate from file.
    OperationResult DispatchOnce(const std::string& system, const std::string& environment,
                                 const std::string& payload,
                                 const std::string& cert_path, const std::string& passphrase);

    /// Sends payload using certificate already in memory.
    OperationResult DispatchOnce(const std::string& system, const std::string& environment,
                                 const std::string& payload, const CredentialBundle& credential);

    /// Sends payload using certificate defined in configuration.
    OperationResult DispatchOnce(const std::string& system, const std::string& environment,
                                 const std::string& payload);

    /// Last phase reached by previous DispatchOnce() before release.
    DispatchState LastState() const { return last_state_; }

    /// Connection attempts made by previous DispatchOnce().
    int Attempts() const { return attempts_; }

  private:
    Dispatcher(const Dispatcher&);
    Dispatcher& operator=(const Dispatcher&);
    OperationResult Dispatch(const std::string& system, const std::string& environment,
                             const std::string& payload, const CredentialBundle* credential,
                             const std::string& cert_path, const std::string& passphrase);
    const UserConfig& config_;
    Connector* connector_;
    CredentialBridge* bridge_;
    bool own_bridge_;
    DispatchState last_state_;
    int attempts_;
    static Logger logger;
  };

} // namespace Aeat

#endif // __AEAT_DISPATCHER_H__
