// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <exception>

#include <aeat/Logger.h>
#include <aeat/SenderError.h>
#include <aeat/communication/ClientSOAP.h>
#include <aeat/credential/CredentialBridge.h>
#include <aeat/message/EnvelopeCodec.h>

#include "Dispatcher.h"

namespace Aeat {

  Logger Dispatcher::logger(Logger::getRootLogger(), "Dispatcher");

  std::string string(DispatchState state) {
    switch (state) {
    case DISPATCH_IDLE: return "Idle";
    case DISPATCH_CREDENTIALS_ACQUIRED: return "CredentialsAcquired";
    case DISPATCH_ENVELOPE_BUILT: return "EnvelopeBuilt";
    case DISPATCH_SENT: return "Sent";
    case DISPATCH_PARSED: return "Parsed";
    case DISPATCH_CREDENTIALS_RELEASED: return "CredentialsReleased";
    }
    return "Unknown";
  }

  Dispatcher::Dispatcher(const UserConfig& config, Connector* connector,
                         CredentialBridge* bridge)
    : config_(config),
      connector_(connector),
      bridge_(bridge),
      own_bridge_(false),
      last_state_(DISPATCH_IDLE),
      attempts_(0) {
    if (!bridge_) {
      bridge_ = new CredentialBridge;
      own_bridge_ = true;
    }
  }

  Dispatcher::~Dispatcher() {
    if (own_bridge_) delete bridge_;
  }

  OperationResult Dispatcher::DispatchOnce(const std::string& system, const std::string& environment,
                                           const std::string& payload,
                                           const std::string& cert_path, const std::string& passphrase) {
    return Dispatch(system, environment, payload, NULL, cert_path, passphrase);
  }

  OperationResult Dispatcher::DispatchOnce(const std::string& system, const std::string& environment,
                                           const std::string& payload, const CredentialBundle& credential) {
    return Dispatch(system, environment, payload, &credential, "", "");
  }

  OperationResult Dispatcher::DispatchOnce(const std::string& system, const std::string& environment,
                                           const std::string& payload) {
    return Dispatch(system, environment, payload, NULL,
                    config_.CertificatePath(), config_.CertificatePassword());
  }

  OperationResult Dispatcher::Dispatch(const std::string& system, const std::string& environment,
                                       const std::string& payload, const CredentialBundle* credential,
                                       const std::string& cert_path, const std::string& passphrase) {
    last_state_ = DISPATCH_IDLE;
    attempts_ = 0;
    // Destructor of material removes files if anything below throws
    EphemeralKeyMaterial material;
    OperationResult result = OperationResult::CommunicationFailure(CommunicationError, "Not sent");
    try {
      TargetEndpoint endpoint = config_.Resolve(system, environment);
      logger.msg(INFO, "Sending to %s %s: %s", endpoint.system, endpoint.environment, endpoint.url.str());

      if (credential) {
        bridge_->Materialize(*credential, material);
      } else {
        if (cert_path.empty()) throw ConfigError("Certificate file is not specified");
        bridge_->Materialize(CredentialBundle::Load(cert_path, passphrase), material);
      }
      last_state_ = DISPATCH_CREDENTIALS_ACQUIRED;

      std::string envelope = EnvelopeCodec::BuildEnvelope(endpoint.operation, endpoint.op_namespace, payload);
      last_state_ = DISPATCH_ENVELOPE_BUILT;

      ClientSOAP client(endpoint, connector_);
      std::string response;
      try {
        response = client.Send(envelope, material);
      } catch (std::exception&) {
        attempts_ = client.Attempts();
        throw;
      }
      attempts_ = client.Attempts();
      last_state_ = DISPATCH_SENT;

      result = EnvelopeCodec::ParseResponse(response);
      last_state_ = DISPATCH_PARSED;
    } catch (SenderError& e) {
      logger.msg(ERROR, "%s: %s", ErrorKindString(e.Kind()), e.what());
      result = OperationResult::CommunicationFailure(e.Kind(), e.what());
    } catch (std::exception& e) {
      logger.msg(ERROR, "Unexpected failure: %s", e.what());
      result = OperationResult::CommunicationFailure(CommunicationError, e.what());
    }
    bridge_->Release(material);
    for (std::list<std::string>::const_iterator err = material.ReleaseErrors().begin();
         err != material.ReleaseErrors().end(); ++err) {
      logger.msg(WARNING, "Temporary key material not removed: %s", *err);
    }
    logger.msg(VERBOSE, "%s -> %s: %s", string(last_state_),
               string(DISPATCH_CREDENTIALS_RELEASED), (std::string)result);
    return result;
  }

} // namespace Aeat
