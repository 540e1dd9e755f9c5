// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <glibmm/timer.h>

#include <aeat/Logger.h>
#include <aeat/SenderError.h>
#include <aeat/Utils.h>
#include <aeat/credential/CredentialBridge.h>
#include <aeat/message/EnvelopeCodec.h>

#include "ClientHTTP.h"
#include "TLSConnection.h"
#include "ClientSOAP.h"

namespace Aeat {

  Logger ClientSOAP::logger(Logger::getRootLogger(), "ClientSOAP");

  ClientSOAP::ClientSOAP(const TargetEndpoint& endpoint, Connector* connector)
    : endpoint_(endpoint),
      connector_(connector),
      own_connector_(false),
      attempts_(0),
      code_(0) {
    if (!connector_) {
      connector_ = new TLSConnector;
      own_connector_ = true;
    }
  }

  ClientSOAP::~ClientSOAP() {
    if (own_connector_) delete connector_;
  }

  std::string ClientSOAP::Send(const std::string& envelope, const EphemeralKeyMaterial& material) {
    return Send(envelope, material.CertificateFile(), material.KeyFile());
  }

  std::string ClientSOAP::Send(const std::string& envelope,
                               const std::string& cert_file, const std::string& key_file) {
    attempts_ = 0;
    code_ = 0;
    ConnectionConfig cfg;
    cfg.url = endpoint_.url;
    cfg.connect_timeout = endpoint_.connect_timeout;
    cfg.read_timeout = endpoint_.read_timeout;
    cfg.cert_file = cert_file;
    cfg.key_file = key_file;

    std::multimap<std::string, std::string> attributes;
    attributes.insert(std::pair<std::string, std::string>("Content-Type", "text/xml; charset=utf-8"));
    attributes.insert(std::pair<std::string, std::string>("SOAPAction", "\"" + endpoint_.soap_action + "\""));
    attributes.insert(std::pair<std::string, std::string>("Accept", "text/xml"));
    attributes.insert(std::pair<std::string, std::string>("User-Agent", "aeat-sender"));

    int max_attempts = (endpoint_.retry_attempts > 0) ? endpoint_.retry_attempts : 1;
    int backoff = endpoint_.retry_backoff;
    AutoPointer<Connection> connection;
    for (;;) {
      ++attempts_;
      logger.msg(VERBOSE, "Connecting to %s (attempt %d of %d)",
                 endpoint_.url.str(), attempts_, max_attempts);
      TransportStatus status;
      connection = connector_->Connect(cfg, status);
      if (connection) break;
      if (!status.isRetriable()) {
        logger.msg(ERROR, "Failed to establish connection to %s: %s",
                   endpoint_.url.str(), (std::string)status);
        throw CommunicationException(IString("Failed to establish connection to %s: %s",
                                             endpoint_.url.str(), status.getExplanation()).str());
      }
      if (attempts_ >= max_attempts) {
        logger.msg(ERROR, "Failed to connect to %s after %d attempts: %s",
                   endpoint_.url.str(), attempts_, status.getExplanation());
        throw CommunicationException(IString("Failed to connect to %s after %d attempts: %s",
                                             endpoint_.url.str(), attempts_,
                                             status.getExplanation()).str());
      }
      logger.msg(WARNING, "Connection attempt %d to %s failed: %s",
                 attempts_, endpoint_.url.str(), status.getExplanation());
      if (backoff > 0) {
        logger.msg(INFO, "Retrying in %d s", backoff);
        Glib::usleep((unsigned long)backoff * 1000000UL);
        backoff *= 2;
      }
    }

    HTTPClientInfo info;
    std::string response;
    TransportStatus status;
    {
      ClientHTTP http(*connection, endpoint_.url);
      status = http.process("POST", attributes, envelope, info, response);
    }
    connection->Close();
    if (!status) {
      // Server may have received request already, repeating could duplicate submission
      logger.msg(ERROR, "Request to %s failed: %s", endpoint_.url.str(), (std::string)status);
      if (status.getKind() == READ_TIMEOUT) {
        throw CommunicationException(IString("Timeout waiting for response from %s: %s",
                                             endpoint_.url.str(), status.getExplanation()).str());
      }
      throw CommunicationException(IString("Communication with %s failed: %s",
                                           endpoint_.url.str(), status.getExplanation()).str());
    }
    code_ = info.code;
    if ((info.code >= 200) && (info.code < 300)) {
      logger.msg(VERBOSE, "Response received: HTTP %d", info.code);
      return response;
    }
    // SOAP 1.1 reports Fault with status 500
    if (EnvelopeCodec::HasFault(response)) {
      logger.msg(VERBOSE, "HTTP %d response carries SOAP Fault", info.code);
      return response;
    }
    logger.msg(ERROR, "Unexpected response from %s: HTTP %d %s",
               endpoint_.url.str(), info.code, info.reason);
    throw CommunicationException(IString("HTTP %d %s", info.code, info.reason).str());
  }

} // namespace Aeat
