// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_CLIENTSOAP_H__
#define __AEAT_CLIENTSOAP_H__

#include <string>

#include <aeat/UserConfig.h>
#include <aeat/communication/Connection.h>

namespace Aeat {

  class Logger;
  class EphemeralKeyMaterial;

  /** Class with easy interface for sending SOAP messages over HTTPS.
      One instance serves one endpoint. Every Send() opens its own
      connection which is closed before returning. */
  class ClientSOAP {
  public:
    /** If connector is NULL TLSConnector is used. Otherwise connector
        must outlive this object. */
    ClientSOAP(const TargetEndpoint& endpoint, Connector* connector = NULL);
    ~ClientSOAP();
    /** Posts envelope and returns body of response.
        Connection attempts failing before any byte of request was sent
        are repeated up to retry_attempts times of endpoint waiting
        retry_backoff seconds before second attempt and doubling delay
        afterwards. Once request was started nothing is repeated.
        Response with status outside 2xx is returned only if it carries
        SOAP Fault. Throws CommunicationException on every other failure. */
    std::string Send(const std::string& envelope,
                     const std::string& cert_file, const std::string& key_file);
    /** Same as above using files of materialized credentials. */
    std::string Send(const std::string& envelope, const EphemeralKeyMaterial& material);
    /** Number of connection attempts made by last Send(). */
    int Attempts() const { return attempts_; }
    /** Status code of last response, 0 if none was received. */
    int ResponseCode() const { return code_; }
    const TargetEndpoint& Endpoint() const { return endpoint_; }
  private:
    ClientSOAP(const ClientSOAP&);
    ClientSOAP& operator=(const ClientSOAP&);
    TargetEndpoint endpoint_;
    Connector* connector_;
    bool own_connector_;
    int attempts_;
    int code_;
    static Logger logger;
  };

} // namespace Aeat

#endif // __AEAT_CLIENTSOAP_H__
