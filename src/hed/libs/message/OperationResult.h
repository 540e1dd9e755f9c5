// OperationResult.h

#ifndef __AEAT_OPERATIONRESULT_H__
#define __AEAT_OPERATIONRESULT_H__

#include <string>

#include <aeat/SenderError.h>

namespace Aeat {

  //! Content of SOAP Fault returned by server.
  class FaultInfo {
  public:
    FaultInfo() {}
    FaultInfo(const std::string& code, const std::string& string,
              const std::string& detail = "")
      : code(code), string(string), detail(detail) {}

    //! Short machine token from faultcode, possibly prefixed.
    std::string code;
    //! Human readable message from faultstring.
    std::string string;
    //! Serialized content of detail element, may be empty.
    std::string detail;
    //! Serialized Fault element. Used when code and string are both empty.
    std::string xml;

    //! Message suitable for reporting.
    /*! Contains both code and string, or whole Fault if both are empty.
     */
    std::string Message() const;
  };

  //! Kinds of outcome of one send operation.
  enum ResultKind {
    RESULT_SUCCESS = 0,               //! Server returned business response
    RESULT_FUNCTIONAL_FAILURE = 1,    //! Server returned SOAP Fault
    RESULT_COMMUNICATION_FAILURE = 2  //! No usable response was obtained
  };

  //! Conversion to string.
  std::string string(ResultKind kind);

  //! Outcome of one send operation.
  /*! Exactly one of three variants. Success carries response payload,
    functional failure carries Fault and communication failure carries
    category of failure and its explanation. Instances are created only
    through static factory methods.
  */
  class OperationResult {
  public:
    //! Success with payload extracted from response Body.
    static OperationResult Success(const std::string& response);

    //! Server refused request.
    static OperationResult FunctionalFailure(const FaultInfo& fault);

    //! Request could not be delivered or response can not be used.
    /*! @param cause One of error categories other than FunctionalError.
      @param explanation Description of failure.
    */
    static OperationResult CommunicationFailure(ErrorKind cause,
                                                const std::string& explanation);

    //! Returns kind of outcome.
    ResultKind getKind() const;

    //! Is it success?
    bool isSuccess() const;

    //! Response payload. Empty unless success.
    const std::string& getResponse() const;

    //! Fault returned by server. Empty unless functional failure.
    const FaultInfo& getFault() const;

    //! Error category of failure.
    /*! NoError for success, FunctionalError for functional failure.
     */
    ErrorKind getCause() const;

    //! Returns explanation of failure.
    /*! For functional failure it is message composed of Fault.
     */
    std::string getExplanation() const;

    //! Conversion to string.
    operator std::string() const;

    //! Is it success?
    operator bool(void) const { return isSuccess(); };

    //! Returns true if it is not success.
    bool operator!(void) const { return !isSuccess(); };

  private:
    OperationResult(ResultKind kind);

    ResultKind kind;
    std::string response;
    FaultInfo fault;
    ErrorKind cause;
    std::string explanation;
  };

}

#endif
