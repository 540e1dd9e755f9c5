// OperationResult.cpp

#include <aeat/StringConv.h>

#include "OperationResult.h"

namespace Aeat {

  std::string FaultInfo::Message() const {
    std::string msg;
    if (!code.empty()) msg += "Code: " + code;
    if (!string.empty()) {
      if (!msg.empty()) msg += " ";
      msg += "Message: " + string;
    }
    if (msg.empty()) msg = trim(xml);
    if (msg.empty()) msg = "SOAP Fault detected in response";
    return msg;
  }

  std::string string(ResultKind kind) {
    if (kind == RESULT_SUCCESS)
      return "SUCCESS";
    else if (kind == RESULT_FUNCTIONAL_FAILURE)
      return "FUNCTIONAL_FAILURE";
    else if (kind == RESULT_COMMUNICATION_FAILURE)
      return "COMMUNICATION_FAILURE";
    else  // There should be no other alternative!
      return "";
  }

  OperationResult::OperationResult(ResultKind kind)
    : kind(kind),
      cause(NoError) {
  }

  OperationResult OperationResult::Success(const std::string& response) {
    OperationResult result(RESULT_SUCCESS);
    result.response = response;
    return result;
  }

  OperationResult OperationResult::FunctionalFailure(const FaultInfo& fault) {
    OperationResult result(RESULT_FUNCTIONAL_FAILURE);
    result.fault = fault;
    result.cause = FunctionalError;
    return result;
  }

  OperationResult OperationResult::CommunicationFailure(ErrorKind cause,
                                                        const std::string& explanation) {
    OperationResult result(RESULT_COMMUNICATION_FAILURE);
    // Functional errors have own variant
    result.cause = ((cause == NoError) || (cause == FunctionalError)) ? CommunicationError : cause;
    result.explanation = explanation;
    return result;
  }

  ResultKind OperationResult::getKind() const {
    return kind;
  }

  bool OperationResult::isSuccess() const {
    return kind == RESULT_SUCCESS;
  }

  const std::string& OperationResult::getResponse() const {
    return response;
  }

  const FaultInfo& OperationResult::getFault() const {
    return fault;
  }

  ErrorKind OperationResult::getCause() const {
    return cause;
  }

  std::string OperationResult::getExplanation() const {
    if (kind == RESULT_FUNCTIONAL_FAILURE) return fault.Message();
    return explanation;
  }

  OperationResult::operator std::string() const {
    if (kind == RESULT_SUCCESS) return string(kind);
    return string(kind) + ": " + ErrorKindString(cause) + " (" + getExplanation() + ")";
  }

}
