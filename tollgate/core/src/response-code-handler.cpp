#include "tollgate/response-code-handler.hpp"

#include <memory>

#include "tollgate/exchange.hpp"
#include "tollgate/handler.hpp"
#include "tollgate/http-status-code.hpp"
#include "tollgate/log.hpp"

namespace tollgate {

void ResponseCodeHandler::process(Exchange& exchange) {
  if (exchange.isResponseStarted()) {
    log::debug("Response already started, not setting status {}", _responseCode);
  } else {
    exchange.setResponseCode(_responseCode);
  }
  exchange.endExchange();
}

const HandlerPtr& ResponseCodeHandler::Handle200() {
  static const HandlerPtr kHandler = std::make_shared<ResponseCodeHandler>(http::StatusCodeOK);
  return kHandler;
}

const HandlerPtr& ResponseCodeHandler::Handle404() {
  static const HandlerPtr kHandler = std::make_shared<ResponseCodeHandler>(http::StatusCodeNotFound);
  return kHandler;
}

const HandlerPtr& ResponseCodeHandler::Handle500() {
  static const HandlerPtr kHandler = std::make_shared<ResponseCodeHandler>(http::StatusCodeInternalServerError);
  return kHandler;
}

const HandlerPtr& ResponseCodeHandler::Handle503() {
  static const HandlerPtr kHandler = std::make_shared<ResponseCodeHandler>(http::StatusCodeServiceUnavailable);
  return kHandler;
}

}  // namespace tollgate
