#include "tollgate/handler.hpp"

#include <exception>

#include "tollgate/configuration-error.hpp"
#include "tollgate/exchange.hpp"
#include "tollgate/http-status-code.hpp"
#include "tollgate/log.hpp"

namespace tollgate {

void handlerNotNull(const HandlerPtr& handler) {
  if (!handler) {
    throw ConfigurationError("Handler cannot be null");
  }
}

void executeHandler(Handler& handler, Exchange& exchange) {
  try {
    handler.process(exchange);
  } catch (const std::exception& ex) {
    log::error("Uncaught exception while processing exchange: {}", ex.what());
    if (exchange.isComplete()) {
      return;
    }
    if (!exchange.isResponseStarted()) {
      exchange.setResponseCode(http::StatusCodeInternalServerError);
    }
    exchange.endExchange();
  }
}

}  // namespace tollgate
