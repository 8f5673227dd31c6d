#pragma once

#include <memory>

namespace tollgate {

class Exchange;

// Unit of processing over an Exchange.
// process() is invoked synchronously by whatever previously held the exchange. An implementation either completes
// the exchange, forwards it to its next handler, or parks it for later resumption.
// Handlers chain through shared "next" references and must never form a cycle.
class Handler {
 public:
  Handler() noexcept = default;

  Handler(const Handler&) = delete;
  Handler(Handler&&) = delete;
  Handler& operator=(const Handler&) = delete;
  Handler& operator=(Handler&&) = delete;

  virtual ~Handler() = default;

  virtual void process(Exchange& exchange) = 0;
};

using HandlerPtr = std::shared_ptr<Handler>;

// Throws ConfigurationError if handler is empty.
void handlerNotNull(const HandlerPtr& handler);

// Run handler on exchange. An exception escaping the handler is logged, turned into a 500 response if no output
// started yet, and the exchange is ended.
void executeHandler(Handler& handler, Exchange& exchange);

}  // namespace tollgate
