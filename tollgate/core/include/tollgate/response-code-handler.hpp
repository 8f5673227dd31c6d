#pragma once

#include "tollgate/handler.hpp"
#include "tollgate/http-status-code.hpp"

namespace tollgate {

// Terminal handler answering a fixed status code and ending the exchange.
class ResponseCodeHandler final : public Handler {
 public:
  explicit ResponseCodeHandler(http::StatusCode responseCode) noexcept : _responseCode(responseCode) {}

  void process(Exchange& exchange) override;

  [[nodiscard]] http::StatusCode responseCode() const noexcept { return _responseCode; }

  // Shared stateless instances.
  static const HandlerPtr& Handle200();
  static const HandlerPtr& Handle404();
  static const HandlerPtr& Handle500();
  static const HandlerPtr& Handle503();

 private:
  http::StatusCode _responseCode;
};

}  // namespace tollgate
