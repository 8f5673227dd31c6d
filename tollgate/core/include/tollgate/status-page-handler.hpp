#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "tollgate/handler.hpp"
#include "tollgate/http-status-code.hpp"

namespace tollgate {

// Serves a fixed page for the configured response codes.
// The page is produced only if the exchange ends with one of these codes and no response output started; it is
// written into the exchange ResponseData. The handler then forwards to its next handler (a 404 responder by
// default). No response code is handled if the list is empty.
class StatusPageHandler final : public Handler {
 public:
  struct Page {
    std::vector<http::StatusCode> responseCodes;
    std::string contentType;
    std::string body;
  };

  explicit StatusPageHandler(Page page);

  StatusPageHandler(Page page, HandlerPtr next);

  void process(Exchange& exchange) override;

  // Replace the served page. Exchanges already in flight keep the page they started with.
  void setPage(Page page);

  [[nodiscard]] std::shared_ptr<const Page> page() const noexcept { return _page.load(std::memory_order_acquire); }

  [[nodiscard]] HandlerPtr next() const noexcept { return _next.load(std::memory_order_acquire); }

  // Atomically swap the next handler, returning the previous one. Throws ConfigurationError if next is empty.
  HandlerPtr setNext(HandlerPtr next);

 private:
  std::atomic<std::shared_ptr<const Page>> _page;
  std::atomic<HandlerPtr> _next;
};

}  // namespace tollgate
