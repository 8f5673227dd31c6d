#include "tollgate/status-page-handler.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <utility>

#include "tollgate/exchange-data.hpp"
#include "tollgate/exchange.hpp"
#include "tollgate/handler.hpp"
#include "tollgate/log.hpp"
#include "tollgate/response-code-handler.hpp"

namespace tollgate {

StatusPageHandler::StatusPageHandler(Page page)
    : StatusPageHandler(std::move(page), ResponseCodeHandler::Handle404()) {}

StatusPageHandler::StatusPageHandler(Page page, HandlerPtr next)
    : _page(std::make_shared<const Page>(std::move(page))), _next(std::move(next)) {
  handlerNotNull(_next.load(std::memory_order_relaxed));
}

void StatusPageHandler::process(Exchange& exchange) {
  exchange.addDefaultResponseListener([page = page()](Exchange& ex) {
    if (ex.isResponseStarted() ||
        std::ranges::find(page->responseCodes, ex.responseCode()) == page->responseCodes.end()) {
      return false;
    }
    log::debug("Serving status page for response code {}", ex.responseCode());
    auto& response = ex.attachment(kResponseDataKey);
    response.contentType = page->contentType;
    response.body = page->body;
    ex.startResponse();
    return true;
  });
  executeHandler(*next(), exchange);
}

void StatusPageHandler::setPage(Page page) {
  _page.store(std::make_shared<const Page>(std::move(page)), std::memory_order_release);
}

HandlerPtr StatusPageHandler::setNext(HandlerPtr next) {
  handlerNotNull(next);
  return _next.exchange(std::move(next), std::memory_order_acq_rel);
}

}  // namespace tollgate
