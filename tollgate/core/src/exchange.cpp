#include "tollgate/exchange.hpp"

#include <atomic>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "tollgate/exchange-data.hpp"
#include "tollgate/http-status-code.hpp"
#include "tollgate/log.hpp"

namespace tollgate {

void NextListener::proceed() {
  if (_proceeded) {
    return;
  }
  _proceeded = true;
  _exchange.invokeCompletionListener(_nextPos);
}

void Exchange::setResponseCode(http::StatusCode responseCode) {
  if (_responseStarted) {
    throw std::logic_error("Cannot change the response code once the response has started");
  }
  _responseCode = responseCode;
}

void Exchange::addCompletionListener(CompletionListener listener) {
  if (isComplete()) {
    throw std::logic_error("Cannot add a completion listener to a completed exchange");
  }
  _completionListeners.push_back(std::move(listener));
}

void Exchange::addDefaultResponseListener(DefaultResponseListener listener) {
  _defaultResponseListeners.push_back(std::move(listener));
}

void Exchange::endExchange() {
  if (_complete.exchange(true, std::memory_order_acq_rel)) {
    log::trace("Exchange already complete, ignoring endExchange");
    return;
  }
  if (!_responseStarted) {
    for (auto it = _defaultResponseListeners.rbegin(); it != _defaultResponseListeners.rend(); ++it) {
      if ((*it)(*this)) {
        break;
      }
    }
    _defaultResponseListeners.clear();
  }
  _responseStarted = true;
  invokeCompletionListener(0);
}

void Exchange::startAsync() {
  const bool* asyncSupported = getAttachment(kAsyncSupportedKey);
  if (asyncSupported != nullptr && !*asyncSupported) {
    throw std::logic_error("Asynchronous processing is not supported for this exchange");
  }
  _asyncStarted = true;
}

void Exchange::invokeCompletionListener(std::size_t pos) {
  if (pos >= _completionListeners.size()) {
    return;
  }
  NextListener next(*this, pos + 1U);
  _completionListeners[pos](*this, next);
}

}  // namespace tollgate
