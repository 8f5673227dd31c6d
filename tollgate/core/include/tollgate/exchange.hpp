#pragma once

#include <any>
#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tollgate/attachment-key.hpp"
#include "tollgate/http-status-code.hpp"

namespace tollgate {

class Exchange;

// Capability handed to a completion listener to invoke the listener registered after it.
// A listener that never calls proceed() vetoes the remaining ones.
class NextListener {
 public:
  NextListener(const NextListener&) = delete;
  NextListener& operator=(const NextListener&) = delete;

  // Invoke the next completion listener, if any. Subsequent calls are no-ops.
  void proceed();

 private:
  friend class Exchange;

  NextListener(Exchange& exchange, std::size_t nextPos) noexcept : _exchange(exchange), _nextPos(nextPos) {}

  Exchange& _exchange;
  std::size_t _nextPos;
  bool _proceeded{false};
};

// Mutable record of one request / response cycle.
//
// An Exchange is created by the transport layer on request arrival and travels through the handler chain.
// It is owned by the thread currently processing it, except while parked in an admission queue where ownership
// belongs to the dispatcher that will resume it. The transport must keep it alive (and at the same address)
// until its completion listeners have run, which is why it is neither copyable nor movable.
class Exchange {
 public:
  using CompletionListener = std::function<void(Exchange&, NextListener&)>;

  // Returns true if it produced the response, which stops the remaining default response listeners.
  using DefaultResponseListener = std::function<bool(Exchange&)>;

  Exchange() = default;

  Exchange(const Exchange&) = delete;
  Exchange(Exchange&&) = delete;
  Exchange& operator=(const Exchange&) = delete;
  Exchange& operator=(Exchange&&) = delete;

  ~Exchange() = default;

  // Get the attachment stored under given key, or nullptr if absent.
  template <class T>
  [[nodiscard]] T* getAttachment(const AttachmentKey<T>& key) noexcept {
    auto it = _attachments.find(&key);
    return it == _attachments.end() ? nullptr : std::any_cast<T>(&it->second);
  }

  template <class T>
  [[nodiscard]] const T* getAttachment(const AttachmentKey<T>& key) const noexcept {
    auto it = _attachments.find(&key);
    return it == _attachments.end() ? nullptr : std::any_cast<T>(&it->second);
  }

  // Store value under given key, returning the previously attached value, if any.
  template <class T>
  std::optional<T> putAttachment(const AttachmentKey<T>& key, T value) {
    auto [it, inserted] = _attachments.try_emplace(&key);
    std::optional<T> previous;
    if (!inserted) {
      previous.emplace(std::move(*std::any_cast<T>(&it->second)));
    }
    it->second.template emplace<T>(std::move(value));
    return previous;
  }

  // Get the attachment under given key, default constructing it first if absent.
  template <class T>
  T& attachment(const AttachmentKey<T>& key) {
    auto [it, inserted] = _attachments.try_emplace(&key);
    if (inserted) {
      return it->second.template emplace<T>();
    }
    return *std::any_cast<T>(&it->second);
  }

  template <class T>
  std::optional<T> removeAttachment(const AttachmentKey<T>& key) {
    auto it = _attachments.find(&key);
    if (it == _attachments.end()) {
      return std::nullopt;
    }
    std::optional<T> previous(std::move(*std::any_cast<T>(&it->second)));
    _attachments.erase(it);
    return previous;
  }

  [[nodiscard]] http::StatusCode responseCode() const noexcept { return _responseCode; }

  // Set the response code. Throws std::logic_error once the response has started.
  void setResponseCode(http::StatusCode responseCode);

  [[nodiscard]] bool isResponseStarted() const noexcept { return _responseStarted; }

  // Mark that response output has begun. Irreversible.
  void startResponse() noexcept { _responseStarted = true; }

  // Register a listener run when the exchange completes. Listeners run in registration order, exactly once.
  // Throws std::logic_error if the exchange is already complete.
  void addCompletionListener(CompletionListener listener);

  // Register a listener consulted, in reverse registration order, when the exchange ends before any response
  // output started.
  void addDefaultResponseListener(DefaultResponseListener listener);

  // Complete the exchange: give default response listeners a chance to produce the response, commit it, then run
  // the completion listener chain. Only the first call has an effect.
  void endExchange();

  [[nodiscard]] bool isComplete() const noexcept { return _complete.load(std::memory_order_acquire); }

  // Declare that processing continues asynchronously after the current handler returns: handlers that would
  // otherwise end the exchange on return leave it open.
  // Throws std::logic_error if the handler in charge of this exchange does not support asynchronous processing.
  void startAsync();

  [[nodiscard]] bool isAsyncStarted() const noexcept { return _asyncStarted; }

 private:
  friend class NextListener;

  void invokeCompletionListener(std::size_t pos);

  std::unordered_map<const void*, std::any> _attachments;
  std::vector<CompletionListener> _completionListeners;
  std::vector<DefaultResponseListener> _defaultResponseListeners;
  std::atomic<bool> _complete{false};
  http::StatusCode _responseCode{http::StatusCodeOK};
  bool _responseStarted{false};
  bool _asyncStarted{false};
};

}  // namespace tollgate
