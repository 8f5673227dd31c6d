#include "tollgate/exchange.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "tollgate/attachment-key.hpp"
#include "tollgate/exchange-data.hpp"
#include "tollgate/http-status-code.hpp"

namespace tollgate {

namespace {
const AttachmentKey<int> kCounterKey{"counter"};
const AttachmentKey<int> kOtherCounterKey{"other-counter"};
const AttachmentKey<std::string> kLabelKey{"label"};
}  // namespace

TEST(ExchangeTest, DefaultState) {
  Exchange exchange;
  EXPECT_EQ(exchange.responseCode(), http::StatusCodeOK);
  EXPECT_FALSE(exchange.isResponseStarted());
  EXPECT_FALSE(exchange.isComplete());
  EXPECT_FALSE(exchange.isAsyncStarted());
  EXPECT_EQ(exchange.getAttachment(kCounterKey), nullptr);
}

TEST(ExchangeTest, AttachmentsAreIndexedByKeyIdentity) {
  Exchange exchange;
  EXPECT_FALSE(exchange.putAttachment(kCounterKey, 1).has_value());
  EXPECT_FALSE(exchange.putAttachment(kOtherCounterKey, 2).has_value());
  exchange.putAttachment(kLabelKey, std::string("first"));

  ASSERT_NE(exchange.getAttachment(kCounterKey), nullptr);
  EXPECT_EQ(*exchange.getAttachment(kCounterKey), 1);
  EXPECT_EQ(*exchange.getAttachment(kOtherCounterKey), 2);
  EXPECT_EQ(*exchange.getAttachment(kLabelKey), "first");

  std::optional<int> previous = exchange.putAttachment(kCounterKey, 10);
  ASSERT_TRUE(previous.has_value());
  EXPECT_EQ(*previous, 1);
  EXPECT_EQ(*exchange.getAttachment(kCounterKey), 10);

  std::optional<std::string> removed = exchange.removeAttachment(kLabelKey);
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(*removed, "first");
  EXPECT_EQ(exchange.getAttachment(kLabelKey), nullptr);
  EXPECT_FALSE(exchange.removeAttachment(kLabelKey).has_value());
}

TEST(ExchangeTest, AttachmentDefaultConstructsOnce) {
  Exchange exchange;
  RequestData& request = exchange.attachment(kRequestDataKey);
  EXPECT_TRUE(request.path.empty());
  request.path = "/orders";

  EXPECT_EQ(exchange.attachment(kRequestDataKey).path, "/orders");
  const Exchange& constExchange = exchange;
  ASSERT_NE(constExchange.getAttachment(kRequestDataKey), nullptr);
  EXPECT_EQ(constExchange.getAttachment(kRequestDataKey), &request);
}

TEST(ExchangeTest, RequestDataHeaderLookup) {
  RequestData request{.method = "GET", .path = "/", .headers = {{"Accept", "text/plain"}}, .body = {}};
  EXPECT_EQ(request.headerValue("Accept"), "text/plain");
  EXPECT_TRUE(request.headerValue("Host").empty());
}

TEST(ExchangeTest, ResponseCodeIsFrozenOnceResponseStarted) {
  Exchange exchange;
  exchange.setResponseCode(http::StatusCodeNotFound);
  EXPECT_EQ(exchange.responseCode(), http::StatusCodeNotFound);

  exchange.startResponse();
  EXPECT_TRUE(exchange.isResponseStarted());
  EXPECT_THROW(exchange.setResponseCode(http::StatusCodeOK), std::logic_error);
  EXPECT_EQ(exchange.responseCode(), http::StatusCodeNotFound);
}

TEST(ExchangeTest, CompletionListenersRunInRegistrationOrderExactlyOnce) {
  Exchange exchange;
  std::vector<int> calls;
  for (int listenerPos = 0; listenerPos < 3; ++listenerPos) {
    exchange.addCompletionListener([&calls, listenerPos](Exchange&, NextListener& next) {
      calls.push_back(listenerPos);
      next.proceed();
      next.proceed();  // second call is a no-op
    });
  }

  exchange.endExchange();
  exchange.endExchange();

  EXPECT_TRUE(exchange.isComplete());
  EXPECT_TRUE(exchange.isResponseStarted());
  EXPECT_EQ(calls, (std::vector<int>{0, 1, 2}));
}

TEST(ExchangeTest, ListenerNotProceedingVetoesRemainingOnes) {
  Exchange exchange;
  std::vector<int> calls;
  exchange.addCompletionListener([&calls](Exchange&, NextListener& next) {
    calls.push_back(0);
    next.proceed();
  });
  exchange.addCompletionListener([&calls](Exchange&, NextListener&) { calls.push_back(1); });
  exchange.addCompletionListener([&calls](Exchange&, NextListener& next) {
    calls.push_back(2);
    next.proceed();
  });

  exchange.endExchange();

  EXPECT_EQ(calls, (std::vector<int>{0, 1}));
}

TEST(ExchangeTest, ListenerMayProceedAfterItsOwnWork) {
  Exchange exchange;
  std::vector<int> calls;
  exchange.addCompletionListener([&calls](Exchange&, NextListener& next) {
    next.proceed();
    calls.push_back(0);
  });
  exchange.addCompletionListener([&calls](Exchange&, NextListener& next) {
    calls.push_back(1);
    next.proceed();
  });

  exchange.endExchange();

  EXPECT_EQ(calls, (std::vector<int>{1, 0}));
}

TEST(ExchangeTest, CannotAddCompletionListenerOnceComplete) {
  Exchange exchange;
  exchange.endExchange();
  EXPECT_THROW(exchange.addCompletionListener([](Exchange&, NextListener&) {}), std::logic_error);
}

TEST(ExchangeTest, DefaultResponseListenersRunInReverseOrderUntilOneResponds) {
  Exchange exchange;
  std::vector<int> calls;
  exchange.addDefaultResponseListener([&calls](Exchange&) {
    calls.push_back(0);
    return false;
  });
  exchange.addDefaultResponseListener([&calls](Exchange& ex) {
    calls.push_back(1);
    ex.startResponse();
    return true;
  });
  exchange.addDefaultResponseListener([&calls](Exchange&) {
    calls.push_back(2);
    return false;
  });

  exchange.endExchange();

  EXPECT_EQ(calls, (std::vector<int>{2, 1}));
}

TEST(ExchangeTest, DefaultResponseListenersSkippedWhenResponseStarted) {
  Exchange exchange;
  bool called = false;
  exchange.addDefaultResponseListener([&called](Exchange&) {
    called = true;
    return true;
  });
  exchange.startResponse();

  exchange.endExchange();

  EXPECT_FALSE(called);
}

TEST(ExchangeTest, DefaultResponseListenersRunBeforeCompletionListeners) {
  Exchange exchange;
  std::vector<std::string> calls;
  exchange.addCompletionListener([&calls](Exchange& ex, NextListener& next) {
    calls.push_back(ex.isResponseStarted() ? "completion-started" : "completion-not-started");
    next.proceed();
  });
  exchange.addDefaultResponseListener([&calls](Exchange&) {
    calls.emplace_back("default");
    return false;
  });

  exchange.endExchange();

  EXPECT_EQ(calls, (std::vector<std::string>{"default", "completion-started"}));
}

TEST(ExchangeTest, StartAsyncAllowedByDefault) {
  Exchange exchange;
  exchange.startAsync();
  EXPECT_TRUE(exchange.isAsyncStarted());
}

TEST(ExchangeTest, StartAsyncRejectedWhenNotSupported) {
  Exchange exchange;
  exchange.putAttachment(kAsyncSupportedKey, false);
  EXPECT_THROW(exchange.startAsync(), std::logic_error);
  EXPECT_FALSE(exchange.isAsyncStarted());

  exchange.putAttachment(kAsyncSupportedKey, true);
  exchange.startAsync();
  EXPECT_TRUE(exchange.isAsyncStarted());
}

}  // namespace tollgate
