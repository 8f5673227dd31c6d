#include <tollgate/tollgate.hpp>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <latch>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace tollgate;

namespace {

// Pretends to be a slow backend that needs a break every 50 requests.
class SlowUnit final : public Unit {
 public:
  void init() override { log::info("SlowUnit initialized"); }

  InvocationResult service(const RequestData &request, ResponseData &response) override {
    std::this_thread::sleep_for(std::chrono::milliseconds{2});
    if (++_nbServed % 50 == 0) {
      return InvocationResult::TemporarilyUnavailable(std::chrono::seconds{0});
    }
    response.contentType = "text/plain";
    response.body = "Hello from tollgate! You requested " + request.path;
    return InvocationResult::Ok();
  }

  void destroy() noexcept override { log::info("SlowUnit destroyed after {} requests", _nbServed.load()); }

 private:
  std::atomic<uint64_t> _nbServed{0};
};

uint32_t ParseArg(const char *arg, uint32_t defaultValue) {
  if (arg == nullptr) {
    return defaultValue;
  }
  uint32_t value = 0;
  const auto [ptr, errc] = std::from_chars(arg, arg + std::strlen(arg), value);
  if (errc != std::errc{} || ptr != arg + std::strlen(arg)) {
    std::cerr << "Invalid number: " << arg << "\n";
    std::exit(EXIT_FAILURE);
  }
  return value;
}

}  // namespace

// Usage: limited-unit [maxConcurrentRequests] [nbRequests]
int main(int argc, char **argv) {
  const uint32_t maxConcurrentRequests = ParseArg(argc > 1 ? argv[1] : nullptr, 4);
  const uint32_t nbRequests = ParseArg(argc > 2 ? argv[2] : nullptr, 1000);

  log::set_level(log::level::info);

  try {
    auto pool = std::make_shared<WorkerPool>(4);
    auto unit = std::make_shared<ManagedUnit>(UnitInfo{}.withName("slow"), [] { return std::make_unique<SlowUnit>(); });
    auto invoker = std::make_shared<UnitInvoker>(unit);
    auto admission = std::make_shared<AdmissionController>(
        AdmissionConfig{}.withName("slow-admission").withMaxConcurrentRequests(maxConcurrentRequests), invoker, pool);

    std::vector<std::unique_ptr<Exchange>> exchanges;
    std::latch done(nbRequests);
    for (uint32_t requestPos = 0; requestPos < nbRequests; ++requestPos) {
      auto &exchange = *exchanges.emplace_back(std::make_unique<Exchange>());
      exchange.attachment(kRequestDataKey).path = "/item/" + std::to_string(requestPos);
      exchange.addCompletionListener([&done](Exchange &, NextListener &next) {
        next.proceed();
        done.count_down();
      });
    }

    const auto start = std::chrono::steady_clock::now();
    {
      // Each thread plays the role of a transport delivering exchanges.
      std::vector<std::jthread> transports;
      for (std::size_t transportPos = 0; transportPos < 8; ++transportPos) {
        transports.emplace_back([&exchanges, &admission, transportPos] {
          for (std::size_t requestPos = transportPos; requestPos < exchanges.size(); requestPos += 8) {
            executeHandler(*admission, *exchanges[requestPos]);
          }
        });
      }
    }
    done.wait();
    pool->stop();

    std::size_t nbOk = 0;
    for (const auto &exchange : exchanges) {
      nbOk += exchange->responseCode() == http::StatusCodeOK ? 1U : 0U;
    }
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    std::cout << nbOk << " / " << nbRequests << " requests answered 200 in " << elapsed.count() << " ms\n";
    std::cout << "Admission stats: " << admission->stats().json_str() << '\n';
  } catch (const std::exception &e) {
    std::cerr << "Example encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
