#include "tollgate/internal/admission-state.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

namespace tollgate::internal {

TEST(AdmissionStateTest, AdmitsUpToMaximum) {
  AdmissionState state(2);
  EXPECT_EQ(state.maximum(), 2U);
  EXPECT_EQ(state.current(), 0U);

  EXPECT_TRUE(state.tryAdmit());
  EXPECT_TRUE(state.tryAdmit());
  EXPECT_FALSE(state.tryAdmit());
  EXPECT_EQ(state.current(), 2U);
}

TEST(AdmissionStateTest, ReleaseNeverGoesBelowZero) {
  AdmissionState state(1);
  EXPECT_FALSE(state.release());
  EXPECT_TRUE(state.tryAdmit());
  EXPECT_TRUE(state.release());
  EXPECT_FALSE(state.release());
  EXPECT_EQ(state.current(), 0U);
}

TEST(AdmissionStateTest, ForceAdmitIgnoresMaximum) {
  AdmissionState state(1);
  EXPECT_EQ(state.forceAdmit(), 1U);
  EXPECT_EQ(state.forceAdmit(), 2U);
  EXPECT_EQ(state.current(), 2U);
  EXPECT_EQ(state.maximum(), 1U);
  EXPECT_FALSE(state.tryAdmit());
}

TEST(AdmissionStateTest, ResizeKeepsCurrent) {
  AdmissionState state(3);
  ASSERT_TRUE(state.tryAdmit());
  ASSERT_TRUE(state.tryAdmit());

  auto [previousMaximum, current] = state.resize(1);
  EXPECT_EQ(previousMaximum, 3U);
  EXPECT_EQ(current, 2U);
  EXPECT_EQ(state.maximum(), 1U);
  EXPECT_EQ(state.current(), 2U);
  EXPECT_FALSE(state.tryAdmit());
}

TEST(AdmissionStateTest, ReleaseIfOverCapacity) {
  AdmissionState state(2);
  ASSERT_TRUE(state.tryAdmit());
  ASSERT_TRUE(state.tryAdmit());
  EXPECT_FALSE(state.releaseIfOverCapacity());

  state.resize(1);
  EXPECT_TRUE(state.releaseIfOverCapacity());
  EXPECT_EQ(state.current(), 1U);
  EXPECT_FALSE(state.releaseIfOverCapacity());
}

TEST(AdmissionStateTest, LargestCapacityDoesNotOverflowIntoMaximum) {
  AdmissionState state(AdmissionState::kMaxCapacity);
  EXPECT_EQ(state.maximum(), AdmissionState::kMaxCapacity);
  EXPECT_TRUE(state.tryAdmit());
  EXPECT_EQ(state.current(), 1U);
  EXPECT_EQ(state.maximum(), AdmissionState::kMaxCapacity);
}

TEST(AdmissionStateTest, ConcurrentAdmissionsNeverExceedMaximum) {
  static constexpr uint32_t kMaximum = 8;
  static constexpr int kNbThreads = 8;
  static constexpr int kNbIterations = 10000;
  AdmissionState state(kMaximum);
  std::atomic<uint32_t> maxObserved{0};

  std::vector<std::jthread> threads;
  for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
    threads.emplace_back([&state, &maxObserved] {
      for (int iter = 0; iter < kNbIterations; ++iter) {
        if (state.tryAdmit()) {
          uint32_t current = state.current();
          uint32_t observed = maxObserved.load();
          while (current > observed && !maxObserved.compare_exchange_weak(observed, current)) {
          }
          state.release();
        }
      }
    });
  }
  threads.clear();

  EXPECT_LE(maxObserved.load(), kMaximum);
  EXPECT_EQ(state.current(), 0U);
}

}  // namespace tollgate::internal
