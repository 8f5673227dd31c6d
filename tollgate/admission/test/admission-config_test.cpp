#include "tollgate/admission-config.hpp"

#include <gtest/gtest.h>

#include "tollgate/configuration-error.hpp"
#include "tollgate/internal/admission-state.hpp"

namespace tollgate {

TEST(AdmissionConfigTest, Defaults) {
  AdmissionConfig config;
  EXPECT_EQ(config.name, "admission");
  EXPECT_EQ(config.maxConcurrentRequests, 64U);
  EXPECT_EQ(config.saturationPolicy, AdmissionConfig::SaturationPolicy::Queue);
  EXPECT_NO_THROW(config.validate());
}

TEST(AdmissionConfigTest, FluentSetters) {
  AdmissionConfig config;
  config.withName("orders")
      .withMaxConcurrentRequests(5)
      .withSaturationPolicy(AdmissionConfig::SaturationPolicy::Reject);
  EXPECT_EQ(config.name, "orders");
  EXPECT_EQ(config.maxConcurrentRequests, 5U);
  EXPECT_EQ(config.saturationPolicy, AdmissionConfig::SaturationPolicy::Reject);
  EXPECT_NE(config, AdmissionConfig{});
}

TEST(AdmissionConfigTest, MaximumBounds) {
  EXPECT_THROW(AdmissionConfig{}.withMaxConcurrentRequests(0).validate(), ConfigurationError);
  EXPECT_NO_THROW(AdmissionConfig{}.withMaxConcurrentRequests(1).validate());
  EXPECT_NO_THROW(AdmissionConfig{}.withMaxConcurrentRequests(internal::AdmissionState::kMaxCapacity).validate());
  EXPECT_THROW(AdmissionConfig{}.withMaxConcurrentRequests(internal::AdmissionState::kMaxCapacity + 1U).validate(),
               ConfigurationError);
}

TEST(AdmissionConfigTest, NameRequired) {
  EXPECT_THROW(AdmissionConfig{}.withName("").validate(), ConfigurationError);
}

}  // namespace tollgate
