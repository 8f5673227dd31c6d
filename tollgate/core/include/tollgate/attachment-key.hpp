#pragma once

#include <string_view>

namespace tollgate {

// Typed key identifying one attachment slot of an Exchange.
// Identity is the address of the key object, so keys are meant to be declared once, as namespace scope
// inline variables, and referenced everywhere else:
//
//   inline const AttachmentKey<MyFlag> kMyFlagKey{"my-flag"};
//
// The name is only used for diagnostics.
template <class T>
class AttachmentKey {
 public:
  using value_type = T;

  explicit constexpr AttachmentKey(std::string_view name) noexcept : _name(name) {}

  AttachmentKey(const AttachmentKey&) = delete;
  AttachmentKey(AttachmentKey&&) = delete;
  AttachmentKey& operator=(const AttachmentKey&) = delete;
  AttachmentKey& operator=(AttachmentKey&&) = delete;

  ~AttachmentKey() = default;

  [[nodiscard]] constexpr std::string_view name() const noexcept { return _name; }

 private:
  std::string_view _name;
};

}  // namespace tollgate
