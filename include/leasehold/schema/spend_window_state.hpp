#pragma once

#include <leasehold/schema/primitives.hpp>

// Schema type: spend window state.
// Rolling daily spend counter written by the spend limit policy on commit.
namespace leasehold::schema {

template <uint16_t Version>
struct spend_window_state;

template <>
struct spend_window_state<1> final {
  uint16_t version{1};
  timestamp_milliseconds_t window_start{};
  amount_t spent{};
};

using spend_window_state_t = spend_window_state<1>;

}  // namespace leasehold::schema
