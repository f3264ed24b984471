#include <gtest/gtest.h>
#include <bastion/schema/delay.hpp>

using namespace bastion::schema;

TEST(delay, fresh_delay_is_effective_immediately) {
  auto delay = make_delay(300);
  EXPECT_EQ(current_delay(delay, 0), 300u);
  EXPECT_EQ(current_delay(delay, 1000), 300u);
}

TEST(delay, increase_applies_at_once) {
  auto [updated, effect] = with_update(make_delay(100), 1000, 250, 0);
  EXPECT_EQ(effect, 1000u);
  EXPECT_EQ(current_delay(updated, 1000), 250u);
}

TEST(delay, decrease_waits_for_the_difference) {
  auto [updated, effect] = with_update(make_delay(100), 1000, 40, 0);
  EXPECT_EQ(effect, 1060u);
  EXPECT_EQ(current_delay(updated, 1059), 100u);
  EXPECT_EQ(current_delay(updated, 1060), 40u);
}

TEST(delay, minimum_setback_bounds_any_change) {
  constexpr auto kSetback = duration_seconds_t{5 * 24 * 60 * 60};
  auto [updated, effect] = with_update(make_delay(0), 1000, 10, kSetback);
  EXPECT_EQ(effect, 1000 + kSetback);
  EXPECT_EQ(current_delay(updated, 1000), 0u);
  EXPECT_EQ(current_delay(updated, effect), 10u);
}

TEST(delay, pending_update_is_replaced_from_the_current_value) {
  auto [first, first_effect] = with_update(make_delay(100), 1000, 0, 0);
  EXPECT_EQ(first_effect, 1100u);

  auto [second, second_effect] = with_update(first, 1050, 80, 0);
  EXPECT_EQ(second.value_before, 100u);
  EXPECT_EQ(second_effect, 1070u);
  EXPECT_EQ(current_delay(second, 1069), 100u);
  EXPECT_EQ(current_delay(second, 1070), 80u);
}
