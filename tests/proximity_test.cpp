// divewatch-Prod headers
#include "core/Clock.hpp"
#include "core/Logger.hpp"
#include "location/ProximityStateMachine.hpp"

// GTest headers
#include <gtest/gtest.h>

// STL headers
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace divewatch::test {

  using divewatch::location::ProximityEvent;
  using divewatch::location::ProximityEventKind;
  using divewatch::location::ProximityStateMachine;
  using divewatch::model::SiteEvent;
  using divewatch::model::SiteTransition;
  using namespace std::chrono_literals;

  class ProximityStateMachineTest : public ::testing::Test {
  protected:
    void SetUp() override {
      clock = std::make_shared<core::ManualClock>(core::TimePoint{} + 500h);
      logger = std::make_shared<core::Logger>();
      logger->setEchoLevel(core::LogLevel::Error);
      machine = std::make_unique<ProximityStateMachine>(clock, core::ProximityConfig{}, logger);
      machine->setListener([this](const ProximityEvent& ev) { events.push_back(ev); });
    }

    std::shared_ptr<core::ManualClock> clock;
    std::shared_ptr<core::Logger> logger;
    std::unique_ptr<ProximityStateMachine> machine;
    std::vector<ProximityEvent> events;
  };

  TEST_F(ProximityStateMachineTest, enterEmitsArrival) {
    machine->enter("blue_hole");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, ProximityEventKind::Arrived);
    EXPECT_EQ(events[0].siteId, "blue_hole");
    EXPECT_EQ(events[0].at, clock->now());
    EXPECT_TRUE(machine->isAtSite());
    EXPECT_EQ(*machine->currentSiteId(), "blue_hole");
  }

  TEST_F(ProximityStateMachineTest, exitJustShortOfThirtyMinutesIsNotADive) {
    machine->enter("reef");
    clock->advance(29min + 59s);
    machine->exit("reef");
    ASSERT_EQ(events.size(), 1u); // arrival only
    EXPECT_FALSE(machine->isAtSite());
  }

  TEST_F(ProximityStateMachineTest, exitAtThirtyMinutesCompletesExactlyOneDive) {
    machine->enter("reef");
    clock->advance(30min);
    machine->exit("reef");
    machine->exit("reef");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, ProximityEventKind::DiveCompleted);
    EXPECT_EQ(events[1].siteId, "reef");
    EXPECT_EQ(events[1].dwell, 30min);
  }

  TEST_F(ProximityStateMachineTest, duplicateEnterForSameSiteKeepsOriginalArrival) {
    machine->enter("wreck");
    const auto firstArrival = *machine->enteredAt();
    clock->advance(10min);
    machine->enter("wreck");
    EXPECT_EQ(events.size(), 1u);
    EXPECT_EQ(*machine->enteredAt(), firstArrival);

    clock->advance(20min);
    machine->exit("wreck");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].dwell, 30min);
  }

  TEST_F(ProximityStateMachineTest, enterAtOtherSiteExitsFirstThenArrives) {
    machine->enter("A");
    clock->advance(45min);
    machine->enter("B");

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1].kind, ProximityEventKind::DiveCompleted);
    EXPECT_EQ(events[1].siteId, "A");
    EXPECT_EQ(events[2].kind, ProximityEventKind::Arrived);
    EXPECT_EQ(events[2].siteId, "B");
    EXPECT_EQ(*machine->currentSiteId(), "B");
  }

  TEST_F(ProximityStateMachineTest, shortStayBeforeHoppingSitesOnlyArrives) {
    std::vector<std::pair<std::string, std::chrono::seconds>> exits;
    machine->setExitListener([&](const std::string& id, std::chrono::seconds d) { exits.emplace_back(id, d); });
    machine->enter("A");
    clock->advance(5min);
    machine->enter("B");

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, ProximityEventKind::Arrived);
    ASSERT_EQ(exits.size(), 1u);
    EXPECT_EQ(exits[0].first, "A");
    EXPECT_EQ(exits[0].second, 5min);
  }

  TEST_F(ProximityStateMachineTest, exitForSiteWeAreNotAtIsIgnored) {
    machine->exit("nowhere");
    machine->enter("A");
    clock->advance(1h);
    machine->exit("B");
    EXPECT_EQ(events.size(), 1u);
    EXPECT_TRUE(machine->isAtSite());
  }

  TEST_F(ProximityStateMachineTest, handleDispatchesSiteEvents) {
    machine->handle(SiteEvent{ "A", SiteTransition::Enter });
    clock->advance(31min);
    machine->handle(SiteEvent{ "A", SiteTransition::Exit });
    ASSERT_EQ(events.size(), 2u);
    EXPECT_STREQ(location::toString(events[1].kind), "dive_completed");
  }

  TEST_F(ProximityStateMachineTest, customDwellThreshold) {
    core::ProximityConfig cfg;
    cfg.completionDwell = 10min;
    ProximityStateMachine quick(clock, cfg, logger);
    int completions = 0;
    quick.setListener([&](const ProximityEvent& ev) {
      if (ev.kind == ProximityEventKind::DiveCompleted)
        ++completions;
    });
    quick.enter("A");
    clock->advance(10min);
    quick.exit("A");
    EXPECT_EQ(completions, 1);
  }

  TEST_F(ProximityStateMachineTest, dwellIgnoresWallClockSteps) {
    machine->enter("A");
    clock->advance(31min);
    clock->stepWall(-1h); // NTP pulls the wall clock back mid-dive
    machine->exit("A");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, ProximityEventKind::DiveCompleted);
    EXPECT_EQ(events[1].dwell, 31min);

    machine->enter("B");
    clock->advance(5min);
    clock->stepWall(1h); // a forward jump is not time spent at the site
    machine->exit("B");
    EXPECT_EQ(events.size(), 3u);
    EXPECT_EQ(events.back().kind, ProximityEventKind::Arrived);
  }

} // namespace divewatch::test
