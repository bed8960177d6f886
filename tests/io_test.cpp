// divewatch-Prod headers
#include "io/ConsoleNotificationDispatcher.hpp"
#include "io/JsonSiteCatalog.hpp"
#include "io/SimulatedLocationService.hpp"
#include "io/SoftwareRegionMonitor.hpp"
#include "location/GeoMath.hpp"

// divewatch-Fake headers
#include "GeoFixtures.hpp"

// 3rd-party headers
#include <nlohmann/json.hpp>

// GTest headers
#include <gtest/gtest.h>

// STL headers
#include <chrono>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace divewatch::test {

  using divewatch::io::JsonSiteCatalog;
  using divewatch::io::RegionMonitorError;
  using divewatch::io::SimulatedLocationService;
  using divewatch::io::SiteQueryResult;
  using divewatch::io::SoftwareRegionMonitor;
  using divewatch::model::AuthorizationStatus;
  using divewatch::model::MonitoredRegion;
  using nlohmann::json;

  namespace {

    MonitoredRegion circle(const std::string& id, const model::Coordinate& c, double radiusM = 500.0) {
      MonitoredRegion r;
      r.identifier = id;
      r.siteId = id;
      r.center = c;
      r.radiusM = radiusM;
      return r;
    }

  } // namespace

  // ---- GeoMath ----

  TEST(GeoMath, destinationAndDistanceAgree) {
    for (double km : { 0.5, 10.0, 50.0, 120.0 }) {
      const auto p = location::destination(origin(), 37.0, km * 1000.0);
      EXPECT_NEAR(location::distanceKm(origin(), p), km, 1e-6);
    }
  }

  TEST(GeoMath, oneDegreeOfLatitude) {
    const model::Coordinate a{ 0.0, 0.0 };
    const model::Coordinate b{ 1.0, 0.0 };
    EXPECT_NEAR(location::distanceKm(a, b), 111.19, 0.01);
    EXPECT_DOUBLE_EQ(location::distanceMeters(a, a), 0.0);
  }

  // ---- SoftwareRegionMonitor ----

  class SoftwareRegionMonitorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      io::RegionMonitor::Handlers h;
      h.onEnter = [this](const std::string& id) { log.push_back("enter " + id); };
      h.onExit = [this](const std::string& id) { log.push_back("exit " + id); };
      h.onStateDetermined = [this](const std::string& id, bool inside) {
        log.push_back(std::string(inside ? "inside " : "outside ") + id);
      };
      h.onMonitoringFailed = [this](const std::optional<std::string>& id, const std::string& err) {
        log.push_back("failed " + id.value_or("?") + " " + err);
      };
      monitor.setHandlers(std::move(h));
    }

    SoftwareRegionMonitor monitor;
    std::vector<std::string> log;
  };

  TEST_F(SoftwareRegionMonitorTest, raisesEnterAndExitOnCrossings) {
    monitor.install(circle("r1", origin()));
    monitor.updatePosition(fixAt(offset(kEast, 2.0)));
    monitor.updatePosition(fixAt(offset(kEast, 0.3)));
    monitor.updatePosition(fixAt(offset(kEast, 0.4))); // still inside
    monitor.updatePosition(fixAt(offset(kEast, 0.7)));
    EXPECT_EQ(log, (std::vector<std::string>{ "enter r1", "exit r1" }));
  }

  TEST_F(SoftwareRegionMonitorTest, installWhileInsideReportsState) {
    monitor.updatePosition(fixAt(origin()));
    monitor.install(circle("r1", offset(kNorth, 0.1)));
    EXPECT_EQ(log, std::vector<std::string>{ "inside r1" });
  }

  TEST_F(SoftwareRegionMonitorTest, exitsAreReportedBeforeEnters) {
    monitor.install(circle("a", offset(kWest, 0.3), 400.0));
    monitor.install(circle("b", offset(kEast, 0.3), 400.0));
    monitor.updatePosition(fixAt(offset(kWest, 0.3)));
    log.clear();
    monitor.updatePosition(fixAt(offset(kEast, 0.3)));
    EXPECT_EQ(log, (std::vector<std::string>{ "exit a", "enter b" }));
  }

  TEST_F(SoftwareRegionMonitorTest, enforcesCapacity) {
    SoftwareRegionMonitor small(2);
    small.install(circle("a", origin()));
    small.install(circle("b", origin()));
    EXPECT_THROW(small.install(circle("c", origin())), RegionMonitorError);
    small.install(circle("a", offset(kEast, 1.0))); // replacing an existing id is fine
    EXPECT_EQ(small.count(), 2u);
    small.remove("a");
    small.remove("unknown");
    EXPECT_EQ(small.regionIds(), std::vector<std::string>{ "b" });
  }

  TEST_F(SoftwareRegionMonitorTest, failRegionDropsItAndNotifies) {
    monitor.install(circle("a", origin()));
    monitor.failRegion("a", "denied");
    EXPECT_EQ(monitor.count(), 0u);
    EXPECT_EQ(log, std::vector<std::string>{ "failed a denied" });
  }

  // ---- JsonSiteCatalog ----

  TEST(JsonSiteCatalog, parsesBothLayouts) {
    const auto a = JsonSiteCatalog::parse(json::parse(R"([{"id":"x","lat":24.5,"lon":-81.0}])"));
    ASSERT_EQ(a.size(), 1u);
    EXPECT_EQ(a[0].id, "x");

    const auto b = JsonSiteCatalog::parse(json::parse(R"({"sites":[{"id":42,"lat":1,"lon":2}]})"));
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].id, "42");
    EXPECT_DOUBLE_EQ(b[0].coordinate.longitude, 2.0);
  }

  TEST(JsonSiteCatalog, rejectsMalformedSites) {
    EXPECT_THROW(JsonSiteCatalog::parse(json::parse(R"({"sites":3})")), std::invalid_argument);
    EXPECT_THROW(JsonSiteCatalog::parse(json::parse(R"([{"id":"x","lat":1}])")), std::invalid_argument);
    EXPECT_THROW(JsonSiteCatalog::parse(json::parse(R"([{"id":"x","lat":91,"lon":0}])")),
                 std::invalid_argument);
  }

  TEST(JsonSiteCatalog, nearbyIsSortedFilteredAndLimited) {
    JsonSiteCatalog catalog({ siteAt("far", kEast, 60.0), siteAt("c", kEast, 3.0), siteAt("a", kWest, 1.0),
                              siteAt("b", kNorth, 2.0), siteAt("tie2", kNorth, 5.0),
                              siteAt("tie1", kNorth, 5.0) }); // same spot: id breaks the tie
    SiteQueryResult got;
    catalog.nearby(fixAt(origin()), 50.0, 4, [&](SiteQueryResult r) { got = std::move(r); });
    ASSERT_TRUE(got.ok());
    std::vector<std::string> ids;
    for (const auto& s : got.sites)
      ids.push_back(s.id);
    EXPECT_EQ(ids, (std::vector<std::string>{ "a", "b", "c", "tie1" }));
  }

  TEST(JsonSiteCatalog, addAndRemove) {
    JsonSiteCatalog catalog;
    catalog.add(siteAt("a", kEast, 1.0));
    EXPECT_EQ(catalog.size(), 1u);
    EXPECT_TRUE(catalog.remove("a"));
    EXPECT_FALSE(catalog.remove("a"));
    EXPECT_EQ(catalog.size(), 0u);
  }

  // ---- SimulatedLocationService ----

  TEST(SimulatedLocationService, promptResolvesToConfiguredAnswer) {
    SimulatedLocationService sim(AuthorizationStatus::NotDetermined, AuthorizationStatus::Denied);
    std::vector<AuthorizationStatus> seen;
    io::LocationService::Handlers h;
    h.onAuthorizationChanged = [&](AuthorizationStatus s) { seen.push_back(s); };
    sim.setHandlers(std::move(h));

    sim.requestAuthorization();
    sim.requestAuthorization(); // already determined: no second change
    EXPECT_EQ(sim.promptCount(), 2);
    EXPECT_EQ(seen, std::vector<AuthorizationStatus>{ AuthorizationStatus::Denied });
  }

  TEST(SimulatedLocationService, appliesDistanceFilterPerMode) {
    SimulatedLocationService sim(AuthorizationStatus::AuthorizedWhenInUse);
    int delivered = 0;
    io::LocationService::Handlers h;
    h.onLocation = [&](const model::Position&) { ++delivered; };
    sim.setHandlers(std::move(h));

    EXPECT_FALSE(sim.deliver(fixAt(origin()))); // updates not started
    sim.startStandardUpdates();
    EXPECT_TRUE(sim.deliver(fixAt(origin())));
    EXPECT_FALSE(sim.deliver(fixAt(offset(kEast, 0.02))));
    EXPECT_TRUE(sim.deliver(fixAt(offset(kEast, 0.06))));

    sim.stopStandardUpdates();
    sim.startSignificantChangeUpdates();
    EXPECT_FALSE(sim.deliver(fixAt(offset(kEast, 0.4))));
    EXPECT_TRUE(sim.deliver(fixAt(offset(kEast, 0.6))));
    EXPECT_EQ(delivered, 3);
  }

  // ---- ConsoleNotificationDispatcher ----

  TEST(ConsoleNotificationDispatcher, reschedulingReplacesPendingReminder) {
    std::ostringstream out;
    io::ConsoleNotificationDispatcher notifier(out);
    notifier.scheduleDelayed("A", std::chrono::seconds{ 900 });
    notifier.scheduleImmediate("A");
    auto pending = notifier.pendingFor("A");
    ASSERT_TRUE(pending);
    EXPECT_EQ(pending->category, io::kPromptCategory);

    notifier.cancel("A");
    notifier.cancel("A");
    EXPECT_FALSE(notifier.pendingFor("A"));
    EXPECT_EQ(out.str(), "notify  DIVE_LOG_REMINDER site=A in 900s\n"
                         "notify  DIVE_LOG_PROMPT site=A now\n"
                         "notify  cancel site=A\n");
  }

} // namespace divewatch::test
