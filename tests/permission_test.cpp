// divewatch-Prod headers
#include "core/Logger.hpp"
#include "core/PersistentStore.hpp"
#include "location/PermissionPhaseController.hpp"

// divewatch-Fake headers
#include "FakeLocationService.hpp"

// GTest headers
#include <gtest/gtest.h>

// STL headers
#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace divewatch::test {

  using divewatch::location::PermissionPhaseController;
  using divewatch::model::AuthorizationStatus;
  using divewatch::model::PermissionPhase;
  using Outcome = PermissionPhaseController::StartOutcome;

  class PermissionPhaseTest : public ::testing::Test {
  protected:
    void SetUp() override {
      location = std::make_shared<FakeLocationService>();
      store = std::make_shared<core::PersistentStore>();
      logger = std::make_shared<core::Logger>();
      logger->setEchoLevel(core::LogLevel::Error);
    }

    PermissionPhaseController& make() {
      controller = std::make_unique<PermissionPhaseController>(location, store, logger);
      controller->setStartHandler([this] { ++starts; });
      controller->setStopHandler([this] { ++stops; });
      return *controller;
    }

    std::optional<std::string> persisted() const { return store->get(PermissionPhaseController::kPhaseKey); }

    std::shared_ptr<FakeLocationService> location;
    std::shared_ptr<core::PersistentStore> store;
    std::shared_ptr<core::Logger> logger;
    std::unique_ptr<PermissionPhaseController> controller;
    int starts = 0;
    int stops = 0;
  };

  TEST_F(PermissionPhaseTest, launchInInitialPhaseNeverPrompts) {
    auto& c = make();
    EXPECT_EQ(c.requestStart(false), Outcome::NotStarted);
    EXPECT_EQ(c.requestStart(false), Outcome::NotStarted);
    EXPECT_EQ(location->prompts, 0);
    EXPECT_EQ(c.currentPhase(), PermissionPhase::Initial);
    EXPECT_EQ(starts, 0);
  }

  TEST_F(PermissionPhaseTest, userTapShowsExplainerAndPrompts) {
    auto& c = make();
    EXPECT_EQ(c.requestStart(true), Outcome::PromptShown);
    EXPECT_EQ(location->prompts, 1);
    EXPECT_EQ(c.currentPhase(), PermissionPhase::ExplainerShown);
    EXPECT_EQ(persisted(), "explainerShown");
  }

  TEST_F(PermissionPhaseTest, launchAfterExplainerStillDoesNotPrompt) {
    auto& c = make();
    c.requestStart(true);
    EXPECT_EQ(c.requestStart(false), Outcome::NotStarted);
    EXPECT_EQ(location->prompts, 1);
  }

  TEST_F(PermissionPhaseTest, grantStartsMonitoringOnce) {
    auto& c = make();
    c.requestStart(true);
    c.onSystemAuthorizationChanged(AuthorizationStatus::AuthorizedWhenInUse);
    EXPECT_EQ(c.currentPhase(), PermissionPhase::Granted);
    EXPECT_EQ(starts, 1);
    EXPECT_EQ(persisted(), "granted");

    c.onSystemAuthorizationChanged(AuthorizationStatus::AuthorizedAlways); // still granted
    EXPECT_EQ(starts, 1);
  }

  TEST_F(PermissionPhaseTest, notDeterminedCallbackKeepsExplainerPhase) {
    auto& c = make();
    c.requestStart(true);
    c.onSystemAuthorizationChanged(AuthorizationStatus::NotDetermined);
    EXPECT_EQ(c.currentPhase(), PermissionPhase::ExplainerShown);
  }

  TEST_F(PermissionPhaseTest, deniedPhaseNeverPromptsAgain) {
    auto& c = make();
    c.requestStart(true);
    c.onSystemAuthorizationChanged(AuthorizationStatus::Denied);
    EXPECT_EQ(c.currentPhase(), PermissionPhase::Denied);

    EXPECT_EQ(c.requestStart(true), Outcome::NotStarted);
    EXPECT_EQ(c.requestStart(false), Outcome::NotStarted);
    EXPECT_EQ(location->prompts, 1);
    EXPECT_EQ(starts, 0);
  }

  TEST_F(PermissionPhaseTest, grantedPhaseStartsOnLaunchWithoutPrompt) {
    store->set(PermissionPhaseController::kPhaseKey, "granted");
    location->status = AuthorizationStatus::AuthorizedWhenInUse;
    auto& c = make();
    EXPECT_EQ(c.currentPhase(), PermissionPhase::Granted);
    EXPECT_EQ(c.requestStart(false), Outcome::Started);
    EXPECT_EQ(starts, 1);
    EXPECT_EQ(location->prompts, 0);
  }

  TEST_F(PermissionPhaseTest, existingAuthorizationBypassesExplainer) {
    location->status = AuthorizationStatus::AuthorizedAlways;
    auto& c = make();
    EXPECT_EQ(c.currentPhase(), PermissionPhase::Granted);
    EXPECT_EQ(c.requestStart(false), Outcome::Started);
    EXPECT_EQ(location->prompts, 0);
  }

  TEST_F(PermissionPhaseTest, restrictedAtLaunchIsDenied) {
    location->status = AuthorizationStatus::Restricted;
    auto& c = make();
    EXPECT_EQ(c.currentPhase(), PermissionPhase::Denied);
    EXPECT_EQ(persisted(), "denied");
  }

  TEST_F(PermissionPhaseTest, systemRevocationStopsMonitoring) {
    location->status = AuthorizationStatus::AuthorizedWhenInUse;
    auto& c = make();
    c.onSystemAuthorizationChanged(AuthorizationStatus::Denied);
    EXPECT_EQ(c.currentPhase(), PermissionPhase::Denied);
    EXPECT_EQ(stops, 1);
  }

  TEST_F(PermissionPhaseTest, grantFromSystemSettingsLeavesDenied) {
    location->status = AuthorizationStatus::Denied;
    auto& c = make();
    c.onSystemAuthorizationChanged(AuthorizationStatus::AuthorizedWhenInUse);
    EXPECT_EQ(c.currentPhase(), PermissionPhase::Granted);
    EXPECT_EQ(starts, 1);
  }

  TEST_F(PermissionPhaseTest, skipMovesToDeniedWithoutPrompt) {
    auto& c = make();
    c.userSkipped();
    EXPECT_EQ(c.currentPhase(), PermissionPhase::Denied);
    EXPECT_EQ(location->prompts, 0);
  }

  TEST_F(PermissionPhaseTest, skipIsIgnoredOnceGranted) {
    location->status = AuthorizationStatus::AuthorizedWhenInUse;
    auto& c = make();
    c.userSkipped();
    EXPECT_EQ(c.currentPhase(), PermissionPhase::Granted);
  }

  TEST_F(PermissionPhaseTest, resetForgetsPersistedPhase) {
    location->status = AuthorizationStatus::AuthorizedWhenInUse;
    auto& c = make();
    c.reset();
    EXPECT_EQ(c.currentPhase(), PermissionPhase::Initial);
    EXPECT_FALSE(persisted().has_value());
    EXPECT_EQ(stops, 1);
  }

  TEST_F(PermissionPhaseTest, unknownPersistedValueFallsBackToInitial) {
    store->set(PermissionPhaseController::kPhaseKey, "maybe");
    auto& c = make();
    EXPECT_EQ(c.currentPhase(), PermissionPhase::Initial);
  }

  TEST_F(PermissionPhaseTest, phaseSurvivesRestartThroughBackingFile) {
    const std::string path = ::testing::TempDir() + "divewatch_permission_state.json";
    std::remove(path.c_str());
    {
      store = std::make_shared<core::PersistentStore>(path);
      store->load();
      auto& c = make();
      c.requestStart(true);
      EXPECT_EQ(c.currentPhase(), PermissionPhase::ExplainerShown);
    }

    store = std::make_shared<core::PersistentStore>(path);
    store->load();
    auto& c = make();
    EXPECT_EQ(c.currentPhase(), PermissionPhase::ExplainerShown);
    EXPECT_EQ(c.requestStart(false), Outcome::NotStarted);
    EXPECT_EQ(location->prompts, 1);
    std::remove(path.c_str());
  }

  TEST_F(PermissionPhaseTest, rejectsMissingDependency) {
    EXPECT_THROW(PermissionPhaseController(nullptr, store, logger), std::invalid_argument);
  }

} // namespace divewatch::test
