// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * LedLink - Render Scheduler Unit Tests
 *
 * Tests for the fixed-budget loop tick:
 * - Budget and busy-flag yields
 * - Connection indicator priority
 * - Connected flash lifecycle
 * - Mode reset and renderer dispatch
 * - Effect registry bounds
 */

#include <unity.h>

#include "audio/AudioFeatureProcessor.h"
#include "effects/EffectRegistry.h"
#include "effects/StaticColorRenderer.h"
#include "mocks/FakeRenderer.h"
#include "mocks/MemoryRecordStorage.h"
#include "mocks/MockLedDriver.h"
#include "mocks/MockPlatformServices.h"
#include "mocks/MockRadio.h"
#include "mocks/RecordingStatusSink.h"
#include "network/ConnectionManager.h"
#include "persistence/CredentialStore.h"
#include "render/ConnectedFlash.h"
#include "render/ConnectionIndicator.h"
#include "render/RenderScheduler.h"

using namespace ledlink;
using effects::ModeId;
using hal::RGB;
using network::ConnectionState;
using render::ConnectedFlash;
using render::ConnectionIndicator;
using render::RenderScheduler;

//==============================================================================
// Test Fixtures
//==============================================================================

namespace {

struct Fixture {
    test::MockRadio radio;
    test::MemoryRecordStorage storage;
    persistence::CredentialStore store;
    test::RecordingStatusSink sink;
    network::ConnectionManager manager;

    render::LightState lights;
    audio::AudioFeatureProcessor audio;
    effects::EffectRegistry registry;
    test::FakeRenderer renderer;

    test::MockLedDriver driver;
    test::MockPlatformServices platform;
    RenderScheduler scheduler;

    Fixture()
        : store(storage)
        , manager(radio, store, sink)
        , scheduler(lights, audio, manager, registry, driver, platform) {
        registry.registerEffect(ModeId::Static, &renderer);
    }

    /// Drive the manager straight to CONFIG_BROADCAST (no flash armed)
    void enterSteadyState() {
        store.save("Home", "secret99");
        radio.associated = true;
        manager.begin();
        manager.update(0);
        manager.update(1);
        manager.notifyCommandReceived();
        manager.update(2);
        TEST_ASSERT_EQUAL(ConnectionState::ConfigBroadcast, manager.getState());
    }
};

} // namespace

//==============================================================================
// Startup
//==============================================================================

void test_sched_begin_blanks_strip() {
    Fixture f;
    TEST_ASSERT_TRUE(f.scheduler.begin(0));

    TEST_ASSERT_EQUAL_INT(1, f.driver.initCalls);
    TEST_ASSERT_EQUAL_INT(1, f.driver.showCalls);
    TEST_ASSERT_EQUAL_UINT16(8, f.scheduler.getLedCount());
    TEST_ASSERT_TRUE(f.driver.allPixels(RGB::Black()));
    TEST_ASSERT_EQUAL_UINT8(f.lights.brightness, f.driver.brightness);
}

void test_sched_begin_reports_driver_failure() {
    Fixture f;
    f.driver.initResult = false;

    TEST_ASSERT_FALSE(f.scheduler.begin(0));
    TEST_ASSERT_EQUAL_INT(0, f.driver.showCalls);
}

//==============================================================================
// Budget and busy flag
//==============================================================================

void test_sched_budget_per_mode() {
    TEST_ASSERT_EQUAL_UINT32(33, RenderScheduler::budgetFor(ModeId::Static));
    TEST_ASSERT_EQUAL_UINT32(33, RenderScheduler::budgetFor(ModeId::Matrix));
    TEST_ASSERT_EQUAL_UINT32(16, RenderScheduler::budgetFor(ModeId::AudioSpectrum));
    TEST_ASSERT_EQUAL_UINT32(16, RenderScheduler::budgetFor(ModeId::AudioRainbowBars));
}

void test_sched_ambient_budget_yields() {
    Fixture f;
    f.enterSteadyState();
    f.scheduler.begin(100);

    f.scheduler.tick(100);
    TEST_ASSERT_EQUAL_UINT32(1, f.scheduler.getStats().framesRendered);

    f.scheduler.tick(120);
    TEST_ASSERT_EQUAL_UINT32(1, f.scheduler.getStats().framesRendered);
    TEST_ASSERT_EQUAL_UINT32(1, f.scheduler.getStats().budgetYields);
    TEST_ASSERT_EQUAL_INT(1, f.platform.yields);
    TEST_ASSERT_EQUAL_UINT32(1, f.platform.yieldedMs);
    // One feed for the rendered tick, one for the yield
    TEST_ASSERT_EQUAL_INT(2, f.platform.watchdogFeeds);

    f.scheduler.tick(133);
    TEST_ASSERT_EQUAL_UINT32(2, f.scheduler.getStats().framesRendered);
    // The network is serviced on every tick, skipped or not
    TEST_ASSERT_EQUAL_INT(3, f.platform.serviceCalls);
}

void test_sched_audio_budget_yields() {
    Fixture f;
    test::FakeRenderer spectrum;
    f.registry.registerEffect(ModeId::AudioSpectrum, &spectrum);
    f.lights.mode = ModeId::AudioSpectrum;
    f.enterSteadyState();
    f.scheduler.begin(100);

    f.scheduler.tick(100);
    f.scheduler.tick(115);
    TEST_ASSERT_EQUAL_UINT32(1, f.scheduler.getStats().budgetYields);

    f.scheduler.tick(116);
    TEST_ASSERT_EQUAL_UINT32(2, f.scheduler.getStats().framesRendered);
    TEST_ASSERT_EQUAL_INT(2, spectrum.renders);
}

void test_sched_busy_slot_yields() {
    Fixture f;
    f.enterSteadyState();
    f.scheduler.begin(0);

    // Transport holds the slot
    TEST_ASSERT_TRUE(f.audio.tryBeginRender());
    f.scheduler.tick(0);

    TEST_ASSERT_EQUAL_UINT32(0, f.scheduler.getStats().framesRendered);
    TEST_ASSERT_EQUAL_UINT32(1, f.scheduler.getStats().busyYields);
    TEST_ASSERT_EQUAL_INT(1, f.platform.yields);
    TEST_ASSERT_EQUAL_INT(1, f.driver.showCalls);  // begin() only

    f.audio.endRender();
    f.scheduler.tick(1);
    TEST_ASSERT_EQUAL_UINT32(1, f.scheduler.getStats().framesRendered);
    TEST_ASSERT_EQUAL_INT(2, f.driver.showCalls);

    // Released again after the tick
    TEST_ASSERT_TRUE(f.audio.tryBeginRender());
    f.audio.endRender();
}

//==============================================================================
// Connection indicator
//==============================================================================

void test_sched_hotspot_shows_blue_indicator() {
    Fixture f;
    f.manager.begin();
    f.scheduler.begin(0);

    f.scheduler.tick(500);

    RGB expected = ConnectionIndicator::colorFor(ConnectionState::HotspotMode, 500);
    TEST_ASSERT_TRUE(f.driver.allPixels(expected));
    TEST_ASSERT_EQUAL_UINT8(0, expected.r);
    TEST_ASSERT_EQUAL_UINT8(0, expected.g);
    TEST_ASSERT_TRUE(expected.b > 0);
    TEST_ASSERT_EQUAL_INT(0, f.renderer.renders);
}

void test_indicator_hotspot_breathes() {
    TEST_ASSERT_TRUE(RGB::Black() == ConnectionIndicator::colorFor(ConnectionState::HotspotMode, 0));
    TEST_ASSERT_TRUE(RGB::Blue() == ConnectionIndicator::colorFor(ConnectionState::HotspotMode, 1000));
    TEST_ASSERT_TRUE(RGB::Black() == ConnectionIndicator::colorFor(ConnectionState::HotspotMode, 2000));
}

void test_sched_connecting_blinks_amber() {
    Fixture f;
    f.store.save("Home", "secret99");
    f.manager.begin();
    f.scheduler.begin(0);

    f.scheduler.tick(0);
    TEST_ASSERT_EQUAL(ConnectionState::Connecting, f.manager.getState());
    TEST_ASSERT_TRUE(f.driver.allPixels(RGB::Amber()));

    f.scheduler.tick(250);
    TEST_ASSERT_TRUE(f.driver.allPixels(RGB::Black()));

    f.scheduler.tick(500);
    TEST_ASSERT_TRUE(f.driver.allPixels(RGB::Amber()));
}

void test_sched_awaiting_command_shows_dim_green() {
    Fixture f;
    f.store.save("Home", "secret99");
    f.radio.associated = true;
    f.manager.begin();
    f.manager.update(0);
    f.manager.update(1);
    TEST_ASSERT_EQUAL(ConnectionState::AwaitingFirstCommand, f.manager.getState());
    f.scheduler.begin(0);

    f.scheduler.tick(10);

    TEST_ASSERT_TRUE(f.driver.allPixels(RGB(0, 64, 0)));
    TEST_ASSERT_EQUAL_INT(0, f.renderer.renders);
}

void test_sched_steady_state_uses_renderer() {
    Fixture f;
    f.enterSteadyState();
    f.scheduler.begin(0);
    f.lights.brightness = 42;

    f.scheduler.tick(0);

    TEST_ASSERT_EQUAL_INT(1, f.renderer.renders);
    TEST_ASSERT_TRUE(f.renderer.sawAudio);
    TEST_ASSERT_TRUE(f.driver.allPixels(f.renderer.color()));
    TEST_ASSERT_EQUAL_UINT8(42, f.driver.brightness);
}

//==============================================================================
// Mode changes and audio
//==============================================================================

void test_sched_mode_change_resets_renderer() {
    Fixture f;
    test::FakeRenderer fire(RGB(200, 40, 0));
    f.registry.registerEffect(ModeId::Fire, &fire);
    f.enterSteadyState();
    f.scheduler.begin(0);
    f.scheduler.tick(0);

    f.lights.mode = ModeId::Fire;
    f.lights.modeResetPending = true;
    f.scheduler.tick(100);
    TEST_ASSERT_EQUAL_INT(1, fire.resets);
    TEST_ASSERT_EQUAL_UINT32(0, fire.lastFrame.elapsedMs);
    TEST_ASSERT_FALSE(f.lights.modeResetPending);
    TEST_ASSERT_TRUE(f.driver.allPixels(RGB(200, 40, 0)));

    f.scheduler.tick(200);
    TEST_ASSERT_EQUAL_INT(1, fire.resets);
    TEST_ASSERT_EQUAL_UINT32(100, fire.lastFrame.elapsedMs);
    TEST_ASSERT_EQUAL_UINT32(100, fire.lastFrame.deltaMs);
}

void test_sched_same_mode_reselect_restarts() {
    Fixture f;
    f.enterSteadyState();
    f.scheduler.begin(0);
    f.scheduler.tick(0);
    f.scheduler.tick(100);
    TEST_ASSERT_EQUAL_UINT32(100, f.renderer.lastFrame.elapsedMs);

    f.lights.modeResetPending = true;
    f.scheduler.tick(200);

    TEST_ASSERT_EQUAL_INT(1, f.renderer.resets);
    TEST_ASSERT_EQUAL_UINT32(0, f.renderer.lastFrame.elapsedMs);
}

void test_sched_missing_renderer_paints_black() {
    Fixture f;
    f.enterSteadyState();
    f.scheduler.begin(0);
    f.scheduler.tick(0);
    TEST_ASSERT_TRUE(f.driver.allPixels(f.renderer.color()));

    f.lights.mode = ModeId::Rainbow;
    f.scheduler.tick(100);

    TEST_ASSERT_TRUE(f.driver.allPixels(RGB::Black()));
    TEST_ASSERT_EQUAL_UINT32(2, f.scheduler.getStats().framesRendered);
}

void test_sched_audio_processed_only_in_audio_modes() {
    Fixture f;
    test::FakeRenderer energy;
    f.registry.registerEffect(ModeId::AudioEnergy, &energy);
    f.enterSteadyState();
    f.scheduler.begin(0);

    uint8_t bands[audio::NUM_BANDS];
    for (uint8_t i = 0; i < audio::NUM_BANDS; ++i) {
        bands[i] = 100;
    }

    TEST_ASSERT_TRUE(f.audio.submitFrame(bands, 0));
    f.scheduler.tick(0);
    TEST_ASSERT_TRUE(f.audio.getFeatures().stale);

    f.lights.mode = ModeId::AudioEnergy;
    f.scheduler.tick(40);
    TEST_ASSERT_FALSE(f.audio.getFeatures().stale);
    TEST_ASSERT_EQUAL_UINT8(100, f.audio.getFeatures().energy);
    TEST_ASSERT_EQUAL_INT(1, energy.renders);
}

//==============================================================================
// Connected flash
//==============================================================================

void test_sched_flash_runs_after_indicator_and_restores() {
    Fixture f;
    f.store.save("Home", "secret99");
    f.radio.associated = true;
    f.manager.begin();
    f.scheduler.begin(0);

    // Association edge arms the flash; the indicator still wins
    f.scheduler.tick(0);
    TEST_ASSERT_EQUAL(ConnectionState::Connected, f.manager.getState());
    TEST_ASSERT_TRUE(f.scheduler.isFlashActive());
    TEST_ASSERT_TRUE(f.driver.allPixels(RGB(0, 64, 0)));

    f.scheduler.tick(40);
    f.manager.notifyCommandReceived();

    // Indicator gone: flash starts lit
    f.scheduler.tick(80);
    TEST_ASSERT_EQUAL(ConnectionState::ConfigBroadcast, f.manager.getState());
    TEST_ASSERT_TRUE(f.driver.allPixels(RGB::Green()));

    f.scheduler.tick(380);
    TEST_ASSERT_TRUE(f.driver.allPixels(RGB::Black()));

    f.scheduler.tick(580);
    TEST_ASSERT_TRUE(f.driver.allPixels(RGB::Green()));
    TEST_ASSERT_EQUAL_INT(0, f.renderer.renders);

    // Completing tick hands the strip straight back to the mode renderer
    f.scheduler.tick(1580);
    TEST_ASSERT_FALSE(f.scheduler.isFlashActive());
    TEST_ASSERT_EQUAL_INT(1, f.renderer.renders);
    TEST_ASSERT_TRUE(f.driver.allPixels(f.renderer.color()));
    for (uint16_t i = 0; i < f.scheduler.getLedCount(); ++i) {
        TEST_ASSERT_TRUE(f.renderer.color() == f.scheduler.getBuffer()[i]);
    }

    f.scheduler.tick(1620);
    TEST_ASSERT_EQUAL_INT(2, f.renderer.renders);
    TEST_ASSERT_TRUE(f.driver.allPixels(f.renderer.color()));
}

void test_flash_restores_snapshot_and_yields_on_completion() {
    ConnectedFlash flash;
    RGB leds[4];
    for (uint16_t i = 0; i < 4; ++i) {
        leds[i] = RGB(200, 10, 10);
    }

    TEST_ASSERT_FALSE(flash.render(leds, 4, 0));
    flash.arm();
    TEST_ASSERT_TRUE(flash.isActive());
    TEST_ASSERT_FALSE(flash.isRunning());

    TEST_ASSERT_TRUE(flash.render(leds, 4, 1000));
    TEST_ASSERT_TRUE(flash.isRunning());
    TEST_ASSERT_TRUE(RGB::Green() == leds[0]);

    TEST_ASSERT_TRUE(flash.render(leds, 4, 1300));
    TEST_ASSERT_TRUE(RGB::Black() == leds[3]);

    // Last call restores the frame captured at start but leaves the tick to the renderer
    TEST_ASSERT_FALSE(flash.render(leds, 4, 2500));
    TEST_ASSERT_FALSE(flash.isRunning());
    TEST_ASSERT_FALSE(flash.isActive());
    for (uint16_t i = 0; i < 4; ++i) {
        TEST_ASSERT_TRUE(RGB(200, 10, 10) == leds[i]);
    }

    TEST_ASSERT_FALSE(flash.render(leds, 4, 2540));
}

void test_sched_reconfigure_cancels_flash() {
    Fixture f;
    f.store.save("Home", "secret99");
    f.radio.associated = true;
    f.manager.begin();
    f.scheduler.begin(0);
    f.scheduler.tick(0);
    TEST_ASSERT_TRUE(f.scheduler.isFlashActive());

    f.radio.associated = false;
    TEST_ASSERT_TRUE(f.manager.reconfigure("Other", "password1"));
    f.scheduler.tick(40);

    TEST_ASSERT_FALSE(f.scheduler.isFlashActive());
    TEST_ASSERT_EQUAL(ConnectionState::Connecting, f.manager.getState());
}

//==============================================================================
// Effects
//==============================================================================

void test_registry_rejects_bad_registrations() {
    effects::EffectRegistry registry;
    test::FakeRenderer renderer;

    TEST_ASSERT_FALSE(registry.registerEffect(static_cast<ModeId>(effects::MODE_COUNT), &renderer));
    TEST_ASSERT_FALSE(registry.registerEffect(ModeId::Fire, nullptr));
    TEST_ASSERT_EQUAL_UINT8(0, registry.getRegisteredCount());

    TEST_ASSERT_TRUE(registry.registerEffect(ModeId::Fire, &renderer));
    TEST_ASSERT_TRUE(registry.registerEffect(ModeId::Fire, &renderer));
    TEST_ASSERT_EQUAL_UINT8(1, registry.getRegisteredCount());
    TEST_ASSERT_TRUE(registry.isRegistered(2));
    TEST_ASSERT_FALSE(registry.isRegistered(99));
    TEST_ASSERT_NULL(registry.get(static_cast<ModeId>(99)));
}

void test_static_renderer_fills_color() {
    effects::StaticColorRenderer renderer;
    RGB leds[5];

    render::RenderContext ctx;
    ctx.mode = ModeId::Static;
    ctx.brightness = 255;
    ctx.staticColor = RGB(1, 2, 3);
    ctx.leds = leds;
    ctx.ledCount = 5;

    audio::AudioFeatures features;
    render::RenderFrame frame = {0, 0, 0, &features};

    renderer.render(ctx, frame);

    for (uint8_t i = 0; i < 5; ++i) {
        TEST_ASSERT_TRUE(RGB(1, 2, 3) == leds[i]);
    }
}

//==============================================================================
// Test Suite Runner
//==============================================================================

void run_render_scheduler_tests() {
    RUN_TEST(test_sched_begin_blanks_strip);
    RUN_TEST(test_sched_begin_reports_driver_failure);

    RUN_TEST(test_sched_budget_per_mode);
    RUN_TEST(test_sched_ambient_budget_yields);
    RUN_TEST(test_sched_audio_budget_yields);
    RUN_TEST(test_sched_busy_slot_yields);

    RUN_TEST(test_sched_hotspot_shows_blue_indicator);
    RUN_TEST(test_indicator_hotspot_breathes);
    RUN_TEST(test_sched_connecting_blinks_amber);
    RUN_TEST(test_sched_awaiting_command_shows_dim_green);
    RUN_TEST(test_sched_steady_state_uses_renderer);

    RUN_TEST(test_sched_mode_change_resets_renderer);
    RUN_TEST(test_sched_same_mode_reselect_restarts);
    RUN_TEST(test_sched_missing_renderer_paints_black);
    RUN_TEST(test_sched_audio_processed_only_in_audio_modes);

    RUN_TEST(test_sched_flash_runs_after_indicator_and_restores);
    RUN_TEST(test_flash_restores_snapshot_and_yields_on_completion);
    RUN_TEST(test_sched_reconfigure_cancels_flash);

    RUN_TEST(test_registry_rejects_bad_registrations);
    RUN_TEST(test_static_renderer_fills_color);
}
