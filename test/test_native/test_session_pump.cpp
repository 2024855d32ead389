// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * LedLink - Session Pump Unit Tests
 *
 * - Audio frames bypass the queue
 * - Other messages wait for drain() on the loop thread
 * - Full queue and oversized messages reported to the transport
 * - Session greetings follow the connection state
 */

#include <unity.h>

#include <vector>

#include "audio/AudioFeatureProcessor.h"
#include "effects/EffectRegistry.h"
#include "mocks/FakeRenderer.h"
#include "mocks/MemoryRecordStorage.h"
#include "mocks/MockRadio.h"
#include "mocks/RecordingStatusSink.h"
#include "network/ConnectionManager.h"
#include "network/SessionPump.h"
#include "persistence/CredentialStore.h"
#include "protocol/ProtocolEngine.h"
#include "render/RenderContext.h"

using namespace ledlink;
using network::AcceptResult;
using network::SessionPump;
using protocol::DispatchResult;
using protocol::SessionContext;

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
    protocol::ProtocolEngine engine;
    SessionPump pump;

    Fixture()
        : store(storage)
        , manager(radio, store, sink)
        , engine(lights, audio, manager, store, registry)
        , pump(engine, manager, sink) {
        for (uint8_t i = 0; i < effects::MODE_COUNT; ++i) {
            registry.registerEffect(static_cast<effects::ModeId>(i), &renderer);
        }
    }

    AcceptResult accept(const std::vector<uint8_t>& bytes, uint32_t sessionId = 1,
                        bool viaHotspot = false) {
        SessionContext session;
        session.sessionId = sessionId;
        session.viaHotspot = viaHotspot;
        DispatchResult reply;
        return pump.acceptMessage(session, bytes.data(), bytes.size(), 0, reply);
    }
};

} // namespace

//==============================================================================
// Routing
//==============================================================================

void test_pump_audio_frame_dispatched_in_place() {
    Fixture f;
    std::vector<uint8_t> frame(17, 50);
    frame[0] = 0x04;

    TEST_ASSERT_EQUAL(AcceptResult::Handled, f.accept(frame));
    TEST_ASSERT_EQUAL_UINT32(1, f.audio.getFramesAccepted());
    TEST_ASSERT_EQUAL_UINT16(0, f.pump.drain(10));
}

void test_pump_light_command_waits_for_drain() {
    Fixture f;

    TEST_ASSERT_EQUAL(AcceptResult::Queued, f.accept({0x03, 17}));
    TEST_ASSERT_NOT_EQUAL(17, f.lights.brightness);

    TEST_ASSERT_EQUAL_UINT16(1, f.pump.drain(10));
    TEST_ASSERT_EQUAL_UINT8(17, f.lights.brightness);
    TEST_ASSERT_TRUE(f.sink.sent.empty());
}

void test_pump_drain_preserves_order() {
    Fixture f;
    f.accept({0x03, 1});
    f.accept({0x03, 2});
    f.accept({0x03, 3});

    f.pump.drain(10);
    TEST_ASSERT_EQUAL_UINT8(3, f.lights.brightness);
}

void test_pump_error_reply_sent_to_originating_session() {
    Fixture f;
    f.accept({0x42}, 9);

    f.pump.drain(10);

    TEST_ASSERT_EQUAL_UINT32(1, f.sink.sent.size());
    TEST_ASSERT_EQUAL_UINT32(9, f.sink.sent[0].first);
    TEST_ASSERT_EQUAL_STRING("ERR:unknown_opcode", f.sink.sent[0].second.c_str());
}

//==============================================================================
// Back-pressure
//==============================================================================

void test_pump_full_queue_reports_busy() {
    Fixture f;
    for (size_t i = 0; i < SessionPump::QUEUE_CAPACITY; ++i) {
        TEST_ASSERT_EQUAL(AcceptResult::Queued, f.accept({0x03, static_cast<uint8_t>(i)}));
    }
    TEST_ASSERT_EQUAL(AcceptResult::Busy, f.accept({0x03, 200}));

    // Audio still flows while the queue is full
    std::vector<uint8_t> frame(17, 10);
    frame[0] = 0x04;
    TEST_ASSERT_EQUAL(AcceptResult::Handled, f.accept(frame));

    TEST_ASSERT_EQUAL_UINT16(SessionPump::QUEUE_CAPACITY, f.pump.drain(10));
    TEST_ASSERT_EQUAL_UINT8(SessionPump::QUEUE_CAPACITY - 1, f.lights.brightness);
}

void test_pump_oversized_message_rejected() {
    Fixture f;
    std::vector<uint8_t> big(config::NetworkConfig::WS_MAX_MESSAGE_SIZE + 1, 0x01);

    TEST_ASSERT_EQUAL(AcceptResult::TooLarge, f.accept(big));
    TEST_ASSERT_EQUAL_UINT16(0, f.pump.drain(10));
}

void test_pump_clear_drops_pending_work() {
    Fixture f;
    f.accept({0x03, 99});
    f.pump.clear();

    TEST_ASSERT_EQUAL_UINT16(0, f.pump.drain(10));
    TEST_ASSERT_NOT_EQUAL(99, f.lights.brightness);
}

//==============================================================================
// Greetings and replies
//==============================================================================

void test_pump_greets_new_session_in_hotspot() {
    Fixture f;
    f.manager.begin();

    TEST_ASSERT_TRUE(f.pump.acceptSessionOpen(4));
    f.pump.drain(10);

    TEST_ASSERT_EQUAL_UINT32(1, f.sink.sent.size());
    TEST_ASSERT_EQUAL_UINT32(4, f.sink.sent[0].first);
    TEST_ASSERT_EQUAL_STRING("AP_MODE", f.sink.sent[0].second.c_str());
}

void test_pump_no_greeting_while_connecting() {
    Fixture f;
    f.store.save("HomeNet", "pw123456");
    f.manager.begin();

    f.pump.acceptSessionOpen(4);
    f.pump.drain(10);

    TEST_ASSERT_TRUE(f.sink.sent.empty());
}

void test_pump_reconfigure_reply_reaches_session() {
    Fixture f;
    f.manager.begin();
    std::vector<uint8_t> msg = {0xFF, 4, 8, 'H', 'o', 'm', 'e', 's', 'e', 'c', 'r', 'e', 't', '9', '9'};

    TEST_ASSERT_EQUAL(AcceptResult::Queued, f.accept(msg, 3, true));
    f.pump.drain(10);

    TEST_ASSERT_EQUAL_UINT32(1, f.sink.sent.size());
    TEST_ASSERT_EQUAL_STRING("RECONFIG:Home", f.sink.sent[0].second.c_str());
}

//==============================================================================
// Test Suite Runner
//==============================================================================

void run_session_pump_tests() {
    RUN_TEST(test_pump_audio_frame_dispatched_in_place);
    RUN_TEST(test_pump_light_command_waits_for_drain);
    RUN_TEST(test_pump_drain_preserves_order);
    RUN_TEST(test_pump_error_reply_sent_to_originating_session);

    RUN_TEST(test_pump_full_queue_reports_busy);
    RUN_TEST(test_pump_oversized_message_rejected);
    RUN_TEST(test_pump_clear_drops_pending_work);

    RUN_TEST(test_pump_greets_new_session_in_hotspot);
    RUN_TEST(test_pump_no_greeting_while_connecting);
    RUN_TEST(test_pump_reconfigure_reply_reaches_session);
}
