// Tests for NotificationRouter: ordering, stale filtering, event payloads

#include "notification_router.hpp"
#include "test_support.hpp"
#include <iostream>
#include <cassert>
#include <vector>

using namespace voxbridge;
using namespace voxbridge::testing;

struct RouterRig {
    EventEmitter events;
    EventLog log{events};
    FakeChannel channel;
    SessionStateMachine session{events};
    ModelCache models{ModelConfig(), channel, session, events};
    NotificationRouter router{session, models, events, true};
    std::vector<std::pair<std::string, std::string>> transcripts;

    RouterRig() {
        router.set_transcript_handler([this](const std::string& id, const std::string& text) {
            transcripts.push_back(std::make_pair(id, text));
        });
    }

    std::string transcribing_session() {
        auto now = SessionStateMachine::Clock::now();
        std::string id = session.begin_session(now);
        session.mark_transcribing(id, now);
        return id;
    }
};

static Notification completion(const std::string& session_id, const std::string& text) {
    Json::Value params(Json::objectValue);
    params["session_id"] = session_id;
    params["text"] = text;
    params["duration_ms"] = 2400;
    params["confidence"] = 0.92;
    return Notification{"event.transcription_complete", params};
}

void test_completion_accepted_once() {
    std::cout << "Testing completion is accepted once..." << std::endl;

    RouterRig rig;
    std::string id = rig.transcribing_session();

    rig.router.dispatch(completion(id, "hello"));
    rig.router.dispatch(completion(id, "hello again"));

    assert(rig.transcripts.size() == 1);
    assert(rig.transcripts[0].first == id);
    assert(rig.transcripts[0].second == "hello");
    assert(rig.router.stale_dropped() == 1);
    assert(rig.router.dispatched() == 2);
    assert(rig.session.phase() == Phase::Idle);

    auto ready = rig.log.of(UiEventType::TranscriptReady);
    assert(ready.size() == 1);
    assert(ready[0].payload["duration_ms"].asInt() == 2400);
    assert(ready[0].payload["confidence"].asDouble() > 0.9);

    std::cout << "  PASS" << std::endl;
}

void test_unknown_session_dropped() {
    std::cout << "Testing events for unknown sessions..." << std::endl;

    RouterRig rig;
    rig.transcribing_session();

    rig.router.dispatch(completion("00000000-0000-4000-8000-000000000000", "ghost"));
    rig.router.dispatch(completion("", "no id"));
    assert(rig.transcripts.empty());
    assert(rig.router.stale_dropped() == 2);
    assert(rig.session.phase() == Phase::Transcribing);

    std::cout << "  PASS" << std::endl;
}

void test_empty_transcript() {
    std::cout << "Testing empty transcript..." << std::endl;

    RouterRig rig;
    std::string id = rig.transcribing_session();
    rig.router.dispatch(completion(id, ""));

    assert(rig.transcripts.empty());
    assert(rig.session.phase() == Phase::Idle);
    assert(rig.log.has_message_containing("No speech detected"));

    std::cout << "  PASS" << std::endl;
}

void test_transcription_error() {
    std::cout << "Testing transcription error..." << std::endl;

    RouterRig rig;
    std::string id = rig.transcribing_session();

    Json::Value params(Json::objectValue);
    params["session_id"] = id;
    params["kind"] = "E_TRANSCRIBE";
    params["message"] = "Decoder failed";
    rig.router.dispatch(Notification{"event.transcription_error", params});

    SessionSnapshot snap = rig.session.snapshot();
    assert(snap.phase == Phase::Error);
    assert(snap.error_kind == ErrorKind::TranscriptionFailure);
    assert(snap.error_message == "Decoder failed");
    assert(rig.log.has_message_containing("Decoder failed. Try again."));

    // A completion after the error is stale
    rig.router.dispatch(completion(id, "late"));
    assert(rig.transcripts.empty());
    assert(rig.router.stale_dropped() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_error_without_kind() {
    std::cout << "Testing error without a kind..." << std::endl;

    RouterRig rig;
    std::string id = rig.transcribing_session();

    Json::Value params(Json::objectValue);
    params["session_id"] = id;
    rig.router.dispatch(Notification{"event.transcription_error", params});

    SessionSnapshot snap = rig.session.snapshot();
    assert(snap.error_kind == ErrorKind::TranscriptionFailure);
    assert(snap.error_message == "Transcription failed");

    std::cout << "  PASS" << std::endl;
}

void test_audio_levels() {
    std::cout << "Testing audio level routing..." << std::endl;

    RouterRig rig;

    // Meter levels need no session
    Json::Value meter(Json::objectValue);
    meter["source"] = "meter";
    meter["rms"] = 0.1;
    meter["peak"] = 0.4;
    rig.router.dispatch(Notification{"event.audio_level", meter});

    // Recording levels for a session that does not exist are stale
    Json::Value level(Json::objectValue);
    level["source"] = "recording";
    level["session_id"] = "nope";
    level["rms"] = 0.2;
    rig.router.dispatch(Notification{"event.audio_level", level});

    auto now = SessionStateMachine::Clock::now();
    std::string id = rig.session.begin_session(now);
    level["session_id"] = id;
    rig.router.dispatch(Notification{"event.audio_level", level});
    rig.router.dispatch(Notification{"event.audio_level", level});

    auto levels = rig.log.of(UiEventType::AudioLevel);
    assert(levels.size() == 3);
    assert(!levels[0].payload.isMember("session_id"));
    assert(levels[0].payload["peak"].asDouble() > 0.3);
    assert(levels[1].payload["session_seq"].asUInt64() == 1);
    assert(levels[2].payload["session_seq"].asUInt64() == 2);
    assert(rig.router.stale_dropped() == 1);

    // Completion continues the same per-session counter
    rig.session.mark_transcribing(id, now);
    rig.router.dispatch(completion(id, "text"));
    auto ready = rig.log.of(UiEventType::TranscriptReady);
    assert(ready.size() == 1);
    assert(ready[0].payload["session_seq"].asUInt64() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_model_events_forwarded() {
    std::cout << "Testing model notifications reach the cache..." << std::endl;

    RouterRig rig;

    Json::Value progress(Json::objectValue);
    progress["model_id"] = "parakeet-tdt-0.6b-v3";
    progress["current"] = 500;
    progress["total"] = 1000;
    rig.router.dispatch(Notification{"event.model_progress", progress});

    ModelStatus status = rig.models.status();
    assert(status.state == ModelState::Downloading);
    assert(status.progress.current == 500);

    Json::Value done(Json::objectValue);
    done["model_id"] = "parakeet-tdt-0.6b-v3";
    done["status"] = "ready";
    rig.router.dispatch(Notification{"event.model_status", done});
    assert(rig.models.status().state == ModelState::Ready);
    assert(!rig.models.status().progress.valid);

    // Unknown methods are ignored
    rig.router.dispatch(Notification{"event.from_the_future", Json::Value()});
    assert(rig.router.dispatched() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_queue_preserves_order() {
    std::cout << "Testing queued dispatch order..." << std::endl;

    RouterRig rig;
    rig.router.start();

    auto now = SessionStateMachine::Clock::now();
    std::string id = rig.session.begin_session(now);
    for (int i = 0; i < 20; ++i) {
        Json::Value level(Json::objectValue);
        level["source"] = "recording";
        level["session_id"] = id;
        level["rms"] = i / 100.0;
        rig.router.push(Notification{"event.audio_level", level});
    }
    assert(rig.router.wait_idle(5000));
    rig.router.stop();

    auto levels = rig.log.of(UiEventType::AudioLevel);
    assert(levels.size() == 20);
    for (size_t i = 0; i < levels.size(); ++i) {
        assert(levels[i].payload["session_seq"].asUInt64() == i + 1);
        if (i > 0) assert(levels[i].seq > levels[i - 1].seq);
    }

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Notification Router Test Suite ===" << std::endl << std::endl;

    test_completion_accepted_once();
    test_unknown_session_dropped();
    test_empty_transcript();
    test_transcription_error();
    test_error_without_kind();
    test_audio_levels();
    test_model_events_forwarded();
    test_queue_preserves_order();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
