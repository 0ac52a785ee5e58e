#include "app.hpp"
#include <iostream>

// Linux status indicator - console only, no GUI dependencies

namespace voxbridge {

static App* g_app = nullptr;
static int g_token = 0;

static const char* phase_label(const std::string& phase) {
    if (phase == "idle") return "Ready";
    if (phase == "loading_model") return "Loading model...";
    if (phase == "recording") return "Recording...";
    if (phase == "transcribing") return "Transcribing...";
    if (phase == "error") return "Error";
    return "Unknown";
}

static void print_event(const UiEvent& event) {
    const Json::Value& p = event.payload;

    switch (event.type) {
        case UiEventType::PhaseChanged: {
            std::cout << "[voxbridge] " << phase_label(p["phase"].asString());
            if (p["error"].isObject()) {
                std::cout << ": " << p["error"]["message"].asString();
                std::string hint = p["error"]["remediation_text"].asString();
                if (!hint.empty()) std::cout << " " << hint;
            }
            std::cout << std::endl;
            break;
        }
        case UiEventType::WorkerHealth:
            if (p["state"].asString() == "failed") {
                std::cerr << "[voxbridge] Worker stopped restarting: " << p["message"].asString() << std::endl;
            }
            break;
        case UiEventType::ModelStatus: {
            const Json::Value& progress = p["progress"];
            if (progress.isObject() && progress["total"].asUInt64() > 0) {
                uint64_t pct = progress["current"].asUInt64() * 100 / progress["total"].asUInt64();
                std::cout << "[voxbridge] Model " << p["model_id"].asString() << " "
                          << p["status"].asString() << " " << pct << "%" << std::endl;
            }
            break;
        }
        case UiEventType::UserMessage: {
            bool error = p["level"].asString() == "error";
            std::ostream& out = error ? std::cerr : std::cout;
            out << "[voxbridge] " << p["message"].asString();
            if (p["blocking"].asBool()) out << " (action required)";
            out << std::endl;
            break;
        }
        case UiEventType::AudioLevel:
        case UiEventType::TranscriptReady:
            break;
    }
}

bool create_status_indicator(App* app) {
    if (g_app) return true;
    g_app = app;
    g_token = app->events().subscribe(print_event);
    return true;
}

void destroy_status_indicator() {
    if (g_app) {
        g_app->events().unsubscribe(g_token);
    }
    g_app = nullptr;
    g_token = 0;
}

} // namespace voxbridge
