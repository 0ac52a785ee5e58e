#include "app.hpp"
#include "config.hpp"
#include <iostream>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <thread>
#include <chrono>

static voxbridge::App* g_app = nullptr;

void signal_handler(int signum) {
    std::cout << "\nReceived signal " << signum << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config PATH      Config file (default: ~/.voxbridge/config.json)\n"
              << "  -w, --worker CMD       Speech worker executable (default: voxbridge-worker)\n"
              << "  --worker-arg ARG       Extra worker argument (repeatable)\n"
              << "  -m, --model ID         Model id (default: parakeet-tdt-0.6b-v3)\n"
              << "  -d, --device-pref P    Inference device: auto, cpu, cuda (default: auto)\n"
              << "  -k, --keycode N        Hotkey keycode (default: Right Alt)\n"
              << "  --mode MODE            Hotkey mode: hold, toggle (default: hold)\n"
              << "  --no-paste             Don't auto-paste, just copy to clipboard\n"
              << "  --echo-worker          Mirror worker diagnostics to stderr\n"
              << "  -h, --help             Show this help\n"
              << "\nOne-shot commands (start the worker, run, exit):\n"
              << "  --list-devices         Print audio input devices\n"
              << "  --download-model       Install the configured model\n"
              << "  --purge-model          Delete the configured model from the cache\n"
              << "\nHotkey:\n"
              << "  Hold the configured key to record, release to transcribe and paste.\n"
              << "  In toggle mode press once to start and again to stop; double-tap cancels.\n"
              << "\nReplacement rules:\n"
              << "  Edit ~/.voxbridge/replacements.txt (created on first run).\n"
              << std::endl;
}

enum class Command {
    Run,
    ListDevices,
    DownloadModel,
    PurgeModel
};

static int run_command(voxbridge::App& app, Command command) {
    if (!app.wait_for_worker(30000)) {
        std::cerr << "Speech worker did not become ready" << std::endl;
        return 1;
    }

    switch (command) {
        case Command::ListDevices: {
            Json::Value devices = app.list_devices();
            for (const auto& device : devices) {
                std::cout << device.get("uid", "").asString() << "  "
                          << device.get("name", "").asString()
                          << (device.get("is_default", false).asBool() ? "  (default)" : "") << std::endl;
            }
            return 0;
        }
        case Command::DownloadModel: {
            voxbridge::ModelActionResult result = app.download_model();
            if (!result.success) return 1;

            // Progress arrives as notifications; wait for the worker's verdict
            voxbridge::ModelState state = app.model_status().state;
            while (!app.quitting() && state != voxbridge::ModelState::Ready &&
                   state != voxbridge::ModelState::Error) {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
                state = app.model_status().state;
            }
            std::cout << "Model " << voxbridge::model_state_name(state) << std::endl;
            return state == voxbridge::ModelState::Ready ? 0 : 1;
        }
        case Command::PurgeModel: {
            voxbridge::ModelActionResult result = app.purge_model();
            return result.success ? 0 : 1;
        }
        case Command::Run:
            break;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    voxbridge::Config config;
    Command command = Command::Run;

    // Config file first so flags can override it
    std::string config_path = voxbridge::default_config_path();
    for (int i = 1; i < argc; ++i) {
        if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[i + 1];
        }
    }
    std::string error;
    if (!voxbridge::load_config_file(config_path, config, &error)) {
        std::cerr << "Ignoring config file " << config_path << ": " << error << std::endl;
    }

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            ++i;
        }
        else if ((strcmp(argv[i], "-w") == 0 || strcmp(argv[i], "--worker") == 0) && i + 1 < argc) {
            config.worker.command = argv[++i];
        }
        else if (strcmp(argv[i], "--worker-arg") == 0 && i + 1 < argc) {
            config.worker.args.push_back(argv[++i]);
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model") == 0) && i + 1 < argc) {
            config.model.model_id = argv[++i];
        }
        else if ((strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--device-pref") == 0) && i + 1 < argc) {
            config.model.device_pref = argv[++i];
        }
        else if ((strcmp(argv[i], "-k") == 0 || strcmp(argv[i], "--keycode") == 0) && i + 1 < argc) {
            config.hotkey.keycode = static_cast<uint32_t>(std::atoi(argv[++i]));
        }
        else if (strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            const char* mode = argv[++i];
            if (!voxbridge::parse_hotkey_mode(mode, config.hotkey.mode)) {
                std::cerr << "Unknown hotkey mode: " << mode << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        else if (strcmp(argv[i], "--no-paste") == 0) {
            config.injection.auto_paste = false;
        }
        else if (strcmp(argv[i], "--echo-worker") == 0) {
            config.worker.echo_stderr = true;
        }
        else if (strcmp(argv[i], "--list-devices") == 0) {
            command = Command::ListDevices;
        }
        else if (strcmp(argv[i], "--download-model") == 0) {
            command = Command::DownloadModel;
        }
        else if (strcmp(argv[i], "--purge-model") == 0) {
            command = Command::PurgeModel;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }
    if (command != Command::Run) {
        config.model.auto_initialize = false;
    }

    // Setup signal handlers; a dead worker pipe must not kill us
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    voxbridge::App app;
    g_app = &app;

    std::cout << "voxbridge - Voice to Text\n" << std::endl;
    std::cout << "Worker: " << config.worker.command << std::endl;
    std::cout << "Model: " << config.model.model_id << " (" << config.model.device_pref << ")" << std::endl;
    std::cout << "Hotkey mode: " << voxbridge::hotkey_mode_name(config.hotkey.mode) << std::endl;
    std::cout << "Auto-paste: " << (config.injection.auto_paste ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    if (!app.initialize(config)) {
        std::cerr << "Failed to initialize application" << std::endl;
        g_app = nullptr;
        return 1;
    }

    int result = command == Command::Run ? app.run() : run_command(app, command);

    app.shutdown();
    g_app = nullptr;
    return result;
}
