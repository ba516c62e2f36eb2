/**
 * @file main.cpp
 * @brief Markoshka - motivational phrase display, main entry point
 *
 * Shows short Russian phrases from a catalogue on a 20x2 character display
 * (serial VFD, I2C LCD or the terminal), with a mode button, a weather
 * button and an optional weather screen.
 *
 * Usage:
 *   markoshka [config.json]
 */

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include <curl/curl.h>

#include "common/clock.h"
#include "common/http_utils.h"
#include "config/config_manager.h"
#include "content/mode_controller.h"
#include "content/overlay_scheduler.h"
#include "content/phrase_catalogue.h"
#include "content/phrase_sequencer.h"
#include "debug/log_system.h"
#include "display/display_factory.h"
#include "input/button_manager.h"
#include "input/console_input.h"
#include "loop/loop_handlers.h"
#include "weather/weather_client.h"

// Version - set by the build
#ifndef MARKOSHKA_VERSION
#define MARKOSHKA_VERSION "0.0.0-dev"
#endif

static const char* TAG = "MAIN";

static std::atomic<bool> g_running(true);

// Signal handler for graceful shutdown
static void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

static void installSignalHandlers() {
    struct sigaction action;
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

static bool loadCatalogue(const ConfigManager& config, PhraseCatalogue* catalogue) {
    const std::string path = config.getCataloguePath();
    if (path.empty()) {
        *catalogue = defaultCatalogue();
        if (catalogue->empty()) {
            return false;
        }
        MK_LOGI(TAG, "Using built-in catalogue");
    } else {
        std::string error;
        if (!PhraseCatalogue::loadFromFile(path, catalogue, &error)) {
            MK_LOGE(TAG, "Catalogue %s rejected: %s", path.c_str(), error.c_str());
            return false;
        }
        MK_LOGI(TAG, "Loaded catalogue %s", path.c_str());
    }

    MK_LOGI(TAG, "%zu categories, %zu phrases",
            catalogue->size(), catalogue->totalPhraseCount());
    return true;
}

// Curl global state for the lifetime of main()
class CurlGlobal {
public:
    CurlGlobal() : _ok(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}
    ~CurlGlobal() {
        if (_ok) curl_global_cleanup();
    }
    bool ok() const { return _ok; }

private:
    bool _ok;
};

int main(int argc, char* argv[]) {
    log_system_init();

    printf("\n");
    printf("===========================================\n");
    printf("  Markoshka - 20x2 phrase display\n");
    printf("  Version: %s\n", MARKOSHKA_VERSION);
    printf("===========================================\n\n");
    fflush(stdout);

    // =========================================================================
    // Configuration
    // =========================================================================

    ConfigManager config;
    if (!config.begin(argc > 1 ? argv[1] : nullptr)) {
        MK_LOGE(TAG, "Configuration error, exiting");
        return 1;
    }

    LogLevel level = LOG_LEVEL_INFO;
    if (log_system_parse_level(config.getLogLevel().c_str(), &level)) {
        log_system_set_level(level);
    }
    MK_LOGD(TAG, "Config: %s", config.exportConfig().c_str());

    PhraseCatalogue catalogue;
    if (!loadCatalogue(config, &catalogue)) {
        MK_LOGE(TAG, "Catalogue error, exiting");
        return 1;
    }

    installSignalHandlers();

    CurlGlobal curl;
    if (!curl.ok()) {
        MK_LOGW(TAG, "curl_global_init failed, weather requests will fail");
    }

    // =========================================================================
    // Collaborators
    // =========================================================================

    SteadyClock clock;

    DisplayFactory factory;
    std::unique_ptr<DisplayDriver> display = factory.create(config.getDisplaySettings());

    PhraseSequencer sequencer(catalogue);
    OverlayScheduler overlay(config.getOverlayMs());
    ModeController modes(sequencer, overlay);

    CurlTransport transport;
    WeatherClient weather(transport, clock, config.getWeatherConfig());

    ButtonManager modeButton(
        config.getModeButtonConfig(),
        [&modes]() { modes.post(UserIntent::SHORT_PRESS); },
        [&modes]() { modes.post(UserIntent::LONG_PRESS); });
    ButtonManager weatherButton(
        config.getWeatherButtonConfig(),
        [&modes]() { modes.post(UserIntent::WEATHER_PRESS); },
        [&modes]() { modes.post(UserIntent::WEATHER_LONG_PRESS); });

    if (!modeButton.begin()) {
        MK_LOGW(TAG, "Mode button unavailable");
    }
    if (!weatherButton.begin()) {
        MK_LOGW(TAG, "Weather button unavailable");
    }

    ConsoleInput console(
        [&modes](UserIntent intent) { modes.post(intent); },
        []() { g_running = false; });
    if (config.getConsoleInput() && !console.begin()) {
        MK_LOGW(TAG, "Console input unavailable");
    }

    // =========================================================================
    // Loading screen and main loop
    // =========================================================================

    LoopContext ctx;
    ctx.clock = &clock;
    ctx.display = display.get();
    ctx.sequencer = &sequencer;
    ctx.modes = &modes;
    ctx.overlay = &overlay;
    ctx.weather = &weather;
    ctx.running = &g_running;
    ctx.timing.refresh_interval_ms = config.getRefreshIntervalMs();
    ctx.timing.poll_interval_ms = config.getPollIntervalMs();
    ctx.timing.category_hold_ms = config.getCategoryHoldMs();
    ctx.timing.scroll_delay_ms = config.getScrollDelayMs();

    const bool clean = runDisplaySession(ctx, MARKOSHKA_VERSION);

    // =========================================================================
    // Shutdown
    // =========================================================================

    MK_LOGI(TAG, "Shutting down");
    console.close();
    weatherButton.close();
    modeButton.close();
    display->write(frameFromLines("", ""));

    return clean ? 0 : 1;
}
