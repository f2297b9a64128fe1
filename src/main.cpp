#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

#include "voice_gateway/backend/http_synthesis_client.hpp"
#include "voice_gateway/backend/langgraph_backend.hpp"
#include "voice_gateway/backend/ws_recognition_client.hpp"
#include "voice_gateway/config.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/server/rest_server.hpp"
#include "voice_gateway/session/session_manager.hpp"
#include "voice_gateway/sip/app.hpp"
#include "voice_gateway/vad/model.hpp"

namespace {

std::atomic<bool> g_stop{false};
std::atomic<voice_gateway::SipApp*> g_sip_app{nullptr};

void handle_signal(int) {
    g_stop = true;
    if (auto* app = g_sip_app.load()) {
        app->request_stop();
    }
}

voice_gateway::PipelineServices make_services(const voice_gateway::Config& config) {
    using namespace voice_gateway;
    const std::chrono::milliseconds acquire_timeout(config.pool_acquire_timeout_ms);

    PipelineServices services;
    WsRecognitionClient::Options recognition_options;
    recognition_options.base_url = config.recognition_url;
    services.recognition_pool = std::make_shared<RecognitionPool>(
        "recognition", static_cast<size_t>(config.recognition_pool_size), acquire_timeout,
        [recognition_options]() -> std::unique_ptr<RecognitionClient> {
            return std::make_unique<WsRecognitionClient>(recognition_options);
        });

    HttpSynthesisClient::Options synthesis_options;
    synthesis_options.base_url = config.synthesis_url;
    synthesis_options.request.connect_timeout = std::chrono::milliseconds(
        static_cast<int64_t>(config.backend_connect_timeout * 1000.0));
    synthesis_options.request.read_timeout = std::chrono::milliseconds(
        static_cast<int64_t>(config.backend_read_timeout * 1000.0));
    synthesis_options.request.write_timeout = synthesis_options.request.read_timeout;
    services.synthesis_pool = std::make_shared<SynthesisPool>(
        "synthesis", static_cast<size_t>(config.synthesis_pool_size), acquire_timeout,
        [synthesis_options]() -> std::unique_ptr<SynthesisClient> {
            return std::make_unique<HttpSynthesisClient>(synthesis_options);
        });

    services.backend =
        std::make_shared<LangGraphBackend>(LangGraphBackend::Options::from_config(config));
    if (config.vad_model_path) {
        services.vad_model =
            vad::load_speech_model(*config.vad_model_path, config.audio_sample_rate);
    }
    return services;
}

}

int main() {
    using namespace voice_gateway;
    try {
        const auto config = Config::load();
        config.validate();
        logging::init(config);
        info("Starting voice-gateway",
             {kv("backend_url", config.backend_url),
              kv("recognition_url", config.recognition_url),
              kv("synthesis_url", config.synthesis_url),
              kv("rest_port", config.rest_api_port),
              kv("sip_enabled", config.sip_enabled),
              kv("interruptions_allowed", config.interruptions_are_allowed)});

        auto services = make_services(config);
        auto backend = std::dynamic_pointer_cast<LangGraphBackend>(services.backend);
        SessionManager sessions(SessionManager::Options::from_config(config),
                                PipelineSettings::from_config(config),
                                std::move(services));

        RestServer rest_server(config, sessions, [backend]() {
            return backend ? backend->list_assistants() : nlohmann::json::array();
        });
        rest_server.start();

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        if (config.sip_enabled) {
            SipApp app(config, sessions);
            app.init();
            g_sip_app = &app;
            if (!g_stop) {
                app.run();
            }
            g_sip_app = nullptr;
            info("Shutting down");
            sessions.shutdown();
            app.stop();
        } else {
            while (!g_stop) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            info("Shutting down");
            sessions.shutdown();
        }
        rest_server.stop();
    } catch (const std::exception& ex) {
        error("Startup failed", {kv("error", ex.what())});
        return 1;
    }
    return 0;
}
