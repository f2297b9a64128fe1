#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace voice_gateway {
namespace vad {

// Per-window speech probability. Implementations are shared between
// sessions; the recurrent state lives with the caller.
class SpeechModel {
public:
    virtual ~SpeechModel() = default;

    virtual int sampling_rate() const = 0;
    virtual size_t window_size() const = 0;
    virtual std::vector<float> initialize_state() const = 0;
    virtual float get_speech_prob(const std::vector<float>& audio,
                                  std::vector<float>* state) const = 0;
};

// Silero VAD exported to ONNX. Only available when built with ONNX Runtime;
// otherwise the constructor throws.
class SileroVadModel : public SpeechModel {
public:
    SileroVadModel(const std::filesystem::path& model_path, int sampling_rate);
    ~SileroVadModel() override;

    int sampling_rate() const override;
    size_t window_size() const override;
    std::vector<float> initialize_state() const override;
    float get_speech_prob(const std::vector<float>& audio,
                          std::vector<float>* state) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Loads the configured model, or returns nullptr when none is configured or
// it cannot be loaded. Failures are logged.
std::shared_ptr<SpeechModel> load_speech_model(const std::filesystem::path& model_path,
                                               int sampling_rate);

}
}
