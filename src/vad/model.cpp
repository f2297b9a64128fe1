#include "voice_gateway/vad/model.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include "voice_gateway/logging.hpp"

#ifdef VOICEGW_HAS_ONNX
#include <onnxruntime_cxx_api.h>
#endif

namespace voice_gateway {
namespace vad {

namespace {

// Silero expects 512 samples per window at 16 kHz and 256 at 8 kHz.
size_t window_for_rate(int sampling_rate) {
    if (sampling_rate == 16000) {
        return 512;
    }
    if (sampling_rate == 8000) {
        return 256;
    }
    throw std::runtime_error("VAD supports 8000 or 16000 Hz, got " +
                             std::to_string(sampling_rate));
}

}

#ifdef VOICEGW_HAS_ONNX

namespace {

Ort::Env& ort_env() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "voice_gateway_vad");
    return env;
}

std::vector<std::string> node_names(const Ort::Session& session, bool inputs) {
    Ort::AllocatorWithDefaultOptions allocator;
    const size_t count = inputs ? session.GetInputCount() : session.GetOutputCount();
    std::vector<std::string> names;
    names.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto name = inputs ? session.GetInputNameAllocated(i, allocator)
                           : session.GetOutputNameAllocated(i, allocator);
        names.emplace_back(name ? name.get() : "");
    }
    return names;
}

bool contains(const std::vector<std::string>& names, const char* needle) {
    return std::find(names.begin(), names.end(), needle) != names.end();
}

Ort::SessionOptions session_options() {
    Ort::SessionOptions options;
    options.SetIntraOpNumThreads(1);
    options.SetInterOpNumThreads(1);
    return options;
}

}

struct SileroVadModel::Impl {
    Ort::Session session;
    int sampling_rate;
    size_t window;
    bool takes_sample_rate;
    bool takes_state;
    bool returns_state;

    Impl(const std::filesystem::path& model_path, int sampling_rate_in)
        : session(ort_env(), model_path.string().c_str(), session_options()),
          sampling_rate(sampling_rate_in),
          window(window_for_rate(sampling_rate_in)) {
        const auto inputs = node_names(session, true);
        const auto outputs = node_names(session, false);
        if (!contains(inputs, "input") || !contains(outputs, "output")) {
            throw std::runtime_error("VAD model lacks 'input'/'output' nodes");
        }
        takes_sample_rate = contains(inputs, "sr");
        takes_state = contains(inputs, "state");
        returns_state = contains(outputs, "stateN");
    }
};

SileroVadModel::SileroVadModel(const std::filesystem::path& model_path, int sampling_rate)
    : impl_(std::make_unique<Impl>(model_path, sampling_rate)) {}

SileroVadModel::~SileroVadModel() = default;

int SileroVadModel::sampling_rate() const {
    return impl_->sampling_rate;
}

size_t SileroVadModel::window_size() const {
    return impl_->window;
}

std::vector<float> SileroVadModel::initialize_state() const {
    if (!impl_->takes_state) {
        return {};
    }
    return std::vector<float>(2 * 1 * 128, 0.0f);
}

float SileroVadModel::get_speech_prob(const std::vector<float>& audio,
                                      std::vector<float>* state) const {
    if (audio.empty()) {
        return 0.0f;
    }

    auto mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    std::vector<const char*> input_names{"input"};
    std::vector<Ort::Value> inputs;
    inputs.reserve(3);

    std::array<int64_t, 2> audio_shape{1, static_cast<int64_t>(audio.size())};
    inputs.emplace_back(Ort::Value::CreateTensor<float>(
        mem_info, const_cast<float*>(audio.data()), audio.size(),
        audio_shape.data(), audio_shape.size()));

    std::array<int64_t, 1> rate_shape{1};
    std::array<int64_t, 1> rate_value{impl_->sampling_rate};
    if (impl_->takes_sample_rate) {
        input_names.push_back("sr");
        inputs.emplace_back(Ort::Value::CreateTensor<int64_t>(
            mem_info, rate_value.data(), rate_value.size(),
            rate_shape.data(), rate_shape.size()));
    }

    std::array<int64_t, 3> state_shape{2, 1, 128};
    std::vector<float> current_state;
    if (impl_->takes_state) {
        current_state = (state && !state->empty()) ? *state : initialize_state();
        input_names.push_back("state");
        inputs.emplace_back(Ort::Value::CreateTensor<float>(
            mem_info, current_state.data(), current_state.size(),
            state_shape.data(), state_shape.size()));
    }

    std::vector<const char*> output_names{"output"};
    if (impl_->returns_state) {
        output_names.push_back("stateN");
    }

    auto outputs = impl_->session.Run(Ort::RunOptions{nullptr},
                                      input_names.data(), inputs.data(), inputs.size(),
                                      output_names.data(), output_names.size());

    float prob = 0.0f;
    if (!outputs.empty() && outputs[0].IsTensor()) {
        const auto* data = outputs[0].GetTensorData<float>();
        prob = data ? data[0] : 0.0f;
    }
    if (state && impl_->returns_state && outputs.size() > 1 && outputs[1].IsTensor()) {
        const auto* data = outputs[1].GetTensorData<float>();
        const auto count = outputs[1].GetTensorTypeAndShapeInfo().GetElementCount();
        if (data && count > 0) {
            state->assign(data, data + count);
        }
    }
    return prob;
}

#else

struct SileroVadModel::Impl {
    int sampling_rate = 16000;
};

SileroVadModel::SileroVadModel(const std::filesystem::path&, int) {
    throw std::runtime_error("ONNX Runtime not enabled");
}

SileroVadModel::~SileroVadModel() = default;

int SileroVadModel::sampling_rate() const {
    return impl_ ? impl_->sampling_rate : 0;
}

size_t SileroVadModel::window_size() const {
    return window_for_rate(sampling_rate());
}

std::vector<float> SileroVadModel::initialize_state() const {
    return {};
}

float SileroVadModel::get_speech_prob(const std::vector<float>&, std::vector<float>*) const {
    return 0.0f;
}

#endif

std::shared_ptr<SpeechModel> load_speech_model(const std::filesystem::path& model_path,
                                               int sampling_rate) {
    if (model_path.empty()) {
        return nullptr;
    }
    try {
        auto model = std::make_shared<SileroVadModel>(model_path, sampling_rate);
        logging::info("VAD model loaded",
                      {kv("path", model_path.string()), kv("sample_rate", sampling_rate)});
        return model;
    } catch (const std::exception& ex) {
        logging::warn("VAD model unavailable, relying on recognition speech events",
                      {kv("path", model_path.string()), kv("error", ex.what())});
        return nullptr;
    }
}

}
}
