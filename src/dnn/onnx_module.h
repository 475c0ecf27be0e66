#pragma once

#include <onnxruntime_cxx_api.h>
#include <memory>
#include <mutex>
#include <vector>
#include <string>

// Single-input, single-output ONNX Runtime session.
class OnnxNet {
    public:
        OnnxNet(Ort::Env& env, const std::string& model_path);
        // Runs the model on a float tensor and returns the first output,
        // flattened.
        std::vector<float> forward(std::vector<float>& input, const std::vector<int64_t>& input_shape);

    private:
        Ort::SessionOptions session_options;
        std::unique_ptr<Ort::Session> session;
        Ort::MemoryInfo memory_info;
        std::vector<Ort::AllocatedStringPtr> input_names_ptrs;
        std::vector<Ort::AllocatedStringPtr> output_names_ptrs;
        std::vector<const char*> input_names;
        std::vector<const char*> output_names;
        std::mutex run_mutex;
};
