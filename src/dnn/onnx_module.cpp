#include "onnx_module.h"

#include <stdexcept>

namespace {

void get_node_names(
    Ort::Session& session,
    bool is_input,
    std::vector<Ort::AllocatedStringPtr>& names_ptrs,
    std::vector<const char*>& names
) {
    Ort::AllocatorWithDefaultOptions allocator;
    size_t num_nodes = is_input ? session.GetInputCount() : session.GetOutputCount();

    for (size_t i = 0; i < num_nodes; i++) {
        auto name_ptr = is_input ?
            session.GetInputNameAllocated(i, allocator) :
            session.GetOutputNameAllocated(i, allocator);
        names_ptrs.push_back(std::move(name_ptr));
        names.push_back(names_ptrs.back().get());
    }
}

} // namespace

OnnxNet::OnnxNet(Ort::Env& env, const std::string& model_path)
    : memory_info(Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator, OrtMemType::OrtMemTypeDefault)) {
    try {
        session = std::make_unique<Ort::Session>(env, model_path.c_str(), session_options);
    } catch (const Ort::Exception& e) {
        throw std::runtime_error("Error loading model " + model_path + ": " + e.what());
    }

    get_node_names(*session, true, input_names_ptrs, input_names);
    get_node_names(*session, false, output_names_ptrs, output_names);
    if (input_names.size() != 1 || output_names.empty()) {
        throw std::runtime_error("Unexpected model signature: " + model_path);
    }
}

std::vector<float> OnnxNet::forward(std::vector<float>& input, const std::vector<int64_t>& input_shape) {
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        memory_info,
        input.data(),
        input.size(),
        input_shape.data(),
        input_shape.size()
    );

    std::vector<Ort::Value> outputs;
    {
        std::lock_guard<std::mutex> lock(run_mutex);
        outputs = session->Run(
            Ort::RunOptions{nullptr},
            input_names.data(),
            &input_tensor,
            1,
            output_names.data(),
            1
        );
    }

    size_t count = outputs[0].GetTensorTypeAndShapeInfo().GetElementCount();
    const float* data = outputs[0].GetTensorData<float>();
    return std::vector<float>(data, data + count);
}
