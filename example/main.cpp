// example/main.cpp
// Score a converted model from the command line
//
// Usage:
//   sk_wrap_example <transformer|regressor|classifier|anomaly> <model> [options]
//
//   <model> ending in .onnx runs on ONNX Runtime; anything else is read as a
//   frozen TensorFlow GraphDef and needs --input / --output endpoint names.
//
// Options:
//   --input NAME     graph input endpoint, repeatable (GraphDef only)
//   --output NAME    graph output endpoint, repeatable (GraphDef only)
//   --rows N         rows of generated input (default 4)
//   --cols N         columns of generated input (default 1)
//   --threads N      intra-op threads
//   --batch N        rows per scoring partition
//   --device NAME    cpu, cuda or cuda:<N>
//   --offset X       score offset for anomaly detectors
//   --shift X        decision-function shift for anomaly detectors
//
// The input is a generated rows x cols float matrix; each mode's operations
// are run on it and printed.

#include "sk_wrap/all.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace {

struct Options {
    sk_wrap::TaskMode mode{sk_wrap::TaskMode::Classifier};
    std::string model_path;
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
    std::int64_t rows{4};
    std::int64_t cols{1};
    sk_wrap::ExecutionResourceConfig resources;
    sk_wrap::ExtraConfig extra;
};

sk_wrap::TaskMode parse_mode(std::string_view s) {
    if (s == "transformer") return sk_wrap::TaskMode::Transformer;
    if (s == "regressor") return sk_wrap::TaskMode::Regressor;
    if (s == "classifier") return sk_wrap::TaskMode::Classifier;
    if (s == "anomaly") return sk_wrap::TaskMode::AnomalyDetector;
    throw sk_wrap::Error::Wrapper(sk_wrap::ErrorCode::InvalidArgument, "sk_wrap_example",
        "unknown mode", s);
}

Options parse_args(int argc, char** argv) {
    if (argc < 3) {
        throw sk_wrap::Error::Wrapper(sk_wrap::ErrorCode::InvalidArgument, "sk_wrap_example",
            "usage: sk_wrap_example <transformer|regressor|classifier|anomaly> <model> [options]");
    }

    Options opt;
    opt.mode = parse_mode(argv[1]);
    opt.model_path = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string_view flag = argv[i];
        if (i + 1 >= argc) {
            throw sk_wrap::Error::Wrapper(sk_wrap::ErrorCode::InvalidArgument, "sk_wrap_example",
                "option needs a value", flag);
        }
        const std::string value = argv[++i];

        if (flag == "--input") opt.inputs.push_back(value);
        else if (flag == "--output") opt.outputs.push_back(value);
        else if (flag == "--rows") opt.rows = std::stoll(value);
        else if (flag == "--cols") opt.cols = std::stoll(value);
        else if (flag == "--threads") opt.resources.thread_count = std::stoi(value);
        else if (flag == "--batch") opt.resources.batch_size = std::stoll(value);
        else if (flag == "--device") opt.resources.device = value;
        else if (flag == "--offset") opt.extra.set(std::string(sk_wrap::keys::kOffset), std::stod(value));
        else if (flag == "--shift") opt.extra.set(std::string(sk_wrap::keys::kIForestThreshold), std::stod(value));
        else {
            throw sk_wrap::Error::Wrapper(sk_wrap::ErrorCode::InvalidArgument, "sk_wrap_example",
                "unknown option", flag);
        }
    }
    return opt;
}

std::vector<std::uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw sk_wrap::Error::Wrapper(sk_wrap::ErrorCode::InvalidArgument, "sk_wrap_example",
            "cannot open model file", path);
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

sk_wrap::ModelArtifact load_artifact(const Options& opt) {
    std::vector<std::uint8_t> bytes = read_file(opt.model_path);
    if (opt.model_path.ends_with(".onnx")) {
        return sk_wrap::OnnxModel{std::move(bytes)};
    }
    return sk_wrap::TensorFlowGraphDef{std::move(bytes), opt.inputs, opt.outputs};
}

sk_wrap::Array generated_input(std::int64_t rows, std::int64_t cols) {
    std::vector<float> values(static_cast<std::size_t>(rows * cols));
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<float>(i) * 0.1f;
    }
    return sk_wrap::Array::FromVector<float>(std::vector<std::int64_t>{rows, cols}, std::move(values));
}

void print_array(std::string_view label, const sk_wrap::Array& a) {
    std::cout << label << " [" << a.dtype_name() << "; ";
    for (std::size_t i = 0; i < a.shape().size(); ++i) {
        std::cout << (i ? " x " : "") << a.shape()[i];
    }
    std::cout << "]:";

    const std::vector<double> values = a.to_vector<double>();
    const std::size_t shown = std::min<std::size_t>(values.size(), 10);
    for (std::size_t i = 0; i < shown; ++i) std::cout << ' ' << values[i];
    if (shown < values.size()) std::cout << " ...";
    std::cout << '\n';
}

} // namespace

int main(int argc, char** argv) {
    try {
        const Options opt = parse_args(argc, argv);
        sk_wrap::AnyContainer container =
            sk_wrap::make_container(opt.mode, load_artifact(opt), opt.resources, opt.extra);

        std::cout << "model: " << opt.model_path
                  << " (" << sk_wrap::task_mode_name(opt.mode) << ")\n";

        const sk_wrap::Array x = generated_input(opt.rows, opt.cols);
        print_array("input", x);

        std::visit([&](const auto& c) {
            using C = std::decay_t<decltype(c)>;
            if constexpr (C::mode == sk_wrap::TaskMode::Transformer) {
                print_array("transform", c.transform(x));
            } else {
                print_array("predict", c.predict(x));
                if constexpr (C::mode == sk_wrap::TaskMode::Classifier) {
                    print_array("predict_proba", c.predict_proba(x));
                }
                if constexpr (C::mode == sk_wrap::TaskMode::AnomalyDetector) {
                    print_array("decision_function", c.decision_function(x));
                    if (c.extra_config().contains(sk_wrap::keys::kOffset)) {
                        print_array("score_samples", c.score_samples(x));
                    }
                }
            }
        }, container);
        return 0;

    } catch (const sk_wrap::Error& e) {
        std::cerr << "error (" << e.code_name() << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "fatal error: " << e.what() << "\n";
        return 1;
    }
}
