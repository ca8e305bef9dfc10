// main.cpp
//
// StepFlow command line driver. Parses CLI (CLI11), loads the JSON model,
// compiles it and either:
// - prints the compiled plan/buffer descriptor (--describe)
// - runs the simulation and reports or writes probe data (--out)
// - runs a compute-only benchmark writing NDJSON perf lines (--bench)
#include "StepFlowSimulator.hpp"
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

static nlohmann::json loadModelJson(const std::string& path) {
    // Also look one and two levels up so the binary can run from a build dir
    for (const std::string prefix : {"", "../", "../../"}) {
        std::ifstream f(prefix + path);
        if (f.good()) {
            nlohmann::json json;
            f >> json;
            return json;
        }
    }
    throw std::runtime_error("Could not find model file: " + path);
}

static nlohmann::json probeDataJson(const StepFlow::Simulator& sim) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& probe : sim.model().probes) out[probe.name] = sim.data(probe.name);
    return out;
}

int main(int argc, char** argv) {
    std::string modelPath = "models/lowpass.json";
    int steps = 1000;
    int stepBlocks = 0;            // 0 = unbounded
    bool unroll = false;
    std::string dtype = "float32";
    int batch = 1;
    std::string device = "cpu";
    unsigned seed = 0;
    double dt = 0.0;               // 0 = use the model's dt
    bool describe = false;
    std::string outPath;
    bool debug = false;
    bool bench = false;
    int benchDuration = 5;         // seconds
    std::string perfOut;           // NDJSON file

    CLI::App app{"StepFlow"};
    try {
        app.add_option("--model", modelPath, "Path to model JSON file");
        app.add_option("--steps", steps, "Number of simulation steps");
        app.add_option("--step-blocks", stepBlocks, "Steps per compiled run (0=unbounded)");
        app.add_flag("--unroll", unroll, "Replicate the step computation step-blocks times");
        app.add_option("--dtype", dtype, "Float element type: float32|float64");
        app.add_option("--batch", batch, "Minibatch size");
        app.add_option("--device", device, "Device the graph is compiled for");
        app.add_option("--seed", seed, "Seed for the compile-time random state");
        app.add_option("--dt", dt, "Timestep override in seconds (0=model dt)");
        app.add_flag("--describe", describe, "Print the compiled plan and buffer layout as JSON");
        app.add_option("--out", outPath, "Write probe data as JSON to file");
        app.add_flag("--debug", debug, "Verbose compile/run diagnostics");
        // Bench/perf
        app.add_flag("--bench", bench, "Compute-only benchmark");
        app.add_option("--bench-duration", benchDuration, "Benchmark duration seconds");
        app.add_option("--perf-out", perfOut, "Write NDJSON perf summaries to file");
        app.allow_extras(false);
        app.set_config("--config");
        app.set_help_all_flag("--help-all", "Show all help");
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    try {
        if (debug) StepFlow::setDebug(true);

        StepFlow::Model model = StepFlow::Model::fromJson(loadModelJson(modelPath));
        StepFlow::CompileOptions options;
        if (dt > 0.0) options.dt = dt;
        if (stepBlocks > 0) options.stepBlocks = stepBlocks;
        options.unroll = unroll;
        options.dtype = StepFlow::parseElementType(dtype);
        options.batchSize = batch;
        options.device = device;
        options.seed = seed;

        StepFlow::Simulator sim(std::move(model), options);

        if (describe) {
            fmt::print("{}\n", sim.graph().describe().dump(2));
            return 0;
        }

        if (bench) {
            using clk = std::chrono::steady_clock;
            using namespace std::chrono;
            std::FILE* fp = perfOut.empty() ? nullptr : std::fopen(perfOut.c_str(), "w");
            if (!perfOut.empty() && !fp) throw std::runtime_error("Could not open perf output: " + perfOut);
            const int chunk = stepBlocks > 0 ? stepBlocks : steps;
            const auto endAt = clk::now() + seconds(benchDuration);
            unsigned long long runs = 0, stepsRun = 0, nsAccum = 0, nsMin = ~0ull, nsMax = 0;
            while (clk::now() < endAt) {
                auto t0 = clk::now();
                sim.runSteps(chunk);
                auto ns = static_cast<unsigned long long>(duration_cast<nanoseconds>(clk::now() - t0).count());
                ++runs; stepsRun += chunk; nsAccum += ns;
                if (ns < nsMin) nsMin = ns;
                if (ns > nsMax) nsMax = ns;
                if (fp) {
                    std::fprintf(fp, "{\"type\":\"perf\",\"steps\":%d,\"runTimeNs\":%llu}\n", chunk, ns);
                }
                // Probe data grows without bound otherwise
                sim.reset();
            }
            if (fp) {
                std::fprintf(fp,
                    "{\"type\":\"summary\",\"runs\":%llu,\"steps\":%llu,\"runTimeNsAccum\":%llu,\"runTimeNsMin\":%llu,\"runTimeNsMax\":%llu}\n",
                    runs, stepsRun, nsAccum, runs ? nsMin : 0ull, nsMax);
                std::fclose(fp);
            }
            double nsPerStep = stepsRun ? static_cast<double>(nsAccum) / stepsRun : 0.0;
            fmt::print("bench: {} runs, {} steps, {:.1f} ns/step\n", runs, stepsRun, nsPerStep);
            return 0;
        }

        auto t0 = std::chrono::steady_clock::now();
        sim.runSteps(steps);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        fmt::print("StepFlow ran {} steps of '{}' in {} ms (t={:.4f}s, {} groups)\n", sim.step(), modelPath, ms,
                   sim.time(), sim.graph().plan().size());

        if (!outPath.empty()) {
            std::ofstream f(outPath);
            if (!f.good()) throw std::runtime_error("Could not open output file: " + outPath);
            f << probeDataJson(sim).dump(2) << "\n";
            fmt::print("Probe data written to {}\n", outPath);
        } else {
            for (const auto& probe : sim.model().probes) {
                const auto& rows = sim.data(probe.name);
                if (rows.empty()) continue;
                fmt::print("  {}: last = [", probe.name);
                for (size_t i = 0; i < rows.back().size(); ++i) {
                    fmt::print("{}{:.4g}", i ? ", " : "", rows.back()[i]);
                }
                fmt::print("]\n");
            }
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
    return 0;
}
