#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include "glyph_icon.h"
#include "image.h"
#include "resample_opencl.h"

#ifndef VAULTY_KERNEL_DIR
#define VAULTY_KERNEL_DIR "src/kernels"
#endif

// Structure to track execution timing
struct ExecutionTiming {
    double setupTime = 0;
    double generateTime = 0;
    double verifyTime = 0;
    double totalTime = 0;
};

// Function to display profiling information
void displayProfilingInfo(const ExecutionTiming& timing) {
    std::cout << "\n===== Profiling Information =====" << std::endl;
    std::cout << std::fixed << std::setprecision(6);
    std::cout << "OpenCL setup:          " << timing.setupTime << " seconds" << std::endl;
    std::cout << "Render and write:      " << timing.generateTime << " seconds" << std::endl;
    std::cout << "Verify:                " << timing.verifyTime << " seconds" << std::endl;
    std::cout << "--------------------------------" << std::endl;
    std::cout << "Total execution time:  " << timing.totalTime << " seconds" << std::endl;
    std::cout << "=================================" << std::endl;
}

static void printUsage(const char* program) {
    std::cout << "Usage: " << program
              << " [-p|--parallel|-s|--serial] [--cpu] [--verify] [all|favicon|icons] [output_root]" << std::endl;
}

int main(int argc, char* argv[]) {
    ExecutionTiming timing;
    auto start_total = std::chrono::high_resolution_clock::now();

    bool use_opencl = true;
    bool verify = false;
    std::string target = "all";
    std::string output_root = ".";

    // Options first, then up to two positional arguments
    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-p" || arg == "--parallel") {
            useOpenMP = true;
            std::cout << "Running in parallel mode with OpenMP" << std::endl;
        } else if (arg == "-s" || arg == "--serial") {
            useOpenMP = false;
        } else if (arg == "--cpu") {
            use_opencl = false;
        } else if (arg == "--verify") {
            verify = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cout << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() > 0) target = positional[0];
    if (positional.size() > 1) output_root = positional[1];

    std::vector<GlyphIconConfig> configs;
    if (target == "all" || target == "favicon") configs.push_back(faviconConfig());
    if (target == "all" || target == "icons") configs.push_back(extensionIconConfig());
    if (configs.empty()) {
        std::cerr << "Unknown target: " << target << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    OpenCLResources gpu;
    auto start = std::chrono::high_resolution_clock::now();
    if (use_opencl) {
        std::string kernel_path = std::string(VAULTY_KERNEL_DIR) + "/resample_kernel.cl";
        if (!initializeOpenCL(gpu, kernel_path)) {
            std::cout << "Using CPU algorithm..." << std::endl;
        }
    } else {
        std::cout << "Using CPU algorithm..." << std::endl;
    }
    auto end = std::chrono::high_resolution_clock::now();
    timing.setupTime = std::chrono::duration<double>(end - start).count();

    int status = 0;
    start = std::chrono::high_resolution_clock::now();
    for (const GlyphIconConfig& config : configs) {
        if (!generateGlyphIcons(config, output_root, &gpu)) {
            std::cerr << "Error: failed to generate " << config.name << std::endl;
            status = 1;
            break;
        }
    }
    end = std::chrono::high_resolution_clock::now();
    timing.generateTime = std::chrono::duration<double>(end - start).count();

    if (status == 0 && verify) {
        start = std::chrono::high_resolution_clock::now();
        for (const GlyphIconConfig& config : configs) {
            if (!verifyGlyphIcons(config, output_root)) {
                std::cerr << "Error: verification failed for " << config.name << std::endl;
                status = 1;
                break;
            }
        }
        end = std::chrono::high_resolution_clock::now();
        timing.verifyTime = std::chrono::duration<double>(end - start).count();
    }

    releaseOpenCL(gpu);

    auto end_total = std::chrono::high_resolution_clock::now();
    timing.totalTime = std::chrono::duration<double>(end_total - start_total).count();
    displayProfilingInfo(timing);

    return status;
}
