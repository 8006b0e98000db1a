#ifndef RESAMPLE_OPENCL_H
#define RESAMPLE_OPENCL_H

#include <CL/cl.h>
#include <string>
#include "image.h"

// OpenCL objects shared by every GPU resample of a run
struct OpenCLResources {
    cl_context context = nullptr;
    cl_command_queue queue = nullptr;
    cl_device_id device = nullptr;
    cl_program program = nullptr;
    bool ready = false;
};

// Pick the first platform/device, create a profiling queue and build the
// resample kernels from kernelPath. Returns false (and releases anything
// created) when any step fails.
bool initializeOpenCL(OpenCLResources& cl, const std::string& kernelPath);

void releaseOpenCL(OpenCLResources& cl);

// Lanczos resize on the device. Returns false on any OpenCL error.
bool resizeLanczosGPU(const OpenCLResources& cl, const Image& src, int dstWidth, int dstHeight, Image& out);

// GPU when cl is ready, CPU otherwise or when the GPU path fails
Image resizeImage(const Image& src, int dstWidth, int dstHeight, const OpenCLResources* cl);

#endif // RESAMPLE_OPENCL_H
