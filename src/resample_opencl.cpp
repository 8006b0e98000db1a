#include "resample_opencl.h"

#include <fstream>
#include <iostream>
#include <vector>
#include "resample.h"

bool initializeOpenCL(OpenCLResources& cl, const std::string& kernelPath) {
    cl_int err;

    cl_uint numPlatforms;
    err = clGetPlatformIDs(0, NULL, &numPlatforms);
    if (err != CL_SUCCESS || numPlatforms == 0) {
        std::cerr << "No OpenCL platform found. Using CPU version." << std::endl;
        return false;
    }
    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), NULL);
    if (err != CL_SUCCESS) {
        std::cerr << "Error retrieving platforms. Using CPU version." << std::endl;
        return false;
    }
    cl_platform_id platform = platforms[0];

    cl_uint numDevices;
    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_ALL, 0, NULL, &numDevices);
    if (err != CL_SUCCESS || numDevices == 0) {
        std::cerr << "No OpenCL device found. Using CPU version." << std::endl;
        return false;
    }
    std::vector<cl_device_id> devices(numDevices);
    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_ALL, numDevices, devices.data(), NULL);
    if (err != CL_SUCCESS) {
        std::cerr << "Error retrieving devices. Using CPU version." << std::endl;
        return false;
    }
    cl.device = devices[0];

    char deviceName[256] = {0};
    clGetDeviceInfo(cl.device, CL_DEVICE_NAME, sizeof(deviceName) - 1, deviceName, NULL);
    std::cout << "OpenCL device: " << deviceName << std::endl;

    cl.context = clCreateContext(nullptr, 1, &cl.device, nullptr, nullptr, &err);
    if (err != CL_SUCCESS) {
        std::cerr << "Error creating context. Using CPU version." << std::endl;
        cl.context = nullptr;
        return false;
    }

    cl.queue = clCreateCommandQueue(cl.context, cl.device, CL_QUEUE_PROFILING_ENABLE, &err);
    if (err != CL_SUCCESS) {
        std::cerr << "Error creating command queue. Using CPU version." << std::endl;
        cl.queue = nullptr;
        releaseOpenCL(cl);
        return false;
    }

    std::ifstream kernelFile(kernelPath);
    if (!kernelFile.is_open()) {
        std::cerr << "Unable to open kernel file " << kernelPath << ". Using CPU version." << std::endl;
        releaseOpenCL(cl);
        return false;
    }
    std::string src((std::istreambuf_iterator<char>(kernelFile)), std::istreambuf_iterator<char>());
    const char* source = src.c_str();

    cl.program = clCreateProgramWithSource(cl.context, 1, &source, nullptr, &err);
    if (err != CL_SUCCESS) {
        std::cerr << "Error creating resample program. Using CPU version." << std::endl;
        cl.program = nullptr;
        releaseOpenCL(cl);
        return false;
    }

    err = clBuildProgram(cl.program, 1, &cl.device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        std::cerr << "Resample program compilation error." << std::endl;

        size_t logSize;
        clGetProgramBuildInfo(cl.program, cl.device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> buildLog(logSize + 1, '\0');
        clGetProgramBuildInfo(cl.program, cl.device, CL_PROGRAM_BUILD_LOG, logSize, buildLog.data(), nullptr);
        std::cerr << buildLog.data() << std::endl;

        releaseOpenCL(cl);
        return false;
    }

    std::cout << "OpenCL context, command queue and resample kernels ready." << std::endl;
    cl.ready = true;
    return true;
}

void releaseOpenCL(OpenCLResources& cl) {
    if (cl.program) clReleaseProgram(cl.program);
    if (cl.queue) clReleaseCommandQueue(cl.queue);
    if (cl.context) clReleaseContext(cl.context);
    cl.program = nullptr;
    cl.queue = nullptr;
    cl.context = nullptr;
    cl.ready = false;
}

static double eventMillis(cl_event event) {
    cl_ulong timeStart, timeEnd;
    clGetEventProfilingInfo(event, CL_PROFILING_COMMAND_START, sizeof(timeStart), &timeStart, NULL);
    clGetEventProfilingInfo(event, CL_PROFILING_COMMAND_END, sizeof(timeEnd), &timeEnd, NULL);
    return (timeEnd - timeStart) / 1000000.0;
}

bool resizeLanczosGPU(const OpenCLResources& cl, const Image& src, int dstWidth, int dstHeight, Image& out) {
    if (!cl.ready) return false;

    cl_int err;
    ResampleCoefficients horizontal = computeLanczosCoefficients(src.width, dstWidth);
    ResampleCoefficients vertical = computeLanczosCoefficients(src.height, dstHeight);
    std::vector<float> pixels = premultiply(src);

    size_t inputSize = pixels.size() * sizeof(float);
    size_t rowsSize = static_cast<size_t>(dstWidth) * src.height * 4 * sizeof(float);
    size_t outputSize = static_cast<size_t>(dstWidth) * dstHeight * 4 * sizeof(float);

    cl_kernel horizontalKernel = nullptr;
    cl_kernel verticalKernel = nullptr;
    std::vector<cl_mem> buffers;

    auto release = [&]() {
        for (cl_mem buffer : buffers) {
            if (buffer) clReleaseMemObject(buffer);
        }
        if (horizontalKernel) clReleaseKernel(horizontalKernel);
        if (verticalKernel) clReleaseKernel(verticalKernel);
    };

    horizontalKernel = clCreateKernel(cl.program, "resample_horizontal", &err);
    if (err != CL_SUCCESS) {
        std::cerr << "Error creating horizontal resample kernel." << std::endl;
        horizontalKernel = nullptr;
        release();
        return false;
    }
    verticalKernel = clCreateKernel(cl.program, "resample_vertical", &err);
    if (err != CL_SUCCESS) {
        std::cerr << "Error creating vertical resample kernel." << std::endl;
        verticalKernel = nullptr;
        release();
        return false;
    }

    cl_int bufferErr = CL_SUCCESS;
    auto createBuffer = [&](cl_mem_flags flags, size_t size, void* host) {
        cl_mem buffer = clCreateBuffer(cl.context, flags, size, host, &err);
        if (err != CL_SUCCESS) bufferErr = err;
        buffers.push_back(err == CL_SUCCESS ? buffer : nullptr);
        return buffer;
    };

    cl_mem inputBuffer = createBuffer(CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, inputSize, pixels.data());
    cl_mem rowsBuffer = createBuffer(CL_MEM_READ_WRITE, rowsSize, nullptr);
    cl_mem outputBuffer = createBuffer(CL_MEM_WRITE_ONLY, outputSize, nullptr);
    cl_mem hBounds = createBuffer(CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR,
                                  horizontal.bounds.size() * sizeof(int), horizontal.bounds.data());
    cl_mem hWeights = createBuffer(CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR,
                                   horizontal.weights.size() * sizeof(float), horizontal.weights.data());
    cl_mem vBounds = createBuffer(CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR,
                                  vertical.bounds.size() * sizeof(int), vertical.bounds.data());
    cl_mem vWeights = createBuffer(CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR,
                                   vertical.weights.size() * sizeof(float), vertical.weights.data());

    if (bufferErr != CL_SUCCESS) {
        std::cerr << "Error creating resample buffers." << std::endl;
        release();
        return false;
    }

    // Horizontal pass: src.width x src.height -> dstWidth x src.height
    int inWidth = src.width;
    int height = src.height;
    err  = clSetKernelArg(horizontalKernel, 0, sizeof(cl_mem), &inputBuffer);
    err |= clSetKernelArg(horizontalKernel, 1, sizeof(cl_mem), &rowsBuffer);
    err |= clSetKernelArg(horizontalKernel, 2, sizeof(cl_mem), &hBounds);
    err |= clSetKernelArg(horizontalKernel, 3, sizeof(cl_mem), &hWeights);
    err |= clSetKernelArg(horizontalKernel, 4, sizeof(int), &inWidth);
    err |= clSetKernelArg(horizontalKernel, 5, sizeof(int), &dstWidth);
    err |= clSetKernelArg(horizontalKernel, 6, sizeof(int), &height);
    err |= clSetKernelArg(horizontalKernel, 7, sizeof(int), &horizontal.kernelSize);
    if (err != CL_SUCCESS) {
        std::cerr << "Error setting horizontal resample kernel arguments." << std::endl;
        release();
        return false;
    }

    // Vertical pass: dstWidth x src.height -> dstWidth x dstHeight
    err  = clSetKernelArg(verticalKernel, 0, sizeof(cl_mem), &rowsBuffer);
    err |= clSetKernelArg(verticalKernel, 1, sizeof(cl_mem), &outputBuffer);
    err |= clSetKernelArg(verticalKernel, 2, sizeof(cl_mem), &vBounds);
    err |= clSetKernelArg(verticalKernel, 3, sizeof(cl_mem), &vWeights);
    err |= clSetKernelArg(verticalKernel, 4, sizeof(int), &dstWidth);
    err |= clSetKernelArg(verticalKernel, 5, sizeof(int), &height);
    err |= clSetKernelArg(verticalKernel, 6, sizeof(int), &dstHeight);
    err |= clSetKernelArg(verticalKernel, 7, sizeof(int), &vertical.kernelSize);
    if (err != CL_SUCCESS) {
        std::cerr << "Error setting vertical resample kernel arguments." << std::endl;
        release();
        return false;
    }

    cl_event horizontalEvent;
    cl_event verticalEvent;
    size_t horizontalSize[2] = { (size_t)dstWidth, (size_t)height };
    size_t verticalSize[2] = { (size_t)dstWidth, (size_t)dstHeight };

    err = clEnqueueNDRangeKernel(cl.queue, horizontalKernel, 2, nullptr, horizontalSize, nullptr, 0, nullptr, &horizontalEvent);
    if (err != CL_SUCCESS) {
        std::cerr << "Failed to execute horizontal resample kernel." << std::endl;
        release();
        return false;
    }
    err = clEnqueueNDRangeKernel(cl.queue, verticalKernel, 2, nullptr, verticalSize, nullptr, 1, &horizontalEvent, &verticalEvent);
    if (err != CL_SUCCESS) {
        std::cerr << "Failed to execute vertical resample kernel." << std::endl;
        clReleaseEvent(horizontalEvent);
        release();
        return false;
    }

    clFinish(cl.queue);
    std::cout << "Resample kernels " << src.width << "x" << src.height << " -> " << dstWidth << "x" << dstHeight
              << ": " << eventMillis(horizontalEvent) + eventMillis(verticalEvent) << " ms" << std::endl;
    clReleaseEvent(horizontalEvent);
    clReleaseEvent(verticalEvent);

    std::vector<float> resized(static_cast<size_t>(dstWidth) * dstHeight * 4);
    err = clEnqueueReadBuffer(cl.queue, outputBuffer, CL_TRUE, 0, outputSize, resized.data(), 0, nullptr, nullptr);
    release();
    if (err != CL_SUCCESS) {
        std::cerr << "Failed to read resample results." << std::endl;
        return false;
    }

    out = unpremultiply(resized, dstWidth, dstHeight);
    return true;
}

Image resizeImage(const Image& src, int dstWidth, int dstHeight, const OpenCLResources* cl) {
    if (src.width == dstWidth && src.height == dstHeight) return src;

    if (cl && cl->ready) {
        Image out;
        if (resizeLanczosGPU(*cl, src, dstWidth, dstHeight, out)) return out;
        std::cerr << "GPU resample failed. Using CPU version." << std::endl;
    }
    return resizeLanczos(src, dstWidth, dstHeight);
}
