#include "gpudiffrenderer.h"
#include "performancemonitor.h"
#include <algorithm>
#include <vector>

// ============================================================================
// OpenCL Implementation
// ============================================================================

#ifdef OPENCL_AVAILABLE

namespace {

/**
 * Releases a cl_mem when leaving scope
 */
struct ScopedMem {
    cl_mem mem = nullptr;

    ScopedMem() = default;
    ScopedMem(const ScopedMem&) = delete;
    ScopedMem& operator=(const ScopedMem&) = delete;
    ~ScopedMem() {
        if (mem) {
            clReleaseMemObject(mem);
        }
    }
};

std::string clErrorText(const std::string& what, cl_int error) {
    return what + " (OpenCL error " + std::to_string(error) + ")";
}

} // namespace

OpenCLDiffRenderer::OpenCLDiffRenderer() {
    if (!initializeOpenCL()) {
        if (m_errorMessage.empty()) {
            m_errorMessage = "Failed to initialize OpenCL";
        }
        cleanup();
    }
}

OpenCLDiffRenderer::~OpenCLDiffRenderer() {
    cleanup();
}

bool OpenCLDiffRenderer::initializeOpenCL() {
    cl_int error;

    cl_uint platformCount = 0;
    error = clGetPlatformIDs(0, nullptr, &platformCount);
    if (error != CL_SUCCESS || platformCount == 0) {
        m_errorMessage = "No OpenCL platforms found";
        return false;
    }

    std::vector<cl_platform_id> platforms(platformCount);
    error = clGetPlatformIDs(platformCount, platforms.data(), nullptr);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to get OpenCL platforms", error);
        return false;
    }

    // Prefer a GPU with image support, then any device with image support
    const cl_device_type preferredTypes[] = { CL_DEVICE_TYPE_GPU, CL_DEVICE_TYPE_ALL };
    for (cl_device_type type : preferredTypes) {
        for (cl_platform_id platform : platforms) {
            cl_uint deviceCount = 0;
            if (clGetDeviceIDs(platform, type, 0, nullptr, &deviceCount) != CL_SUCCESS || deviceCount == 0) {
                continue;
            }

            std::vector<cl_device_id> devices(deviceCount);
            if (clGetDeviceIDs(platform, type, deviceCount, devices.data(), nullptr) != CL_SUCCESS) {
                continue;
            }

            for (cl_device_id device : devices) {
                cl_bool imageSupport = CL_FALSE;
                clGetDeviceInfo(device, CL_DEVICE_IMAGE_SUPPORT, sizeof(imageSupport), &imageSupport, nullptr);
                if (imageSupport == CL_TRUE) {
                    m_platform = platform;
                    m_device = device;
                    break;
                }
            }
            if (m_device) break;
        }
        if (m_device) break;
    }

    if (!m_device) {
        m_errorMessage = "No OpenCL device with image support found";
        return false;
    }

    size_t nameSize = 0;
    clGetDeviceInfo(m_device, CL_DEVICE_NAME, 0, nullptr, &nameSize);
    std::vector<char> name(nameSize + 1, '\0');
    clGetDeviceInfo(m_device, CL_DEVICE_NAME, nameSize, name.data(), nullptr);
    m_deviceName = std::string(name.data());

    clGetDeviceInfo(m_device, CL_DEVICE_GLOBAL_MEM_SIZE, sizeof(m_deviceMemoryTotal), &m_deviceMemoryTotal, nullptr);
    clGetDeviceInfo(m_device, CL_DEVICE_IMAGE2D_MAX_WIDTH, sizeof(m_maxImageWidth), &m_maxImageWidth, nullptr);
    clGetDeviceInfo(m_device, CL_DEVICE_IMAGE2D_MAX_HEIGHT, sizeof(m_maxImageHeight), &m_maxImageHeight, nullptr);

    m_context = clCreateContext(nullptr, 1, &m_device, nullptr, nullptr, &error);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to create OpenCL context", error);
        return false;
    }

    m_commandQueue = clCreateCommandQueue(m_context, m_device, 0, &error);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to create OpenCL command queue", error);
        return false;
    }

    if (!createKernels()) {
        return false;
    }

    m_isInitialized = true;
    LOG_INFO("GPU", "OpenCL diff renderer ready on " + m_deviceName);
    return true;
}

void OpenCLDiffRenderer::cleanup() {
    if (m_renderKernel) { clReleaseKernel(m_renderKernel); m_renderKernel = nullptr; }
    if (m_maskKernel) { clReleaseKernel(m_maskKernel); m_maskKernel = nullptr; }
    if (m_program) { clReleaseProgram(m_program); m_program = nullptr; }
    if (m_commandQueue) { clReleaseCommandQueue(m_commandQueue); m_commandQueue = nullptr; }
    if (m_context) { clReleaseContext(m_context); m_context = nullptr; }

    m_isInitialized = false;
}

bool OpenCLDiffRenderer::createKernels() {
    const char* kernelSource = getDiffKernelSource();

    cl_int error;
    m_program = clCreateProgramWithSource(m_context, 1, &kernelSource, nullptr, &error);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to create OpenCL program", error);
        return false;
    }

    error = clBuildProgram(m_program, 1, &m_device, nullptr, nullptr, nullptr);
    if (error != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(m_program, m_device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> log(logSize + 1, '\0');
        clGetProgramBuildInfo(m_program, m_device, CL_PROGRAM_BUILD_LOG, logSize, log.data(), nullptr);
        m_errorMessage = "Failed to build OpenCL program: " + std::string(log.data());
        return false;
    }

    m_renderKernel = clCreateKernel(m_program, "render_diff", &error);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to create render kernel", error);
        return false;
    }

    m_maskKernel = clCreateKernel(m_program, "count_mask", &error);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to create mask kernel", error);
        return false;
    }

    return true;
}

cl_mem OpenCLDiffRenderer::createInputImage(const cv::Mat& rgba, cl_int& error) {
    cv::Mat source = rgba.isContinuous() ? rgba : rgba.clone();

    cl_image_format format;
    format.image_channel_order = CL_RGBA;
    format.image_channel_data_type = CL_UNORM_INT8;

    cl_image_desc desc = {};
    desc.image_type = CL_MEM_OBJECT_IMAGE2D;
    desc.image_width = static_cast<size_t>(source.cols);
    desc.image_height = static_cast<size_t>(source.rows);
    desc.image_row_pitch = source.step[0];

    return clCreateImage(m_context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, &format, &desc,
                         source.data, &error);
}

bool OpenCLDiffRenderer::renderDiff(const Canvas& canvas1, const Canvas& canvas2, Canvas& output,
                                    const GPUDiffOptions& options, DiffResult& result) {
    PERF_TIMER_CAT("gpuRenderDiff", "GPU");

    if (!m_isInitialized) {
        return false;
    }
    if (canvas1.isEmpty() || canvas2.isEmpty()) {
        m_errorMessage = "Input canvas has no pixel data";
        return false;
    }

    const int width = std::max(canvas1.width(), canvas2.width());
    const int height = std::max(canvas1.height(), canvas2.height());
    if (static_cast<size_t>(width) > m_maxImageWidth || static_cast<size_t>(height) > m_maxImageHeight) {
        m_errorMessage = "Image size " + std::to_string(width) + "x" + std::to_string(height) +
                         " exceeds device limits";
        return false;
    }
    if (!DiffResult::isCountable(width, height)) {
        m_errorMessage = "Image size " + std::to_string(width) + "x" + std::to_string(height) +
                         " exceeds the countable pixel range";
        return false;
    }

    const size_t pixelCount = static_cast<size_t>(width) * height;
    cl_int error = CL_SUCCESS;

    ScopedMem texture1;
    ScopedMem texture2;
    ScopedMem outputBuffer;
    ScopedMem maskBuffer;

    texture1.mem = createInputImage(canvas1.pixels(), error);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to upload first texture", error);
        return false;
    }
    texture2.mem = createInputImage(canvas2.pixels(), error);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to upload second texture", error);
        return false;
    }

    outputBuffer.mem = clCreateBuffer(m_context, CL_MEM_WRITE_ONLY, pixelCount * 4, nullptr, &error);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to allocate output buffer", error);
        return false;
    }
    maskBuffer.mem = clCreateBuffer(m_context, CL_MEM_WRITE_ONLY, pixelCount, nullptr, &error);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to allocate mask buffer", error);
        return false;
    }

    cl_int clWidth = width;
    cl_int clHeight = height;
    cl_float threshold = static_cast<cl_float>(options.threshold);
    cl_float opacity = static_cast<cl_float>(options.overlayOpacity);
    cl_int grayscale = options.useGrayscale ? 1 : 0;

    error = clSetKernelArg(m_renderKernel, 0, sizeof(cl_mem), &texture1.mem);
    error |= clSetKernelArg(m_renderKernel, 1, sizeof(cl_mem), &texture2.mem);
    error |= clSetKernelArg(m_renderKernel, 2, sizeof(cl_mem), &outputBuffer.mem);
    error |= clSetKernelArg(m_renderKernel, 3, sizeof(cl_int), &clWidth);
    error |= clSetKernelArg(m_renderKernel, 4, sizeof(cl_int), &clHeight);
    error |= clSetKernelArg(m_renderKernel, 5, sizeof(cl_float), &threshold);
    error |= clSetKernelArg(m_renderKernel, 6, sizeof(cl_float), &opacity);
    error |= clSetKernelArg(m_renderKernel, 7, sizeof(cl_int), &grayscale);
    if (error != CL_SUCCESS) {
        m_errorMessage = "Failed to set render kernel arguments";
        return false;
    }

    error = clSetKernelArg(m_maskKernel, 0, sizeof(cl_mem), &texture1.mem);
    error |= clSetKernelArg(m_maskKernel, 1, sizeof(cl_mem), &texture2.mem);
    error |= clSetKernelArg(m_maskKernel, 2, sizeof(cl_mem), &maskBuffer.mem);
    error |= clSetKernelArg(m_maskKernel, 3, sizeof(cl_int), &clWidth);
    error |= clSetKernelArg(m_maskKernel, 4, sizeof(cl_int), &clHeight);
    error |= clSetKernelArg(m_maskKernel, 5, sizeof(cl_float), &threshold);
    error |= clSetKernelArg(m_maskKernel, 6, sizeof(cl_int), &grayscale);
    if (error != CL_SUCCESS) {
        m_errorMessage = "Failed to set mask kernel arguments";
        return false;
    }

    const size_t globalSize[2] = { static_cast<size_t>(width), static_cast<size_t>(height) };

    error = clEnqueueNDRangeKernel(m_commandQueue, m_renderKernel, 2, nullptr, globalSize, nullptr, 0, nullptr, nullptr);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to run render kernel", error);
        return false;
    }
    error = clEnqueueNDRangeKernel(m_commandQueue, m_maskKernel, 2, nullptr, globalSize, nullptr, 0, nullptr, nullptr);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to run mask kernel", error);
        return false;
    }

    cv::Mat staging(height, width, CV_8UC4);
    cv::Mat mask(height, width, CV_8UC1);

    error = clEnqueueReadBuffer(m_commandQueue, outputBuffer.mem, CL_TRUE, 0, pixelCount * 4,
                                staging.data, 0, nullptr, nullptr);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to read back diff image", error);
        return false;
    }
    error = clEnqueueReadBuffer(m_commandQueue, maskBuffer.mem, CL_TRUE, 0, pixelCount,
                                mask.data, 0, nullptr, nullptr);
    if (error != CL_SUCCESS) {
        m_errorMessage = clErrorText("Failed to read back difference mask", error);
        return false;
    }

    output.resize(width, height);
    output.putImageData(staging);

    result = DiffResult::fromCount(cv::countNonZero(mask), static_cast<int>(pixelCount));
    return true;
}

std::string OpenCLDiffRenderer::getDeviceInfo() const {
    return "OpenCL Device: " + m_deviceName +
           " (Memory: " + std::to_string(m_deviceMemoryTotal / (1024 * 1024)) + " MB)";
}

const char* OpenCLDiffRenderer::getDiffKernelSource() {
    return R"(
__constant sampler_t texSampler = CLK_NORMALIZED_COORDS_TRUE |
                                  CLK_ADDRESS_CLAMP_TO_EDGE |
                                  CLK_FILTER_NEAREST;

float to_grayscale(float4 color) {
    return dot(color.xyz, (float3)(0.299f, 0.587f, 0.114f));
}

float pixel_difference(float4 c1, float4 c2, int useGrayscale) {
    if (useGrayscale) {
        return fabs(to_grayscale(c1) - to_grayscale(c2));
    }
    return length(c1.xyz - c2.xyz) / sqrt(3.0f);
}

float2 texel_center(int x, int y, int width, int height) {
    return (float2)((x + 0.5f) / width, (y + 0.5f) / height);
}

__kernel void render_diff(__read_only image2d_t tex1,
                          __read_only image2d_t tex2,
                          __global uchar4* output,
                          int width, int height,
                          float threshold, float overlayOpacity,
                          int useGrayscale) {
    int x = get_global_id(0);
    int y = get_global_id(1);
    if (x >= width || y >= height) return;

    float2 coord = texel_center(x, y, width, height);
    float4 c1 = read_imagef(tex1, texSampler, coord);
    float4 c2 = read_imagef(tex2, texSampler, coord);

    float4 color;
    if (pixel_difference(c1, c2, useGrayscale) * 255.0f > threshold) {
        color = (float4)(1.0f, 0.0f, 0.0f, 1.0f);
    } else {
        color = mix(c1, c2, overlayOpacity);
        color.w = 1.0f;
    }

    output[y * width + x] = convert_uchar4_sat_rte(color * 255.0f);
}

__kernel void count_mask(__read_only image2d_t tex1,
                         __read_only image2d_t tex2,
                         __global uchar* mask,
                         int width, int height,
                         float threshold,
                         int useGrayscale) {
    int x = get_global_id(0);
    int y = get_global_id(1);
    if (x >= width || y >= height) return;

    float2 coord = texel_center(x, y, width, height);
    float4 c1 = read_imagef(tex1, texSampler, coord);
    float4 c2 = read_imagef(tex2, texSampler, coord);

    mask[y * width + x] = (pixel_difference(c1, c2, useGrayscale) * 255.0f > threshold) ? 1 : 0;
}
)";
}

#endif // OPENCL_AVAILABLE

// ============================================================================
// GPUDiffRendererFactory Implementation
// ============================================================================

std::unique_ptr<GPUDiffRenderer> GPUDiffRendererFactory::createBestRenderer() {
    GPUAccelerationType bestType = PlatformDetector::getInstance().getBestGPUAcceleration();
    if (bestType == GPUAccelerationType::None) {
        LOG_INFO("GPU", "No GPU with image support detected");
        return nullptr;
    }

    auto renderer = createRenderer(bestType);
    if (renderer && !renderer->isReady()) {
        LOG_WARNING("GPU", "GPU renderer unavailable: " + renderer->getErrorMessage());
        return nullptr;
    }
    return renderer;
}

std::unique_ptr<GPUDiffRenderer> GPUDiffRendererFactory::createRenderer(GPUAccelerationType type) {
    switch (type) {
#ifdef OPENCL_AVAILABLE
        case GPUAccelerationType::OpenCL:
            if (isOpenCLAvailable()) {
                return std::make_unique<OpenCLDiffRenderer>();
            }
            break;
#endif
        default:
            break;
    }
    return nullptr;
}

bool GPUDiffRendererFactory::isOpenCLAvailable() {
#ifdef OPENCL_AVAILABLE
    cl_uint platformCount = 0;
    cl_int error = clGetPlatformIDs(0, nullptr, &platformCount);
    return (error == CL_SUCCESS && platformCount > 0);
#else
    return false;
#endif
}
