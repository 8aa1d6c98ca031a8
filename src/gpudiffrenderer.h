#ifndef GPUDIFFRENDERER_H
#define GPUDIFFRENDERER_H

#include "canvas.h"
#include "diffoptions.h"
#include "platformdetector.h"
#include <memory>
#include <string>

#ifdef OPENCL_AVAILABLE
    #ifdef __APPLE__
        #include <OpenCL/opencl.h>
    #else
        #include <CL/cl.h>
    #endif
#endif

/**
 * Parameters of the fused GPU comparison
 */
struct GPUDiffOptions {
    double threshold = 10.0;
    double overlayOpacity = 0.5;
    bool useGrayscale = false;
};

/**
 * Base class for device-side diff renderers
 *
 * renderDiff() compares two surfaces on the device, writes the result into the
 * output surface and counts differing pixels with a separate mask pass. The
 * output surface is only modified when every device step succeeded.
 */
class GPUDiffRenderer {
public:
    GPUDiffRenderer() = default;
    virtual ~GPUDiffRenderer() = default;

    GPUDiffRenderer(const GPUDiffRenderer&) = delete;
    GPUDiffRenderer& operator=(const GPUDiffRenderer&) = delete;

    /**
     * Render the comparison of two surfaces
     * @param canvas1 First image
     * @param canvas2 Second image
     * @param output Resized to max(width) x max(height) and filled on success
     * @param options Threshold, overlay opacity and grayscale flag
     * @param result Receives the difference statistics on success
     * @return false on any device failure, see getErrorMessage()
     */
    virtual bool renderDiff(const Canvas& canvas1, const Canvas& canvas2, Canvas& output,
                            const GPUDiffOptions& options, DiffResult& result) = 0;

    virtual GPUAccelerationType getAccelerationType() const = 0;
    virtual bool isReady() const = 0;
    virtual std::string getErrorMessage() const = 0;
    virtual std::string getDeviceInfo() const = 0;
};

#ifdef OPENCL_AVAILABLE
/**
 * OpenCL implementation using two read-only image objects and two kernels
 */
class OpenCLDiffRenderer : public GPUDiffRenderer {
public:
    OpenCLDiffRenderer();
    ~OpenCLDiffRenderer() override;

    bool renderDiff(const Canvas& canvas1, const Canvas& canvas2, Canvas& output,
                    const GPUDiffOptions& options, DiffResult& result) override;

    GPUAccelerationType getAccelerationType() const override { return GPUAccelerationType::OpenCL; }
    bool isReady() const override { return m_isInitialized; }
    std::string getErrorMessage() const override { return m_errorMessage; }
    std::string getDeviceInfo() const override;

private:
    bool initializeOpenCL();
    bool createKernels();
    void cleanup();

    cl_mem createInputImage(const cv::Mat& rgba, cl_int& error);

    static const char* getDiffKernelSource();

    cl_platform_id m_platform = nullptr;
    cl_device_id m_device = nullptr;
    cl_context m_context = nullptr;
    cl_command_queue m_commandQueue = nullptr;
    cl_program m_program = nullptr;

    cl_kernel m_renderKernel = nullptr;
    cl_kernel m_maskKernel = nullptr;

    size_t m_maxImageWidth = 0;
    size_t m_maxImageHeight = 0;
    cl_ulong m_deviceMemoryTotal = 0;

    bool m_isInitialized = false;
    std::string m_errorMessage;
    std::string m_deviceName;
};
#endif // OPENCL_AVAILABLE

/**
 * Factory for creating the best available renderer
 */
class GPUDiffRendererFactory {
public:
    /**
     * Create the best renderer for this platform
     * @return Ready renderer, or nullptr when no device qualifies
     */
    static std::unique_ptr<GPUDiffRenderer> createBestRenderer();

    /**
     * Create a renderer for a specific API
     * @return Renderer (check isReady()), or nullptr if the API is not compiled in
     */
    static std::unique_ptr<GPUDiffRenderer> createRenderer(GPUAccelerationType type);

    static bool isOpenCLAvailable();
};

#endif // GPUDIFFRENDERER_H
