#ifndef PLATFORMDETECTOR_H
#define PLATFORMDETECTOR_H

#include <string>

/**
 * Enumeration of supported operating systems
 */
enum class OperatingSystem {
    Unknown,
    macOS,
    Windows,
    Linux,
    FreeBSD
};

/**
 * Enumeration of supported GPU acceleration APIs
 */
enum class GPUAccelerationType {
    None,
    OpenCL
};

/**
 * Runtime capabilities the comparison pipeline depends on
 */
struct PlatformCapabilities {
    OperatingSystem operatingSystem = OperatingSystem::Unknown;
    std::string osVersion;
    int logicalCores = 1;

    bool openCL = false;            // at least one OpenCL platform with a device
    bool openCLImages = false;      // that device supports image objects
    std::string openCLDevice;

    bool backgroundThreads = false; // worker threads can be started
};

/**
 * Probes the host once and caches the result
 */
class PlatformDetector {
public:
    /**
     * Get the singleton instance of PlatformDetector
     * @return Reference to the singleton instance
     */
    static PlatformDetector& getInstance();

    const PlatformCapabilities& getCapabilities() const { return m_capabilities; }

    /**
     * Get the best GPU API usable for diff rendering
     * @return GPUAccelerationType::None when no device has image support
     */
    GPUAccelerationType getBestGPUAcceleration() const;

    /**
     * Human readable one-line-per-item summary
     */
    std::string getCapabilitiesSummary() const;

    static std::string toString(OperatingSystem os);
    static std::string toString(GPUAccelerationType type);

private:
    PlatformDetector();

    PlatformDetector(const PlatformDetector&) = delete;
    PlatformDetector& operator=(const PlatformDetector&) = delete;

    void detectOperatingSystem();
    void detectThreading();
    void detectOpenCL();

    PlatformCapabilities m_capabilities;
};

#endif // PLATFORMDETECTOR_H
