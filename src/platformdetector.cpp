#include "platformdetector.h"
#include "performancemonitor.h"
#include <sstream>
#include <thread>
#include <vector>
#include <QThread>

#if defined(__linux__) || defined(__APPLE__) || defined(__FreeBSD__)
    #include <sys/utsname.h>
#endif

// OpenCL detection
#ifdef OPENCL_AVAILABLE
    #ifdef __APPLE__
        #include <OpenCL/opencl.h>
    #else
        #include <CL/cl.h>
    #endif
#endif

PlatformDetector& PlatformDetector::getInstance() {
    static PlatformDetector instance;
    return instance;
}

PlatformDetector::PlatformDetector() {
    detectOperatingSystem();
    detectThreading();
    detectOpenCL();

    LOG_INFO("Platform", getCapabilitiesSummary());
}

void PlatformDetector::detectOperatingSystem() {
#ifdef _WIN32
    m_capabilities.operatingSystem = OperatingSystem::Windows;
#elif defined(__APPLE__)
    m_capabilities.operatingSystem = OperatingSystem::macOS;
#elif defined(__linux__)
    m_capabilities.operatingSystem = OperatingSystem::Linux;
#elif defined(__FreeBSD__)
    m_capabilities.operatingSystem = OperatingSystem::FreeBSD;
#else
    m_capabilities.operatingSystem = OperatingSystem::Unknown;
#endif

#if defined(__linux__) || defined(__APPLE__) || defined(__FreeBSD__)
    struct utsname unameData;
    if (uname(&unameData) == 0) {
        m_capabilities.osVersion = std::string(unameData.release);
    }
#endif
}

void PlatformDetector::detectThreading() {
    int cores = static_cast<int>(std::thread::hardware_concurrency());
    m_capabilities.logicalCores = cores > 0 ? cores : QThread::idealThreadCount();

#if QT_CONFIG(thread)
    m_capabilities.backgroundThreads = true;
#else
    m_capabilities.backgroundThreads = false;
#endif
}

void PlatformDetector::detectOpenCL() {
#ifdef OPENCL_AVAILABLE
    cl_uint platformCount = 0;
    cl_int error = clGetPlatformIDs(0, nullptr, &platformCount);
    if (error != CL_SUCCESS || platformCount == 0) {
        return;
    }

    std::vector<cl_platform_id> platforms(platformCount);
    if (clGetPlatformIDs(platformCount, platforms.data(), nullptr) != CL_SUCCESS) {
        return;
    }

    for (cl_platform_id platform : platforms) {
        cl_uint deviceCount = 0;
        if (clGetDeviceIDs(platform, CL_DEVICE_TYPE_ALL, 0, nullptr, &deviceCount) != CL_SUCCESS ||
            deviceCount == 0) {
            continue;
        }

        std::vector<cl_device_id> devices(deviceCount);
        if (clGetDeviceIDs(platform, CL_DEVICE_TYPE_ALL, deviceCount, devices.data(), nullptr) != CL_SUCCESS) {
            continue;
        }

        m_capabilities.openCL = true;

        for (cl_device_id device : devices) {
            cl_bool imageSupport = CL_FALSE;
            clGetDeviceInfo(device, CL_DEVICE_IMAGE_SUPPORT, sizeof(imageSupport), &imageSupport, nullptr);
            if (imageSupport == CL_TRUE) {
                size_t nameSize = 0;
                clGetDeviceInfo(device, CL_DEVICE_NAME, 0, nullptr, &nameSize);
                std::vector<char> name(nameSize + 1, '\0');
                clGetDeviceInfo(device, CL_DEVICE_NAME, nameSize, name.data(), nullptr);

                m_capabilities.openCLImages = true;
                m_capabilities.openCLDevice = std::string(name.data());
                return;
            }
        }
    }
#endif
}

GPUAccelerationType PlatformDetector::getBestGPUAcceleration() const {
    if (m_capabilities.openCL && m_capabilities.openCLImages) {
        return GPUAccelerationType::OpenCL;
    }
    return GPUAccelerationType::None;
}

std::string PlatformDetector::getCapabilitiesSummary() const {
    std::ostringstream oss;
    oss << "OS: " << toString(m_capabilities.operatingSystem);
    if (!m_capabilities.osVersion.empty()) {
        oss << " " << m_capabilities.osVersion;
    }
    oss << ", logical cores: " << m_capabilities.logicalCores
        << ", background threads: " << (m_capabilities.backgroundThreads ? "yes" : "no")
        << ", GPU: " << toString(getBestGPUAcceleration());
    if (!m_capabilities.openCLDevice.empty()) {
        oss << " (" << m_capabilities.openCLDevice << ")";
    }
    return oss.str();
}

std::string PlatformDetector::toString(OperatingSystem os) {
    switch (os) {
        case OperatingSystem::macOS: return "macOS";
        case OperatingSystem::Windows: return "Windows";
        case OperatingSystem::Linux: return "Linux";
        case OperatingSystem::FreeBSD: return "FreeBSD";
        case OperatingSystem::Unknown:
        default: return "Unknown";
    }
}

std::string PlatformDetector::toString(GPUAccelerationType type) {
    switch (type) {
        case GPUAccelerationType::OpenCL: return "OpenCL";
        case GPUAccelerationType::None:
        default: return "None";
    }
}
