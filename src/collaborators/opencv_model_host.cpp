#include "collaborators/opencv_model_host.h"
#include <QDebug>
#include <opencv2/core/ocl.hpp>

OpenCvModelHost::OpenCvModelHost(const AcceleratorProbe::AcceleratorInfo &info)
    : m_info(info)
    , m_releaseCount(0)
{
}

size_t OpenCvModelHost::acceleratorMemoryBytes() const
{
    return m_info.isOpenCLCompatible ? m_info.totalMemory : 0;
}

void OpenCvModelHost::configureExecution(const ExecutionPolicy &policy)
{
    m_policy = policy;

    if (!m_info.isOpenCLCompatible) {
        qInfo() << "OpenCvModelHost: CPU execution, tier" << resourceTierName(policy.tier);
        return;
    }

    qInfo() << "OpenCvModelHost: Tier" << resourceTierName(policy.tier)
            << "| memory saving:" << policy.memorySavingExecution
            << "| OpenCL:" << !policy.memorySavingExecution;
}

void OpenCvModelHost::applyExecutionPolicy()
{
    if (!m_info.isOpenCLCompatible) {
        return;
    }

    const bool useOpenCL = !m_policy.memorySavingExecution;
    if (cv::ocl::useOpenCL() != useOpenCL) {
        cv::ocl::setUseOpenCL(useOpenCL);
        qDebug() << "OpenCvModelHost: OpenCL" << (useOpenCL ? "enabled" : "disabled") << "on this thread";
    }
}

void OpenCvModelHost::releaseTransientMemory()
{
    ++m_releaseCount;
    if (m_info.isOpenCLCompatible && cv::ocl::useOpenCL()) {
        cv::ocl::finish();
    }
    qDebug() << "OpenCvModelHost: Released transient memory (" << m_releaseCount << "releases)";
}
