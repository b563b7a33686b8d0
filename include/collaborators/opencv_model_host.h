#ifndef OPENCV_MODEL_HOST_H
#define OPENCV_MODEL_HOST_H

#include "core/accelerator_probe.h"
#include "core/collaborators.h"

/**
 * @brief Model host backed by OpenCV's OpenCL runtime
 *
 * Capacity comes from a one-time AcceleratorProbe. Memory-saving execution
 * turns OpenCL off so models run from host memory; release flushes the
 * OpenCL queue so no device buffers outlive a job.
 *
 * OpenCV keeps the OpenCL switch per thread, so configureExecution() only
 * records the policy and applyExecutionPolicy() sets it on the calling thread.
 */
class OpenCvModelHost : public ModelHost
{
public:
    explicit OpenCvModelHost(const AcceleratorProbe::AcceleratorInfo &info);

    size_t acceleratorMemoryBytes() const override;
    void configureExecution(const ExecutionPolicy &policy) override;
    void applyExecutionPolicy() override;
    void releaseTransientMemory() override;

    const AcceleratorProbe::AcceleratorInfo &acceleratorInfo() const { return m_info; }
    int releaseCount() const { return m_releaseCount; }

private:
    AcceleratorProbe::AcceleratorInfo m_info;
    ExecutionPolicy m_policy;
    int m_releaseCount;
};

#endif // OPENCV_MODEL_HOST_H
