#include "core/accelerator_probe.h"
#include <QDebug>
#include <opencv2/opencv.hpp>
#include <opencv2/core/ocl.hpp>

AcceleratorProbe::AcceleratorInfo AcceleratorProbe::probe()
{
    AcceleratorInfo info;
    bool previousUseOpenCL = false;
    bool switched = false;

    try {
        if (!cv::ocl::haveOpenCL()) {
            qDebug() << "AcceleratorProbe: OpenCL not available in OpenCV build";
            return info;
        }

        // The switch is per thread; leave it as the caller had it
        previousUseOpenCL = cv::ocl::useOpenCL();
        cv::ocl::setUseOpenCL(true);
        switched = true;

        const cv::ocl::Device &device = cv::ocl::Device::getDefault();
        if (!cv::ocl::useOpenCL() || !device.available()) {
            qDebug() << "AcceleratorProbe: No usable OpenCL device";
        } else {
            info.isOpenCLCompatible = true;
            info.name = QString::fromStdString(device.name());
            info.vendor = QString::fromStdString(device.vendorName());
            info.version = QString::fromStdString(device.version());
            info.totalMemory = device.globalMemSize();
            info.computeUnits = device.maxComputeUnits();
        }

    } catch (const cv::Exception &e) {
        qWarning() << "AcceleratorProbe: OpenCL detection failed:" << e.what();
        info = AcceleratorInfo();
    }

    if (switched) {
        cv::ocl::setUseOpenCL(previousUseOpenCL);
    }

    qDebug() << "AcceleratorProbe:" << describe(info);
    return info;
}

QString AcceleratorProbe::describe(const AcceleratorInfo &info)
{
    if (!info.isOpenCLCompatible) {
        return QStringLiteral("no accelerator (CPU execution)");
    }
    return QStringLiteral("%1 (%2, %3) | Global Memory: %4 MB | Compute Units: %5")
        .arg(info.name, info.vendor, info.version)
        .arg(static_cast<qulonglong>(info.totalMemory / (1024 * 1024)))
        .arg(info.computeUnits);
}
