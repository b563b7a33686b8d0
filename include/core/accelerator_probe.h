#ifndef ACCELERATOR_PROBE_H
#define ACCELERATOR_PROBE_H

#include <QString>
#include <cstddef>

/**
 * @brief One-shot query of the OpenCL accelerator visible to OpenCV
 */
class AcceleratorProbe
{
public:
    struct AcceleratorInfo {
        QString name;
        QString vendor;
        QString version;
        size_t totalMemory = 0; // bytes, 0 when no device is usable
        int computeUnits = 0;
        bool isOpenCLCompatible = false;
    };

    static AcceleratorInfo probe();
    static QString describe(const AcceleratorInfo &info);
};

#endif // ACCELERATOR_PROBE_H
