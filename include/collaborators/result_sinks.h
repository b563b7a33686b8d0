#ifndef RESULT_SINKS_H
#define RESULT_SINKS_H

#include <QString>
#include <memory>
#include "core/collaborators.h"
#include "core/pipeline_config.h"

/**
 * @brief Persists results as PNG files; the locator is the file path
 */
class FileResultSink : public ResultSink
{
public:
    explicit FileResultSink(const QString &directory);

    ResultReference deliver(const cv::Mat &image, const QString &jobId) override;
    bool isPersistent() const override { return true; }

    QString directory() const { return m_directory; }

private:
    QString m_directory;
};

/**
 * @brief Encodes results as base64 JPEG (quality 95) returned inline with the job
 */
class InlineResultSink : public ResultSink
{
public:
    ResultReference deliver(const cv::Mat &image, const QString &jobId) override;
    bool isPersistent() const override { return false; }

    static constexpr int JpegQuality = 95;
};

// Sink selected by the configured storage mode
std::shared_ptr<ResultSink> createResultSink(const PipelineConfig &config);

#endif // RESULT_SINKS_H
