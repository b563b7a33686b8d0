#include "collaborators/result_sinks.h"
#include "core/pipeline_errors.h"
#include <QByteArray>
#include <QDebug>
#include <QDir>
#include <memory>
#include <vector>

FileResultSink::FileResultSink(const QString &directory)
    : m_directory(directory)
{
}

ResultReference FileResultSink::deliver(const cv::Mat &image, const QString &jobId)
{
    QDir dir(m_directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        throw FatalPipelineError("FileResultSink: Cannot create result directory " + m_directory.toStdString());
    }

    const QString path = dir.absoluteFilePath(QStringLiteral("%1.png").arg(jobId));
    bool written = false;
    try {
        written = cv::imwrite(path.toStdString(), image);
    } catch (const cv::Exception &e) {
        throw FatalPipelineError(std::string("FileResultSink: PNG encoding failed: ") + e.what());
    }
    if (!written) {
        throw FatalPipelineError("FileResultSink: Failed to write " + path.toStdString());
    }

    qDebug() << "FileResultSink: Stored result" << path;
    ResultReference reference;
    reference.kind = ResultReference::Kind::Locator;
    reference.value = path;
    return reference;
}

ResultReference InlineResultSink::deliver(const cv::Mat &image, const QString &jobId)
{
    std::vector<uchar> buffer;
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, JpegQuality};
    if (!cv::imencode(".jpg", image, buffer, params)) {
        throw FatalPipelineError("InlineResultSink: JPEG encoding failed for job " + jobId.toStdString());
    }

    const QByteArray bytes(reinterpret_cast<const char *>(buffer.data()), static_cast<int>(buffer.size()));
    ResultReference reference;
    reference.kind = ResultReference::Kind::InlineToken;
    reference.value = QString::fromLatin1(bytes.toBase64());

    qDebug() << "InlineResultSink: Encoded result for" << jobId << "|" << buffer.size() << "bytes";
    return reference;
}

std::shared_ptr<ResultSink> createResultSink(const PipelineConfig &config)
{
    if (config.storageMode == PipelineConfig::StorageMode::Filesystem) {
        return std::make_shared<FileResultSink>(config.storageDirectory);
    }
    return std::make_shared<InlineResultSink>();
}
