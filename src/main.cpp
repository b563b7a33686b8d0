#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QTextStream>
#include "collaborators/cascade_face_locator.h"
#include "collaborators/label_map_segmentation_provider.h"
#include "collaborators/opencv_model_host.h"
#include "collaborators/openpose_dnn_provider.h"
#include "collaborators/passthrough_synthesizer.h"
#include "collaborators/result_sinks.h"
#include "core/accelerator_probe.h"
#include "core/image_validator.h"
#include "core/pipeline_config.h"
#include "core/pipeline_context.h"
#include "core/pipeline_errors.h"
#include "core/tryon_service.h"
#include <memory>
#include <opencv2/opencv.hpp>

namespace {

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw InputValidationError("Cannot open " + path.toStdString() + ": " + file.errorString().toStdString());
    }
    return file.readAll();
}

void printJson(const QJsonObject &object)
{
    QTextStream out(stdout);
    out << QJsonDocument(object).toJson(QJsonDocument::Indented);
    out.flush();
}

std::shared_ptr<PipelineContext> buildContext(const QCommandLineParser &parser, const PipelineConfig &config,
                                              const cv::Size &photoSize)
{
    auto context = std::make_shared<PipelineContext>();

    // The label map belongs to the original photo, not to the letterboxed canvas
    context->segmentation = std::make_shared<LabelMapSegmentationProvider>(
        LabelMapSegmentationProvider::fromFile(parser.value(QStringLiteral("labels")), photoSize));
    context->pose = std::make_shared<OpenPoseDnnProvider>(parser.value(QStringLiteral("pose-model")),
                                                          parser.value(QStringLiteral("pose-proto")));
    context->synthesizer = std::make_shared<CompositePassthroughSynthesizer>();
    context->sink = createResultSink(config);
    // Probed once; the health report reads the stored result
    context->accelerator = AcceleratorProbe::probe();
    context->modelHost = std::make_shared<OpenCvModelHost>(context->accelerator);

    auto faceLocator = std::make_shared<CascadeFaceLocator>(parser.value(QStringLiteral("face-cascade")));
    if (faceLocator->isLoaded()) {
        context->faceLocator = faceLocator;
    }

    context->finalize(config.tierThresholdBytes());
    return context;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tryon_cli"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Virtual try-on pipeline"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {QStringLiteral("person"), QStringLiteral("Person photo (JPEG, PNG or WebP)."), QStringLiteral("file")},
        {QStringLiteral("garment"), QStringLiteral("Garment photo (JPEG, PNG or WebP)."), QStringLiteral("file")},
        {QStringLiteral("labels"), QStringLiteral("Human-parsing label map of the person photo."), QStringLiteral("file")},
        {QStringLiteral("category"), QStringLiteral("Garment category: upper, lower or full."),
         QStringLiteral("category"), QStringLiteral("upper")},
        {QStringLiteral("pose-model"), QStringLiteral("OpenPose BODY_25 weights."), QStringLiteral("file")},
        {QStringLiteral("pose-proto"), QStringLiteral("OpenPose BODY_25 prototxt."), QStringLiteral("file")},
        {QStringLiteral("face-cascade"), QStringLiteral("Haar cascade for the face locator."), QStringLiteral("file")},
        {QStringLiteral("config"), QStringLiteral("INI settings file."), QStringLiteral("file")},
        {QStringLiteral("output"), QStringLiteral("Also write the result image to this path."), QStringLiteral("file")},
        {QStringLiteral("async"), QStringLiteral("Submit to the worker queue and poll until done.")},
        {QStringLiteral("health"), QStringLiteral("Print the service health report and exit.")},
    });
    parser.process(app);

    const PipelineConfig config = PipelineConfig::load(parser.value(QStringLiteral("config")));

    // The health report loads the same models, only the photos are optional
    const bool healthOnly = parser.isSet(QStringLiteral("health"));
    QStringList required = {QStringLiteral("labels"), QStringLiteral("pose-model"), QStringLiteral("pose-proto")};
    if (!healthOnly) {
        required << QStringLiteral("person") << QStringLiteral("garment");
    }
    for (const QString &name : required) {
        if (!parser.isSet(name)) {
            qCritical().noquote() << "Missing required option --" + name;
            parser.showHelp(2);
        }
    }

    try {
        QByteArray personBytes;
        QByteArray garmentBytes;
        cv::Size photoSize;
        if (!healthOnly) {
            personBytes = readFile(parser.value(QStringLiteral("person")));
            garmentBytes = readFile(parser.value(QStringLiteral("garment")));
            photoSize = ImageValidator(config.maxUploadMb, config.outputSize)
                            .decode(personBytes, QStringLiteral("Person"))
                            .size();
        }

        std::shared_ptr<PipelineContext> context = buildContext(parser, config, photoSize);
        TryOnService service(context, config);

        if (healthOnly) {
            printJson(service.healthJson());
            return 0;
        }

        const QString category = parser.value(QStringLiteral("category"));

        TryOnJob job;
        if (parser.isSet(QStringLiteral("async"))) {
            const QString jobId = service.submit(personBytes, garmentBytes, category);
            printJson(service.poll(jobId));
            while (!service.waitForJob(jobId, 1000)) {
                printJson(service.poll(jobId));
            }
            job = *service.job(jobId);
        } else {
            job = service.runSync(personBytes, garmentBytes, category);
        }

        printJson(job.toJson());

        if (job.status != JobStatus::Succeeded) {
            return 1;
        }

        if (parser.isSet(QStringLiteral("output")) && job.result) {
            cv::Mat image;
            if (job.result->kind == ResultReference::Kind::Locator) {
                image = cv::imread(job.result->value.toStdString(), cv::IMREAD_COLOR);
            } else {
                const QByteArray encoded = QByteArray::fromBase64(job.result->value.toLatin1());
                const std::vector<uchar> buffer(encoded.constBegin(), encoded.constEnd());
                image = cv::imdecode(buffer, cv::IMREAD_COLOR);
            }
            if (image.empty() || !cv::imwrite(parser.value(QStringLiteral("output")).toStdString(), image)) {
                qCritical() << "Failed to write" << parser.value(QStringLiteral("output"));
                return 1;
            }
            qInfo() << "Result written to" << parser.value(QStringLiteral("output"));
        }
        return 0;

    } catch (const InputValidationError &e) {
        qCritical() << "Rejected input:" << e.what();
        return 2;
    } catch (const PipelineError &e) {
        qCritical() << e.kind() << ":" << e.what();
        return 1;
    } catch (const cv::Exception &e) {
        qCritical() << "OpenCV error:" << e.what();
        return 1;
    }
}
