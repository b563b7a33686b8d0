#include "core/tryon_service.h"
#include "core/accelerator_probe.h"
#include "core/job_queue_worker.h"
#include "core/pipeline_errors.h"
#include "core/pipeline_orchestrator.h"
#include <QDebug>
#include <QJsonObject>
#include <QThread>

TryOnService::TryOnService(std::shared_ptr<PipelineContext> context, const PipelineConfig &config,
                           QObject *parent)
    : QObject(parent)
    , m_context(std::move(context))
    , m_config(config)
    , m_validator(config.maxUploadMb, config.outputSize)
    , m_orchestrator(nullptr)
    , m_workerThread(nullptr)
    , m_worker(nullptr)
{
    if (!m_context) {
        throw FatalPipelineError("TryOnService: No pipeline context");
    }

    m_orchestrator = new PipelineOrchestrator(*m_context, m_store, m_config, this);

    // One worker per instance: the accelerator is an exclusive resource
    m_workerThread = new QThread();
    m_workerThread->setObjectName(QStringLiteral("TryOnWorker"));
    m_worker = new JobQueueWorker(m_orchestrator);
    m_worker->moveToThread(m_workerThread);
    connect(m_worker, &JobQueueWorker::jobProcessed, this, &TryOnService::jobFinished);
    m_workerThread->start();

    qInfo() << "TryOnService: Ready | tier" << resourceTierName(m_context->executionPolicy().tier)
            << "| storage" << storageModeName(m_config.storageMode);
}

TryOnService::~TryOnService()
{
    // A running job finishes; jobs still queued are dropped with the process
    m_workerThread->quit();
    m_workerThread->wait();
    delete m_worker;
    delete m_workerThread;
}

TryOnRequest TryOnService::makeRequest(const QByteArray &personBytes, const QByteArray &garmentBytes,
                                       const QString &category) const
{
    const std::optional<GarmentCategory> parsed = parseGarmentCategory(category);
    if (!parsed) {
        throw InputValidationError(
            QStringLiteral("Unknown garment category '%1' (expected upper, lower or full)").arg(category).toStdString());
    }

    TryOnRequest request;
    request.person = m_validator.prepare(personBytes, QStringLiteral("Person"));
    request.garment = m_validator.prepare(garmentBytes, QStringLiteral("Garment"));
    request.category = *parsed;
    return request;
}

TryOnRequest TryOnService::makeRequest(const cv::Mat &person, const cv::Mat &garment,
                                       GarmentCategory category) const
{
    TryOnRequest request;
    request.person = m_validator.prepare(person, QStringLiteral("Person"));
    request.garment = m_validator.prepare(garment, QStringLiteral("Garment"));
    request.category = category;
    return request;
}

QString TryOnService::enqueue(const TryOnRequest &request)
{
    const QString jobId = m_store.create(request.category);
    if (!m_worker->enqueue(jobId, request)) {
        JobError error;
        error.kind = QStringLiteral("FatalPipelineError");
        error.message = QStringLiteral("Job could not be queued");
        error.jobId = jobId;
        m_store.markFailed(jobId, error);
    }
    qInfo() << "TryOnService: Submitted job" << jobId << "(" << garmentCategoryName(request.category) << ")";
    return jobId;
}

TryOnJob TryOnService::execute(const TryOnRequest &request)
{
    const QString jobId = m_store.create(request.category);
    m_orchestrator->run(jobId, request);
    const std::optional<TryOnJob> finished = m_store.get(jobId);
    if (!finished) {
        throw FatalPipelineError("TryOnService: Job vanished from the store");
    }
    return *finished;
}

QString TryOnService::submit(const QByteArray &personBytes, const QByteArray &garmentBytes,
                             const QString &category)
{
    return enqueue(makeRequest(personBytes, garmentBytes, category));
}

QString TryOnService::submit(const cv::Mat &person, const cv::Mat &garment, GarmentCategory category)
{
    return enqueue(makeRequest(person, garment, category));
}

TryOnJob TryOnService::runSync(const QByteArray &personBytes, const QByteArray &garmentBytes,
                               const QString &category)
{
    return execute(makeRequest(personBytes, garmentBytes, category));
}

TryOnJob TryOnService::runSync(const cv::Mat &person, const cv::Mat &garment, GarmentCategory category)
{
    return execute(makeRequest(person, garment, category));
}

std::optional<TryOnJob> TryOnService::job(const QString &jobId) const
{
    return m_store.get(jobId);
}

QJsonObject TryOnService::poll(const QString &jobId) const
{
    return m_store.snapshotJson(jobId);
}

bool TryOnService::waitForJob(const QString &jobId, int timeoutMs) const
{
    return m_store.waitForTerminal(jobId, timeoutMs);
}

int TryOnService::expireResults()
{
    return m_store.expire(m_config.resultTtlSeconds);
}

QJsonObject TryOnService::healthJson() const
{
    const CapabilityFlags &capabilities = m_context->capabilities();
    const ExecutionPolicy &policy = m_context->executionPolicy();
    const AcceleratorProbe::AcceleratorInfo &accelerator = m_context->accelerator;

    QJsonObject acceleratorJson;
    acceleratorJson.insert(QStringLiteral("available"), accelerator.isOpenCLCompatible);
    acceleratorJson.insert(QStringLiteral("name"), accelerator.name);
    acceleratorJson.insert(QStringLiteral("vendor"), accelerator.vendor);
    acceleratorJson.insert(QStringLiteral("total_memory_gb"),
                           static_cast<double>(m_context->modelHost->acceleratorMemoryBytes()) / 1e9);

    QJsonObject health;
    health.insert(QStringLiteral("status"), QStringLiteral("ok"));
    health.insert(QStringLiteral("resource_tier"), resourceTierName(policy.tier));
    health.insert(QStringLiteral("memory_saving_execution"), policy.memorySavingExecution);
    health.insert(QStringLiteral("refinement_enabled"), policy.attemptRefinement);
    health.insert(QStringLiteral("face_locator_loaded"), capabilities.hasFaceLocator);
    health.insert(QStringLiteral("face_embedder_loaded"), capabilities.hasFaceEmbedder);
    health.insert(QStringLiteral("persistent_store"), capabilities.hasPersistentStore);
    health.insert(QStringLiteral("queued_jobs"), m_worker->pendingJobs());
    health.insert(QStringLiteral("accelerator"), acceleratorJson);
    return health;
}
