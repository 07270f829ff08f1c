#include "batchoperationmanager.h"
#include "appconfig.h"
#include "documentbackend.h"
#include "mupdfdocumentbackend.h"
#include "pdfmergeengine.h"
#include "pdfsplitengine.h"
#include "progresssink.h"

#include <QDebug>
#include <QMetaObject>
#include <QThread>
#include <QtConcurrent>

namespace {

// 工作线程中的进度通过队列连接回到管理器线程
class QueuedProgressSink : public ProgressSink
{
public:
    explicit QueuedProgressSink(BatchOperationManager* manager)
        : m_manager(manager)
    {
    }

    void report(int percent) override
    {
        QMetaObject::invokeMethod(m_manager, "progressChanged",
                                  Qt::QueuedConnection,
                                  Q_ARG(int, percent));
    }

private:
    BatchOperationManager* m_manager;
};

}

BatchOperationManager::BatchOperationManager(QObject* parent)
    : BatchOperationManager([]() -> std::unique_ptr<DocumentBackend> {
          return std::make_unique<MuPDFDocumentBackend>();
      }, parent)
{
}

BatchOperationManager::BatchOperationManager(BackendFactory factory, QObject* parent)
    : QObject(parent)
    , m_backendFactory(std::move(factory))
    , m_running(false)
{
    qRegisterMetaType<BatchResult>("BatchResult");

    connect(&m_watcher, &QFutureWatcher<BatchResult>::finished,
            this, &BatchOperationManager::onWorkerFinished);
}

BatchOperationManager::~BatchOperationManager()
{
    // 工作线程持有 this，必须等它结束
    if (m_running.load()) {
        qWarning() << "BatchOperationManager: Destroyed while a batch is running, waiting";
        m_watcher.waitForFinished();
    }
}

bool BatchOperationManager::startMerge(const QStringList& sourcePaths, const QString& outputPath)
{
    bool verbose = AppConfig::instance().debugMode();

    return startJob(BatchKind::Merge,
                    [sourcePaths, outputPath, verbose](DocumentBackend& backend,
                                                       ProgressSink& progress) {
                        PdfMergeEngine engine(backend);
                        engine.setVerboseLogging(verbose);
                        return engine.merge(sourcePaths, outputPath, progress);
                    });
}

bool BatchOperationManager::startSplit(const QString& sourcePath,
                                       const PartitionSpec& spec,
                                       const QString& outputFolder,
                                       const QString& fileNamePattern)
{
    bool verbose = AppConfig::instance().debugMode();

    return startJob(BatchKind::Split,
                    [sourcePath, spec, outputFolder, fileNamePattern, verbose](
                        DocumentBackend& backend, ProgressSink& progress) {
                        PdfSplitEngine engine(backend);
                        engine.setVerboseLogging(verbose);
                        return engine.split(sourcePath, spec, outputFolder, fileNamePattern, progress);
                    });
}

bool BatchOperationManager::startJob(BatchKind kind, Job job)
{
    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        qWarning() << "BatchOperationManager: A batch is already running";
        return false;
    }

    emit operationStarted(kind);

    // 在后台线程执行，后端在该线程中创建和销毁
    QFuture<BatchResult> future = QtConcurrent::run([this, kind, job]() {
        qDebug() << "BatchOperationManager: Worker started"
                 << "Thread:" << QThread::currentThreadId();

        std::unique_ptr<DocumentBackend> backend = m_backendFactory ? m_backendFactory() : nullptr;
        if (!backend) {
            return BatchResult::failure(kind, BatchError::OpenError,
                                        "No document backend available");
        }

        QueuedProgressSink progress(this);
        return job(*backend, progress);
    });

    m_watcher.setFuture(future);
    return true;
}

void BatchOperationManager::onWorkerFinished()
{
    m_lastResult = m_watcher.result();
    m_running.store(false);

    if (m_lastResult.success) {
        rememberOutputLocation(m_lastResult);
        qInfo() << "BatchOperationManager: Batch finished -"
                << m_lastResult.succeededCount() << "succeeded,"
                << m_lastResult.failedCount() << "failed";
    } else {
        qWarning() << "BatchOperationManager: Batch failed:"
                   << batchErrorName(m_lastResult.error) << m_lastResult.errorMessage;
    }

    emit operationCompleted(m_lastResult);
}

bool BatchOperationManager::isRunning() const
{
    return m_running.load();
}

void BatchOperationManager::waitForFinished()
{
    m_watcher.waitForFinished();
}

void BatchOperationManager::rememberOutputLocation(const BatchResult& result)
{
    AppConfig& config = AppConfig::instance();
    if (result.kind == BatchKind::Merge) {
        config.setLastMergeOutputPath(result.outputPath);
    } else {
        config.setLastOutputFolder(result.outputPath);
    }
    config.save();
}
