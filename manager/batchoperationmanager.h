#ifndef BATCHOPERATIONMANAGER_H
#define BATCHOPERATIONMANAGER_H

#include <QFutureWatcher>
#include <QObject>
#include <QString>
#include <QStringList>
#include <atomic>
#include <functional>
#include <memory>

#include "datastructure.h"

class DocumentBackend;
class ProgressSink;

/**
 * @brief 批处理管理器
 *
 * 职责：
 * 1. 在工作线程中执行合并/分割（同一时间只执行一个批处理）
 * 2. 每个批处理创建独立的文档后端，结束时销毁
 * 3. 把进度从工作线程转发到管理器所在线程
 * 4. 每个已开始的批处理恰好发出一次 operationCompleted
 */
class BatchOperationManager : public QObject
{
    Q_OBJECT

public:
    using BackendFactory = std::function<std::unique_ptr<DocumentBackend>()>;

    /**
     * @brief 使用 MuPDF 后端
     */
    explicit BatchOperationManager(QObject* parent = nullptr);

    /**
     * @brief 使用自定义后端工厂（工厂在工作线程中调用）
     */
    explicit BatchOperationManager(BackendFactory factory, QObject* parent = nullptr);

    ~BatchOperationManager();

    /**
     * @brief 开始合并
     * @return 已有批处理在执行时返回 false
     */
    bool startMerge(const QStringList& sourcePaths, const QString& outputPath);

    /**
     * @brief 开始分割
     * @return 已有批处理在执行时返回 false
     */
    bool startSplit(const QString& sourcePath,
                    const PartitionSpec& spec,
                    const QString& outputFolder,
                    const QString& fileNamePattern);

    bool isRunning() const;

    /**
     * @brief 阻塞等待当前批处理结束（不处理完成信号）
     */
    void waitForFinished();

    /**
     * @brief 最近一次完成的批处理结果
     */
    BatchResult lastResult() const { return m_lastResult; }

signals:
    void operationStarted(BatchKind kind);

    /**
     * @brief 进度（0-100），同一批处理内不会下降
     */
    void progressChanged(int percent);

    void operationCompleted(const BatchResult& result);

private slots:
    void onWorkerFinished();

private:
    using Job = std::function<BatchResult(DocumentBackend&, ProgressSink&)>;

    bool startJob(BatchKind kind, Job job);
    void rememberOutputLocation(const BatchResult& result);

    BackendFactory m_backendFactory;
    QFutureWatcher<BatchResult> m_watcher;
    std::atomic_bool m_running;
    BatchResult m_lastResult;
};

#endif // BATCHOPERATIONMANAGER_H
