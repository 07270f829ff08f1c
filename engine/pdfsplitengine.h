#ifndef PDFSPLITENGINE_H
#define PDFSPLITENGINE_H

#include <QString>
#include <QVector>

#include "datastructure.h"

class DocumentBackend;
class ProgressSink;
class SourceDocument;

/**
 * @brief PDF分割引擎（1个源文件 -> N个输出文件）
 *
 * 三种分割方式共用同一外壳：
 * 1. 参数检查（文件名规则、区间、份数），不做任何I/O
 * 2. 检查源文件存在，整体读入并打开一次
 * 3. 确保输出目录存在（不存在则创建）
 * 4. 逐份创建输出文档、复制页面、保存、立即关闭
 * 5. 源文档在返回前关闭，且只关闭一次
 *
 * 单份失败（复制或保存）只记录并跳过，不影响整体结果；
 * 整体失败只来自前置条件（参数、源文件、输出目录）。
 */
class PdfSplitEngine
{
public:
    explicit PdfSplitEngine(DocumentBackend& backend);

    /**
     * @brief 按页码区间分割
     * @param ranges 1-based 闭区间，序号为其在列表中的位置（1-based）
     */
    BatchResult splitByRanges(const QString& sourcePath,
                              const QVector<PageRange>& ranges,
                              const QString& outputFolder,
                              const QString& fileNamePattern,
                              ProgressSink& progress);

    /**
     * @brief 每页一个文件，序号为页码
     */
    BatchResult splitByPage(const QString& sourcePath,
                            const QString& outputFolder,
                            const QString& fileNamePattern,
                            ProgressSink& progress);

    /**
     * @brief 等分为 parts 份
     *
     * 每份 ceil(总页数/parts) 页，起始页超过总页数的份不再生成，
     * 序号使用份的位置（index+1），因此实际文件数可能少于 parts。
     */
    BatchResult splitEqually(const QString& sourcePath,
                             int parts,
                             const QString& outputFolder,
                             const QString& fileNamePattern,
                             ProgressSink& progress);

    /**
     * @brief 按 PartitionSpec 分派
     */
    BatchResult split(const QString& sourcePath,
                      const PartitionSpec& spec,
                      const QString& outputFolder,
                      const QString& fileNamePattern,
                      ProgressSink& progress);

    BatchResult split(const QString& sourcePath,
                      const PartitionSpec& spec,
                      const QString& outputFolder,
                      const QString& fileNamePattern);

    void setVerboseLogging(bool enabled) { m_verboseLogging = enabled; }
    bool verboseLogging() const { return m_verboseLogging; }

private:
    // 一个待生成的输出文件
    struct PartJob {
        int sequence;
        PageRange pages;
    };

    /**
     * @brief 检查与源文档无关的参数
     */
    bool validateArguments(const PartitionSpec& spec, const QString& fileNamePattern,
                           QString* errorMsg) const;

    /**
     * @brief 根据分割方式和总页数生成任务列表
     * @param progressTotal 进度的分母
     */
    QVector<PartJob> planJobs(const PartitionSpec& spec, int totalPages, int* progressTotal) const;

    /**
     * @brief 生成一个输出文件，输出文档在返回前关闭
     */
    ItemOutcome writePart(SourceDocument& source, const PartJob& job,
                          const QString& outputFolder, const QString& fileNamePattern);

    static int requestedCountOf(const PartitionSpec& spec, int totalPages);

    DocumentBackend& m_backend;
    bool m_verboseLogging;
};

#endif // PDFSPLITENGINE_H
