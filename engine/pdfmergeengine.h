#ifndef PDFMERGEENGINE_H
#define PDFMERGEENGINE_H

#include <QString>
#include <QStringList>

#include "datastructure.h"

class DocumentBackend;
class OutputDocument;
class ProgressSink;
class SourceDocument;

/**
 * @brief PDF合并引擎（N个源文件 -> 1个输出文件）
 *
 * 处理规则：
 * 1. 按调用方给定的顺序逐个复制源文件的全部页面，该顺序即输出页序
 * 2. 不存在或无法读取的源文件跳过并记录，不影响其他文件
 * 3. 某个源文件复制到一半失败时，撤回该文件已复制的页面
 * 4. 没有任何页面时失败（NoPages），不写文件
 * 5. 保存失败时整体失败（SaveError）
 *
 * 所有源文档保持打开直到输出文档保存完成；
 * 任何退出路径上都是先关闭输出文档，再关闭源文档。
 */
class PdfMergeEngine
{
public:
    explicit PdfMergeEngine(DocumentBackend& backend);

    /**
     * @brief 合并PDF
     * @param sourcePaths 源文件路径（有序）
     * @param outputPath 输出文件路径，父目录不存在时自动创建
     * @param progress 进度接收端，每处理完一个源文件报告一次
     * @return 批处理结果，items 按源文件顺序给出每个文件的结果
     */
    BatchResult merge(const QStringList& sourcePaths, const QString& outputPath,
                      ProgressSink& progress);

    BatchResult merge(const QStringList& sourcePaths, const QString& outputPath);

    /**
     * @brief 是否逐页输出调试日志
     */
    void setVerboseLogging(bool enabled) { m_verboseLogging = enabled; }
    bool verboseLogging() const { return m_verboseLogging; }

private:
    /**
     * @brief 复制一个源文件的全部页面
     * @return 全部复制成功返回 true；失败时已复制的页面由调用方撤回
     */
    bool appendAllPages(SourceDocument& source, OutputDocument& output, QString* errorMsg);

    DocumentBackend& m_backend;
    bool m_verboseLogging;
};

#endif // PDFMERGEENGINE_H
