#include "pdfmergeengine.h"
#include "documentbackend.h"
#include "progresssink.h"

#include <QDebug>
#include <QFileInfo>
#include <memory>
#include <vector>

PdfMergeEngine::PdfMergeEngine(DocumentBackend& backend)
    : m_backend(backend)
    , m_verboseLogging(false)
{
}

BatchResult PdfMergeEngine::merge(const QStringList& sourcePaths, const QString& outputPath)
{
    NullProgressSink progress;
    return merge(sourcePaths, outputPath, progress);
}

BatchResult PdfMergeEngine::merge(const QStringList& sourcePaths, const QString& outputPath,
                                  ProgressSink& progress)
{
    BatchResult result;
    result.kind = BatchKind::Merge;
    result.outputPath = outputPath;
    result.requestedCount = sourcePaths.size();

    auto fail = [&result](BatchError error, const QString& message) {
        qCritical() << "PdfMergeEngine:" << batchErrorName(error) << "-" << message;
        result.success = false;
        result.error = error;
        result.errorMessage = message;
        return result;
    };

    if (sourcePaths.isEmpty()) {
        return fail(BatchError::InvalidArgument, "No source files specified");
    }
    if (outputPath.trimmed().isEmpty()) {
        return fail(BatchError::InvalidArgument, "No output path specified");
    }

    qInfo() << "PdfMergeEngine: Merging" << sourcePaths.size() << "files into" << outputPath;

    // 声明顺序决定释放顺序：output 先于 sources 释放
    std::vector<std::unique_ptr<SourceDocument>> sources;
    QString error;
    std::unique_ptr<OutputDocument> output = m_backend.createOutput(&error);
    if (!output) {
        return fail(BatchError::SaveError, error);
    }

    ProgressTracker tracker(progress, sourcePaths.size());

    for (int i = 0; i < sourcePaths.size(); ++i) {
        const QString& sourcePath = sourcePaths[i];

        ItemOutcome outcome;
        outcome.item = sourcePath;
        outcome.sequence = i + 1;

        qDebug() << "PdfMergeEngine: [" << (i + 1) << "/" << sourcePaths.size() << "]"
                 << QFileInfo(sourcePath).fileName();

        if (!QFileInfo(sourcePath).isFile()) {
            outcome.error = BatchError::NotFound;
            outcome.errorMessage = QString("File not found: %1").arg(sourcePath);
            qWarning() << "PdfMergeEngine: Skipping missing file" << sourcePath;
        } else {
            std::unique_ptr<SourceDocument> source = m_backend.openSource(sourcePath, &error);
            if (!source) {
                outcome.error = BatchError::OpenError;
                outcome.errorMessage = error;
                qWarning() << "PdfMergeEngine: Skipping unreadable file" << sourcePath << "-" << error;
            } else {
                int pagesBefore = output->pageCount();
                if (appendAllPages(*source, *output, &error)) {
                    outcome.success = true;
                    outcome.pagesCopied = source->pageCount();
                } else {
                    outcome.error = BatchError::CopyError;
                    outcome.errorMessage = error;
                    qWarning() << "PdfMergeEngine: Copy failed, skipping" << sourcePath << "-" << error;

                    QString rollbackError;
                    if (!output->truncate(pagesBefore, &rollbackError)) {
                        return fail(BatchError::CopyError,
                                    QString("Cannot remove partially copied pages of %1: %2")
                                        .arg(sourcePath, rollbackError));
                    }
                }

                // 复制失败的源文档同样保持打开，保证输出文档先关闭
                sources.push_back(std::move(source));
            }
        }

        result.items.append(outcome);
        tracker.step();
    }

    if (output->pageCount() == 0) {
        return fail(BatchError::NoPages, "No pages could be merged");
    }

    qInfo() << "PdfMergeEngine: Saving" << output->pageCount() << "pages to" << outputPath;

    if (!output->save(outputPath, &error)) {
        return fail(BatchError::SaveError, error);
    }

    output->close();
    for (std::unique_ptr<SourceDocument>& source : sources) {
        source->close();
    }

    if (!QFileInfo::exists(outputPath)) {
        return fail(BatchError::SaveError, QString("Output file was not created: %1").arg(outputPath));
    }

    result.success = true;
    qInfo() << "PdfMergeEngine: Merge completed -" << result.succeededCount() << "of"
            << sourcePaths.size() << "files," << result.totalPagesCopied() << "pages";
    return result;
}

bool PdfMergeEngine::appendAllPages(SourceDocument& source, OutputDocument& output,
                                    QString* errorMsg)
{
    int pageCount = source.pageCount();
    for (int pageIndex = 0; pageIndex < pageCount; ++pageIndex) {
        if (!output.appendPage(source, pageIndex, errorMsg)) {
            return false;
        }

        if (m_verboseLogging) {
            qDebug() << "PdfMergeEngine:   page" << (pageIndex + 1) << "/" << pageCount << "copied";
        }
    }
    return true;
}
