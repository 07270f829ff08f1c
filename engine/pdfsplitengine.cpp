#include "pdfsplitengine.h"
#include "documentbackend.h"
#include "namingpattern.h"
#include "pagerangeutil.h"
#include "progresssink.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <memory>

PdfSplitEngine::PdfSplitEngine(DocumentBackend& backend)
    : m_backend(backend)
    , m_verboseLogging(false)
{
}

BatchResult PdfSplitEngine::splitByRanges(const QString& sourcePath,
                                          const QVector<PageRange>& ranges,
                                          const QString& outputFolder,
                                          const QString& fileNamePattern,
                                          ProgressSink& progress)
{
    return split(sourcePath, PartitionSpec::byRanges(ranges), outputFolder, fileNamePattern, progress);
}

BatchResult PdfSplitEngine::splitByPage(const QString& sourcePath,
                                        const QString& outputFolder,
                                        const QString& fileNamePattern,
                                        ProgressSink& progress)
{
    return split(sourcePath, PartitionSpec::byPage(), outputFolder, fileNamePattern, progress);
}

BatchResult PdfSplitEngine::splitEqually(const QString& sourcePath,
                                         int parts,
                                         const QString& outputFolder,
                                         const QString& fileNamePattern,
                                         ProgressSink& progress)
{
    return split(sourcePath, PartitionSpec::equally(parts), outputFolder, fileNamePattern, progress);
}

BatchResult PdfSplitEngine::split(const QString& sourcePath,
                                  const PartitionSpec& spec,
                                  const QString& outputFolder,
                                  const QString& fileNamePattern)
{
    NullProgressSink progress;
    return split(sourcePath, spec, outputFolder, fileNamePattern, progress);
}

BatchResult PdfSplitEngine::split(const QString& sourcePath,
                                  const PartitionSpec& spec,
                                  const QString& outputFolder,
                                  const QString& fileNamePattern,
                                  ProgressSink& progress)
{
    BatchResult result;
    result.kind = BatchKind::Split;
    result.outputPath = outputFolder;

    auto fail = [&result](BatchError error, const QString& message) {
        qCritical() << "PdfSplitEngine:" << batchErrorName(error) << "-" << message;
        result.success = false;
        result.error = error;
        result.errorMessage = message;
        return result;
    };

    // 1. 参数检查
    QString error;
    if (!validateArguments(spec, fileNamePattern, &error)) {
        return fail(BatchError::InvalidArgument, error);
    }

    // 2. 源文件
    if (!QFileInfo(sourcePath).isFile()) {
        return fail(BatchError::NotFound, QString("Source file not found: %1").arg(sourcePath));
    }

    std::unique_ptr<SourceDocument> source = m_backend.openSource(sourcePath, &error);
    if (!source) {
        return fail(BatchError::OpenError, error);
    }

    int totalPages = source->pageCount();
    result.requestedCount = requestedCountOf(spec, totalPages);

    if (spec.mode == PartitionSpec::Mode::Ranges) {
        for (const PageRange& range : spec.ranges) {
            if (!range.isValidFor(totalPages)) {
                return fail(BatchError::InvalidArgument,
                            QString("Page range %1 exceeds page count %2")
                                .arg(PageRangeUtil::toString(range))
                                .arg(totalPages));
            }
        }
    }

    // 3. 输出目录（QDir("") 指向当前目录，空路径必须先拒绝）
    if (outputFolder.trimmed().isEmpty()) {
        return fail(BatchError::NotFound, "No output folder specified");
    }
    if (!QDir(outputFolder).exists()) {
        qInfo() << "PdfSplitEngine: Creating output folder" << outputFolder;
        if (!QDir().mkpath(outputFolder)) {
            return fail(BatchError::NotFound, QString("Cannot create output folder: %1").arg(outputFolder));
        }
    }

    // 4. 逐份生成
    int progressTotal = 0;
    const QVector<PartJob> jobs = planJobs(spec, totalPages, &progressTotal);

    qInfo() << "PdfSplitEngine: Splitting" << QFileInfo(sourcePath).fileName()
            << "(" << totalPages << "pages ) into" << jobs.size() << "files";

    ProgressTracker tracker(progress, progressTotal);
    for (const PartJob& job : jobs) {
        ItemOutcome outcome = writePart(*source, job, outputFolder, fileNamePattern);
        result.items.append(outcome);
        tracker.step();
    }

    // 5. 关闭源文档
    source->close();

    result.success = true;
    qInfo() << "PdfSplitEngine: Split completed -" << result.succeededCount() << "succeeded,"
            << result.failedCount() << "failed";
    return result;
}

bool PdfSplitEngine::validateArguments(const PartitionSpec& spec,
                                       const QString& fileNamePattern,
                                       QString* errorMsg) const
{
    if (!NamingPattern::isValid(fileNamePattern)) {
        if (errorMsg) {
            *errorMsg = QString("File name pattern must contain %1: '%2'")
                            .arg(NamingPattern::PLACEHOLDER, fileNamePattern);
        }
        return false;
    }

    switch (spec.mode) {
    case PartitionSpec::Mode::Ranges:
        if (spec.ranges.isEmpty()) {
            if (errorMsg) *errorMsg = "No page ranges specified";
            return false;
        }
        for (const PageRange& range : spec.ranges) {
            if (!range.isWellFormed()) {
                if (errorMsg) {
                    *errorMsg = QString("Invalid page range %1").arg(PageRangeUtil::toString(range));
                }
                return false;
            }
        }
        break;
    case PartitionSpec::Mode::Equal:
        if (spec.parts < 1) {
            if (errorMsg) *errorMsg = QString("Invalid number of parts: %1").arg(spec.parts);
            return false;
        }
        break;
    case PartitionSpec::Mode::SinglePage:
        break;
    }

    return true;
}

QVector<PdfSplitEngine::PartJob> PdfSplitEngine::planJobs(const PartitionSpec& spec,
                                                          int totalPages,
                                                          int* progressTotal) const
{
    QVector<PartJob> jobs;

    switch (spec.mode) {
    case PartitionSpec::Mode::Ranges:
        for (int i = 0; i < spec.ranges.size(); ++i) {
            jobs.append(PartJob{i + 1, spec.ranges[i]});
        }
        *progressTotal = spec.ranges.size();
        break;
    case PartitionSpec::Mode::SinglePage:
        for (int i = 0; i < totalPages; ++i) {
            jobs.append(PartJob{i + 1, PageRange(i + 1, i + 1)});
        }
        *progressTotal = totalPages;
        break;
    case PartitionSpec::Mode::Equal: {
        // 第 i 个区间总是第 i 份，序号不重新编号
        const QVector<PageRange> ranges = PageRangeUtil::equalPartition(totalPages, spec.parts);
        for (int i = 0; i < ranges.size(); ++i) {
            jobs.append(PartJob{i + 1, ranges[i]});
        }
        *progressTotal = spec.parts;
        if (ranges.size() < spec.parts) {
            qInfo() << "PdfSplitEngine:" << totalPages << "pages only fill" << ranges.size()
                    << "of" << spec.parts << "parts";
        }
        break;
    }
    }

    return jobs;
}

ItemOutcome PdfSplitEngine::writePart(SourceDocument& source, const PartJob& job,
                                      const QString& outputFolder,
                                      const QString& fileNamePattern)
{
    ItemOutcome outcome;
    outcome.sequence = job.sequence;
    outcome.pages = job.pages;
    outcome.item = QDir(outputFolder).filePath(NamingPattern::render(fileNamePattern, job.sequence));

    qDebug() << "PdfSplitEngine: [" << job.sequence << "] Creating"
             << QFileInfo(outcome.item).fileName()
             << "(pages" << PageRangeUtil::toString(job.pages) << ")";

    QString error;
    std::unique_ptr<OutputDocument> output = m_backend.createOutput(&error);
    if (!output) {
        outcome.error = BatchError::SaveError;
        outcome.errorMessage = error;
        qWarning() << "PdfSplitEngine: Skipping part" << job.sequence << "-" << error;
        return outcome;
    }

    for (int pageNumber = job.pages.start; pageNumber <= job.pages.end; ++pageNumber) {
        if (!output->appendPage(source, pageNumber - 1, &error)) {
            outcome.error = BatchError::CopyError;
            outcome.errorMessage = error;
            qWarning() << "PdfSplitEngine: Skipping part" << job.sequence << "-" << error;
            output->close();
            return outcome;
        }

        if (m_verboseLogging) {
            qDebug() << "PdfSplitEngine:   page" << pageNumber << "copied";
        }
    }

    if (!output->save(outcome.item, &error)) {
        outcome.error = BatchError::SaveError;
        outcome.errorMessage = error;
        qWarning() << "PdfSplitEngine: Skipping part" << job.sequence << "-" << error;
        output->close();
        return outcome;
    }

    output->close();

    outcome.success = true;
    outcome.pagesCopied = job.pages.pageCount();
    return outcome;
}

int PdfSplitEngine::requestedCountOf(const PartitionSpec& spec, int totalPages)
{
    switch (spec.mode) {
    case PartitionSpec::Mode::Ranges:
        return spec.ranges.size();
    case PartitionSpec::Mode::SinglePage:
        return totalPages;
    case PartitionSpec::Mode::Equal:
        return spec.parts;
    }
    return 0;
}
