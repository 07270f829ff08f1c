#include "pagerangeutil.h"

#include <QRegularExpression>
#include <QStringList>

bool PageRangeUtil::parse(const QString& text, int pageCount,
                          QVector<PageRange>& outRanges, QString* errorMsg)
{
    outRanges.clear();

    if (text.trimmed().isEmpty()) {
        if (errorMsg) *errorMsg = QStringLiteral("No page range specified");
        return false;
    }

    static const QRegularExpression itemPattern(QStringLiteral("^(\\d+)\\s*-\\s*(\\d+)$"));

    QVector<PageRange> ranges;
    const QStringList items = text.split(',');
    for (const QString& rawItem : items) {
        const QString item = rawItem.trimmed();
        QRegularExpressionMatch match = itemPattern.match(item);
        if (!match.hasMatch()) {
            if (errorMsg) {
                *errorMsg = QString("Invalid page range format: '%1' (expected e.g. 1-3, 4-7)")
                                .arg(item);
            }
            return false;
        }

        bool startOk = false;
        bool endOk = false;
        int start = match.captured(1).toInt(&startOk);
        int end = match.captured(2).toInt(&endOk);
        if (!startOk || !endOk) {
            if (errorMsg) *errorMsg = QString("Page number too large: '%1'").arg(item);
            return false;
        }

        PageRange range(start, end);
        if (!range.isValidFor(pageCount)) {
            if (errorMsg) {
                *errorMsg = QString("Page range out of bounds: '%1' (must satisfy 1 <= start <= end <= %2)")
                                .arg(item).arg(pageCount);
            }
            return false;
        }

        ranges.append(range);
    }

    outRanges = ranges;
    return true;
}

int PageRangeUtil::pagesPerPart(int totalPages, int parts)
{
    if (parts < 1 || totalPages <= 0) {
        return 0;
    }
    return (totalPages + parts - 1) / parts;
}

QVector<PageRange> PageRangeUtil::equalPartition(int totalPages, int parts)
{
    QVector<PageRange> ranges;
    int perPart = pagesPerPart(totalPages, parts);
    if (perPart == 0) {
        return ranges;
    }

    for (int i = 0; i < parts; ++i) {
        int startPage = i * perPart + 1;
        if (startPage > totalPages) {
            break;
        }
        int endPage = qMin((i + 1) * perPart, totalPages);
        ranges.append(PageRange(startPage, endPage));
    }
    return ranges;
}

QString PageRangeUtil::toString(const PageRange& range)
{
    return QString("%1-%2").arg(range.start).arg(range.end);
}
