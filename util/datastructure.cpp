#include "datastructure.h"

QString batchErrorName(BatchError error)
{
    switch (error) {
    case BatchError::None:
        return QStringLiteral("None");
    case BatchError::OpenError:
        return QStringLiteral("OpenError");
    case BatchError::SaveError:
        return QStringLiteral("SaveError");
    case BatchError::CopyError:
        return QStringLiteral("CopyError");
    case BatchError::InvalidArgument:
        return QStringLiteral("InvalidArgument");
    case BatchError::NoPages:
        return QStringLiteral("NoPages");
    case BatchError::NotFound:
        return QStringLiteral("NotFound");
    }
    return QStringLiteral("Unknown");
}

int BatchResult::succeededCount() const
{
    int count = 0;
    for (const ItemOutcome& outcome : items) {
        if (outcome.success) count++;
    }
    return count;
}

int BatchResult::failedCount() const
{
    return items.size() - succeededCount();
}

int BatchResult::totalPagesCopied() const
{
    int total = 0;
    for (const ItemOutcome& outcome : items) {
        if (outcome.success) total += outcome.pagesCopied;
    }
    return total;
}

QStringList BatchResult::outputFiles() const
{
    QStringList files;
    if (kind == BatchKind::Merge) {
        if (success) files.append(outputPath);
        return files;
    }

    for (const ItemOutcome& outcome : items) {
        if (outcome.success) files.append(outcome.item);
    }
    return files;
}

BatchResult BatchResult::failure(BatchKind kind, BatchError error, const QString& message)
{
    BatchResult result;
    result.kind = kind;
    result.success = false;
    result.error = error;
    result.errorMessage = message;
    return result;
}
