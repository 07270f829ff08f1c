#include "documentbackend.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

int DocumentBackend::probePageCount(const QString& filePath)
{
    if (!QFileInfo::exists(filePath)) {
        return 0;
    }

    QString error;
    std::unique_ptr<SourceDocument> document = openSource(filePath, &error);
    if (!document) {
        qWarning() << "DocumentBackend: Cannot read page count of" << filePath << "-" << error;
        return 0;
    }

    int count = document->pageCount();
    document->close();
    return count;
}

bool DocumentBackend::readFileToMemory(const QString& filePath, QByteArray& outData,
                                       QString* errorMsg)
{
    QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        if (errorMsg) *errorMsg = QString("File not found: %1").arg(filePath);
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMsg) {
            *errorMsg = QString("Cannot open %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }

    outData = file.readAll();
    file.close();

    if (outData.isEmpty()) {
        if (errorMsg) *errorMsg = QString("File is empty: %1").arg(filePath);
        return false;
    }

    return true;
}

bool DocumentBackend::ensureParentDirectory(const QString& filePath, QString* errorMsg)
{
    QString dirPath = QFileInfo(filePath).absolutePath();
    QDir dir(dirPath);
    if (dir.exists()) {
        return true;
    }

    qDebug() << "DocumentBackend: Creating output directory" << dirPath;
    if (!QDir().mkpath(dirPath)) {
        if (errorMsg) *errorMsg = QString("Cannot create directory: %1").arg(dirPath);
        return false;
    }
    return true;
}
