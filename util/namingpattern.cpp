#include "namingpattern.h"

const QString NamingPattern::PLACEHOLDER = QStringLiteral("[N]");

bool NamingPattern::isValid(const QString& pattern)
{
    if (pattern.trimmed().isEmpty()) {
        return false;
    }
    return pattern.contains(PLACEHOLDER);
}

QString NamingPattern::render(const QString& pattern, int sequenceNumber)
{
    QString fileName = pattern;
    return fileName.replace(PLACEHOLDER, formatSequence(sequenceNumber));
}

QString NamingPattern::formatSequence(int sequenceNumber)
{
    return QString("%1").arg(sequenceNumber, SEQUENCE_WIDTH, 10, QChar('0'));
}
