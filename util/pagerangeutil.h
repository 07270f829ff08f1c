#ifndef PAGERANGEUTIL_H
#define PAGERANGEUTIL_H

#include <QString>
#include <QVector>

#include "datastructure.h"

/**
 * @brief 页码区间工具
 *
 * 负责：
 * - 解析用户输入的区间文本（"1-10, 11-20"）
 * - 计算等分区间
 */
class PageRangeUtil
{
public:
    /**
     * @brief 解析页码区间文本
     * @param text 形如 "1-3, 4-7" 的文本，逗号分隔，允许空白
     * @param pageCount 文档总页数，用于范围检查
     * @param outRanges 输出区间（按输入顺序）
     * @param errorMsg 错误信息输出参数
     * @return 全部区间合法时返回 true，否则 outRanges 为空
     */
    static bool parse(const QString& text, int pageCount,
                      QVector<PageRange>& outRanges, QString* errorMsg = nullptr);

    /**
     * @brief 每份页数 = ceil(totalPages / parts)
     */
    static int pagesPerPart(int totalPages, int parts);

    /**
     * @brief 计算等分区间
     *
     * 第 i 份（0-based）为 [i*ppp+1, min((i+1)*ppp, totalPages)]，
     * 起始页超过总页数的份被省略，因此返回数量可能少于 parts。
     * 返回的第 i 个元素总是对应第 i 份。
     */
    static QVector<PageRange> equalPartition(int totalPages, int parts);

    /**
     * @brief 区间的可读文本，例如 "3-7"
     */
    static QString toString(const PageRange& range);
};

#endif // PAGERANGEUTIL_H
