#ifndef NAMINGPATTERN_H
#define NAMINGPATTERN_H

#include <QString>

/**
 * @brief 输出文件名规则
 *
 * 规则中的占位符 [N] 会被替换为3位补零的序号，例如：
 *   render("doc_[N].pdf", 7)    -> "doc_007.pdf"
 *   render("doc_[N].pdf", 1234) -> "doc_1234.pdf"
 *
 * 3位是最小宽度，不会截断
 */
class NamingPattern
{
public:
    /// 占位符
    static const QString PLACEHOLDER;

    /// 序号最小宽度
    static constexpr int SEQUENCE_WIDTH = 3;

    /**
     * @brief 规则是否可用（非空且包含占位符）
     */
    static bool isValid(const QString& pattern);

    /**
     * @brief 生成文件名，替换所有占位符
     * @param pattern 文件名规则
     * @param sequenceNumber 1-based 序号
     */
    static QString render(const QString& pattern, int sequenceNumber);

    /**
     * @brief 生成序号文本（补零到3位）
     */
    static QString formatSequence(int sequenceNumber);
};

#endif // NAMINGPATTERN_H
