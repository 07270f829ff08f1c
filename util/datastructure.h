#ifndef DATASTRUCTURE_H
#define DATASTRUCTURE_H

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

// 页码区间 [start, end]，1-based，闭区间
struct PageRange {
    int start;
    int end;

    PageRange() : start(0), end(0) {}
    PageRange(int s, int e) : start(s), end(e) {}

    int pageCount() const { return end - start + 1; }

    // 仅检查结构：1 <= start <= end
    bool isWellFormed() const { return start >= 1 && start <= end; }

    // 完整检查：1 <= start <= end <= totalPages
    bool isValidFor(int totalPages) const { return isWellFormed() && end <= totalPages; }

    bool operator==(const PageRange& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const PageRange& other) const { return !(*this == other); }
};

/**
 * @brief 分割方式
 *
 * - Ranges: 按调用方给定的页码区间
 * - SinglePage: 每页一个文件
 * - Equal: 按份数等分
 */
struct PartitionSpec {
    enum class Mode {
        Ranges,
        SinglePage,
        Equal
    };

    Mode mode;
    QVector<PageRange> ranges;  // 仅 Ranges 模式
    int parts;                  // 仅 Equal 模式

    PartitionSpec() : mode(Mode::SinglePage), parts(0) {}

    static PartitionSpec byRanges(const QVector<PageRange>& r) {
        PartitionSpec spec;
        spec.mode = Mode::Ranges;
        spec.ranges = r;
        return spec;
    }

    static PartitionSpec byPage() {
        return PartitionSpec();
    }

    static PartitionSpec equally(int partCount) {
        PartitionSpec spec;
        spec.mode = Mode::Equal;
        spec.parts = partCount;
        return spec;
    }
};

// ========== 错误分类 ==========

enum class BatchError {
    None,
    OpenError,        // 源文件无法读取或不是PDF
    SaveError,        // 输出文件写入失败
    CopyError,        // 页面复制失败
    InvalidArgument,  // 参数错误（区间、份数、文件名规则）
    NoPages,          // 合并结果没有任何页面
    NotFound          // 源文件或输出目录不存在且无法创建
};

QString batchErrorName(BatchError error);

// ========== 批处理结果 ==========

enum class BatchKind {
    Merge,
    Split
};

/**
 * @brief 单个处理单位的结果
 *
 * 合并时 item 为源文件路径，分割时 item 为输出文件路径
 */
struct ItemOutcome {
    QString item;
    int sequence;       // 1-based 序号
    PageRange pages;    // 分割时对应的源页码区间，合并时为空
    int pagesCopied;
    bool success;
    BatchError error;
    QString errorMessage;

    ItemOutcome()
        : sequence(0), pagesCopied(0), success(false), error(BatchError::None) {}
};

struct BatchResult {
    BatchKind kind;
    bool success;
    BatchError error;         // success == false 时的致命原因
    QString errorMessage;
    QString outputPath;       // 合并输出文件或分割输出目录
    int requestedCount;       // 请求的处理单位数（源文件/区间/页/份）
    QVector<ItemOutcome> items;

    BatchResult()
        : kind(BatchKind::Merge), success(false), error(BatchError::None), requestedCount(0) {}

    int succeededCount() const;
    int failedCount() const;
    int totalPagesCopied() const;

    // 成功写出的文件（合并时为输出文件本身）
    QStringList outputFiles() const;

    static BatchResult failure(BatchKind kind, BatchError error, const QString& message);
};

Q_DECLARE_METATYPE(BatchKind)
Q_DECLARE_METATYPE(BatchResult)

#endif // DATASTRUCTURE_H
