#ifndef DOCUMENTBACKEND_H
#define DOCUMENTBACKEND_H

#include <QByteArray>
#include <QString>
#include <memory>

/**
 * @brief 只读源文档句柄
 *
 * 打开时文件内容已完整读入内存，不持有源文件的系统句柄。
 * close() 可重复调用，析构时自动 close()。
 */
class SourceDocument
{
public:
    virtual ~SourceDocument() = default;

    virtual QString path() const = 0;
    virtual int pageCount() const = 0;
    virtual bool isOpen() const = 0;
    virtual void close() = 0;
};

/**
 * @brief 可写的输出文档（初始为空）
 *
 * 页面顺序就是 appendPage 的调用顺序。
 */
class OutputDocument
{
public:
    virtual ~OutputDocument() = default;

    virtual int pageCount() const = 0;

    /**
     * @brief 把源文档的一页（0-based）结构化复制到末尾
     */
    virtual bool appendPage(SourceDocument& source, int pageIndex, QString* errorMsg = nullptr) = 0;

    /**
     * @brief 删除末尾的页面，只保留前 pageCount 页
     */
    virtual bool truncate(int pageCount, QString* errorMsg = nullptr) = 0;

    /**
     * @brief 写出到新文件，自动创建缺失的父目录
     *
     * 直接写目标路径，没有临时文件再改名的过程，
     * 写入中途被外部中断时可能留下不完整的文件。
     */
    virtual bool save(const QString& filePath, QString* errorMsg = nullptr) = 0;

    virtual bool isOpen() const = 0;
    virtual void close() = 0;
};

/**
 * @brief 文档后端 - 隐藏具体PDF库
 *
 * 句柄生命周期约定：
 * 1. 后端的生命周期必须覆盖它创建的所有句柄
 * 2. 输出文档先于向其提供页面的源文档关闭
 * 3. 每个句柄只释放一次（close 之后再 close 或析构不做任何事）
 *
 * 非线程安全：一个后端实例只在一个线程上使用。
 */
class DocumentBackend
{
public:
    virtual ~DocumentBackend() = default;

    /**
     * @brief 打开源文档
     * @return 失败（文件不存在或无法解析）返回 nullptr
     */
    virtual std::unique_ptr<SourceDocument> openSource(const QString& filePath,
                                                       QString* errorMsg = nullptr) = 0;

    /**
     * @brief 创建空的输出文档
     */
    virtual std::unique_ptr<OutputDocument> createOutput(QString* errorMsg = nullptr) = 0;

    /**
     * @brief 读取页数（打开后立即关闭），不存在或无法解析时返回 0
     */
    int probePageCount(const QString& filePath);

    /**
     * @brief 一次性读取整个文件，随即关闭文件
     */
    static bool readFileToMemory(const QString& filePath, QByteArray& outData,
                                 QString* errorMsg = nullptr);

    /**
     * @brief 创建目标文件的父目录
     */
    static bool ensureParentDirectory(const QString& filePath, QString* errorMsg = nullptr);
};

#endif // DOCUMENTBACKEND_H
