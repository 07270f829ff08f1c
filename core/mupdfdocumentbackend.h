#ifndef MUPDFDOCUMENTBACKEND_H
#define MUPDFDOCUMENTBACKEND_H

#include <QString>
#include <QVector>
#include <memory>

#include "documentbackend.h"

extern "C" {
#include <mupdf/fitz.h>
#include <mupdf/pdf.h>
}

/**
 * @brief 基于 MuPDF 的文档后端
 *
 * 每个实例拥有独立的 fz_context（不使用锁），
 * 由它打开/创建的所有文档共享这个 context，
 * 因此实例只能在创建它的工作线程中使用。
 */
class MuPDFDocumentBackend : public DocumentBackend
{
public:
    MuPDFDocumentBackend();
    ~MuPDFDocumentBackend() override;

    // 禁止拷贝
    MuPDFDocumentBackend(const MuPDFDocumentBackend&) = delete;
    MuPDFDocumentBackend& operator=(const MuPDFDocumentBackend&) = delete;

    std::unique_ptr<SourceDocument> openSource(const QString& filePath,
                                               QString* errorMsg = nullptr) override;
    std::unique_ptr<OutputDocument> createOutput(QString* errorMsg = nullptr) override;

    /**
     * @brief context 是否创建成功
     */
    bool isValid() const { return m_context != nullptr; }

    QString getLastError() const { return m_lastError; }

    fz_context* context() const { return m_context; }

private:
    bool createContext();
    void destroyContext();
    void setLastError(const QString& error);

private:
    fz_context* m_context;
    QString m_lastError;
};

/**
 * @brief MuPDF 源文档（从内存缓冲区打开）
 */
class MuPDFSourceDocument : public SourceDocument
{
public:
    MuPDFSourceDocument(fz_context* ctx, pdf_document* doc, const QString& path, int pageCount);
    ~MuPDFSourceDocument() override;

    MuPDFSourceDocument(const MuPDFSourceDocument&) = delete;
    MuPDFSourceDocument& operator=(const MuPDFSourceDocument&) = delete;

    QString path() const override { return m_path; }
    int pageCount() const override { return m_pageCount; }
    bool isOpen() const override { return m_document != nullptr; }
    void close() override;

    fz_context* context() const { return m_context; }
    pdf_document* document() const { return m_document; }

private:
    fz_context* m_context;
    pdf_document* m_document;
    QString m_path;
    int m_pageCount;
};

/**
 * @brief MuPDF 输出文档
 *
 * 对每个源文档维护一个 graft map，
 * 同一源文档的多页共享字体、图片等资源，不会重复复制。
 */
class MuPDFOutputDocument : public OutputDocument
{
public:
    MuPDFOutputDocument(fz_context* ctx, pdf_document* doc);
    ~MuPDFOutputDocument() override;

    MuPDFOutputDocument(const MuPDFOutputDocument&) = delete;
    MuPDFOutputDocument& operator=(const MuPDFOutputDocument&) = delete;

    int pageCount() const override;
    bool appendPage(SourceDocument& source, int pageIndex, QString* errorMsg = nullptr) override;
    bool truncate(int pageCount, QString* errorMsg = nullptr) override;
    bool save(const QString& filePath, QString* errorMsg = nullptr) override;
    bool isOpen() const override { return m_document != nullptr; }
    void close() override;

private:
    pdf_graft_map* graftMapFor(const MuPDFSourceDocument* source);
    void dropGraftMaps();

    struct GraftEntry {
        const MuPDFSourceDocument* source;
        pdf_graft_map* map;
    };

    fz_context* m_context;
    pdf_document* m_document;
    QVector<GraftEntry> m_graftMaps;
};

#endif // MUPDFDOCUMENTBACKEND_H
