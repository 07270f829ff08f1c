#include "mupdfdocumentbackend.h"

#include <QByteArray>
#include <QDebug>
#include <QThread>

namespace {

extern "C" {
static void mupdf_warning_callback(void* user, const char* message)
{
    Q_UNUSED(user);
    qDebug() << "MuPDF warning:" << message;
}

static void mupdf_error_callback(void* user, const char* message)
{
    Q_UNUSED(user);
    qWarning() << "MuPDF error:" << message;
}
}

}

// ========================================
// MuPDFDocumentBackend
// ========================================

MuPDFDocumentBackend::MuPDFDocumentBackend()
    : m_context(nullptr)
{
    if (!createContext()) {
        qCritical() << "MuPDFDocumentBackend: Failed to initialize context";
    }
}

MuPDFDocumentBackend::~MuPDFDocumentBackend()
{
    destroyContext();
}

bool MuPDFDocumentBackend::createContext()
{
    if (m_context) {
        return true;
    }

    // 每个后端独立 context，不需要锁
    m_context = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);

    if (!m_context) {
        setLastError("Failed to create MuPDF context");
        return false;
    }

    fz_set_warning_callback(m_context, mupdf_warning_callback, nullptr);
    fz_set_error_callback(m_context, mupdf_error_callback, nullptr);

    fz_try(m_context) {
        fz_register_document_handlers(m_context);
    }
    fz_catch(m_context) {
        setLastError(QString("Failed to register document handlers: %1")
                         .arg(fz_caught_message(m_context)));
        fz_drop_context(m_context);
        m_context = nullptr;
        return false;
    }

    qDebug() << "MuPDFDocumentBackend: Context created"
             << "Thread:" << QThread::currentThreadId();
    return true;
}

void MuPDFDocumentBackend::destroyContext()
{
    if (!m_context) {
        return;
    }

    fz_drop_context(m_context);
    m_context = nullptr;
}

void MuPDFDocumentBackend::setLastError(const QString& error)
{
    m_lastError = error;
}

std::unique_ptr<SourceDocument> MuPDFDocumentBackend::openSource(const QString& filePath,
                                                                 QString* errorMsg)
{
    if (!m_context) {
        QString err("Invalid MuPDF context");
        setLastError(err);
        if (errorMsg) *errorMsg = err;
        return nullptr;
    }

    // 先整体读入内存，不占用源文件
    QByteArray data;
    QString readError;
    if (!readFileToMemory(filePath, data, &readError)) {
        setLastError(readError);
        if (errorMsg) *errorMsg = readError;
        return nullptr;
    }

    fz_buffer* buffer = nullptr;
    fz_stream* stream = nullptr;
    pdf_document* document = nullptr;
    int pageCount = 0;
    fz_var(buffer);
    fz_var(stream);
    fz_var(document);
    fz_var(pageCount);

    fz_try(m_context) {
        buffer = fz_new_buffer_from_copied_data(
            m_context, static_cast<const unsigned char*>(static_cast<const void*>(data.constData())),
            static_cast<size_t>(data.size()));
        stream = fz_open_buffer(m_context, buffer);
        document = pdf_open_document_with_stream(m_context, stream);
        pageCount = pdf_count_pages(m_context, document);
    }
    fz_always(m_context) {
        // document 自己持有 stream
        fz_drop_stream(m_context, stream);
        fz_drop_buffer(m_context, buffer);
    }
    fz_catch(m_context) {
        QString err = QString("Failed to open document %1: %2")
                          .arg(filePath, QString::fromUtf8(fz_caught_message(m_context)));
        setLastError(err);
        if (errorMsg) *errorMsg = err;
        pdf_drop_document(m_context, document);
        return nullptr;
    }

    qInfo() << "MuPDFDocumentBackend: Opened" << filePath << "pages:" << pageCount;
    return std::make_unique<MuPDFSourceDocument>(m_context, document, filePath, pageCount);
}

std::unique_ptr<OutputDocument> MuPDFDocumentBackend::createOutput(QString* errorMsg)
{
    if (!m_context) {
        QString err("Invalid MuPDF context");
        setLastError(err);
        if (errorMsg) *errorMsg = err;
        return nullptr;
    }

    pdf_document* document = nullptr;
    fz_var(document);

    fz_try(m_context) {
        document = pdf_create_document(m_context);
    }
    fz_catch(m_context) {
        QString err = QString("Failed to create output document: %1")
                          .arg(fz_caught_message(m_context));
        setLastError(err);
        if (errorMsg) *errorMsg = err;
        return nullptr;
    }

    return std::make_unique<MuPDFOutputDocument>(m_context, document);
}

// ========================================
// MuPDFSourceDocument
// ========================================

MuPDFSourceDocument::MuPDFSourceDocument(fz_context* ctx, pdf_document* doc,
                                         const QString& path, int pageCount)
    : m_context(ctx)
    , m_document(doc)
    , m_path(path)
    , m_pageCount(pageCount)
{
}

MuPDFSourceDocument::~MuPDFSourceDocument()
{
    close();
}

void MuPDFSourceDocument::close()
{
    if (!m_document || !m_context) {
        return;
    }

    pdf_drop_document(m_context, m_document);
    m_document = nullptr;
    qDebug() << "MuPDFSourceDocument: Closed" << m_path;
}

// ========================================
// MuPDFOutputDocument
// ========================================

MuPDFOutputDocument::MuPDFOutputDocument(fz_context* ctx, pdf_document* doc)
    : m_context(ctx)
    , m_document(doc)
{
}

MuPDFOutputDocument::~MuPDFOutputDocument()
{
    close();
}

int MuPDFOutputDocument::pageCount() const
{
    if (!m_document) {
        return 0;
    }

    int count = 0;
    fz_var(count);
    fz_try(m_context) {
        count = pdf_count_pages(m_context, m_document);
    }
    fz_catch(m_context) {
        qWarning() << "MuPDFOutputDocument: Failed to count pages:" << fz_caught_message(m_context);
        count = 0;
    }
    return count;
}

pdf_graft_map* MuPDFOutputDocument::graftMapFor(const MuPDFSourceDocument* source)
{
    for (const GraftEntry& entry : m_graftMaps) {
        if (entry.source == source) {
            return entry.map;
        }
    }

    // 可能抛出 MuPDF 异常，调用方负责 fz_try
    pdf_graft_map* map = pdf_new_graft_map(m_context, m_document);
    m_graftMaps.append(GraftEntry{source, map});
    return map;
}

bool MuPDFOutputDocument::appendPage(SourceDocument& source, int pageIndex, QString* errorMsg)
{
    if (!m_document) {
        if (errorMsg) *errorMsg = "Output document is closed";
        return false;
    }

    MuPDFSourceDocument* muSource = dynamic_cast<MuPDFSourceDocument*>(&source);
    if (!muSource || !muSource->isOpen()) {
        if (errorMsg) *errorMsg = "Source is not an open MuPDF document";
        return false;
    }

    if (muSource->context() != m_context) {
        if (errorMsg) *errorMsg = "Source document belongs to another MuPDF context";
        return false;
    }

    if (pageIndex < 0 || pageIndex >= muSource->pageCount()) {
        if (errorMsg) *errorMsg = QString("Invalid page index %1").arg(pageIndex);
        return false;
    }

    fz_try(m_context) {
        pdf_graft_map* map = graftMapFor(muSource);
        pdf_graft_mapped_page(m_context, map, -1, muSource->document(), pageIndex);
    }
    fz_catch(m_context) {
        if (errorMsg) {
            *errorMsg = QString("Failed to copy page %1 of %2: %3")
                            .arg(pageIndex + 1)
                            .arg(muSource->path(), QString::fromUtf8(fz_caught_message(m_context)));
        }
        return false;
    }

    return true;
}

bool MuPDFOutputDocument::truncate(int pageCount, QString* errorMsg)
{
    if (!m_document) {
        if (errorMsg) *errorMsg = "Output document is closed";
        return false;
    }

    int current = this->pageCount();
    if (pageCount < 0 || pageCount > current) {
        if (errorMsg) *errorMsg = QString("Invalid page count %1").arg(pageCount);
        return false;
    }
    if (pageCount == current) {
        return true;
    }

    fz_try(m_context) {
        pdf_delete_page_range(m_context, m_document, pageCount, current);
    }
    fz_catch(m_context) {
        if (errorMsg) {
            *errorMsg = QString("Failed to remove pages: %1").arg(fz_caught_message(m_context));
        }
        return false;
    }

    return true;
}

bool MuPDFOutputDocument::save(const QString& filePath, QString* errorMsg)
{
    if (!m_document) {
        if (errorMsg) *errorMsg = "Output document is closed";
        return false;
    }

    if (filePath.isEmpty()) {
        if (errorMsg) *errorMsg = "No file path specified";
        return false;
    }

    if (!ensureParentDirectory(filePath, errorMsg)) {
        return false;
    }

    pdf_write_options opts = pdf_default_write_options;
    opts.do_garbage = 1;

    QByteArray pathBytes = filePath.toUtf8();

    fz_try(m_context) {
        pdf_save_document(m_context, m_document, pathBytes.constData(), &opts);
    }
    fz_catch(m_context) {
        if (errorMsg) {
            *errorMsg = QString("Failed to save %1: %2")
                            .arg(filePath, QString::fromUtf8(fz_caught_message(m_context)));
        }
        return false;
    }

    qInfo() << "MuPDFOutputDocument: Saved" << filePath;
    return true;
}

void MuPDFOutputDocument::dropGraftMaps()
{
    for (const GraftEntry& entry : m_graftMaps) {
        pdf_drop_graft_map(m_context, entry.map);
    }
    m_graftMaps.clear();
}

void MuPDFOutputDocument::close()
{
    if (!m_document || !m_context) {
        return;
    }

    // graft map 同时引用输出文档和源文档，先释放
    dropGraftMaps();
    pdf_drop_document(m_context, m_document);
    m_document = nullptr;
}
