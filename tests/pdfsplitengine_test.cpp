#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "fakedocumentbackend.h"
#include "pdfsplitengine.h"
#include "progresssink.h"

class PdfSplitEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_tempDir.isValid());
        m_outDir = m_tempDir.filePath("out");
    }

    QString path(const QString& name) const { return m_tempDir.filePath(name); }
    QString outPath(const QString& name) const { return QDir(m_outDir).filePath(name); }

    QString writeSource(const QString& name, int pageCount)
    {
        QString filePath = path(name);
        EXPECT_TRUE(FakeDocumentBackend::writeFakePdf(filePath, "p", pageCount));
        return filePath;
    }

    QStringList outputFileNames() const
    {
        return QDir(m_outDir).entryList(QDir::Files, QDir::Name);
    }

    void expectAllHandlesClosed()
    {
        std::shared_ptr<FakeBackendStats> stats = m_backend.stats();
        EXPECT_EQ(stats->openHandles(), 0);
        EXPECT_EQ(stats->sourcesOpened.load(), stats->sourcesClosed.load());
        EXPECT_EQ(stats->outputsCreated.load(), stats->outputsClosed.load());
    }

    // 源文档最后关闭，且只关闭一次
    void expectSourceClosedLast()
    {
        QStringList log = m_backend.stats()->closeLog();
        ASSERT_FALSE(log.isEmpty());
        EXPECT_TRUE(log.last().startsWith("source:"));
        EXPECT_EQ(log.filter("source:").size(), 1);
    }

    QTemporaryDir m_tempDir;
    QString m_outDir;
    FakeDocumentBackend m_backend;
    NullProgressSink m_progress;
};

// ========== 按区间 ==========

TEST_F(PdfSplitEngineTest, SplitByRanges)
{
    QString src = writeSource("src.pdf", 10);

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitByRanges(src, {PageRange(1, 3), PageRange(4, 7)},
                                              m_outDir, "part_[N].pdf", m_progress);

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    EXPECT_EQ(result.kind, BatchKind::Split);
    EXPECT_EQ(result.requestedCount, 2);
    EXPECT_EQ(result.outputPath, m_outDir);
    EXPECT_EQ(outputFileNames(), QStringList({"part_001.pdf", "part_002.pdf"}));

    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("part_001.pdf")),
              QStringList({"p#1", "p#2", "p#3"}));
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("part_002.pdf")),
              QStringList({"p#4", "p#5", "p#6", "p#7"}));

    ASSERT_EQ(result.items.size(), 2);
    EXPECT_EQ(result.items[0].pages, PageRange(1, 3));
    EXPECT_EQ(result.items[1].pagesCopied, 4);
    EXPECT_EQ(result.outputFiles(),
              QStringList({outPath("part_001.pdf"), outPath("part_002.pdf")}));

    expectAllHandlesClosed();
    expectSourceClosedLast();
}

TEST_F(PdfSplitEngineTest, OverlappingRangesAndCallerOrder)
{
    QString src = writeSource("src.pdf", 5);

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitByRanges(src, {PageRange(4, 5), PageRange(1, 4)},
                                              m_outDir, "r[N].pdf", m_progress);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("r001.pdf")), QStringList({"p#4", "p#5"}));
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("r002.pdf")).size(), 4);
}

TEST_F(PdfSplitEngineTest, RangePastLastPageIsRejected)
{
    QString src = writeSource("src.pdf", 5);

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitByRanges(src, {PageRange(1, 2), PageRange(4, 6)},
                                              m_outDir, "part_[N].pdf", m_progress);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, BatchError::InvalidArgument);
    EXPECT_TRUE(outputFileNames().isEmpty());
    expectAllHandlesClosed();
}

TEST_F(PdfSplitEngineTest, MalformedArgumentsAreRejectedBeforeOpening)
{
    QString src = writeSource("src.pdf", 5);
    PdfSplitEngine engine(m_backend);

    BatchResult noRanges = engine.splitByRanges(src, QVector<PageRange>(), m_outDir,
                                                "part_[N].pdf", m_progress);
    EXPECT_EQ(noRanges.error, BatchError::InvalidArgument);

    BatchResult reversed = engine.splitByRanges(src, {PageRange(3, 2)}, m_outDir,
                                                "part_[N].pdf", m_progress);
    EXPECT_EQ(reversed.error, BatchError::InvalidArgument);

    BatchResult zeroStart = engine.splitByRanges(src, {PageRange(0, 2)}, m_outDir,
                                                 "part_[N].pdf", m_progress);
    EXPECT_EQ(zeroStart.error, BatchError::InvalidArgument);

    BatchResult noParts = engine.splitEqually(src, 0, m_outDir, "part_[N].pdf", m_progress);
    EXPECT_EQ(noParts.error, BatchError::InvalidArgument);

    BatchResult noPlaceholder = engine.splitByPage(src, m_outDir, "part.pdf", m_progress);
    EXPECT_EQ(noPlaceholder.error, BatchError::InvalidArgument);

    BatchResult blankPattern = engine.splitByPage(src, m_outDir, "", m_progress);
    EXPECT_EQ(blankPattern.error, BatchError::InvalidArgument);

    EXPECT_EQ(m_backend.stats()->sourcesOpened.load(), 0);
    EXPECT_FALSE(QDir(m_outDir).exists());
}

// ========== 每页一个文件 ==========

TEST_F(PdfSplitEngineTest, SplitByPage)
{
    QString src = writeSource("src.pdf", 3);

    QVector<int> values;
    CallbackProgressSink progress([&values](int percent) { values.append(percent); });

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitByPage(src, m_outDir, "page_[N].pdf", progress);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.requestedCount, 3);
    EXPECT_EQ(outputFileNames(),
              QStringList({"page_001.pdf", "page_002.pdf", "page_003.pdf"}));
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("page_002.pdf")), QStringList({"p#2"}));
    EXPECT_EQ(values, QVector<int>({33, 67, 100}));

    expectAllHandlesClosed();
    expectSourceClosedLast();
}

TEST_F(PdfSplitEngineTest, SplitByPageWithEmptySource)
{
    QString src = writeSource("empty.pdf", 0);

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitByPage(src, m_outDir, "page_[N].pdf", m_progress);

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.items.isEmpty());
    EXPECT_TRUE(outputFileNames().isEmpty());
    expectAllHandlesClosed();
}

// ========== 等分 ==========

TEST_F(PdfSplitEngineTest, SplitEqually)
{
    QString src = writeSource("src.pdf", 10);

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitEqually(src, 3, m_outDir, "eq_[N].pdf", m_progress);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(outputFileNames(), QStringList({"eq_001.pdf", "eq_002.pdf", "eq_003.pdf"}));
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("eq_001.pdf")).size(), 4);
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("eq_002.pdf")).size(), 4);
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("eq_003.pdf")),
              QStringList({"p#9", "p#10"}));
    expectAllHandlesClosed();
}

TEST_F(PdfSplitEngineTest, SplitEquallyOmitsTrailingParts)
{
    QString src = writeSource("src.pdf", 9);

    QVector<int> values;
    CallbackProgressSink progress([&values](int percent) { values.append(percent); });

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitEqually(src, 4, m_outDir, "eq_[N].pdf", progress);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.requestedCount, 4);
    EXPECT_EQ(result.items.size(), 3);
    EXPECT_EQ(outputFileNames(), QStringList({"eq_001.pdf", "eq_002.pdf", "eq_003.pdf"}));

    // 进度分母是请求的份数，省略的份不再报告
    EXPECT_EQ(values, QVector<int>({25, 50, 75}));
}

TEST_F(PdfSplitEngineTest, SplitEquallyMorePartsThanPages)
{
    QString src = writeSource("src.pdf", 2);

    QVector<int> values;
    CallbackProgressSink progress([&values](int percent) { values.append(percent); });

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitEqually(src, 5, m_outDir, "eq_[N].pdf", progress);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(outputFileNames(), QStringList({"eq_001.pdf", "eq_002.pdf"}));
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("eq_002.pdf")), QStringList({"p#2"}));
    EXPECT_EQ(values, QVector<int>({20, 40}));
}

TEST_F(PdfSplitEngineTest, SplitDispatchesOnPartitionSpec)
{
    QString src = writeSource("src.pdf", 4);

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.split(src, PartitionSpec::equally(2), m_outDir, "s_[N].pdf");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(outputFileNames(), QStringList({"s_001.pdf", "s_002.pdf"}));
}

// ========== 失败处理 ==========

TEST_F(PdfSplitEngineTest, ItemFailuresDoNotFailTheBatch)
{
    QString src = writeSource("src.pdf", 4);
    m_backend.failSaveFor("_002");
    m_backend.failAppendFor("src.pdf", 2);

    QVector<int> values;
    CallbackProgressSink progress([&values](int percent) { values.append(percent); });

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitByPage(src, m_outDir, "page_[N].pdf", progress);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.error, BatchError::None);
    ASSERT_EQ(result.items.size(), 4);
    EXPECT_TRUE(result.items[0].success);
    EXPECT_EQ(result.items[1].error, BatchError::SaveError);
    EXPECT_EQ(result.items[2].error, BatchError::CopyError);
    EXPECT_TRUE(result.items[3].success);
    EXPECT_EQ(result.succeededCount(), 2);
    EXPECT_EQ(result.failedCount(), 2);

    EXPECT_EQ(outputFileNames(), QStringList({"page_001.pdf", "page_004.pdf"}));
    EXPECT_EQ(result.outputFiles(),
              QStringList({outPath("page_001.pdf"), outPath("page_004.pdf")}));

    // 失败的页同样推进进度
    EXPECT_EQ(values, QVector<int>({25, 50, 75, 100}));

    expectAllHandlesClosed();
    expectSourceClosedLast();
}

TEST_F(PdfSplitEngineTest, EveryItemFailingStillReportsSuccess)
{
    QString src = writeSource("src.pdf", 2);
    m_backend.failSaveFor("page_");

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitByPage(src, m_outDir, "page_[N].pdf", m_progress);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.succeededCount(), 0);
    EXPECT_TRUE(result.outputFiles().isEmpty());
    expectAllHandlesClosed();
}

TEST_F(PdfSplitEngineTest, MissingSource)
{
    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitByPage(path("missing.pdf"), m_outDir, "page_[N].pdf",
                                            m_progress);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, BatchError::NotFound);
    EXPECT_FALSE(QDir(m_outDir).exists());
}

TEST_F(PdfSplitEngineTest, UnreadableSource)
{
    QString src = path("broken.pdf");
    QFile file(src);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("garbage");
    file.close();

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitByPage(src, m_outDir, "page_[N].pdf", m_progress);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, BatchError::OpenError);
    expectAllHandlesClosed();
}

TEST_F(PdfSplitEngineTest, CreatesNestedOutputFolder)
{
    QString src = writeSource("src.pdf", 1);
    QString nested = QDir(m_outDir).filePath("a/b");

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitByPage(src, nested, "page_[N].pdf", m_progress);

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(QFileInfo::exists(QDir(nested).filePath("page_001.pdf")));
}

TEST_F(PdfSplitEngineTest, OutputFolderBlockedByFile)
{
    QString src = writeSource("src.pdf", 1);
    QString blocker = path("blocker");
    QFile file(blocker);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("x");
    file.close();

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitByPage(src, QDir(blocker).filePath("sub"), "page_[N].pdf",
                                            m_progress);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, BatchError::NotFound);
    expectAllHandlesClosed();
}

TEST_F(PdfSplitEngineTest, FailedRangeStillAdvancesProgress)
{
    QString src = writeSource("src.pdf", 6);
    m_backend.failAppendFor("src.pdf", 0);

    QVector<int> values;
    CallbackProgressSink progress([&values](int percent) { values.append(percent); });

    PdfSplitEngine engine(m_backend);
    BatchResult result = engine.splitByRanges(src, {PageRange(1, 2), PageRange(3, 6)},
                                              m_outDir, "r_[N].pdf", progress);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.items[0].error, BatchError::CopyError);
    EXPECT_EQ(outputFileNames(), QStringList({"r_002.pdf"}));
    EXPECT_EQ(values, QVector<int>({50, 100}));
}

TEST_F(PdfSplitEngineTest, BlankOutputFolderIsRejected)
{
    QString src = writeSource("src.pdf", 2);
    PdfSplitEngine engine(m_backend);

    const QStringList blanks = {QString(), QString("  ")};
    for (const QString& folder : blanks) {
        BatchResult result = engine.splitByPage(src, folder, "blank_[N].pdf", m_progress);

        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.error, BatchError::NotFound);
        EXPECT_TRUE(result.items.isEmpty());
    }

    // 不会写到当前工作目录
    EXPECT_FALSE(QFileInfo::exists("blank_001.pdf"));
    EXPECT_FALSE(QFileInfo::exists("blank_002.pdf"));
    EXPECT_EQ(m_backend.stats()->outputsCreated.load(), 0);
    expectAllHandlesClosed();
}

TEST_F(PdfSplitEngineTest, RepeatedSplitOverwritesSameNamedOutputs)
{
    QString src = writeSource("src.pdf", 9);
    PdfSplitEngine engine(m_backend);

    ASSERT_TRUE(engine.splitEqually(src, 3, m_outDir, "eq_[N].pdf", m_progress).success);
    const QStringList firstFiles = outputFileNames();
    const QStringList firstPart = FakeDocumentBackend::readFakePages(outPath("eq_001.pdf"));

    ASSERT_TRUE(engine.splitEqually(src, 3, m_outDir, "eq_[N].pdf", m_progress).success);
    EXPECT_EQ(outputFileNames(), firstFiles);
    EXPECT_EQ(outputFileNames(), QStringList({"eq_001.pdf", "eq_002.pdf", "eq_003.pdf"}));
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("eq_001.pdf")), firstPart);
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("eq_003.pdf")),
              QStringList({"p#7", "p#8", "p#9"}));

    // 份数变少时覆盖前两份，上一次多出的 eq_003.pdf 保留不动
    ASSERT_TRUE(engine.splitEqually(src, 2, m_outDir, "eq_[N].pdf", m_progress).success);
    EXPECT_EQ(outputFileNames(), QStringList({"eq_001.pdf", "eq_002.pdf", "eq_003.pdf"}));
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("eq_001.pdf")).size(), 5);
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("eq_002.pdf")),
              QStringList({"p#6", "p#7", "p#8", "p#9"}));
    EXPECT_EQ(FakeDocumentBackend::readFakePages(outPath("eq_003.pdf")),
              QStringList({"p#7", "p#8", "p#9"}));

    expectAllHandlesClosed();
}
