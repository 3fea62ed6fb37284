// pdfcanvas_test.cpp - PDF output: structure, resources and artifact lifecycle

#include <gtest/gtest.h>

#include <QFile>
#include <QImage>
#include <QRegularExpression>
#include <QTemporaryDir>

#include "document.h"
#include "pdfcanvas.h"
#include "pdfwriter.h"
#include "recordingcanvas.h"
#include "testhelpers.h"

using namespace TestHelpers;

namespace {

// Number of pages declared by the page tree
int declaredPageCount(const QByteArray &pdf)
{
    static const QRegularExpression countRx(QStringLiteral(R"(/Count (\d+))"));
    QRegularExpressionMatch m = countRx.match(QString::fromLatin1(pdf));
    return m.hasMatch() ? m.captured(1).toInt() : -1;
}

} // namespace

class PdfOutputTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        layout.footerText = QStringLiteral("Page {page} of {pages}");
    }

    QString path(const QString &name) const { return dir.filePath(name); }

    QTemporaryDir dir;
    PageLayout layout;
};

TEST_F(PdfOutputTest, BufferHoldsACompleteDocument) {
    Report::Document doc(layout);
    doc.setInfo({QStringLiteral("Titanic Analysis"), QStringLiteral("Insight Hub"), QString()});
    ASSERT_TRUE(doc.addSection(QStringLiteral("Survival"), {numberedLines(20)}));
    Report::Section details = section(QStringLiteral("Fares"), {numberedLines(10, 20)});
    details.pageBreakBefore = true;
    ASSERT_TRUE(doc.addSection(details));

    QByteArray pdf;
    ASSERT_TRUE(doc.renderToData(&pdf));
    EXPECT_EQ(doc.pageCount(), 2);

    EXPECT_TRUE(pdf.startsWith("%PDF-1.7\n"));
    EXPECT_TRUE(pdf.endsWith("%%EOF\n"));
    EXPECT_EQ(declaredPageCount(pdf), 2);
    EXPECT_EQ(pdf.count("/Type /Page\n"), 2);
    EXPECT_TRUE(pdf.contains("/Type /Catalog"));
    EXPECT_TRUE(pdf.contains("/BaseFont /Helvetica-Bold /Encoding /WinAnsiEncoding"));
    EXPECT_TRUE(pdf.contains("/BaseFont /Helvetica-Oblique"));
    EXPECT_TRUE(pdf.contains("/Producer (ReportFlow)"));
    EXPECT_TRUE(pdf.contains("/MediaBox [0 0 612.00 792.00]"));
}

TEST_F(PdfOutputTest, CrossReferenceOffsetsPointAtObjects) {
    Report::Document doc(layout);
    ASSERT_TRUE(doc.addSection(QStringLiteral("Data"), {numberedLines(30), table(30)}));

    QByteArray pdf;
    ASSERT_TRUE(doc.renderToData(&pdf));

    const int startxref = pdf.lastIndexOf("startxref\n");
    ASSERT_GT(startxref, 0);
    const int xrefOffset = pdf.mid(startxref + 10).split('\n').first().toInt();
    ASSERT_EQ(pdf.mid(xrefOffset, 5), QByteArray("xref\n"));

    const QList<QByteArray> lines = pdf.mid(xrefOffset).split('\n');
    const QList<QByteArray> header = lines[1].split(' ');
    ASSERT_EQ(header.size(), 2);
    const int objectCount = header[1].toInt();
    ASSERT_GT(objectCount, 4);
    for (int id = 1; id < objectCount; ++id) {
        const QByteArray entry = lines[2 + id];
        ASSERT_EQ(entry.size(), 19) << "xref entries are 20 bytes with the newline";
        const int offset = entry.left(10).toInt();
        EXPECT_TRUE(pdf.mid(offset).startsWith(QByteArray::number(id) + " 0 obj"))
            << "object " << id;
    }
}

TEST_F(PdfOutputTest, FileIsWrittenOnSuccess) {
    const QString file = path(QStringLiteral("report.pdf"));
    Report::Document doc(layout);
    ASSERT_TRUE(doc.addSection(QStringLiteral("Intro"), {numberedLines(5)}));

    ASSERT_TRUE(doc.renderToFile(file));
    QFile f(file);
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    const QByteArray pdf = f.readAll();
    EXPECT_TRUE(pdf.startsWith("%PDF-"));
    EXPECT_EQ(declaredPageCount(pdf), 1);
}

TEST_F(PdfOutputTest, FailedRenderLeavesNoFile) {
    const QString file = path(QStringLiteral("broken.pdf"));
    Report::Document doc(layout);
    ASSERT_TRUE(doc.addSection(QStringLiteral("Intro"), {numberedLines(5), spacer(900.0)}));

    EXPECT_FALSE(doc.renderToFile(file));
    EXPECT_EQ(doc.lastError().code, Report::ErrorCode::BlockTooLargeError);
    EXPECT_FALSE(QFile::exists(file));
}

TEST_F(PdfOutputTest, FailedRenderClearsTheBuffer) {
    Report::Document doc(layout);
    ASSERT_TRUE(doc.addSection(QString(), {spacer(900.0)}));

    QByteArray pdf("stale");
    EXPECT_FALSE(doc.renderToData(&pdf));
    EXPECT_TRUE(pdf.isEmpty());
}

TEST_F(PdfOutputTest, InvalidConfigurationNeverCreatesTheFile) {
    const QString file = path(QStringLiteral("never.pdf"));
    layout.lineHeight = -1.0;
    Report::Document doc(layout);

    EXPECT_FALSE(doc.renderToFile(file));
    EXPECT_EQ(doc.lastError().code, Report::ErrorCode::InvalidConfigurationError);
    EXPECT_FALSE(QFile::exists(file));
}

TEST_F(PdfOutputTest, UnwritableTargetIsAnOutputError) {
    Report::Document doc(layout);
    ASSERT_TRUE(doc.addSection(QString(), {numberedLines(1)}));

    EXPECT_FALSE(doc.renderToFile(path(QStringLiteral("missing-dir/report.pdf"))));
    EXPECT_EQ(doc.lastError().code, Report::ErrorCode::CanvasIOError);
}

TEST_F(PdfOutputTest, MissingImageIsAnOutputError) {
    const QString file = path(QStringLiteral("charts.pdf"));
    Report::ImageBlock chart;
    chart.source = path(QStringLiteral("no-such-chart.png"));
    chart.width = 300.0;
    chart.height = 200.0;

    Report::Document doc(layout);
    ASSERT_TRUE(doc.addSection(QStringLiteral("Charts"), {chart}));

    EXPECT_FALSE(doc.renderToFile(file));
    EXPECT_EQ(doc.lastError().code, Report::ErrorCode::CanvasIOError);
    EXPECT_EQ(doc.lastError().sectionIndex, 0);
    EXPECT_EQ(doc.lastError().blockIndex, 0);
    EXPECT_FALSE(QFile::exists(file));
}

TEST_F(PdfOutputTest, ImagesAreEmbeddedOncePerSource) {
    QImage raster(8, 4, QImage::Format_ARGB32);
    raster.fill(QColor(30, 77, 121, 128));
    const QString source = path(QStringLiteral("chart.png"));
    ASSERT_TRUE(raster.save(source, "PNG"));

    Report::ImageBlock chart;
    chart.source = source;
    chart.width = 160.0;
    chart.height = 80.0;

    Report::ImageBlock preloaded;
    preloaded.image = raster;
    preloaded.width = 40.0;
    preloaded.height = 20.0;

    Report::Document doc(layout);
    ASSERT_TRUE(doc.addSection(QStringLiteral("Charts"), {chart, chart, preloaded}));

    QByteArray pdf;
    ASSERT_TRUE(doc.renderToData(&pdf));
    EXPECT_EQ(pdf.count("/Subtype /Image"), 2);
    EXPECT_TRUE(pdf.contains("/ColorSpace /DeviceRGB"));
    EXPECT_TRUE(pdf.contains("/Width 8"));
}

TEST_F(PdfOutputTest, LinesAreStrokedInTheirOwnGraphicsState) {
    QByteArray pdf;
    PdfCanvas canvas(&pdf);
    ASSERT_TRUE(canvas.open());
    ASSERT_TRUE(canvas.beginPage());
    canvas.drawLine(QPointF(50, 700), QPointF(562, 700), QColor(255, 0, 0), 1.5);
    ASSERT_TRUE(canvas.endPage());
    ASSERT_TRUE(canvas.close());

    // Short content streams stay uncompressed
    EXPECT_TRUE(pdf.contains("q\n1.00 0.00 0.00 RG\n1.50 w\n"
                             "50.00 700.00 m 562.00 700.00 l S\nQ\n"));
}

TEST_F(PdfOutputTest, LineOutsideAPageIsAnError) {
    QByteArray pdf;
    PdfCanvas canvas(&pdf);
    ASSERT_TRUE(canvas.open());
    canvas.drawLine(QPointF(0, 0), QPointF(10, 10), Qt::black, 1.0);
    EXPECT_TRUE(canvas.hasError());
    EXPECT_FALSE(canvas.close(true));
    EXPECT_TRUE(pdf.isEmpty());
}

// ============================================================================
// Recording canvas
// ============================================================================

TEST(RecordingCanvasTest, RecordsLinesWithTheirStroke) {
    RecordingCanvas canvas;
    ASSERT_TRUE(canvas.open());
    ASSERT_TRUE(canvas.beginPage());
    canvas.drawLine(QPointF(50, 100), QPointF(200, 100), QColor(0x1e, 0x4d, 0x79), 0.75);
    ASSERT_TRUE(canvas.endPage());
    ASSERT_TRUE(canvas.close());

    ASSERT_EQ(canvas.pages().size(), 1);
    const QList<DrawOp> &ops = canvas.pages().first().ops;
    ASSERT_EQ(ops.size(), 1);
    EXPECT_EQ(ops[0].kind, DrawOp::Line);
    EXPECT_EQ(ops[0].p1, QPointF(50, 100));
    EXPECT_EQ(ops[0].p2, QPointF(200, 100));
    EXPECT_EQ(ops[0].stroke, QColor(0x1e, 0x4d, 0x79));
    EXPECT_DOUBLE_EQ(ops[0].strokeWidth, 0.75);
}

TEST(RecordingCanvasTest, LineOutsideAPageIsAnError) {
    RecordingCanvas canvas;
    ASSERT_TRUE(canvas.open());
    canvas.drawLine(QPointF(0, 0), QPointF(10, 10), Qt::black, 1.0);
    EXPECT_TRUE(canvas.hasError());
    EXPECT_TRUE(canvas.pages().isEmpty());
}

// ============================================================================
// Writer primitives
// ============================================================================

TEST(PdfWriterTest, AbortedBufferIsCleared) {
    QByteArray buffer;
    Pdf::Writer writer;
    ASSERT_TRUE(writer.openBuffer(&buffer));
    writer.writeHeader();
    EXPECT_FALSE(buffer.isEmpty());
    EXPECT_TRUE(writer.isOpen());
    EXPECT_FALSE(writer.close(true));
    EXPECT_FALSE(writer.isOpen());
    EXPECT_TRUE(buffer.isEmpty());
}

TEST(PdfWriterTest, UnwrittenReservedObjectIsAnError) {
    QByteArray buffer;
    Pdf::Writer writer;
    ASSERT_TRUE(writer.openBuffer(&buffer));
    writer.writeHeader();
    writer.newObject();
    writer.writeXrefAndTrailer();
    EXPECT_TRUE(writer.hasError());
    EXPECT_FALSE(writer.close());
}

TEST(PdfWriterTest, StringEscaping) {
    EXPECT_EQ(Pdf::toLiteralString(QByteArray("a(b)\\")), QByteArray("(a\\(b\\)\\\\)"));
    EXPECT_EQ(Pdf::toLiteralString(QByteArray("\x80")), QByteArray("(\\200)"));
    EXPECT_EQ(Pdf::toName(QByteArray("Helvetica Bold")), QByteArray("/Helvetica#20Bold"));
    EXPECT_EQ(Pdf::toPdf(12.5), QByteArray("12.50"));
    EXPECT_EQ(Pdf::toObjRef(7), QByteArray("7 0 R"));
}
