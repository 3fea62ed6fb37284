/*
 * pdfcanvas.cpp — PageCanvas backend producing a PDF document
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfcanvas.h"
#include "standardfonts.h"

#include <QDateTime>
#include <QDebug>

#include <utility>

namespace {

QByteArray pdfCoord(qreal v)
{
    return QByteArray::number(v, 'f', 2);
}

// Flatten any alpha channel onto white and return packed RGB rows.
QByteArray rgbOverWhite(const QImage &image)
{
    QImage argb = image.convertToFormat(QImage::Format_ARGB32);
    QByteArray rawData;
    rawData.reserve(argb.width() * argb.height() * 3);
    for (int y = 0; y < argb.height(); ++y) {
        const QRgb *line = reinterpret_cast<const QRgb *>(argb.constScanLine(y));
        for (int x = 0; x < argb.width(); ++x) {
            const QRgb px = line[x];
            const int a = qAlpha(px);
            auto blend = [a](int c) {
                return static_cast<char>((c * a + 255 * (255 - a) + 127) / 255);
            };
            rawData.append(blend(qRed(px)));
            rawData.append(blend(qGreen(px)));
            rawData.append(blend(qBlue(px)));
        }
    }
    return rawData;
}

} // namespace

PdfCanvas::PdfCanvas(const QString &filePath)
    : m_filePath(filePath)
{
}

PdfCanvas::PdfCanvas(QByteArray *buffer)
    : m_buffer(buffer)
{
}

PdfCanvas::~PdfCanvas()
{
    if (m_open)
        close(true);
}

void PdfCanvas::setDocumentInfo(const QString &title, const QString &author,
                                const QString &subject)
{
    m_title = title;
    m_author = author;
    m_subject = subject;
}

QByteArray PdfCanvas::colorOperator(const QColor &color, bool fill)
{
    if (!color.isValid())
        return {};
    QByteArray op = fill ? " rg\n" : " RG\n";
    return pdfCoord(color.redF()) + " " + pdfCoord(color.greenF()) + " "
         + pdfCoord(color.blueF()) + op;
}

// --- Lifecycle ---

bool PdfCanvas::open()
{
    if (m_open) {
        setError(QStringLiteral("PDF output is already open"));
        return false;
    }
    clearError();
    m_fontAliases.clear();
    m_fonts.clear();
    m_images.clear();
    m_pageObjIds.clear();
    m_content.clear();
    m_pageResources = Pdf::ResourceDict();
    m_pageCount = 0;
    m_pageOpen = false;

    bool opened = m_buffer ? m_writer.openBuffer(m_buffer)
                           : m_writer.openFile(m_filePath);
    if (!opened) {
        setError(m_writer.hasError() ? m_writer.errorString()
                                     : QStringLiteral("cannot open PDF output"));
        return false;
    }
    m_open = true;
    m_writer.writeHeader();
    return syncWriterError();
}

bool PdfCanvas::close(bool aborted)
{
    if (!m_open)
        return false;
    m_open = false;

    if (!aborted && m_pageOpen)
        setError(QStringLiteral("close() with page %1 still open").arg(m_pageCount));
    if (!aborted && m_pageObjIds.isEmpty())
        setError(QStringLiteral("document has no pages"));
    m_pageOpen = false;

    if (aborted || hasError()) {
        m_writer.close(true);
        return false;
    }

    writeFonts();
    writeDocumentObjects();
    m_writer.writeXrefAndTrailer();
    syncWriterError();
    if (!m_writer.close(hasError())) {
        syncWriterError();
        if (!hasError())
            setError(QStringLiteral("cannot finish PDF output"));
        return false;
    }
    return true;
}

bool PdfCanvas::beginPage()
{
    if (!m_open || m_pageOpen) {
        setError(QStringLiteral("beginPage() without a closed page on an open canvas"));
        return false;
    }
    m_content.clear();
    m_pageResources = Pdf::ResourceDict();
    m_pageOpen = true;
    ++m_pageCount;
    return true;
}

bool PdfCanvas::endPage()
{
    if (!m_pageOpen) {
        setError(QStringLiteral("endPage() without an open page"));
        return false;
    }
    m_pageOpen = false;

    Pdf::ObjId contentObj = m_writer.startObj();
    m_writer.write("<<\n");
    m_writer.endObjectWithStream(contentObj, m_content);

    Pdf::ObjId pageObj = m_writer.startObj();
    m_writer.write("<<\n");
    m_writer.write("/Type /Page\n");
    m_writer.write("/Parent " + Pdf::toObjRef(m_writer.pagesObj()) + "\n");
    m_writer.write("/MediaBox [0 0 "
                   + Pdf::toPdf(m_pageSize.width()) + " "
                   + Pdf::toPdf(m_pageSize.height()) + "]\n");
    m_writer.write("/Contents " + Pdf::toObjRef(contentObj) + "\n");
    m_writer.write("/Resources ");
    m_writer.writeResourceDict(m_pageResources);
    m_writer.write(">>");
    m_writer.endObj(pageObj);
    m_pageObjIds.append(pageObj);

    m_content.clear();
    return syncWriterError();
}

bool PdfCanvas::syncWriterError()
{
    if (m_writer.hasError())
        setError(m_writer.errorString());
    return !hasError();
}

// --- Resources ---

const PdfCanvas::FontRef &PdfCanvas::ensureFont(const QString &fontName)
{
    auto alias = m_fontAliases.constFind(fontName);
    if (alias == m_fontAliases.constEnd())
        alias = m_fontAliases.insert(fontName, StandardFonts::resolve(fontName).toLatin1());

    const QByteArray baseFont = alias.value();
    auto it = m_fonts.find(baseFont);
    if (it == m_fonts.end()) {
        FontRef ref;
        ref.pdfName = "F" + QByteArray::number(m_fonts.size());
        ref.baseFont = baseFont;
        ref.objId = m_writer.newObject();
        it = m_fonts.insert(baseFont, ref);
    }
    m_pageResources.fonts[it->pdfName] = it->objId;
    return it.value();
}

const PdfCanvas::ImageRef *PdfCanvas::ensureImage(const Report::ImageBlock &block)
{
    const QString key = block.image.isNull()
        ? block.source
        : QStringLiteral("#image:%1").arg(block.image.cacheKey());

    auto it = m_images.find(key);
    if (it == m_images.end()) {
        QImage image = block.image;
        if (image.isNull() && !block.source.isEmpty())
            image = QImage(block.source);
        if (image.isNull()) {
            setError(QStringLiteral("cannot load image %1").arg(block.source));
            return nullptr;
        }

        Pdf::ObjId imgObj = m_writer.startObj();
        m_writer.write("<<\n/Type /XObject\n/Subtype /Image\n");
        m_writer.write("/Width " + Pdf::toPdf(image.width()) + "\n");
        m_writer.write("/Height " + Pdf::toPdf(image.height()) + "\n");
        m_writer.write("/ColorSpace /DeviceRGB\n");
        m_writer.write("/BitsPerComponent 8\n");
        m_writer.endObjectWithStream(imgObj, rgbOverWhite(image));

        ImageRef ref;
        ref.pdfName = "Im" + QByteArray::number(m_images.size());
        ref.objId = imgObj;
        it = m_images.insert(key, ref);
    }
    m_pageResources.xObjects[it->pdfName] = it->objId;
    return &it.value();
}

void PdfCanvas::writeFonts()
{
    for (const FontRef &font : std::as_const(m_fonts)) {
        m_writer.startObj(font.objId);
        m_writer.write("<< /Type /Font /Subtype /Type1 /BaseFont "
                       + Pdf::toName(font.baseFont)
                       + " /Encoding /WinAnsiEncoding >>");
        m_writer.endObj(font.objId);
    }
}

void PdfCanvas::writeDocumentObjects()
{
    // Pages object
    m_writer.startObj(m_writer.pagesObj());
    m_writer.write("<<\n/Type /Pages\n/Kids [");
    for (auto id : std::as_const(m_pageObjIds))
        m_writer.write(Pdf::toObjRef(id) + " ");
    m_writer.write("]\n/Count " + Pdf::toPdf(m_pageObjIds.size()) + "\n>>");
    m_writer.endObj(m_writer.pagesObj());

    // Info object
    m_writer.startObj(m_writer.infoObj());
    m_writer.write("<<\n");
    m_writer.write("/Producer " + Pdf::toLiteralString(QByteArrayLiteral("ReportFlow")) + "\n");
    if (!m_title.isEmpty())
        m_writer.write("/Title " + Pdf::toLiteralString(Pdf::toUTF16(m_title)) + "\n");
    if (!m_author.isEmpty())
        m_writer.write("/Author " + Pdf::toLiteralString(Pdf::toUTF16(m_author)) + "\n");
    if (!m_subject.isEmpty())
        m_writer.write("/Subject " + Pdf::toLiteralString(Pdf::toUTF16(m_subject)) + "\n");
    m_writer.write("/CreationDate "
                   + Pdf::toLiteralString(Pdf::toDateString(QDateTime::currentDateTime()))
                   + "\n");
    m_writer.write(">>");
    m_writer.endObj(m_writer.infoObj());

    // Catalog object
    m_writer.startObj(m_writer.catalogObj());
    m_writer.write("<<\n/Type /Catalog\n/Pages " + Pdf::toObjRef(m_writer.pagesObj()) + "\n");
    m_writer.write(">>");
    m_writer.endObj(m_writer.catalogObj());
}

// --- Drawing primitives ---

void PdfCanvas::drawText(qreal x, qreal y, const QString &text)
{
    if (!m_pageOpen) {
        setError(QStringLiteral("drawText() outside of a page"));
        return;
    }
    if (text.isEmpty())
        return;

    const FontRef &font = ensureFont(m_style.fontName());
    m_content += "BT\n";
    m_content += "/" + font.pdfName + " " + pdfCoord(m_style.fontSize()) + " Tf\n";
    m_content += colorOperator(m_style.color(), true);
    m_content += pdfCoord(x) + " " + pdfCoord(y) + " Td\n";
    m_content += Pdf::toLiteralString(StandardFonts::toWinAnsi(text)) + " Tj\n";
    m_content += "ET\n";
}

bool PdfCanvas::drawImage(const QRectF &rect, const Report::ImageBlock &image)
{
    if (!m_pageOpen) {
        setError(QStringLiteral("drawImage() outside of a page"));
        return false;
    }
    const ImageRef *ref = ensureImage(image);
    if (!ref)
        return false;

    // Translate + scale with cm, then paint with Do
    m_content += "q\n";
    m_content += pdfCoord(rect.width()) + " 0 0 " + pdfCoord(rect.height()) + " "
               + pdfCoord(rect.x()) + " " + pdfCoord(rect.y()) + " cm\n";
    m_content += "/" + ref->pdfName + " Do\n";
    m_content += "Q\n";
    return syncWriterError();
}

void PdfCanvas::drawLine(const QPointF &p1, const QPointF &p2,
                         const QColor &color, qreal width)
{
    if (!m_pageOpen) {
        setError(QStringLiteral("drawLine() outside of a page"));
        return;
    }
    if (!color.isValid() || width <= 0)
        return;

    m_content += "q\n";
    m_content += colorOperator(color, false);
    m_content += pdfCoord(width) + " w\n";
    m_content += pdfCoord(p1.x()) + " " + pdfCoord(p1.y()) + " m "
               + pdfCoord(p2.x()) + " " + pdfCoord(p2.y()) + " l S\n";
    m_content += "Q\n";
}

void PdfCanvas::drawRect(const QRectF &rect, const QColor &fill,
                         const QColor &stroke, qreal strokeWidth)
{
    if (!m_pageOpen) {
        setError(QStringLiteral("drawRect() outside of a page"));
        return;
    }
    const bool doFill = fill.isValid();
    const bool doStroke = stroke.isValid() && strokeWidth > 0;
    if (!doFill && !doStroke)
        return;

    m_content += "q\n";
    if (doFill)
        m_content += colorOperator(fill, true);
    if (doStroke) {
        m_content += colorOperator(stroke, false);
        m_content += pdfCoord(strokeWidth) + " w\n";
    }
    m_content += pdfCoord(rect.x()) + " " + pdfCoord(rect.y()) + " "
               + pdfCoord(rect.width()) + " " + pdfCoord(rect.height()) + " re ";
    m_content += doFill && doStroke ? "B\n" : (doFill ? "f\n" : "S\n");
    m_content += "Q\n";
}
