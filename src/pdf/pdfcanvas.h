/*
 * pdfcanvas.h — PageCanvas backend producing a PDF document
 *
 * Pages are streamed: each page's content stream and page object are
 * written as soon as endPage() is called, so memory use does not grow
 * with the page count.  Text uses the standard Type 1 fonts (nothing is
 * embedded); images are embedded once per source and reused.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_PDFCANVAS_H
#define REPORTFLOW_PDFCANVAS_H

#include "pagecanvas.h"
#include "pdfwriter.h"

#include <QByteArray>
#include <QHash>
#include <QImage>
#include <QList>
#include <QString>

class PdfCanvas : public PageCanvas
{
public:
    // Output to a file (replaced only when close() succeeds)
    explicit PdfCanvas(const QString &filePath);
    // Output to a caller-owned buffer (cleared when the render is aborted)
    explicit PdfCanvas(QByteArray *buffer);
    ~PdfCanvas() override;

    void setDocumentInfo(const QString &title, const QString &author,
                         const QString &subject);

    bool open() override;
    bool close(bool aborted = false) override;
    bool beginPage() override;
    bool endPage() override;

    void drawText(qreal x, qreal y, const QString &text) override;
    bool drawImage(const QRectF &rect, const Report::ImageBlock &image) override;
    void drawLine(const QPointF &p1, const QPointF &p2,
                  const QColor &color, qreal width = 0.5) override;
    void drawRect(const QRectF &rect, const QColor &fill,
                  const QColor &stroke = QColor(),
                  qreal strokeWidth = 0) override;

    QString filePath() const { return m_filePath; }

private:
    struct FontRef {
        QByteArray pdfName;   // resource name, e.g. "F0"
        QByteArray baseFont;  // e.g. "Helvetica-Bold"
        Pdf::ObjId objId = 0; // reserved now, written at close()
    };
    struct ImageRef {
        QByteArray pdfName;   // resource name, e.g. "Im0"
        Pdf::ObjId objId = 0;
    };

    const FontRef &ensureFont(const QString &fontName);
    const ImageRef *ensureImage(const Report::ImageBlock &image);
    void writeFonts();
    void writeDocumentObjects();
    bool syncWriterError();

    static QByteArray colorOperator(const QColor &color, bool fill);

    QString m_filePath;
    QByteArray *m_buffer = nullptr;
    Pdf::Writer m_writer;
    bool m_open = false;

    QString m_title;
    QString m_author;
    QString m_subject;

    // Per document
    QHash<QString, QByteArray> m_fontAliases; // requested name -> base font
    QHash<QByteArray, FontRef> m_fonts;       // keyed by base font
    QHash<QString, ImageRef> m_images; // keyed by source path or image key
    QList<Pdf::ObjId> m_pageObjIds;

    // Per page
    QByteArray m_content;
    Pdf::ResourceDict m_pageResources;
};

#endif // REPORTFLOW_PDFCANVAS_H
