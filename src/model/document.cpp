/*
 * document.cpp — A report: ordered sections plus page configuration
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "document.h"
#include "headerfooterrenderer.h"
#include "pdfcanvas.h"
#include "recordingcanvas.h"
#include "reportsettings.h"

#include <QDate>
#include <QDebug>

#include <variant>

namespace Report {

Document::Document(const PageLayout &pageLayout, const Theme &theme)
    : m_pageLayout(pageLayout)
    , m_theme(theme)
{
    ReportSettings settings;
    settings.pageLayout = pageLayout;
    settings.theme = theme;
    m_configError = settings.validate();
    if (m_configError.isError())
        qWarning() << "Document:" << m_configError.toString();
    m_lastError = m_configError;
}

Document::Document(const ReportSettings &settings)
    : Document(settings.pageLayout, settings.theme)
{
}

bool Document::setLastError(const Error &error)
{
    m_lastError = error;
    return !error.isError();
}

bool Document::addSection(const Section &section)
{
    const int sectionIndex = m_sections.size();
    if (m_rendered) {
        qWarning() << "Document: section" << section.title
                   << "refused, the document has already been rendered";
        return setLastError(Error::make(ErrorCode::InvalidConfigurationError,
                                        QStringLiteral("cannot add sections after rendering"),
                                        sectionIndex));
    }

    for (int bi = 0; bi < section.blocks.size(); ++bi) {
        const QString problem = validateBlock(section.blocks[bi]);
        if (!problem.isEmpty()) {
            Error error = Error::make(ErrorCode::InvalidConfigurationError,
                                      QStringLiteral("%1 block: %2")
                                          .arg(blockKind(section.blocks[bi]), problem),
                                      sectionIndex, bi);
            qWarning() << "Document:" << error.toString();
            return setLastError(error);
        }
    }

    // Tables are drawn at fixed column widths and must stay inside the right margin
    const qreal right = m_pageLayout.pageWidth() - m_pageLayout.margins.right();
    for (int bi = 0; bi < section.blocks.size(); ++bi) {
        const auto *table = std::get_if<TableBlock>(&section.blocks[bi]);
        if (!table)
            continue;
        const qreal left = table->x.value_or(m_pageLayout.margins.left());
        if (left + table->width() > right + 1e-6) {
            Error error = Error::make(ErrorCode::InvalidConfigurationError,
                                      QStringLiteral("table block: %1 pt of columns exceed the "
                                                     "%2 pt content width")
                                          .arg(table->width())
                                          .arg(m_pageLayout.contentWidth()),
                                      sectionIndex, bi);
            qWarning() << "Document:" << error.toString();
            return setLastError(error);
        }
    }

    m_sections.append(section);
    return true;
}

bool Document::addSection(const QString &title, const QList<ContentBlock> &blocks)
{
    Section section;
    section.title = title;
    section.blocks = blocks;
    return addSection(section);
}

bool Document::needsPageCount() const
{
    return HeaderFooterRenderer::needsTotalPages(m_pageLayout.footerText)
        || HeaderFooterRenderer::needsTotalPages(m_pageLayout.continuationText);
}

bool Document::render(PageCanvas *canvas)
{
    m_lastLayout = Layout::LayoutResult();
    if (!isValid())
        return setLastError(m_configError);

    m_rendered = true;

    Layout::Engine engine(m_pageLayout, m_theme);
    engine.setDate(QDate::currentDate());

    // {pages} needs the total up front: count with a throwaway pass
    if (needsPageCount()) {
        RecordingCanvas counter;
        Layout::LayoutResult counted = engine.render(*this, &counter);
        if (!counted.ok()) {
            m_lastLayout = counted;
            return setLastError(counted.error);
        }
        engine.setTotalPages(counted.pageCount);
    }

    m_lastLayout = engine.render(*this, canvas);
    return setLastError(m_lastLayout.error);
}

bool Document::renderToFile(const QString &filePath)
{
    if (!isValid())
        return setLastError(m_configError);

    PdfCanvas canvas(filePath);
    canvas.setDocumentInfo(m_info.title, m_info.author, m_info.subject);
    return render(&canvas);
}

bool Document::renderToData(QByteArray *data)
{
    if (!data)
        return setLastError(Error::make(ErrorCode::CanvasIOError,
                                        QStringLiteral("no output buffer")));
    data->clear();
    if (!isValid())
        return setLastError(m_configError);

    PdfCanvas canvas(data);
    canvas.setDocumentInfo(m_info.title, m_info.author, m_info.subject);
    return render(&canvas);
}

} // namespace Report
